// src/app/main.cpp - meridian_resolve command-line front end
//
// Modes:
//  1. Single request from options (--datetime, --lat, --lon, ...)
//  2. Batch CSV resolved on a pool of worker threads (--batch)
//  3. Health report (--health)

#include "core/csv.hpp"
#include "core/logger.hpp"
#include "resolver/config.hpp"
#include "resolver/runtime.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <getopt.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace meridian;

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitInvalidInput = 1;
constexpr int kExitStartupFailure = 2;

void print_help(const char* argv0)
{
    fmt::print("Usage: {} [options]\n"
               "Resolve a local civil time at a coordinate to UTC.\n\n"
               "  -d, --datetime=TEXT   Local time, YYYY-MM-DDTHH:MM[:SS[.fff]] (no offset)\n"
               "      --lat=DEG         Latitude in degrees [-90, 90]\n"
               "      --lon=DEG         Longitude in degrees [-180, 180]\n"
               "  -p, --profile=NAME    strict_history (default), astro_compat, future_compat, as_entered\n"
               "  -o, --offset=SECONDS  Caller UTC offset (as_entered)\n"
               "  -z, --zone=NAME       Caller zone, IANA name or abbreviation (as_entered)\n"
               "  -b, --batch=FILE      Resolve every row of a CSV file:\n"
               "                        local_datetime,latitude,longitude,parity_profile[,offset][,zone]\n"
               "  -j, --threads=N       Worker threads for --batch (default: hardware concurrency)\n"
               "      --health          Print dataset versions and cache statistics\n"
               "  -h, --help            Display this help and exit\n",
               argv0);
}

void print_result(const resolver::ResolutionResult& result)
{
    fmt::print("utc:                {}\n", result.utc);
    fmt::print("utc_julian_date:    {:.8f}\n", result.utc_julian_date);
    fmt::print("zone_id:            {}\n", result.zone_id);
    fmt::print("offset_seconds:     {}\n", result.offset_seconds);
    fmt::print("dst_active:         {}\n", result.dst_active);
    fmt::print("confidence:         {}\n", to_string(result.confidence));
    fmt::print("reason:             {}\n", result.reason);
    for (const auto& note : result.notes)
    {
        fmt::print("note:               {}\n", note);
    }
    for (const auto& warning : result.warnings)
    {
        fmt::print("warning:            {}: {}\n", warning.code, warning.message);
    }

    const auto& p = result.provenance;
    fmt::print("resolution_mode:    {}\n", p.resolution_mode);
    fmt::print("fold_policy:        {}\n", p.fold_policy);
    fmt::print("sources:            {}\n", fmt::join(p.sources, ","));
    fmt::print("patches_applied:    [{}]\n", fmt::join(p.patches_applied, ","));
    fmt::print("tzdb_version:       {}\n", p.versions.tzdb);
    fmt::print("boundary_version:   {}\n", p.versions.boundary);
    fmt::print("settlement_version: {}\n", p.versions.settlement);
    fmt::print("patch_version:      {}\n", p.versions.patch);
}

// -----------------------------------------------------------------
// Batch mode
// -----------------------------------------------------------------

struct BatchRow
{
    u32 line_number;
    std::optional<resolver::ResolveRequest> request;
    std::string parse_error;
};

std::optional<std::vector<BatchRow>> read_batch(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        MRD_CORE_ERROR("Batch: Failed to open file: {}", path);
        return std::nullopt;
    }

    std::vector<BatchRow> rows;
    std::string line;
    u32 line_number = 0;
    while (std::getline(file, line))
    {
        ++line_number;
        const std::string_view trimmed = core::Csv::trim(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.starts_with("local_datetime"))
        {
            continue;
        }

        BatchRow row{.line_number = line_number};
        const auto fields = core::Csv::split(trimmed);
        const auto lat = fields && fields->size() >= 4 ? core::Csv::parse_f64((*fields)[1]) : std::nullopt;
        const auto lon = fields && fields->size() >= 4 ? core::Csv::parse_f64((*fields)[2]) : std::nullopt;
        if (!fields || fields->size() < 4 || fields->size() > 6 || !lat || !lon)
        {
            row.parse_error = "expected local_datetime,latitude,longitude,parity_profile[,offset][,zone]";
            rows.push_back(std::move(row));
            continue;
        }

        resolver::ResolveRequest request{
            .local_datetime = (*fields)[0],
            .latitude       = *lat,
            .longitude      = *lon,
            .parity_profile = (*fields)[3],
        };
        if (fields->size() >= 5 && !(*fields)[4].empty())
        {
            const auto offset = core::Csv::parse_i64((*fields)[4]);
            if (!offset)
            {
                row.parse_error = fmt::format("unparsable offset '{}'", (*fields)[4]);
                rows.push_back(std::move(row));
                continue;
            }
            request.caller_offset_seconds = *offset;
        }
        if (fields->size() == 6 && !(*fields)[5].empty())
        {
            request.caller_zone = (*fields)[5];
        }

        row.request = std::move(request);
        rows.push_back(std::move(row));
    }
    return rows;
}

int run_batch(const resolver::Runtime& runtime, const std::string& path, unsigned thread_count)
{
    const auto rows = read_batch(path);
    if (!rows)
    {
        return kExitInvalidInput;
    }

    // One output slot per row; workers claim rows through a shared counter
    std::vector<std::string> output(rows->size());
    std::atomic<std::size_t> next{0};
    std::atomic<std::size_t> failures{0};

    const auto worker = [&] {
        for (std::size_t i = next.fetch_add(1); i < rows->size(); i = next.fetch_add(1))
        {
            const BatchRow& row = (*rows)[i];
            if (!row.request)
            {
                output[i] = fmt::format("{},error,,,,,,,{}", row.line_number,
                                        core::Csv::quote(row.parse_error));
                failures.fetch_add(1);
                continue;
            }

            const auto result = runtime.resolver().resolve(*row.request);
            if (!result.ok())
            {
                output[i] = fmt::format("{},error,,,,,,,{}", row.line_number,
                                        core::Csv::quote(result.status().message()));
                failures.fetch_add(1);
                continue;
            }

            std::vector<std::string_view> codes;
            for (const auto& warning : result->warnings)
            {
                codes.push_back(warning.code);
            }
            const std::string patches = fmt::format("{}", fmt::join(result->provenance.patches_applied, ";"));
            output[i] = fmt::format("{},ok,{},{},{},{},{},{},{}",
                                    row.line_number, result->utc, core::Csv::quote(result->zone_id),
                                    result->offset_seconds, result->dst_active,
                                    to_string(result->confidence),
                                    core::Csv::quote(patches), fmt::join(codes, ";"));
        }
    };

    thread_count = std::clamp<unsigned>(thread_count, 1, 64);
    {
        std::vector<std::jthread> workers;
        workers.reserve(thread_count);
        for (unsigned t = 0; t < thread_count; ++t)
        {
            workers.emplace_back(worker);
        }
    }

    fmt::print("line,status,utc,zone_id,offset_seconds,dst_active,confidence,patches_applied,warnings\n");
    for (const auto& line : output)
    {
        fmt::print("{}\n", line);
    }

    MRD_CORE_INFO("Batch: {} rows resolved, {} failed ({} threads)",
                  rows->size() - failures.load(), failures.load(), thread_count);

    return failures.load() == 0 ? kExitOk : kExitInvalidInput;
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    resolver::ResolveRequest request;
    std::optional<f64> latitude;
    std::optional<f64> longitude;
    std::string batch_path;
    unsigned thread_count = std::max(1u, std::thread::hardware_concurrency());
    bool health = false;

    enum LongOnly : int
    {
        kOptLat = 256,
        kOptLon,
        kOptHealth,
    };

    static struct option long_options[] = {
        // clang-format off
        {"datetime", required_argument, nullptr, 'd'},
        {"lat",      required_argument, nullptr, kOptLat},
        {"lon",      required_argument, nullptr, kOptLon},
        {"profile",  required_argument, nullptr, 'p'},
        {"offset",   required_argument, nullptr, 'o'},
        {"zone",     required_argument, nullptr, 'z'},
        {"batch",    required_argument, nullptr, 'b'},
        {"threads",  required_argument, nullptr, 'j'},
        {"health",   no_argument,       nullptr, kOptHealth},
        {"help",     no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
        // clang-format on
    };

    int option_index = 0;
    while (true)
    {
        const int arg = getopt_long(argc, argv, "d:p:o:z:b:j:h", long_options, &option_index);
        if (arg == -1)
        {
            break;
        }

        switch (arg)
        {
            case 'd':
                request.local_datetime = optarg;
                break;
            case kOptLat:
                latitude = core::Csv::parse_f64(optarg);
                if (!latitude)
                {
                    fmt::print(stderr, "Invalid --lat value: {}\n", optarg);
                    return kExitInvalidInput;
                }
                break;
            case kOptLon:
                longitude = core::Csv::parse_f64(optarg);
                if (!longitude)
                {
                    fmt::print(stderr, "Invalid --lon value: {}\n", optarg);
                    return kExitInvalidInput;
                }
                break;
            case 'p':
                request.parity_profile = optarg;
                break;
            case 'o':
            {
                const auto offset = core::Csv::parse_i64(optarg);
                if (!offset)
                {
                    fmt::print(stderr, "Invalid --offset value: {}\n", optarg);
                    return kExitInvalidInput;
                }
                request.caller_offset_seconds = *offset;
                break;
            }
            case 'z':
                request.caller_zone = std::string{optarg};
                break;
            case 'b':
                batch_path = optarg;
                break;
            case 'j':
            {
                const auto threads = core::Csv::parse_i64(optarg);
                if (!threads || *threads < 1)
                {
                    fmt::print(stderr, "Invalid --threads value: {}\n", optarg);
                    return kExitInvalidInput;
                }
                thread_count = static_cast<unsigned>(*threads);
                break;
            }
            case kOptHealth:
                health = true;
                break;
            case 'h':
                print_help(argv[0]);
                return kExitOk;
            default:
                print_help(argv[0]);
                return kExitInvalidInput;
        }
    }

    const bool single = !request.local_datetime.empty() || latitude || longitude;
    if (!health && batch_path.empty() && !single)
    {
        print_help(argv[0]);
        return kExitInvalidInput;
    }
    if (single && (request.local_datetime.empty() || !latitude || !longitude))
    {
        fmt::print(stderr, "--datetime, --lat and --lon are required together\n");
        return kExitInvalidInput;
    }

    // -----------------------------------------------------------------
    // Startup: configuration, logging, datasets
    // -----------------------------------------------------------------
    const auto config = resolver::ResolverConfig::from_environment();
    if (!config.ok())
    {
        fmt::print(stderr, "Configuration error: {}\n", config.status().message());
        return kExitStartupFailure;
    }

    core::Logger::init(config->log);

    const auto runtime = resolver::Runtime::create(*config);
    if (!runtime.ok())
    {
        MRD_CORE_CRITICAL("Startup failed: {}", runtime.status().message());
        core::Logger::shutdown();
        return kExitStartupFailure;
    }

    int exit_code = kExitOk;

    if (single)
    {
        request.latitude = *latitude;
        request.longitude = *longitude;

        const auto result = (*runtime)->resolver().resolve(request);
        if (result.ok())
        {
            print_result(*result);
        }
        else
        {
            fmt::print(stderr, "Invalid request: {}\n", result.status().message());
            exit_code = kExitInvalidInput;
        }
    }

    if (!batch_path.empty())
    {
        exit_code = std::max(exit_code, run_batch(**runtime, batch_path, thread_count));
    }

    if (health)
    {
        fmt::print("{}", resolver::format_health((*runtime)->health()));
    }

    core::Logger::shutdown();
    return exit_code;
}
