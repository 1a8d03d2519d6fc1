/// @file test_time_resolver.cpp
/// @brief End-to-end tests of the resolution pipeline against the bundled datasets.
///
/// Every test builds a Runtime from the sample data directory, so the
/// scenarios below exercise boundary lookup, fallback, patches, fold/gap
/// handling and result assembly together.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/logger.hpp"
#include "resolver/runtime.hpp"
#include "test_support.hpp"

#include <absl/status/status.h>
#include <absl/time/civil_time.h>

#include <memory>
#include <string>
#include <vector>

using namespace meridian;
using namespace meridian::resolver;
using meridian::test::TempCsvFile;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    core::Logger::init(core::LogConfig{.level = "warn"});
    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

namespace
{

std::unique_ptr<Runtime> make_runtime(bool cache_enabled = true)
{
    ResolverConfig config = ResolverConfig::defaults(MRD_DATA_DIR);
    config.cache_enabled = cache_enabled;
    auto runtime = Runtime::create(config);
    REQUIRE(runtime.ok());
    return std::move(*runtime);
}

ResolutionResult resolve(const Runtime& runtime, const ResolveRequest& request)
{
    auto result = runtime.resolver().resolve(request);
    REQUIRE(result.ok());
    return std::move(*result);
}

ResolveRequest request(std::string local, f64 lat, f64 lon, std::string profile = "strict_history")
{
    return ResolveRequest{
        .local_datetime = std::move(local),
        .latitude       = lat,
        .longitude      = lon,
        .parity_profile = std::move(profile),
    };
}

// Sample locations
constexpr f64 kFortKnoxLat = 37.89,     kFortKnoxLon = -85.96;
constexpr f64 kNewYorkLat = 40.7128,    kNewYorkLon = -74.006;
constexpr f64 kLexingtonLat = 38.04,    kLexingtonLon = -84.50;
constexpr f64 kMiamiLat = 25.7617,      kMiamiLon = -80.1918;
constexpr f64 kHonoluluLat = 21.3069,   kHonoluluLon = -157.8583;

} // anonymous namespace

// =================================================================
// Historical patches
// =================================================================

TEST_CASE("Wartime patch applies at Fort Knox in 1943")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("1943-06-15T14:30:00", kFortKnoxLat, kFortKnoxLon));

    CHECK(result.utc == "1943-06-15T19:30:00Z");
    CHECK(result.offset_seconds == -18000);
    CHECK(result.dst_active);
    CHECK(result.zone_id == "UTC-05:00");
    CHECK(result.confidence == Confidence::Medium);
    CHECK(result.provenance.patches_applied == std::vector<std::string>{"fort_knox_1943"});
    CHECK(result.provenance.sources == std::vector<std::string>{"boundary_index", "patch_registry"});
    CHECK(result.provenance.resolution_mode == "strict_history");
    CHECK(result.warnings.empty());
    REQUIRE_FALSE(result.notes.empty());
    CHECK(result.notes.front().starts_with("patch fort_knox_1943:"));
    CHECK(result.reason.find("fort_knox_1943") != std::string::npos);
}

TEST_CASE("Smaller box patch wins over the zone-wide patch")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("1950-12-01T12:00", kFortKnoxLat, kFortKnoxLon));

    CHECK(result.provenance.patches_applied == std::vector<std::string>{"kentucky_west_central_1946"});
    CHECK(result.zone_id == "America/Chicago");
    CHECK(result.offset_seconds == -21600);
    CHECK(result.utc == "1950-12-01T18:00:00Z");
    CHECK(result.confidence == Confidence::Medium);
    CHECK(result.provenance.sources ==
          std::vector<std::string>{"boundary_index", "patch_registry", "tzdb"});
}

TEST_CASE("Zone-wide patch applies its DST rule")
{
    const auto runtime = make_runtime();

    const ResolutionResult summer = resolve(*runtime, request("1950-07-01T12:00", kLexingtonLat, kLexingtonLon));
    CHECK(summer.provenance.patches_applied == std::vector<std::string>{"louisville_local_option_1946"});
    CHECK(summer.offset_seconds == -18000);
    CHECK(summer.dst_active);
    CHECK(summer.utc == "1950-07-01T17:00:00Z");
    CHECK(summer.confidence == Confidence::Low);

    const ResolutionResult winter = resolve(*runtime, request("1950-12-01T12:00", kLexingtonLat, kLexingtonLon));
    CHECK(winter.offset_seconds == -21600);
    CHECK_FALSE(winter.dst_active);
    CHECK(winter.utc == "1950-12-01T18:00:00Z");
}

TEST_CASE("Patch DST rule switches raise no gap or fold warning")
{
    const auto runtime = make_runtime();

    const ResolutionResult spring = resolve(*runtime, request("1950-04-30T00:30", kLexingtonLat, kLexingtonLon));
    CHECK(spring.provenance.patches_applied == std::vector<std::string>{"louisville_local_option_1946"});
    CHECK(spring.dst_active);
    CHECK(spring.utc == "1950-04-30T05:30:00Z");
    CHECK_FALSE(spring.has_warning(warning_codes::kNonExistentLocalTime));

    const ResolutionResult autumn = resolve(*runtime, request("1950-10-29T00:30", kLexingtonLat, kLexingtonLon));
    CHECK_FALSE(autumn.dst_active);
    CHECK(autumn.utc == "1950-10-29T06:30:00Z");
    CHECK_FALSE(autumn.has_warning(warning_codes::kAmbiguousLocalTime));
}

TEST_CASE("AstroCompat ignores patches")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime,
        request("1943-06-15T14:30", kFortKnoxLat, kFortKnoxLon, "astro_compat"));

    CHECK(result.provenance.patches_applied.empty());
    CHECK(result.zone_id == "America/Kentucky/Louisville");
    CHECK(result.confidence == Confidence::High);
    CHECK(result.provenance.sources == std::vector<std::string>{"boundary_index", "tzdb"});
    CHECK(result.provenance.fold_policy == "prefer_earlier_instant");
}

TEST_CASE("FutureCompat applies forward patches only")
{
    const auto runtime = make_runtime();

    const ResolutionResult historical = resolve(*runtime,
        request("1943-06-15T14:30", kFortKnoxLat, kFortKnoxLon, "future_compat"));
    CHECK(historical.provenance.patches_applied.empty());
    CHECK(historical.zone_id == "America/Kentucky/Louisville");

    const ResolutionResult forward = resolve(*runtime,
        request("2035-01-15T12:00", kMiamiLat, kMiamiLon, "future_compat"));
    CHECK(forward.provenance.patches_applied == std::vector<std::string>{"florida_permanent_dst"});
    CHECK(forward.utc == "2035-01-15T16:00:00Z");
    CHECK(forward.offset_seconds == -14400);
    CHECK(forward.confidence == Confidence::Low);

    const ResolutionResult astro = resolve(*runtime, request("2035-01-15T12:00", kMiamiLat, kMiamiLon, "astro_compat"));
    CHECK(astro.utc == "2035-01-15T17:00:00Z");
    CHECK(astro.zone_id == "America/New_York");
}

// =================================================================
// Gaps and folds
// =================================================================

TEST_CASE("Non-existent local time shifts forward by the gap")
{
    const auto runtime = make_runtime();

    for (const char* profile : {"strict_history", "astro_compat", "future_compat", "as_entered"})
    {
        CAPTURE(profile);
        const ResolutionResult result = resolve(*runtime,
            request("2023-03-12T02:30", kNewYorkLat, kNewYorkLon, profile));

        CHECK(result.utc == "2023-03-12T07:30:00Z");
        CHECK(result.offset_seconds == -14400);
        CHECK(result.has_warning(warning_codes::kNonExistentLocalTime));
        CHECK(result.confidence == Confidence::Low);
    }

    // One gap length after the same wall time read with the post-transition offset
    const ResolutionResult gap = resolve(*runtime, request("2023-03-12T02:30", kNewYorkLat, kNewYorkLon));
    const absl::Time post = absl::FromCivil(absl::CivilSecond(2023, 3, 12, 2, 30, 0), absl::FixedTimeZone(-14400));
    CHECK(gap.utc_instant - post == absl::Hours(1));
}

TEST_CASE("Ambiguous local time follows the profile's fold policy")
{
    const auto runtime = make_runtime();

    const ResolutionResult strict = resolve(*runtime, request("2023-11-05T01:30", kNewYorkLat, kNewYorkLon));
    CHECK(strict.utc == "2023-11-05T06:30:00Z");
    CHECK(strict.offset_seconds == -18000);
    CHECK_FALSE(strict.dst_active);
    CHECK(strict.has_warning(warning_codes::kAmbiguousLocalTime));
    CHECK(strict.confidence == Confidence::Low);

    const ResolutionResult astro = resolve(*runtime,
        request("2023-11-05T01:30", kNewYorkLat, kNewYorkLon, "astro_compat"));
    CHECK(astro.utc == "2023-11-05T05:30:00Z");
    CHECK(astro.offset_seconds == -14400);
    CHECK(astro.dst_active);
}

TEST_CASE("Configured fold policy overrides the default")
{
    ResolverConfig config = ResolverConfig::defaults(MRD_DATA_DIR);
    config.fold_policies.strict_history = time::FoldPolicy::PreferDaylightTime;
    const auto runtime = Runtime::create(config);
    REQUIRE(runtime.ok());

    const ResolutionResult result = resolve(**runtime, request("2023-11-05T01:30", kNewYorkLat, kNewYorkLon));
    CHECK(result.utc == "2023-11-05T05:30:00Z");
    CHECK(result.provenance.fold_policy == "prefer_daylight_time");
}

// =================================================================
// Fallback and confidence
// =================================================================

TEST_CASE("Coordinates outside every polygon use the nearest settlement")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("2023-06-01T12:00", kHonoluluLat, kHonoluluLon));

    CHECK(result.zone_id == "Pacific/Honolulu");
    CHECK(result.offset_seconds == -36000);
    CHECK(result.utc == "2023-06-01T22:00:00Z");
    CHECK(result.confidence == Confidence::Medium);
    CHECK(result.provenance.sources ==
          std::vector<std::string>{"boundary_index", "fallback_index", "patch_registry", "tzdb"});
    REQUIRE_FALSE(result.notes.empty());
    CHECK(result.notes.front().starts_with("nearest settlement: Honolulu"));
    CHECK_FALSE(result.has_warning(warning_codes::kDistantFallback));
}

TEST_CASE("Distant fallback is low confidence")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("2023-06-01T12:00", -50.0, -120.0));

    CHECK(result.confidence == Confidence::Low);
    CHECK(result.has_warning(warning_codes::kDistantFallback));
}

TEST_CASE("Confidence tiers are ordered")
{
    const auto runtime = make_runtime();
    const Confidence boundary = resolve(*runtime, request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon)).confidence;
    const Confidence fallback = resolve(*runtime, request("2023-06-01T12:00", kHonoluluLat, kHonoluluLon)).confidence;
    const Confidence fold = resolve(*runtime, request("2023-11-05T01:30", kNewYorkLat, kNewYorkLon)).confidence;

    CHECK(boundary == Confidence::High);
    CHECK(fallback == Confidence::Medium);
    CHECK(fold == Confidence::Low);
    CHECK(fold < fallback);
    CHECK(fallback < boundary);
}

// =================================================================
// AsEntered
// =================================================================

TEST_CASE("Caller offset is echoed verbatim")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("1990-01-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_offset_seconds = -18000;

    const ResolutionResult result = resolve(*runtime, req);
    CHECK(result.utc == "1990-01-01T17:00:00Z");
    CHECK(result.offset_seconds == -18000);
    CHECK(result.zone_id == "UTC-05:00");
    CHECK(result.confidence == Confidence::Low);
    CHECK(result.has_warning(warning_codes::kTrustedUserInput));
    CHECK(result.provenance.sources == std::vector<std::string>{"caller_input"});
    CHECK(result.provenance.resolution_mode == "as_entered");
}

TEST_CASE("Caller offset is used even inside a gap")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-03-12T02:30", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_offset_seconds = -18000;

    const ResolutionResult result = resolve(*runtime, req);
    CHECK(result.utc == "2023-03-12T07:30:00Z");
    CHECK_FALSE(result.has_warning(warning_codes::kNonExistentLocalTime));
}

TEST_CASE("Caller offset with an IANA zone takes the DST flag from the zone")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_offset_seconds = -14400;
    req.caller_zone = "America/New_York";

    const ResolutionResult summer = resolve(*runtime, req);
    CHECK(summer.utc == "2023-07-01T16:00:00Z");
    CHECK(summer.offset_seconds == -14400);
    CHECK(summer.dst_active);
    CHECK(summer.zone_id == "America/New_York");
    CHECK(summer.has_warning(warning_codes::kTrustedUserInput));
    CHECK_FALSE(summer.has_warning(warning_codes::kInvalidUserZone));

    req.local_datetime = "2023-01-15T12:00";
    req.caller_offset_seconds = -18000;
    const ResolutionResult winter = resolve(*runtime, req);
    CHECK(winter.utc == "2023-01-15T17:00:00Z");
    CHECK_FALSE(winter.dst_active);
}

TEST_CASE("Caller offset with an unknown zone reports the offset label")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_offset_seconds = -14400;

    for (const char* zone : {"Mars/Olympus_Mons", "EST,x"})
    {
        CAPTURE(zone);
        req.caller_zone = zone;

        const ResolutionResult result = resolve(*runtime, req);
        CHECK(result.zone_id == "UTC-04:00");
        CHECK(result.offset_seconds == -14400);
        CHECK(result.utc == "2023-07-01T16:00:00Z");
        CHECK_FALSE(result.dst_active);
        CHECK(result.has_warning(warning_codes::kInvalidUserZone));
        CHECK(result.has_warning(warning_codes::kTrustedUserInput));
    }
}

TEST_CASE("Caller offset with an abbreviation keeps the offset and names the abbreviation")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_offset_seconds = -14400;
    req.caller_zone = "EDT";

    const ResolutionResult result = resolve(*runtime, req);
    CHECK(result.zone_id == "EDT");
    CHECK(result.offset_seconds == -14400);
    CHECK(result.dst_active);
    CHECK_FALSE(result.has_warning(warning_codes::kInvalidUserZone));
}

TEST_CASE("Caller IANA zone is resolved and compared with the coordinate")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_zone = "America/Chicago";

    const ResolutionResult result = resolve(*runtime, req);
    CHECK(result.zone_id == "America/Chicago");
    CHECK(result.utc == "2023-07-01T17:00:00Z");
    CHECK(result.confidence == Confidence::Low);
    CHECK(result.has_warning(warning_codes::kTrustedUserInput));
    CHECK(result.has_warning(warning_codes::kUserZoneMismatch));

    req.caller_zone = "America/New_York";
    const ResolutionResult matching = resolve(*runtime, req);
    CHECK(matching.utc == "2023-07-01T16:00:00Z");
    CHECK_FALSE(matching.has_warning(warning_codes::kUserZoneMismatch));
}

TEST_CASE("Caller zone abbreviation maps to a fixed offset")
{
    const auto runtime = make_runtime();
    ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
    req.caller_zone = "EST";

    const ResolutionResult result = resolve(*runtime, req);
    CHECK(result.zone_id == "EST");
    CHECK(result.offset_seconds == -18000);
    CHECK(result.utc == "2023-07-01T17:00:00Z");
    CHECK(result.has_warning(warning_codes::kTrustedUserInput));
    CHECK(result.has_warning(warning_codes::kZoneAbbreviation));
}

TEST_CASE("Unknown caller zone falls through to the standard pipeline")
{
    const auto runtime = make_runtime();

    for (const char* zone : {"Mars/Olympus_Mons", "../../etc/passwd"})
    {
        CAPTURE(zone);
        ResolveRequest req = request("2023-07-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered");
        req.caller_zone = zone;

        const ResolutionResult result = resolve(*runtime, req);
        CHECK(result.has_warning(warning_codes::kInvalidUserZone));
        CHECK_FALSE(result.has_warning(warning_codes::kTrustedUserInput));
        CHECK(result.zone_id == "America/New_York");
        CHECK(result.utc == "2023-07-01T16:00:00Z");
        CHECK(result.provenance.resolution_mode == "as_entered");
    }
}

TEST_CASE("AsEntered without caller input behaves like StrictHistory")
{
    const auto runtime = make_runtime();
    const ResolutionResult entered = resolve(*runtime,
        request("1943-06-15T14:30", kFortKnoxLat, kFortKnoxLon, "as_entered"));
    const ResolutionResult strict = resolve(*runtime, request("1943-06-15T14:30", kFortKnoxLat, kFortKnoxLon));

    CHECK(entered.utc == strict.utc);
    CHECK(entered.zone_id == strict.zone_id);
    CHECK(entered.provenance.patches_applied == strict.provenance.patches_applied);
    CHECK(entered.confidence == strict.confidence);
    CHECK(entered.provenance.resolution_mode == "as_entered");
    CHECK(entered.notes.size() == strict.notes.size() + 1);
}

// =================================================================
// Invalid input
// =================================================================

TEST_CASE("Malformed requests are rejected")
{
    const auto runtime = make_runtime();

    std::vector<ResolveRequest> bad = {
        request("2023-02-30T10:00", kNewYorkLat, kNewYorkLon),
        request("not a date", kNewYorkLat, kNewYorkLon),
        request("2023-06-01T12:00+02:00", kNewYorkLat, kNewYorkLon),
        request("2023-06-01T12:00", 91.0, kNewYorkLon),
        request("2023-06-01T12:00", kNewYorkLat, -180.5),
        request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon, "lenient"),
    };
    bad.push_back(request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon, "as_entered"));
    bad.back().caller_offset_seconds = 70000;

    for (const auto& req : bad)
    {
        CAPTURE(req.local_datetime);
        CAPTURE(req.parity_profile);
        const auto result = runtime->resolver().resolve(req);
        REQUIRE_FALSE(result.ok());
        CHECK(result.status().code() == absl::StatusCode::kInvalidArgument);
    }

    // Nothing was looked up
    CHECK(runtime->health().cache.misses == 0);
}

// =================================================================
// Determinism and cache transparency
// =================================================================

TEST_CASE("Identical requests give identical results")
{
    const auto runtime = make_runtime();
    const ResolveRequest req = request("2023-11-05T01:30", kNewYorkLat, kNewYorkLon);
    CHECK(resolve(*runtime, req) == resolve(*runtime, req));
}

TEST_CASE("Results do not depend on the cache")
{
    const auto cached = make_runtime(true);
    const auto uncached = make_runtime(false);

    const std::vector<ResolveRequest> requests = {
        request("1943-06-15T14:30", kFortKnoxLat, kFortKnoxLon),
        request("1950-07-01T12:00", kLexingtonLat, kLexingtonLon),
        request("2023-03-12T02:30", kNewYorkLat, kNewYorkLon),
        request("2023-06-01T12:00", kHonoluluLat, kHonoluluLon),
        request("2023-06-01T12:00", 40.71284, -74.00601),
        request("2023-06-01T12:00", -50.0, -120.0),
    };

    for (int pass = 0; pass < 2; ++pass)
    {
        for (const auto& req : requests)
        {
            CAPTURE(req.local_datetime);
            CHECK(resolve(*cached, req) == resolve(*uncached, req));
        }
    }

    CHECK(cached->health().cache.hits > 0);
    CHECK_FALSE(uncached->health().cache_enabled);
}

TEST_CASE("Nearby coordinates in the same cache cell share a result")
{
    const auto runtime = make_runtime();
    CHECK(resolve(*runtime, request("2023-06-01T12:00", 40.71284, -74.00601)) ==
          resolve(*runtime, request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon)));
}

TEST_CASE("Request ids are stable hex digests")
{
    const ResolveRequest a = request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon);
    ResolveRequest b = a;
    b.parity_profile = "astro_compat";

    const std::string id = TimeResolver::request_id(a);
    CHECK(id.size() == 16);
    CHECK(id.find_first_not_of("0123456789abcdef") == std::string::npos);
    CHECK(id == TimeResolver::request_id(a));
    CHECK(id != TimeResolver::request_id(b));
}

// =================================================================
// Result formatting
// =================================================================

TEST_CASE("UTC rendering and Julian Date")
{
    const absl::Time j2000 = absl::FromCivil(absl::CivilSecond(2000, 1, 1, 12, 0, 0), absl::UTCTimeZone());
    CHECK(format_utc(j2000) == "2000-01-01T12:00:00Z");
    CHECK(to_julian_date(j2000) == doctest::Approx(2451545.0));
    CHECK(format_utc(j2000 + absl::Milliseconds(250)) == "2000-01-01T12:00:00.25Z");

    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("2000-01-01T07:00", kNewYorkLat, kNewYorkLon));
    CHECK(result.utc == "2000-01-01T12:00:00Z");
    CHECK(result.utc_julian_date == doctest::Approx(2451545.0));
}

// =================================================================
// Startup and health
// =================================================================

TEST_CASE("Health report reflects the loaded datasets")
{
    const auto runtime = make_runtime();
    const ResolutionResult result = resolve(*runtime, request("2023-06-01T12:00", kNewYorkLat, kNewYorkLon));

    const HealthReport report = runtime->health();
    CHECK(report.patch_count == 5);
    CHECK(report.polygon_count == 15);
    CHECK(report.settlement_count == 46);
    CHECK(report.zone_count >= 14);
    CHECK(report.cache_enabled);
    CHECK(report.cache.misses == 1);
    CHECK(report.cache.capacity == 1024);
    CHECK(report.versions == result.provenance.versions);
    CHECK(report.versions.patch.starts_with("patches-"));
    CHECK(report.versions.boundary == "unversioned");

    const std::string text = format_health(report);
    CHECK(text.starts_with("status: ok\n"));
    CHECK(text.find("patches: 5") != std::string::npos);
}

TEST_CASE("Missing or inconsistent datasets fail startup")
{
    SUBCASE("missing patch file")
    {
        ResolverConfig config = ResolverConfig::defaults(MRD_DATA_DIR);
        config.patch_file = "/nonexistent/meridian/patches.csv";
        const auto runtime = Runtime::create(config);
        REQUIRE_FALSE(runtime.ok());
        CHECK(runtime.status().code() == absl::StatusCode::kFailedPrecondition);
    }

    SUBCASE("settlement with an unknown zone")
    {
        const TempCsvFile settlements("meridian_bad_settlements.csv",
            "Name,Latitude,Longitude,ZoneId\n"
            "Atlantis,31.0,-24.0,Atlantic/Atlantis\n");
        ResolverConfig config = ResolverConfig::defaults(MRD_DATA_DIR);
        config.settlement_file = settlements.path();
        const auto runtime = Runtime::create(config);
        REQUIRE_FALSE(runtime.ok());
        CHECK(runtime.status().code() == absl::StatusCode::kFailedPrecondition);
    }
}
