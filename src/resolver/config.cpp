/// @file config.cpp
/// @brief Environment-driven configuration.

#include "resolver/config.hpp"

#include "core/csv.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace meridian::resolver
{

namespace
{

std::string to_lower(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string to_upper(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

absl::Status bad_value(std::string_view name, std::string_view value, std::string_view expected)
{
    return absl::InvalidArgumentError(fmt::format("{}='{}' is invalid: expected {}", name, value, expected));
}

} // anonymous namespace

std::optional<bool> parse_bool(std::string_view text)
{
    const std::string value = to_lower(core::Csv::trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on")
    {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off")
    {
        return false;
    }
    return std::nullopt;
}

ResolverConfig ResolverConfig::defaults(const std::filesystem::path& data_dir)
{
    ResolverConfig config;
    config.patch_file = data_dir / "patches" / "patches_us_pre1967.csv";
    config.boundary_file = data_dir / "boundaries" / "zone_boundaries.csv";
    config.settlement_file = data_dir / "settlements" / "settlements.csv";
    return config;
}

absl::StatusOr<ResolverConfig> ResolverConfig::from_environment()
{
    return from_variables([](std::string_view name) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(name).c_str());
        if (value == nullptr)
        {
            return std::nullopt;
        }
        return std::string{value};
    });
}

// -----------------------------------------------------------------
// Overrides: unset or empty variables keep the default
// -----------------------------------------------------------------

absl::StatusOr<ResolverConfig> ResolverConfig::from_variables(const VariableLookup& lookup)
{
    ResolverConfig config = defaults();

    const auto get = [&lookup](std::string_view name) -> std::optional<std::string> {
        auto value = lookup(name);
        if (!value)
        {
            return std::nullopt;
        }
        const std::string_view trimmed = core::Csv::trim(*value);
        if (trimmed.empty())
        {
            return std::nullopt;
        }
        return std::string{trimmed};
    };

    if (auto v = get("RESOLVER_PATCH_FILE"))        config.patch_file = *v;
    if (auto v = get("RESOLVER_BOUNDARY_FILE"))     config.boundary_file = *v;
    if (auto v = get("RESOLVER_SETTLEMENT_FILE"))   config.settlement_file = *v;
    if (auto v = get("RESOLVER_BOUNDARY_VERSION"))  config.boundary_version = *v;
    if (auto v = get("RESOLVER_SETTLEMENT_VERSION")) config.settlement_version = *v;
    if (auto v = get("RESOLVER_TZDB_VERSION"))      config.tzdb_version = *v;
    if (auto v = get("RESOLVER_LOG_FILE"))          config.log.file = *v;

    if (auto v = get("RESOLVER_LOG_LEVEL"))
    {
        static constexpr std::string_view kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                                       "err", "error", "critical", "off"};
        const std::string level = to_lower(*v);
        if (std::find(std::begin(kLevels), std::end(kLevels), level) == std::end(kLevels))
        {
            return bad_value("RESOLVER_LOG_LEVEL", *v, "trace, debug, info, warn, err, critical or off");
        }
        config.log.level = level;
    }

    if (auto v = get("RESOLVER_CACHE_ENABLED"))
    {
        const auto enabled = parse_bool(*v);
        if (!enabled)
        {
            return bad_value("RESOLVER_CACHE_ENABLED", *v, "a boolean (1/0, true/false, yes/no, on/off)");
        }
        config.cache_enabled = *enabled;
    }

    if (auto v = get("RESOLVER_CACHE_CAPACITY"))
    {
        const auto capacity = core::Csv::parse_i64(*v);
        if (!capacity || *capacity < 0)
        {
            return bad_value("RESOLVER_CACHE_CAPACITY", *v, "a non-negative integer");
        }
        config.cache_capacity = static_cast<std::size_t>(*capacity);
    }

    if (auto v = get("RESOLVER_FALLBACK_MAX_KM"))
    {
        const auto km = core::Csv::parse_f64(*v);
        if (!km || *km < 0.0)
        {
            return bad_value("RESOLVER_FALLBACK_MAX_KM", *v, "a non-negative number of kilometres");
        }
        config.fallback_max_km = *km;
    }

    for (const ParityProfile profile : kAllProfiles)
    {
        const std::string name = "RESOLVER_FOLD_POLICY_" + to_upper(to_string(profile));
        if (auto v = get(name))
        {
            const auto policy = time::parse_fold_policy(to_lower(*v));
            if (!policy)
            {
                return bad_value(name, *v, "prefer_standard_time, prefer_daylight_time or prefer_earlier_instant");
            }
            config.fold_policies.policy_for(profile) = *policy;
        }
    }

    return config;
}

} // namespace meridian::resolver
