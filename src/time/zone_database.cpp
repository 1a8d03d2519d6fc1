/// @file zone_database.cpp
/// @brief Implementation of tz database access, aliases and version detection.

#include "time/zone_database.hpp"

#include "core/csv.hpp"
#include "core/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace meridian::time
{

namespace
{

// Renamed zones: either spelling resolves with any tzdata release
constexpr std::array<std::pair<std::string_view, std::string_view>, 2> kAliases = {{
    {"Europe/Kyiv", "Europe/Kiev"},
    {"Europe/Kiev", "Europe/Kyiv"},
}};

constexpr std::array<ZoneAbbreviation, 8> kAbbreviations = {{
    {"EST", -5 * 3600, false},
    {"EDT", -4 * 3600, true},
    {"CST", -6 * 3600, false},
    {"CDT", -5 * 3600, true},
    {"MST", -7 * 3600, false},
    {"MDT", -6 * 3600, true},
    {"PST", -8 * 3600, false},
    {"PDT", -7 * 3600, true},
}};

// Zone names are paths into the zoneinfo tree; refuse anything that could escape it
bool is_safe_zone_name(std::string_view name)
{
    return !name.empty() && name.front() != '/' &&
           name.find("..") == std::string_view::npos &&
           std::all_of(name.begin(), name.end(), [](char c) {
               return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
                      c == '/' || c == '_' || c == '-' || c == '+';
           });
}

} // anonymous namespace

ZoneDatabase::ZoneDatabase(std::string version)
    : m_version{std::move(version)}
{
}

std::optional<absl::TimeZone> ZoneDatabase::load(std::string_view name)
{
    if (!is_safe_zone_name(name))
    {
        return std::nullopt;
    }

    absl::TimeZone tz;
    if (absl::LoadTimeZone(name, &tz))
    {
        return tz;
    }

    for (const auto& [from, to] : kAliases)
    {
        if (name == from && absl::LoadTimeZone(to, &tz))
        {
            return tz;
        }
    }

    return std::nullopt;
}

std::optional<absl::TimeZone> ZoneDatabase::find(std::string_view name) const
{
    if (const auto it = m_zones.find(name); it != m_zones.end())
    {
        return it->second;
    }
    return load(name);
}

std::vector<std::string> ZoneDatabase::preload(const std::vector<std::string>& names)
{
    std::vector<std::string> missing;
    for (const std::string& name : names)
    {
        if (m_zones.contains(name))
        {
            continue;
        }

        if (auto tz = load(name))
        {
            m_zones.emplace(name, *tz);
        }
        else
        {
            missing.push_back(name);
        }
    }

    MRD_CORE_DEBUG("ZoneDatabase: {} zones preloaded ({} unknown)", m_zones.size(), missing.size());

    return missing;
}

// -----------------------------------------------------------------
// tzdata version: "# version 2025b" on the first line of tzdata.zi
// -----------------------------------------------------------------

std::string ZoneDatabase::detect_version(const std::filesystem::path& zoneinfo_dir)
{
    std::ifstream file(zoneinfo_dir / "tzdata.zi");
    if (!file.is_open())
    {
        return std::string{kUnknownVersion};
    }

    std::string line;
    if (!std::getline(file, line))
    {
        return std::string{kUnknownVersion};
    }

    constexpr std::string_view kPrefix = "# version ";
    const std::string_view view = core::Csv::trim(line);
    if (!view.starts_with(kPrefix))
    {
        return std::string{kUnknownVersion};
    }

    const std::string_view version = core::Csv::trim(view.substr(kPrefix.size()));
    return version.empty() ? std::string{kUnknownVersion} : std::string{version};
}

std::optional<ZoneAbbreviation> ZoneDatabase::find_abbreviation(std::string_view name)
{
    for (const ZoneAbbreviation& abbreviation : kAbbreviations)
    {
        if (name.size() == abbreviation.name.size() &&
            std::equal(name.begin(), name.end(), abbreviation.name.begin(), [](char a, char b) {
                return std::toupper(static_cast<unsigned char>(a)) == b;
            }))
        {
            return abbreviation;
        }
    }
    return std::nullopt;
}

// -----------------------------------------------------------------
// Offset formatting
// -----------------------------------------------------------------

std::string format_offset(i32 offset_seconds)
{
    const char sign = offset_seconds < 0 ? '-' : '+';
    const i32 magnitude = std::abs(offset_seconds);
    const i32 hours = magnitude / 3600;
    const i32 minutes = (magnitude % 3600) / 60;
    const i32 seconds = magnitude % 60;

    if (seconds != 0)
    {
        return fmt::format("{}{:02d}:{:02d}:{:02d}", sign, hours, minutes, seconds);
    }
    return fmt::format("{}{:02d}:{:02d}", sign, hours, minutes);
}

std::string fixed_offset_label(i32 offset_seconds)
{
    return "UTC" + format_offset(offset_seconds);
}

} // namespace meridian::time
