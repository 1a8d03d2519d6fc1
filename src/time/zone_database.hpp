#pragma once

/// @file zone_database.hpp
/// @brief Access to the IANA tz database through absl::TimeZone.

#include "core/types.hpp"

#include <absl/time/time.h>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::time
{
    /// @brief Fixed-offset zone abbreviation accepted from callers (e.g. "EST").
    struct ZoneAbbreviation
    {
        std::string_view name;
        i32 offset_seconds;
        bool dst_active;
    };

    /// @brief Read-only handle on the tz database.
    ///
    /// Zones named by the loaded datasets are preloaded with preload() during
    /// startup; find() serves those from memory and loads any other name on
    /// demand (absl caches loaded zones process-wide and is thread-safe).
    /// "Europe/Kyiv" and "Europe/Kiev" are accepted interchangeably so that
    /// both older and newer tzdata releases work.
    class ZoneDatabase
    {
    public:
        static constexpr std::string_view kDefaultZoneinfoDir = "/usr/share/zoneinfo";
        static constexpr std::string_view kUnknownVersion = "system-tzdb";

        explicit ZoneDatabase(std::string version);

        /// @brief Load a named zone.
        /// @return The zone, or std::nullopt if the name is not in the database.
        [[nodiscard]] std::optional<absl::TimeZone> find(std::string_view name) const;

        /// @brief Load and pin every zone in the list.
        /// @return Names that could not be loaded (empty on success).
        [[nodiscard]] std::vector<std::string> preload(const std::vector<std::string>& names);

        [[nodiscard]] const std::string& version() const { return m_version; }
        [[nodiscard]] std::size_t preloaded_count() const { return m_zones.size(); }

        /// @brief Version of the installed tzdata (first line of tzdata.zi, "# version 2025b").
        /// @return The version string, or kUnknownVersion if it cannot be determined.
        [[nodiscard]] static std::string detect_version(
            const std::filesystem::path& zoneinfo_dir = std::filesystem::path{kDefaultZoneinfoDir});

        /// @brief Look up a North American zone abbreviation (EST, EDT, CST, ...), case-insensitive.
        [[nodiscard]] static std::optional<ZoneAbbreviation> find_abbreviation(std::string_view name);

    private:
        [[nodiscard]] static std::optional<absl::TimeZone> load(std::string_view name);

        std::string m_version;
        std::map<std::string, absl::TimeZone, std::less<>> m_zones;
    };

    /// @brief Render an offset as "+hh:mm" / "-hh:mm" (seconds appended when non-zero).
    [[nodiscard]] std::string format_offset(i32 offset_seconds);

    /// @brief Label for an anonymous fixed offset, e.g. "UTC-05:00".
    [[nodiscard]] std::string fixed_offset_label(i32 offset_seconds);

} // namespace meridian::time
