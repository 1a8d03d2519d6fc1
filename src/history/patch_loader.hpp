#pragma once

/// @file patch_loader.hpp
/// @brief Loads the historical patch dataset into a PatchRegistry.

#include "history/patch_registry.hpp"
#include "time/zone_database.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace meridian::history
{
    /// @brief Static utility class for loading historical patch files.
    class PatchLoader
    {
    public:
        PatchLoader() = delete;

        /// @brief Load a patch CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Id, RegionKind, Region, MinLat, MaxLat, MinLon, MaxLon,
        ///   ValidFrom, ValidTo, Effect, ZoneId, OffsetSeconds, DstRule,
        ///   Confidence, Scope, Reason, Sources
        ///
        /// - RegionKind "box": Region is a label, the four bounds are required.
        /// - RegionKind "zone": Region is a tz zone id, the bounds must be empty.
        /// - ValidFrom/ValidTo: local civil times (date-only means 00:00), half-open.
        /// - Effect "zone_override": ZoneId names the replacement zone.
        /// - Effect "fixed_offset": OffsetSeconds and DstRule are required,
        ///   ZoneId is an optional reported label.
        /// - Sources: ';'-separated references.
        ///
        /// Any malformed row fails the whole load; the offending line is logged.
        /// A file with only a header yields an empty registry.
        ///
        /// @param path Path to the CSV file.
        /// @param zones Database used to validate zone ids.
        [[nodiscard]] static std::optional<PatchRegistry> load_csv(const std::filesystem::path& path,
                                                                   const time::ZoneDatabase& zones);

        /// @brief Dataset version derived from file content: "patches-" + 8 hex digits.
        [[nodiscard]] static std::string content_version(std::string_view content);
    };

} // namespace meridian::history
