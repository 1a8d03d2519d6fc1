#pragma once

/// @file boundary_loader.hpp
/// @brief Loads the zone boundary polygon dataset.

#include "geo/zone_boundary_index.hpp"

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace meridian::geo
{
    /// @brief Static utility class for loading zone boundary polygons.
    class BoundaryLoader
    {
    public:
        BoundaryLoader() = delete;

        /// @brief Load polygons from a boundary CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   ZoneId, Rings
        ///
        /// Rings holds one or more rings separated by '|'. The first ring is the
        /// outer boundary, the rest are holes. Each ring is a ';'-separated list
        /// of "lat lon" vertex pairs in degrees, at least three distinct
        /// vertices. A closing vertex equal to the first one is dropped.
        ///
        /// Any malformed row fails the whole load: a partial boundary dataset
        /// would silently change which zone a coordinate resolves to.
        ///
        /// @param path Path to the CSV file.
        /// @return Polygons in file order, or std::nullopt on failure.
        [[nodiscard]] static std::optional<std::vector<ZonePolygon>>
            load_csv(const std::filesystem::path& path);

        /// @brief Parse the Rings column of one record.
        /// @return The rings, or std::nullopt if any vertex or ring is invalid.
        [[nodiscard]] static std::optional<std::vector<std::vector<Vec2d>>>
            parse_rings(std::string_view text);
    };

} // namespace meridian::geo
