#pragma once

/// @file settlement_loader.hpp
/// @brief Loads the settlement catalog used by the fallback index.

#include "geo/settlement_index.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace meridian::geo
{
    /// @brief Static utility class for loading the settlement catalog.
    class SettlementLoader
    {
    public:
        SettlementLoader() = delete;

        /// @brief Load settlements from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Name, Latitude, Longitude, ZoneId
        ///
        /// Latitude/Longitude are WGS84 degrees. Names may be quoted.
        ///
        /// @param path Path to the CSV file.
        /// @return Settlements in file order, or std::nullopt on any malformed row.
        [[nodiscard]] static std::optional<std::vector<Settlement>>
            load_csv(const std::filesystem::path& path);
    };

} // namespace meridian::geo
