/// @file settlement_loader.cpp
/// @brief Implementation of the settlement catalog loader.

#include "geo/settlement_loader.hpp"

#include "core/csv.hpp"
#include "core/logger.hpp"

namespace meridian::geo
{

// -----------------------------------------------------------------
// Load settlement CSV: Name,Latitude,Longitude,ZoneId
// -----------------------------------------------------------------

std::optional<std::vector<Settlement>> SettlementLoader::load_csv(const std::filesystem::path& path)
{
    const auto doc = core::Csv::read_file(path, {"Name", "Latitude", "Longitude", "ZoneId"},
                                          "SettlementLoader");
    if (!doc)
    {
        return std::nullopt;
    }

    std::vector<Settlement> settlements;
    settlements.reserve(doc->rows.size());

    for (const auto& row : doc->rows)
    {
        const auto lat = core::Csv::parse_f64(row.fields[1]);
        const auto lon = core::Csv::parse_f64(row.fields[2]);
        const auto location = (lat && lon) ? Coordinate::make(*lat, *lon) : std::optional<Coordinate>{};

        if (row.fields[0].empty() || row.fields[3].empty() || !location)
        {
            MRD_CORE_ERROR("SettlementLoader: Malformed line {} of {}", row.line_number, path.string());
            return std::nullopt;
        }

        settlements.push_back(Settlement{
            .name     = row.fields[0],
            .location = *location,
            .zone_id  = row.fields[3],
        });
    }

    if (settlements.empty())
    {
        MRD_CORE_ERROR("SettlementLoader: No settlements found in: {}", path.string());
        return std::nullopt;
    }

    MRD_CORE_INFO("SettlementLoader: Loaded {} settlements from {}", settlements.size(), path.string());

    return settlements;
}

} // namespace meridian::geo
