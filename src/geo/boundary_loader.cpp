/// @file boundary_loader.cpp
/// @brief Implementation of the zone boundary CSV loader.

#include "geo/boundary_loader.hpp"

#include "core/csv.hpp"
#include "core/logger.hpp"

#include <string>

namespace meridian::geo
{

namespace
{

constexpr std::string_view kWhat = "BoundaryLoader";

std::vector<std::string_view> split_on(std::string_view text, char delimiter)
{
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t pos = text.find(delimiter, start);
        parts.push_back(core::Csv::trim(text.substr(start, pos - start)));
        if (pos == std::string_view::npos)
        {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load boundary CSV: ZoneId,Rings
// -----------------------------------------------------------------

std::optional<std::vector<ZonePolygon>> BoundaryLoader::load_csv(const std::filesystem::path& path)
{
    const auto doc = core::Csv::read_file(path, {"ZoneId", "Rings"}, kWhat);
    if (!doc)
    {
        return std::nullopt;
    }

    std::vector<ZonePolygon> polygons;
    polygons.reserve(doc->rows.size());

    for (const auto& row : doc->rows)
    {
        const std::string& zone_id = row.fields[0];
        if (zone_id.empty())
        {
            MRD_CORE_ERROR("{}: Empty zone id on line {} of {}", kWhat, row.line_number, path.string());
            return std::nullopt;
        }

        auto rings = parse_rings(row.fields[1]);
        if (!rings)
        {
            MRD_CORE_ERROR("{}: Invalid ring geometry for {} on line {} of {}",
                           kWhat, zone_id, row.line_number, path.string());
            return std::nullopt;
        }

        polygons.push_back(ZonePolygon{
            .zone_id = zone_id,
            .rings   = std::move(*rings),
            .bounds  = {},
        });
    }

    if (polygons.empty())
    {
        MRD_CORE_ERROR("{}: No polygons found in: {}", kWhat, path.string());
        return std::nullopt;
    }

    MRD_CORE_INFO("{}: Loaded {} polygons from {}", kWhat, polygons.size(), path.string());

    return polygons;
}

// -----------------------------------------------------------------
// Parse "lat lon;lat lon;...|lat lon;..."
// -----------------------------------------------------------------

std::optional<std::vector<std::vector<Vec2d>>> BoundaryLoader::parse_rings(std::string_view text)
{
    std::vector<std::vector<Vec2d>> rings;

    for (const std::string_view ring_text : split_on(text, '|'))
    {
        std::vector<Vec2d> ring;

        for (const std::string_view vertex_text : split_on(ring_text, ';'))
        {
            const std::size_t space = vertex_text.find_first_of(" \t");
            if (space == std::string_view::npos)
            {
                return std::nullopt;
            }

            const auto lat = core::Csv::parse_f64(vertex_text.substr(0, space));
            const auto lon = core::Csv::parse_f64(vertex_text.substr(space + 1));
            if (!lat || !lon || !is_valid_latitude(*lat) || !is_valid_longitude(*lon))
            {
                return std::nullopt;
            }

            ring.emplace_back(*lon, *lat);
        }

        if (ring.size() > 1 && ring.front() == ring.back())
        {
            ring.pop_back();
        }

        if (ring.size() < 3)
        {
            return std::nullopt;
        }

        rings.push_back(std::move(ring));
    }

    return rings;
}

} // namespace meridian::geo
