/// @file patch_loader.cpp
/// @brief Implementation of the strict historical patch loader.

#include "history/patch_loader.hpp"

#include "core/csv.hpp"
#include "core/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstdlib>
#include <set>

namespace meridian::history
{

namespace
{

constexpr std::string_view kWhat = "PatchLoader";

// Column layout
enum Column : std::size_t
{
    kId,
    kRegionKind,
    kRegion,
    kMinLat,
    kMaxLat,
    kMinLon,
    kMaxLon,
    kValidFrom,
    kValidTo,
    kEffect,
    kZoneId,
    kOffsetSeconds,
    kDstRule,
    kConfidence,
    kScope,
    kReason,
    kSources,
};

std::vector<std::string> split_sources(std::string_view text)
{
    std::vector<std::string> sources;
    std::size_t start = 0;
    while (start <= text.size())
    {
        const std::size_t pos = std::min(text.find(';', start), text.size());
        const std::string_view part = core::Csv::trim(text.substr(start, pos - start));
        if (!part.empty())
        {
            sources.emplace_back(part);
        }
        start = pos + 1;
    }
    return sources;
}

/// Parses one data row; returns an error description on failure.
std::variant<Patch, std::string> parse_row(const core::CsvRow& row, const time::ZoneDatabase& zones)
{
    const auto& f = row.fields;

    Patch patch{
        .id          = f[kId],
        .region      = NamedZoneRegion{},
        .valid_from  = {},
        .valid_to    = {},
        .effect      = ZoneOverride{},
        .confidence  = Confidence::Medium,
        .scope       = PatchScope::Historical,
        .reason      = f[kReason],
        .sources     = split_sources(f[kSources]),
    };

    if (patch.id.empty())
    {
        return std::string{"empty patch id"};
    }

    // ---- Region ----
    const bool bounds_empty = f[kMinLat].empty() && f[kMaxLat].empty() &&
                              f[kMinLon].empty() && f[kMaxLon].empty();
    if (f[kRegionKind] == "box")
    {
        const auto min_lat = core::Csv::parse_f64(f[kMinLat]);
        const auto max_lat = core::Csv::parse_f64(f[kMaxLat]);
        const auto min_lon = core::Csv::parse_f64(f[kMinLon]);
        const auto max_lon = core::Csv::parse_f64(f[kMaxLon]);
        if (!min_lat || !max_lat || !min_lon || !max_lon)
        {
            return std::string{"unparsable bounding box"};
        }

        const geo::BoundingBox box{
            .min_lat = *min_lat,
            .max_lat = *max_lat,
            .min_lon = *min_lon,
            .max_lon = *max_lon,
        };
        if (!box.is_valid())
        {
            return std::string{"bounding box out of range or inverted"};
        }
        patch.region = BoxRegion{.box = box, .label = f[kRegion]};
    }
    else if (f[kRegionKind] == "zone")
    {
        if (!bounds_empty)
        {
            return std::string{"zone region must not carry bounds"};
        }
        if (!zones.find(f[kRegion]))
        {
            return fmt::format("unknown region zone id '{}'", f[kRegion]);
        }
        patch.region = NamedZoneRegion{.zone_id = f[kRegion]};
    }
    else
    {
        return fmt::format("unknown region kind '{}'", f[kRegionKind]);
    }

    // ---- Validity interval ----
    const auto valid_from = time::parse_local_datetime(f[kValidFrom], true);
    const auto valid_to = time::parse_local_datetime(f[kValidTo], true);
    if (!valid_from || !valid_to)
    {
        return std::string{"unparsable validity interval"};
    }
    if (!(*valid_from < *valid_to))
    {
        return std::string{"empty or inverted validity interval"};
    }
    patch.valid_from = *valid_from;
    patch.valid_to = *valid_to;

    // ---- Effect ----
    if (f[kEffect] == "zone_override")
    {
        if (!f[kOffsetSeconds].empty() || !f[kDstRule].empty())
        {
            return std::string{"zone_override must not carry an offset or DST rule"};
        }
        if (!zones.find(f[kZoneId]))
        {
            return fmt::format("unknown override zone id '{}'", f[kZoneId]);
        }
        patch.effect = ZoneOverride{.zone_id = f[kZoneId]};
    }
    else if (f[kEffect] == "fixed_offset")
    {
        const auto offset = core::Csv::parse_i64(f[kOffsetSeconds]);
        if (!offset || std::llabs(*offset) > time_constants::kMaxOffsetSeconds)
        {
            return std::string{"missing or out-of-range offset"};
        }
        const auto rule = parse_dst_rule(f[kDstRule]);
        if (!rule)
        {
            return fmt::format("unknown DST rule '{}'", f[kDstRule]);
        }
        patch.effect = FixedOffsetOverride{
            .offset_seconds = static_cast<i32>(*offset),
            .dst_rule       = *rule,
            .zone_label     = f[kZoneId],
        };
    }
    else
    {
        return fmt::format("unknown effect '{}'", f[kEffect]);
    }

    // ---- Metadata ----
    const auto confidence = parse_confidence(f[kConfidence]);
    if (!confidence)
    {
        return fmt::format("unknown confidence '{}'", f[kConfidence]);
    }
    patch.confidence = *confidence;

    const auto scope = parse_patch_scope(f[kScope]);
    if (!scope)
    {
        return fmt::format("unknown scope '{}'", f[kScope]);
    }
    patch.scope = *scope;

    return patch;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load patch CSV
// -----------------------------------------------------------------

std::optional<PatchRegistry> PatchLoader::load_csv(const std::filesystem::path& path,
                                                   const time::ZoneDatabase& zones)
{
    const auto doc = core::Csv::read_file(
        path,
        {"Id", "RegionKind", "Region", "MinLat", "MaxLat", "MinLon", "MaxLon",
         "ValidFrom", "ValidTo", "Effect", "ZoneId", "OffsetSeconds", "DstRule",
         "Confidence", "Scope", "Reason", "Sources"},
        kWhat);
    if (!doc)
    {
        return std::nullopt;
    }

    std::vector<Patch> patches;
    patches.reserve(doc->rows.size());
    std::set<std::string, std::less<>> ids;

    for (const auto& row : doc->rows)
    {
        auto parsed = parse_row(row, zones);
        if (const auto* error = std::get_if<std::string>(&parsed))
        {
            MRD_CORE_ERROR("{}: Line {} of {}: {}", kWhat, row.line_number, path.string(), *error);
            return std::nullopt;
        }

        Patch& patch = std::get<Patch>(parsed);
        if (!ids.insert(patch.id).second)
        {
            MRD_CORE_ERROR("{}: Line {} of {}: duplicate patch id '{}'",
                           kWhat, row.line_number, path.string(), patch.id);
            return std::nullopt;
        }
        patches.push_back(std::move(patch));
    }

    if (patches.empty())
    {
        MRD_CORE_WARN("{}: No patches in {}; historical overrides disabled", kWhat, path.string());
    }

    MRD_CORE_INFO("{}: Loaded {} patches from {}", kWhat, patches.size(), path.string());

    return PatchRegistry(std::move(patches), content_version(doc->content));
}

std::string PatchLoader::content_version(std::string_view content)
{
    const u64 hash = core::fnv1a_64(content);
    return fmt::format("patches-{:08x}", static_cast<u32>(hash >> 32));
}

} // namespace meridian::history
