/// @file patch.cpp
/// @brief Patch region tests and scope names.

#include "history/patch.hpp"

namespace meridian::history
{

std::string_view to_string(PatchScope scope)
{
    switch (scope)
    {
        case PatchScope::Historical: return "historical";
        case PatchScope::Forward:    return "forward";
    }
    return "historical";
}

std::optional<PatchScope> parse_patch_scope(std::string_view text)
{
    if (text == "historical")
    {
        return PatchScope::Historical;
    }
    if (text == "forward")
    {
        return PatchScope::Forward;
    }
    return std::nullopt;
}

bool Patch::covers(const geo::Coordinate& coordinate, std::string_view base_zone_id) const
{
    if (const auto* box = std::get_if<BoxRegion>(&region))
    {
        return box->box.contains(coordinate);
    }
    return std::get<NamedZoneRegion>(region).zone_id == base_zone_id;
}

} // namespace meridian::history
