/// @file result_assembler.cpp
/// @brief Implementation of confidence grading and provenance assembly.

#include "resolver/result_assembler.hpp"

#include "time/zone_database.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace meridian::resolver
{

ResultAssembler::ResultAssembler(DatasetVersions versions, f64 fallback_max_km)
    : m_versions{std::move(versions)}
    , m_fallback_max_km{fallback_max_km}
{
}

ResolutionResult ResultAssembler::assemble(PipelineTrace trace) const
{
    Confidence confidence = Confidence::High;
    std::vector<Warning> warnings = std::move(trace.warnings);
    std::vector<std::string> notes;
    std::vector<std::string> used;

    // ---- Location ----
    if (trace.lookup)
    {
        used.emplace_back(sources::kBoundaryIndex);

        if (trace.lookup->source == ZoneSource::Fallback)
        {
            used.emplace_back(sources::kFallbackIndex);
            confidence = min_confidence(confidence, Confidence::Medium);
            notes.push_back(fmt::format("nearest settlement: {} ({:.1f} km, zone {})",
                                        trace.lookup->settlement, trace.lookup->distance_km,
                                        trace.lookup->zone_id));

            if (trace.lookup->distance_km > m_fallback_max_km)
            {
                confidence = Confidence::Low;
                warnings.push_back(Warning{
                    .code    = std::string{warning_codes::kDistantFallback},
                    .message = fmt::format("nearest settlement {} is {:.1f} km away (limit {:.0f} km)",
                                           trace.lookup->settlement, trace.lookup->distance_km,
                                           m_fallback_max_km),
                });
            }
        }
    }

    // ---- Patches ----
    std::vector<std::string> patches_applied;
    if (trace.patches_consulted)
    {
        used.emplace_back(sources::kPatchRegistry);
    }
    if (trace.patch)
    {
        confidence = min_confidence(confidence, min_confidence(Confidence::Medium, trace.patch->confidence));
        patches_applied.push_back(trace.patch->id);

        std::string note = fmt::format("patch {}: {}", trace.patch->id, trace.patch->reason);
        if (!trace.patch->sources.empty())
        {
            note += fmt::format(" (sources: {})", fmt::join(trace.patch->sources, "; "));
        }
        notes.push_back(std::move(note));
    }

    if (trace.tzdb_used)
    {
        used.emplace_back(sources::kTzdb);
    }

    // ---- Caller input ----
    if (trace.caller_trust != CallerTrust::None)
    {
        used.emplace_back(sources::kCallerInput);
        confidence = Confidence::Low;
    }

    // ---- Fold / gap ----
    if (trace.resolution.warning)
    {
        confidence = Confidence::Low;
        warnings.push_back(*trace.resolution.warning);
    }

    for (std::string& note : trace.notes)
    {
        notes.push_back(std::move(note));
    }

    std::string reason = summarize(trace);

    return ResolutionResult{
        .utc_instant     = trace.resolution.utc,
        .utc             = format_utc(trace.resolution.utc),
        .utc_julian_date = to_julian_date(trace.resolution.utc),
        .zone_id         = std::move(trace.zone_id),
        .offset_seconds  = trace.resolution.offset_seconds,
        .dst_active      = trace.resolution.dst_active,
        .confidence      = confidence,
        .reason          = std::move(reason),
        .notes           = std::move(notes),
        .warnings        = std::move(warnings),
        .provenance      = Provenance{
            .versions        = m_versions,
            .sources         = std::move(used),
            .resolution_mode = std::string{to_string(trace.plan.profile)},
            .fold_policy     = std::string{time::to_string(trace.plan.fold_policy)},
            .patches_applied = std::move(patches_applied),
        },
    };
}

// -----------------------------------------------------------------
// One-line human summary
// -----------------------------------------------------------------

std::string ResultAssembler::summarize(const PipelineTrace& trace)
{
    const std::string offset = time::fixed_offset_label(trace.resolution.offset_seconds);

    if (trace.caller_trust == CallerTrust::Offset)
    {
        return fmt::format("caller-supplied offset {} used as entered", offset);
    }
    if (trace.caller_trust == CallerTrust::Zone)
    {
        return fmt::format("caller-supplied zone {} used as entered ({})", trace.zone_id, offset);
    }
    if (trace.patch)
    {
        return fmt::format("historical patch {} applied: {} ({})", trace.patch->id, trace.zone_id, offset);
    }
    if (trace.lookup && trace.lookup->source == ZoneSource::Fallback)
    {
        return fmt::format("nearest settlement {} places the coordinate in {} ({})",
                           trace.lookup->settlement, trace.zone_id, offset);
    }
    return fmt::format("coordinate lies within {} ({})", trace.zone_id, offset);
}

} // namespace meridian::resolver
