#pragma once

/// @file result_assembler.hpp
/// @brief Confidence grading and provenance assembly.

#include "history/patch.hpp"
#include "resolver/parity_profile.hpp"
#include "resolver/result.hpp"
#include "resolver/zone_locator.hpp"
#include "time/ambiguity_resolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace meridian::resolver
{
    /// @brief Which caller input, if any, was taken as authoritative.
    enum class CallerTrust : u8
    {
        None,
        Offset,
        Zone,
    };

    /// @brief What the pipeline did for one request, collected step by step.
    struct PipelineTrace
    {
        PipelinePlan plan;
        std::optional<ZoneLookup> lookup;           ///< Empty when location was skipped
        const history::Patch* patch = nullptr;      ///< Applied patch, if any
        bool patches_consulted = false;
        bool tzdb_used = false;
        CallerTrust caller_trust = CallerTrust::None;
        std::string zone_id;                        ///< Zone reported in the result
        time::LocalResolution resolution;
        std::vector<std::string> notes;
        std::vector<Warning> warnings;              ///< Warnings raised before assembly
    };

    /// @brief Turns a pipeline trace into an immutable ResolutionResult.
    ///
    /// Confidence starts at High and only ever goes down; the lowest applicable
    /// tier wins:
    /// - fallback index used: Medium (Low beyond the distant-fallback threshold)
    /// - patch applied: Medium, capped by the patch's own confidence
    /// - fold or gap: Low
    /// - caller input trusted: Low
    class ResultAssembler
    {
    public:
        static constexpr f64 kDefaultFallbackMaxKm = 500.0;

        ResultAssembler(DatasetVersions versions, f64 fallback_max_km = kDefaultFallbackMaxKm);

        [[nodiscard]] ResolutionResult assemble(PipelineTrace trace) const;

        [[nodiscard]] const DatasetVersions& versions() const { return m_versions; }
        [[nodiscard]] f64 fallback_max_km() const { return m_fallback_max_km; }

    private:
        [[nodiscard]] static std::string summarize(const PipelineTrace& trace);

        DatasetVersions m_versions;
        f64 m_fallback_max_km;
    };

} // namespace meridian::resolver
