#pragma once

/// @file time_resolver.hpp
/// @brief Request validation and the local-time-to-UTC pipeline.

#include "history/patch_registry.hpp"
#include "resolver/parity_profile.hpp"
#include "resolver/result.hpp"
#include "resolver/result_assembler.hpp"
#include "resolver/zone_locator.hpp"
#include "time/zone_database.hpp"

#include <absl/status/statusor.h>

#include <optional>
#include <string>

namespace meridian::resolver
{
    /// @brief One resolution request as received from a caller.
    struct ResolveRequest
    {
        std::string local_datetime;             ///< Civil time, no offset
        f64 latitude = 0.0;
        f64 longitude = 0.0;
        std::string parity_profile = "strict_history";
        std::optional<i64> caller_offset_seconds;   ///< AsEntered only
        std::optional<std::string> caller_zone;     ///< AsEntered only (IANA name or abbreviation)
    };

    /// @brief Runs requests through locate -> patch -> disambiguate -> assemble.
    ///
    /// Thread-safe: every collaborator is read-only except the locator's cache,
    /// which synchronises internally.
    class TimeResolver
    {
    public:
        TimeResolver(const time::ZoneDatabase& zones,
                     const history::PatchRegistry& patches,
                     ZoneLocator& locator,
                     ParitySelector selector,
                     ResultAssembler assembler);

        /// @brief Resolve one request.
        /// @return The result, or InvalidArgument for malformed input (nothing looked up).
        [[nodiscard]] absl::StatusOr<ResolutionResult> resolve(const ResolveRequest& request) const;

        [[nodiscard]] const ParitySelector& selector() const { return m_selector; }
        [[nodiscard]] const ResultAssembler& assembler() const { return m_assembler; }

        /// @brief Stable hexadecimal id derived from the request fields.
        [[nodiscard]] static std::string request_id(const ResolveRequest& request);

    private:
        struct ValidatedRequest
        {
            time::LocalDateTime local;
            geo::Coordinate coordinate;
            ParityProfile profile;
        };

        [[nodiscard]] static absl::StatusOr<ValidatedRequest> validate(const ResolveRequest& request);

        /// Boundary/fallback, patches, tz rules. Fills trace.
        [[nodiscard]] absl::Status run_standard(const ValidatedRequest& request, PipelineTrace& trace) const;

        /// AsEntered trust path. Returns false when no usable caller input was given.
        [[nodiscard]] absl::StatusOr<bool> run_trusted(const ValidatedRequest& validated,
                                                       const ResolveRequest& request,
                                                       PipelineTrace& trace) const;

        const time::ZoneDatabase& m_zones;
        const history::PatchRegistry& m_patches;
        ZoneLocator& m_locator;
        ParitySelector m_selector;
        ResultAssembler m_assembler;
    };

} // namespace meridian::resolver
