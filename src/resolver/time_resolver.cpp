/// @file time_resolver.cpp
/// @brief Implementation of request validation, pipeline orchestration and audit logging.

#include "resolver/time_resolver.hpp"

#include "core/csv.hpp"
#include "core/logger.hpp"

#include <absl/status/status.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <variant>

namespace meridian::resolver
{

namespace
{

Warning make_warning(std::string_view code, std::string message)
{
    return Warning{.code = std::string{code}, .message = std::move(message)};
}

// Overload set for std::visit
template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

TimeResolver::TimeResolver(const time::ZoneDatabase& zones,
                           const history::PatchRegistry& patches,
                           ZoneLocator& locator,
                           ParitySelector selector,
                           ResultAssembler assembler)
    : m_zones{zones}
    , m_patches{patches}
    , m_locator{locator}
    , m_selector{selector}
    , m_assembler{std::move(assembler)}
{
}

// -----------------------------------------------------------------
// Validation: everything is checked before any lookup
// -----------------------------------------------------------------

absl::StatusOr<TimeResolver::ValidatedRequest> TimeResolver::validate(const ResolveRequest& request)
{
    const auto local = time::parse_local_datetime(core::Csv::trim(request.local_datetime));
    if (!local)
    {
        return absl::InvalidArgumentError(fmt::format(
            "invalid local_datetime '{}': expected YYYY-MM-DDTHH:MM[:SS[.fff]] without an offset",
            request.local_datetime));
    }

    const auto coordinate = geo::Coordinate::make(request.latitude, request.longitude);
    if (!coordinate)
    {
        return absl::InvalidArgumentError(fmt::format(
            "coordinate out of range: latitude {} must be in [-90, 90], longitude {} in [-180, 180]",
            request.latitude, request.longitude));
    }

    const auto profile = parse_parity_profile(request.parity_profile);
    if (!profile)
    {
        return absl::InvalidArgumentError(fmt::format(
            "unknown parity_profile '{}': expected strict_history, astro_compat, future_compat or as_entered",
            request.parity_profile));
    }

    if (request.caller_offset_seconds &&
        std::llabs(*request.caller_offset_seconds) > time_constants::kMaxOffsetSeconds)
    {
        return absl::InvalidArgumentError(fmt::format(
            "caller offset {} s is outside [-64800, 64800]", *request.caller_offset_seconds));
    }

    return ValidatedRequest{
        .local      = *local,
        .coordinate = *coordinate,
        .profile    = *profile,
    };
}

// -----------------------------------------------------------------
// Entry point
// -----------------------------------------------------------------

absl::StatusOr<ResolutionResult> TimeResolver::resolve(const ResolveRequest& request) const
{
    const std::string id = request_id(request);

    MRD_INFO("RESOLVE_REQUEST request_id={} local_datetime={} lat={} lon={} parity_profile={} "
             "tzdb_version={} patch_version={}",
             id, request.local_datetime, request.latitude, request.longitude, request.parity_profile,
             m_assembler.versions().tzdb, m_assembler.versions().patch);

    auto validated = validate(request);
    if (!validated.ok())
    {
        MRD_WARN("RESOLVE_REJECTED request_id={} reason=\"{}\"", id, validated.status().message());
        return validated.status();
    }

    PipelineTrace trace{
        .plan = m_selector.plan(validated->profile),
    };

    bool resolved = false;
    if (trace.plan.trust_caller_input)
    {
        auto trusted = run_trusted(*validated, request, trace);
        if (!trusted.ok())
        {
            return trusted.status();
        }
        resolved = *trusted;
        if (!resolved)
        {
            trace.notes.emplace_back("no usable caller offset or zone; resolved with strict_history rules");
        }
    }

    if (!resolved)
    {
        if (const absl::Status status = run_standard(*validated, trace); !status.ok())
        {
            MRD_ERROR("RESOLVE_FAILED request_id={} reason=\"{}\"", id, status.message());
            return status;
        }
    }

    ResolutionResult result = m_assembler.assemble(std::move(trace));

    MRD_INFO("RESOLVE_COMPLETED request_id={} utc={} zone_id={} offset_seconds={} dst_active={} "
             "confidence={} patches_applied=[{}] warnings={}",
             id, result.utc, result.zone_id, result.offset_seconds, result.dst_active,
             to_string(result.confidence), fmt::join(result.provenance.patches_applied, ","),
             result.warnings.size());

    return result;
}

// -----------------------------------------------------------------
// Standard pipeline: locate -> patch -> tz rules
// -----------------------------------------------------------------

absl::Status TimeResolver::run_standard(const ValidatedRequest& request, PipelineTrace& trace) const
{
    trace.lookup = m_locator.locate(request.coordinate, trace.plan.use_boundary_index);
    if (!trace.lookup)
    {
        return absl::InternalError("no zone found for coordinate: boundary and settlement indexes are empty");
    }

    const std::string& base_zone = trace.lookup->zone_id;
    trace.zone_id = base_zone;

    if (trace.plan.use_patches())
    {
        trace.patches_consulted = true;
        trace.patch = m_patches.match(request.coordinate, request.local, base_zone, trace.plan.patch_subset);
    }

    // Zone whose tz rules apply (empty when a fixed-offset patch takes over)
    std::string rule_zone = base_zone;

    if (trace.patch)
    {
        std::visit(Overloaded{
            [&](const history::ZoneOverride& effect) {
                rule_zone = effect.zone_id;
                trace.zone_id = effect.zone_id;
            },
            [&](const history::FixedOffsetOverride& effect) {
                const bool dst = history::dst_in_effect(effect.dst_rule, request.local);
                const i32 offset = effect.offset_seconds + (dst ? time_constants::kSecondsPerHour : 0);
                rule_zone.clear();
                trace.zone_id = effect.zone_label.empty() ? time::fixed_offset_label(offset) : effect.zone_label;
                trace.resolution = time::AmbiguityResolver::resolve_fixed(request.local, offset, dst);
            },
        }, trace.patch->effect);
    }

    if (!rule_zone.empty())
    {
        const auto tz = m_zones.find(rule_zone);
        if (!tz)
        {
            return absl::InternalError(fmt::format("zone '{}' is not in the tz database", rule_zone));
        }
        trace.tzdb_used = true;
        trace.resolution = time::AmbiguityResolver::resolve(request.local, *tz, rule_zone,
                                                            trace.plan.fold_policy);
    }

    return absl::OkStatus();
}

// -----------------------------------------------------------------
// AsEntered trust path
// -----------------------------------------------------------------

absl::StatusOr<bool> TimeResolver::run_trusted(const ValidatedRequest& validated,
                                               const ResolveRequest& request,
                                               PipelineTrace& trace) const
{
    const std::string caller_zone = request.caller_zone
        ? std::string{core::Csv::trim(*request.caller_zone)} : std::string{};
    const auto abbreviation = time::ZoneDatabase::find_abbreviation(caller_zone);

    // Explicit offset: echoed verbatim; an accompanying zone only names the
    // result and supplies the DST flag at the resulting instant
    if (request.caller_offset_seconds)
    {
        const i32 offset = static_cast<i32>(*request.caller_offset_seconds);

        trace.caller_trust = CallerTrust::Offset;
        trace.zone_id = time::fixed_offset_label(offset);
        trace.resolution = time::AmbiguityResolver::resolve_fixed(validated.local, offset, false);

        if (abbreviation)
        {
            trace.zone_id = std::string{abbreviation->name};
            trace.resolution.dst_active = abbreviation->dst_active;
        }
        else if (!caller_zone.empty())
        {
            if (const auto tz = m_zones.find(caller_zone))
            {
                trace.tzdb_used = true;
                trace.zone_id = caller_zone;
                trace.resolution.dst_active = tz->At(trace.resolution.utc).is_dst;
            }
            else
            {
                trace.warnings.push_back(make_warning(warning_codes::kInvalidUserZone,
                    fmt::format("caller-supplied zone '{}' is not a known zone; ignored", caller_zone)));
            }
        }

        trace.warnings.push_back(make_warning(warning_codes::kTrustedUserInput,
            fmt::format("caller-supplied offset {} used without verification",
                        time::fixed_offset_label(offset))));
        return true;
    }

    if (caller_zone.empty())
    {
        return false;
    }

    if (abbreviation)
    {
        trace.caller_trust = CallerTrust::Zone;
        trace.zone_id = std::string{abbreviation->name};
        trace.resolution = time::AmbiguityResolver::resolve_fixed(
            validated.local, abbreviation->offset_seconds, abbreviation->dst_active);
        trace.warnings.push_back(make_warning(warning_codes::kTrustedUserInput,
            fmt::format("caller-supplied zone {} used without verification", abbreviation->name)));
        trace.warnings.push_back(make_warning(warning_codes::kZoneAbbreviation,
            fmt::format("abbreviation {} mapped to fixed offset {}; prefer an IANA zone name",
                        abbreviation->name, time::fixed_offset_label(abbreviation->offset_seconds))));
        return true;
    }

    const auto tz = m_zones.find(caller_zone);
    if (!tz)
    {
        trace.warnings.push_back(make_warning(warning_codes::kInvalidUserZone,
            fmt::format("caller-supplied zone '{}' is not a known zone; ignored", caller_zone)));
        return false;
    }

    trace.caller_trust = CallerTrust::Zone;
    trace.tzdb_used = true;
    trace.zone_id = caller_zone;
    trace.lookup = m_locator.locate(validated.coordinate, trace.plan.use_boundary_index);
    trace.resolution = time::AmbiguityResolver::resolve(validated.local, *tz, caller_zone,
                                                        trace.plan.fold_policy);
    trace.warnings.push_back(make_warning(warning_codes::kTrustedUserInput,
        fmt::format("caller-supplied zone {} used without verification", caller_zone)));

    if (trace.lookup && trace.lookup->zone_id != caller_zone)
    {
        trace.warnings.push_back(make_warning(warning_codes::kUserZoneMismatch,
            fmt::format("caller zone {} differs from the coordinate's zone {}",
                        caller_zone, trace.lookup->zone_id)));
    }

    return true;
}

// -----------------------------------------------------------------
// Request id: FNV-1a over the raw request fields
// -----------------------------------------------------------------

std::string TimeResolver::request_id(const ResolveRequest& request)
{
    const std::string key = fmt::format("{}|{:.9f}|{:.9f}|{}|{}|{}",
        request.local_datetime, request.latitude, request.longitude, request.parity_profile,
        request.caller_offset_seconds ? fmt::format("{}", *request.caller_offset_seconds) : std::string{},
        request.caller_zone.value_or(std::string{}));
    return fmt::format("{:016x}", core::fnv1a_64(key));
}

} // namespace meridian::resolver
