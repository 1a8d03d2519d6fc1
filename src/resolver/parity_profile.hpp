#pragma once

/// @file parity_profile.hpp
/// @brief Closed set of resolution profiles and the pipeline plan each one selects.

#include "core/types.hpp"
#include "history/patch.hpp"
#include "time/ambiguity_resolver.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace meridian::resolver
{
    /// @brief Named pipeline configuration.
    enum class ParityProfile : u8
    {
        StrictHistory,  ///< Boundaries + every historical patch
        AstroCompat,    ///< Boundaries only, first occurrence on folds
        FutureCompat,   ///< Boundaries + forward-looking patches only
        AsEntered,      ///< Trust the caller's offset or zone
    };

    inline constexpr std::array<ParityProfile, 4> kAllProfiles = {
        ParityProfile::StrictHistory,
        ParityProfile::AstroCompat,
        ParityProfile::FutureCompat,
        ParityProfile::AsEntered,
    };

    /// @brief Wire name ("strict_history", "astro_compat", ...).
    [[nodiscard]] std::string_view to_string(ParityProfile profile);

    /// @brief Parse a wire name. "astro_com" is accepted for AstroCompat.
    [[nodiscard]] std::optional<ParityProfile> parse_parity_profile(std::string_view text);

    /// @brief Fold policy per profile.
    struct FoldPolicyTable
    {
        time::FoldPolicy strict_history = time::FoldPolicy::PreferStandardTime;
        time::FoldPolicy astro_compat   = time::FoldPolicy::PreferEarlierInstant;
        time::FoldPolicy future_compat  = time::FoldPolicy::PreferStandardTime;
        time::FoldPolicy as_entered     = time::FoldPolicy::PreferStandardTime;

        [[nodiscard]] time::FoldPolicy policy_for(ParityProfile profile) const;
        [[nodiscard]] time::FoldPolicy& policy_for(ParityProfile profile);
    };

    /// @brief Everything the pipeline needs to know about a profile.
    struct PipelinePlan
    {
        ParityProfile profile;
        bool use_boundary_index;
        history::PatchSubset patch_subset;
        time::FoldPolicy fold_policy;
        bool trust_caller_input;

        [[nodiscard]] bool use_patches() const { return patch_subset != history::PatchSubset::None; }
    };

    /// @brief The single place where profiles turn into pipeline behaviour.
    class ParitySelector
    {
    public:
        explicit ParitySelector(FoldPolicyTable fold_policies = {})
            : m_fold_policies{fold_policies}
        {
        }

        [[nodiscard]] PipelinePlan plan(ParityProfile profile) const;

        [[nodiscard]] const FoldPolicyTable& fold_policies() const { return m_fold_policies; }

    private:
        FoldPolicyTable m_fold_policies;
    };

} // namespace meridian::resolver
