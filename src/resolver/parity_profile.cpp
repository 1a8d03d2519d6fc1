/// @file parity_profile.cpp
/// @brief Profile names and plan selection.

#include "resolver/parity_profile.hpp"

namespace meridian::resolver
{

std::string_view to_string(ParityProfile profile)
{
    switch (profile)
    {
        case ParityProfile::StrictHistory: return "strict_history";
        case ParityProfile::AstroCompat:   return "astro_compat";
        case ParityProfile::FutureCompat:  return "future_compat";
        case ParityProfile::AsEntered:     return "as_entered";
    }
    return "strict_history";
}

std::optional<ParityProfile> parse_parity_profile(std::string_view text)
{
    for (const ParityProfile profile : kAllProfiles)
    {
        if (text == to_string(profile))
        {
            return profile;
        }
    }
    if (text == "astro_com")
    {
        return ParityProfile::AstroCompat;
    }
    return std::nullopt;
}

namespace
{

// Shared by the const and mutable accessors
template <typename Table>
auto& policy_slot(Table& table, ParityProfile profile)
{
    switch (profile)
    {
        case ParityProfile::StrictHistory: return table.strict_history;
        case ParityProfile::AstroCompat:   return table.astro_compat;
        case ParityProfile::FutureCompat:  return table.future_compat;
        case ParityProfile::AsEntered:     return table.as_entered;
    }
    return table.strict_history;
}

} // anonymous namespace

time::FoldPolicy FoldPolicyTable::policy_for(ParityProfile profile) const
{
    return policy_slot(*this, profile);
}

time::FoldPolicy& FoldPolicyTable::policy_for(ParityProfile profile)
{
    return policy_slot(*this, profile);
}

// -----------------------------------------------------------------
// Plan selection
// -----------------------------------------------------------------

PipelinePlan ParitySelector::plan(ParityProfile profile) const
{
    PipelinePlan plan{
        .profile            = profile,
        .use_boundary_index = true,
        .patch_subset       = history::PatchSubset::All,
        .fold_policy        = m_fold_policies.policy_for(profile),
        .trust_caller_input = false,
    };

    switch (profile)
    {
        case ParityProfile::StrictHistory:
            break;
        case ParityProfile::AstroCompat:
            plan.patch_subset = history::PatchSubset::None;
            break;
        case ParityProfile::FutureCompat:
            plan.patch_subset = history::PatchSubset::ForwardOnly;
            break;
        case ParityProfile::AsEntered:
            plan.trust_caller_input = true;
            break;
    }

    return plan;
}

} // namespace meridian::resolver
