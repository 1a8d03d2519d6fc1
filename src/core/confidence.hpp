#pragma once

/// @file confidence.hpp
/// @brief Ordered confidence tiers shared by patches and results.

#include "core/types.hpp"

#include <algorithm>
#include <optional>
#include <string_view>

namespace meridian
{
    /// @brief Confidence tier. Declaration order is the ordering (Low < Medium < High).
    enum class Confidence : u8
    {
        Low,
        Medium,
        High,
    };

    [[nodiscard]] constexpr std::string_view to_string(Confidence confidence)
    {
        switch (confidence)
        {
            case Confidence::Low:    return "low";
            case Confidence::Medium: return "medium";
            case Confidence::High:   return "high";
        }
        return "low";
    }

    /// @brief Parse "high" / "medium" / "low" (lower-case, as written in datasets).
    [[nodiscard]] constexpr std::optional<Confidence> parse_confidence(std::string_view text)
    {
        if (text == "high")   return Confidence::High;
        if (text == "medium") return Confidence::Medium;
        if (text == "low")    return Confidence::Low;
        return std::nullopt;
    }

    [[nodiscard]] constexpr Confidence min_confidence(Confidence a, Confidence b)
    {
        return std::min(a, b);
    }
}
