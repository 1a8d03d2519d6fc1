#pragma once

/// @file config.hpp
/// @brief Startup configuration read from RESOLVER_* environment variables.

#include "core/logger.hpp"
#include "core/types.hpp"
#include "resolver/parity_profile.hpp"

#include <absl/status/statusor.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#ifndef MRD_DATA_DIR
#define MRD_DATA_DIR "data"
#endif

namespace meridian::resolver
{
    /// @brief Everything Runtime::create() needs. Plain data, copied freely.
    struct ResolverConfig
    {
        std::filesystem::path patch_file;
        std::filesystem::path boundary_file;
        std::filesystem::path settlement_file;
        std::string boundary_version = "unversioned";
        std::string settlement_version = "unversioned";
        std::string tzdb_version;                   ///< Empty: detect from the installed tzdata
        bool cache_enabled = true;
        std::size_t cache_capacity = 1024;
        f64 fallback_max_km = 500.0;
        FoldPolicyTable fold_policies;
        core::LogConfig log;

        /// Returns the value of a variable, or std::nullopt when unset.
        using VariableLookup = std::function<std::optional<std::string>(std::string_view)>;

        /// @brief Defaults with dataset paths under data_dir.
        [[nodiscard]] static ResolverConfig defaults(
            const std::filesystem::path& data_dir = std::filesystem::path{MRD_DATA_DIR});

        /// @brief Defaults overridden by the process environment.
        /// @return The configuration, or InvalidArgument naming the malformed variable.
        [[nodiscard]] static absl::StatusOr<ResolverConfig> from_environment();

        /// @brief Same as from_environment() with an injectable variable source.
        [[nodiscard]] static absl::StatusOr<ResolverConfig> from_variables(const VariableLookup& lookup);
    };

    /// @brief Parse "1/0", "true/false", "yes/no", "on/off" (case-insensitive).
    [[nodiscard]] std::optional<bool> parse_bool(std::string_view text);

} // namespace meridian::resolver
