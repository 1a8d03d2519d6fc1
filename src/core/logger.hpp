#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + audit loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace meridian::core
{
    /// @brief Sink and level settings for Logger::init().
    struct LogConfig
    {
        std::string level = "info";  ///< spdlog level name (trace, debug, info, warn, err, critical, off)
        std::string file;            ///< Rotating log file path; empty disables the file sink
    };

    /// @brief Centralized logging facility for Meridian.
    ///
    /// Provides two separate loggers:
    /// - **MERIDIAN** (core): startup, dataset loading, index construction
    /// - **AUDIT**: one provenance line per resolution request
    ///
    /// Both write to colored console output and, when configured, a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console (+ optional file) sinks.
        /// Must be called once at startup before any MRD_ macros are used.
        static void init(const LogConfig& config = {});

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the core logger ("MERIDIAN").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the request audit logger ("AUDIT").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_audit_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_audit_logger;
    };

} // namespace meridian::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define MRD_CORE_TRACE(...)    ::meridian::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define MRD_CORE_DEBUG(...)    ::meridian::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define MRD_CORE_INFO(...)     ::meridian::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define MRD_CORE_WARN(...)     ::meridian::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define MRD_CORE_ERROR(...)    ::meridian::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define MRD_CORE_CRITICAL(...) ::meridian::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Audit log macros
// -----------------------------------------------------------------
#define MRD_TRACE(...)         ::meridian::core::Logger::get_audit_logger()->trace(__VA_ARGS__)
#define MRD_DEBUG(...)         ::meridian::core::Logger::get_audit_logger()->debug(__VA_ARGS__)
#define MRD_INFO(...)          ::meridian::core::Logger::get_audit_logger()->info(__VA_ARGS__)
#define MRD_WARN(...)          ::meridian::core::Logger::get_audit_logger()->warn(__VA_ARGS__)
#define MRD_ERROR(...)         ::meridian::core::Logger::get_audit_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
