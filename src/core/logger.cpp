/// @file logger.cpp
/// @brief Logger implementation: core + audit spdlog loggers with console and rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace meridian::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_audit_logger;

void Logger::init(const LogConfig& config)
{
    // Re-initialisation replaces the previous registry entries
    spdlog::drop_all();

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    // Console goes to stderr so CLI output on stdout stays parseable
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
    sinks.push_back(console_sink);

    if (!config.file.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(file_sink);
    }

    const spdlog::level::level_enum level = spdlog::level::from_str(config.level);

    // -----------------------------------------------------------------
    // Core logger ("MERIDIAN"): startup and datasets
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("MERIDIAN", sinks.begin(), sinks.end());
    s_core_logger->set_level(level);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // Audit logger ("AUDIT"): per-request provenance
    // -----------------------------------------------------------------
    s_audit_logger = std::make_shared<spdlog::logger>("AUDIT", sinks.begin(), sinks.end());
    s_audit_logger->set_level(level);
    s_audit_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_audit_logger);
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_audit_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_audit_logger()
{
    return s_audit_logger;
}

} // namespace meridian::core
