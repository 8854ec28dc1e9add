#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers shared by the ember modules
///
/// Every module logs through its own named logger (`ember_core`,
/// `ember_event`, `ember_host`). All named loggers write to one sink set owned
/// by the registry; configure_logging() rebuilds that set and swaps it into
/// loggers that already exist, so a logger cached in a static keeps following
/// the configuration.

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define EMBER_LOG_TRACE(...) ::ember_core::core_logger()->trace(__VA_ARGS__)
#define EMBER_LOG_DEBUG(...) ::ember_core::core_logger()->debug(__VA_ARGS__)
#define EMBER_LOG_INFO(...) ::ember_core::core_logger()->info(__VA_ARGS__)
#define EMBER_LOG_WARN(...) ::ember_core::core_logger()->warn(__VA_ARGS__)
#define EMBER_LOG_ERROR(...) ::ember_core::core_logger()->error(__VA_ARGS__)
#define EMBER_LOG_CRITICAL(...) ::ember_core::core_logger()->critical(__VA_ARGS__)

namespace ember_core {

// =============================================================================
// Configuration
// =============================================================================

struct LogConfig {
    bool console_enabled = true;
    /// Write `<log_directory>/ember.log`, rotated by size
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::debug;
};

/// Rebuild the shared sinks and apply `config.level` to every named logger
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a logger attached to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Core utilities (configuration, handles)
std::shared_ptr<spdlog::logger> core_logger();

/// Emitter registration and delivery diagnostics
std::shared_ptr<spdlog::logger> event_logger();

/// Reference host lifecycle and delivery
std::shared_ptr<spdlog::logger> host_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// Override the level of one named logger until the next global change
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Accepts spdlog names plus the aliases "warning", "err" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Shutdown
// =============================================================================

void flush_all_loggers();

/// Flush and drop every named logger
void shutdown_logging();

} // namespace ember_core
