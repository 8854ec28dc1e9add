#pragma once

/// @file config.hpp
/// @brief JSON configuration loading for ember
///
/// Expected document layout:
/// ```json
/// {
///     "logging": {
///         "level": "info",
///         "console": true,
///         "file": false,
///         "directory": "logs",
///         "max_file_size": 10485760,
///         "max_files": 5
///     }
/// }
/// ```
/// Every key is optional; missing keys keep the LogConfig defaults.

#include "error.hpp"
#include "log.hpp"
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace ember_core {

/// Build a LogConfig from a parsed document
[[nodiscard]] Result<LogConfig> log_config_from_json(const nlohmann::json& document);

/// Parse a LogConfig from JSON text
[[nodiscard]] Result<LogConfig> parse_log_config(const std::string& text);

/// Load a LogConfig from a JSON file
[[nodiscard]] Result<LogConfig> load_log_config(const std::string& path);

} // namespace ember_core
