/// @file config.cpp
/// @brief JSON configuration loading for ember_core

#include <ember/core/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace ember_core {

Result<LogConfig> log_config_from_json(const nlohmann::json& document) {
    LogConfig config;

    if (!document.is_object()) {
        return Err<LogConfig>(ConfigError::parse_error("top-level value must be an object"));
    }

    if (!document.contains("logging")) {
        return Ok(config);
    }

    const auto& logging = document["logging"];
    if (!logging.is_object()) {
        return Err<LogConfig>(ConfigError::invalid_value("logging", logging.dump()));
    }

    try {
        if (logging.contains("level")) {
            auto level_name = logging["level"].get<std::string>();
            auto level = parse_log_level(level_name);
            if (!level) {
                return Err<LogConfig>(ConfigError::invalid_value("logging.level", level_name));
            }
            config.level = *level;
        }

        config.console_enabled = logging.value("console", config.console_enabled);
        config.file_enabled = logging.value("file", config.file_enabled);
        config.log_directory = logging.value("directory", config.log_directory);
        config.max_file_size = logging.value("max_file_size", config.max_file_size);
        config.max_files = logging.value("max_files", config.max_files);
    } catch (const nlohmann::json::type_error& err) {
        return Err<LogConfig>(ConfigError::invalid_value("logging", err.what()));
    }

    if (config.file_enabled && config.log_directory.empty()) {
        return Err<LogConfig>(ConfigError::invalid_value("logging.directory", "<empty>"));
    }

    return Ok(config);
}

Result<LogConfig> parse_log_config(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& err) {
        return Err<LogConfig>(ConfigError::parse_error(err.what()));
    }
    return log_config_from_json(document);
}

Result<LogConfig> load_log_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<LogConfig>(ConfigError::file_not_found(path));
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& err) {
        Error error = ConfigError::parse_error(err.what());
        error.with_context("path", path);
        return Err<LogConfig>(std::move(error));
    }

    auto result = log_config_from_json(document);
    if (result.is_err()) {
        result.error().with_context("path", path);
    }
    return result;
}

} // namespace ember_core
