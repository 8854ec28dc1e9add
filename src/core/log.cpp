/// @file log.cpp
/// @brief Named logger registry for ember

#include <ember/core/log.hpp>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace ember_core {

namespace {

constexpr const char* k_console_pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";
constexpr const char* k_file_pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";
constexpr const char* k_file_name = "ember.log";

std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> result;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(k_console_pattern);
        result.push_back(std::move(console));
    }

    if (config.file_enabled) {
        const auto path = std::filesystem::path(config.log_directory) / k_file_name;
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern(k_file_pattern);
            result.push_back(std::move(file));
        } catch (const spdlog::spdlog_ex& ex) {
            spdlog::warn("Cannot open log file '{}': {}", path.string(), ex.what());
        }
    }

    return result;
}

struct LoggerRegistry {
    static LoggerRegistry& instance() {
        static LoggerRegistry registry;
        return registry;
    }

    std::mutex mutex;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
    // Sinks installed by configure_logging; loggers may carry extra ones
    std::vector<spdlog::sink_ptr> sinks = build_sinks(LogConfig{});
    spdlog::level::level_enum level = spdlog::level::debug;
};

/// Replace `old_sinks` in `logger` with `new_sinks`, leaving foreign sinks attached
void swap_sinks(spdlog::logger& logger,
                const std::vector<spdlog::sink_ptr>& old_sinks,
                const std::vector<spdlog::sink_ptr>& new_sinks) {
    auto& attached = logger.sinks();
    attached.erase(std::remove_if(attached.begin(), attached.end(),
        [&](const spdlog::sink_ptr& sink) {
            return std::find(old_sinks.begin(), old_sinks.end(), sink) != old_sinks.end();
        }), attached.end());
    attached.insert(attached.begin(), new_sinks.begin(), new_sinks.end());
}

} // anonymous namespace

void configure_logging(const LogConfig& config) {
    auto& reg = LoggerRegistry::instance();
    auto sinks = build_sinks(config);

    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers) {
        swap_sinks(*logger, reg.sinks, sinks);
        logger->set_level(config.level);
    }
    reg.sinks = std::move(sinks);
    reg.level = config.level;
    spdlog::set_level(config.level);
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);

    auto& slot = reg.loggers[name];
    if (!slot) {
        slot = std::make_shared<spdlog::logger>(name, reg.sinks.begin(), reg.sinks.end());
        slot->set_level(reg.level);
    }
    return slot;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static auto logger = get_logger("ember_core");
    return logger;
}

std::shared_ptr<spdlog::logger> event_logger() {
    static auto logger = get_logger("ember_event");
    return logger;
}

std::shared_ptr<spdlog::logger> host_logger() {
    static auto logger = get_logger("ember_host");
    return logger;
}

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.level = level;
    for (auto& [name, logger] : reg.loggers) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

void set_logger_level(const std::string& name, spdlog::level::level_enum level) {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.loggers.find(name); it != reg.loggers.end()) {
        it->second->set_level(level);
    }
}

spdlog::level::level_enum get_global_log_level() {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.level;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum, std::less<>> k_levels = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    auto it = k_levels.find(str);
    if (it == k_levels.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

void flush_all_loggers() {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
}

void shutdown_logging() {
    auto& reg = LoggerRegistry::instance();
    std::lock_guard<std::mutex> lock(reg.mutex);

    for (auto& [name, logger] : reg.loggers) {
        logger->flush();
    }
    reg.loggers.clear();
    spdlog::shutdown();
}

} // namespace ember_core
