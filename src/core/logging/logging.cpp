#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace dentescope::logging {

namespace {

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

struct SinkRegistry {
    std::mutex mutex;
    LogConfig config;
    std::vector<spdlog::sink_ptr> sinks;
    std::filesystem::path activeFile;
};

SinkRegistry& registry() {
    static SinkRegistry instance;
    return instance;
}

// Caller holds registry().mutex
void buildSinks(SinkRegistry& state) {
    state.sinks.clear();
    state.activeFile.clear();

    auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    state.sinks.push_back(consoleSink);

    std::string fileError;
    if (state.config.enableFileLogging && !state.config.logDirectory.empty()) {
        auto logFile = state.config.logDirectory / (state.config.fileName + ".log");
        try {
            state.sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFile.string(), state.config.maxFileSize, state.config.maxFiles));
            state.activeFile = logFile;
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    for (auto& sink : state.sinks) {
        sink->set_level(toSpdlog(state.config.level));
        sink->set_pattern(state.config.pattern);
    }

    if (!fileError.empty()) {
        consoleSink->log(spdlog::details::log_msg(
            "logging", spdlog::level::warn,
            "file logging disabled: " + fileError));
    }
}

void attach(const SinkRegistry& state, spdlog::logger& logger) {
    logger.sinks() = state.sinks;
    logger.set_level(toSpdlog(state.config.level));
    logger.flush_on(toSpdlog(state.config.flushLevel));
}

}  // anonymous namespace

LogLevel parseLogLevel(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off: return "off";
    }
    return "info";
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    auto& state = registry();
    std::lock_guard lock(state.mutex);

    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    if (state.sinks.empty()) {
        buildSinks(state);
    }

    auto logger = std::make_shared<spdlog::logger>(name);
    attach(state, *logger);
    spdlog::register_logger(logger);
    return logger;
}

void LoggerFactory::configure(const LogConfig& config) {
    auto& state = registry();
    std::lock_guard lock(state.mutex);

    state.config = config;
    buildSinks(state);
    spdlog::set_level(toSpdlog(config.level));

    spdlog::apply_all([&state](std::shared_ptr<spdlog::logger> logger) {
        attach(state, *logger);
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    auto& state = registry();
    std::lock_guard lock(state.mutex);

    state.config.level = level;
    for (auto& sink : state.sinks) {
        sink->set_level(toSpdlog(level));
    }
    spdlog::set_level(toSpdlog(level));
}

LogLevel LoggerFactory::getGlobalLevel() {
    auto& state = registry();
    std::lock_guard lock(state.mutex);
    return state.config.level;
}

std::filesystem::path LoggerFactory::activeLogFile() {
    auto& state = registry();
    std::lock_guard lock(state.mutex);
    return state.activeFile;
}

void LoggerFactory::shutdown() {
    auto& state = registry();
    std::lock_guard lock(state.mutex);
    spdlog::shutdown();
    state.sinks.clear();
    state.activeFile.clear();
}

}  // namespace dentescope::logging
