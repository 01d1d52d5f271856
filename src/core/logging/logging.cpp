#include "core/logging.hpp"

#include <algorithm>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace voxel_stack::logging {

namespace {
// Import workers may request their loggers concurrently
std::mutex& factoryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<spdlog::sink_ptr>& extraSinks() {
    static std::vector<spdlog::sink_ptr> sinks;
    return sinks;
}

spdlog::level::level_enum toSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}
}

LogConfig LoggerFactory::config_ = {};
bool LoggerFactory::configured_ = false;

std::string toString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "trace";
        case LogLevel::Debug:    return "debug";
        case LogLevel::Info:     return "info";
        case LogLevel::Warning:  return "warning";
        case LogLevel::Error:    return "error";
        case LogLevel::Critical: return "critical";
        case LogLevel::Off:      return "off";
    }
    return "info";
}

LogLevel logLevelFromString(const std::string& name) {
    if (name == "trace")    return LogLevel::Trace;
    if (name == "debug")    return LogLevel::Debug;
    if (name == "warning")  return LogLevel::Warning;
    if (name == "error")    return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off")      return LogLevel::Off;
    return LogLevel::Info;
}

std::shared_ptr<spdlog::logger> LoggerFactory::create(const std::string& name) {
    std::lock_guard lock(factoryMutex());

    auto existingLogger = spdlog::get(name);
    if (existingLogger) {
        return existingLogger;
    }

    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sinks.push_back(consoleSink);

    if (config_.enableFileLogging && !config_.logDirectory.empty()) {
        auto logFile = config_.logDirectory / (name + ".log");
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile.string(),
            config_.maxFileSize,
            config_.maxFiles
        ));
    }

    const auto& extra = extraSinks();
    sinks.insert(sinks.end(), extra.begin(), extra.end());

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(toSpdlog(config_.level));
    logger->set_pattern(config_.pattern);

    spdlog::register_logger(logger);

    return logger;
}

bool LoggerFactory::configure(const LogConfig& config) {
    if (!config.isValid()) {
        return false;
    }

    std::lock_guard lock(factoryMutex());
    config_ = config;
    configured_ = true;

    spdlog::set_level(toSpdlog(config.level));
    spdlog::set_pattern(config.pattern);
    return true;
}

void LoggerFactory::addSink(spdlog::sink_ptr sink) {
    if (!sink) {
        return;
    }

    std::lock_guard lock(factoryMutex());
    sink->set_pattern(config_.pattern);
    extraSinks().push_back(sink);

    spdlog::apply_all([&sink](std::shared_ptr<spdlog::logger> logger) {
        logger->sinks().push_back(sink);
    });
}

void LoggerFactory::removeSink(const spdlog::sink_ptr& sink) {
    std::lock_guard lock(factoryMutex());
    auto& extra = extraSinks();
    extra.erase(std::remove(extra.begin(), extra.end(), sink), extra.end());

    spdlog::apply_all([&sink](std::shared_ptr<spdlog::logger> logger) {
        auto& sinks = logger->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
    });
}

void LoggerFactory::setGlobalLevel(LogLevel level) {
    std::lock_guard lock(factoryMutex());
    config_.level = level;
    spdlog::set_level(toSpdlog(level));
}

LogLevel LoggerFactory::getGlobalLevel() {
    std::lock_guard lock(factoryMutex());
    return config_.level;
}

bool LoggerFactory::isConfigured() {
    std::lock_guard lock(factoryMutex());
    return configured_;
}

void LoggerFactory::shutdown() {
    std::lock_guard lock(factoryMutex());
    extraSinks().clear();
    spdlog::shutdown();
    configured_ = false;
}

}  // namespace voxel_stack::logging
