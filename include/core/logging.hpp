/**
 * @file logging.hpp
 * @brief Named spdlog loggers shared by the import pipeline
 * @details Every component requests its logger by name ("StackAssembler",
 *          "VolumeImporter", ...). Loggers write to a colour console sink and,
 *          when enabled, to a rotating file per logger. configure() applies
 *          to loggers created before and after the call.
 *
 * ## Thread Safety
 * - create() and the level functions may be called from concurrent import tasks
 * - addSink() and removeSink() change the sinks of live loggers and must not
 *   race with logging calls
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace voxel_stack::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/// Logging section of an import configuration
struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;

    /// File logging needs a directory; rotation limits must be positive
    [[nodiscard]] bool isValid() const noexcept {
        return maxFileSize > 0 && maxFiles > 0
            && (!enableFileLogging || !logDirectory.empty());
    }
};

/// Lower-case level name as used in configuration files ("debug", "warning", ...)
std::string toString(LogLevel level);

/// Parse a level name; unknown names map to Info
LogLevel logLevelFromString(const std::string& name);

class LoggerFactory {
public:
    /**
     * @brief Get or create a named logger
     *
     * A logger that already exists under this name is returned unchanged.
     */
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    /**
     * @brief Apply a configuration
     *
     * Level and pattern are applied to every registered logger. Sinks are
     * fixed at creation, so file logging only affects loggers created later.
     *
     * @return false (and no change) when the configuration is invalid
     */
    static bool configure(const LogConfig& config);

    /**
     * @brief Attach an additional sink to all current and future loggers
     *
     * Used to capture the log of an import run, e.g. into a stream.
     */
    static void addSink(spdlog::sink_ptr sink);

    /// Detach a sink added with addSink()
    static void removeSink(const spdlog::sink_ptr& sink);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    static bool isConfigured();

    static void shutdown();

private:
    static LogConfig config_;
    static bool configured_;
};

}  // namespace voxel_stack::logging
