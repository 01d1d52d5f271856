#include "core/import_config.hpp"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace voxel_stack::core {

nlohmann::json toJson(const ImportConfig& config) {
    return nlohmann::json{
        {"assembly", {
            {"irregularity_threshold", config.assembly.irregularityThreshold},
            {"rounding_decimals", config.assembly.roundingDecimals},
            {"spacing_tolerance", config.assembly.spacingTolerance},
            {"position_tolerance", config.assembly.positionTolerance}
        }},
        {"rounding_mode", toString(config.roundingMode)},
        {"log", {
            {"level", logging::toString(config.log.level)},
            {"enable_file_logging", config.log.enableFileLogging},
            {"log_directory", config.log.logDirectory.string()},
            {"pattern", config.log.pattern},
            {"max_file_size", config.log.maxFileSize},
            {"max_files", config.log.maxFiles}
        }}
    };
}

std::expected<ImportConfig, ConfigError>
importConfigFromJson(const nlohmann::json& json) {
    if (!json.is_object()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "Configuration root must be a JSON object"
        });
    }

    ImportConfig config;

    try {
        if (json.contains("assembly")) {
            const auto& assembly = json.at("assembly");
            config.assembly.irregularityThreshold = assembly.value(
                "irregularity_threshold", config.assembly.irregularityThreshold);
            config.assembly.roundingDecimals = assembly.value(
                "rounding_decimals", config.assembly.roundingDecimals);
            config.assembly.spacingTolerance = assembly.value(
                "spacing_tolerance", config.assembly.spacingTolerance);
            config.assembly.positionTolerance = assembly.value(
                "position_tolerance", config.assembly.positionTolerance);
        }

        if (json.contains("rounding_mode")) {
            auto name = json.at("rounding_mode").get<std::string>();
            if (!roundingModeFromString(name, config.roundingMode)) {
                return std::unexpected(ConfigError{
                    ConfigError::Code::InvalidValue,
                    "Unknown rounding mode '" + name + "'"
                });
            }
        }

        if (json.contains("log")) {
            const auto& log = json.at("log");
            config.log.level = logging::logLevelFromString(
                log.value("level", logging::toString(config.log.level)));
            config.log.enableFileLogging = log.value(
                "enable_file_logging", config.log.enableFileLogging);
            config.log.logDirectory = log.value(
                "log_directory", config.log.logDirectory.string());
            config.log.pattern = log.value("pattern", config.log.pattern);
            config.log.maxFileSize = log.value("max_file_size", config.log.maxFileSize);
            config.log.maxFiles = log.value("max_files", config.log.maxFiles);
        }
    } catch (const nlohmann::json::exception& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            std::string("Unexpected value type: ") + e.what()
        });
    }

    if (!config.assembly.isValid()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "Assembly thresholds out of range: irregularity_threshold must exceed 1.0, "
            "rounding_decimals must be in [0, 12], tolerances must be positive"
        });
    }

    if (!config.log.isValid()) {
        return std::unexpected(ConfigError{
            ConfigError::Code::InvalidValue,
            "Log settings out of range: file logging needs log_directory, "
            "rotation limits must be positive"
        });
    }

    return config;
}

std::expected<ImportConfig, ConfigError>
loadImportConfig(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            path.string()
        });
    }

    std::ifstream file(path);
    if (!file) {
        return std::unexpected(ConfigError{
            ConfigError::Code::FileNotFound,
            "Cannot open " + path.string()
        });
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        return std::unexpected(ConfigError{
            ConfigError::Code::ParseFailed,
            path.string() + ": " + e.what()
        });
    }

    return importConfigFromJson(json);
}

std::expected<void, ConfigError>
saveImportConfig(const ImportConfig& config, const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return std::unexpected(ConfigError{
            ConfigError::Code::WriteFailed,
            "Cannot open " + path.string() + " for writing"
        });
    }

    file << toJson(config).dump(2);
    if (!file) {
        return std::unexpected(ConfigError{
            ConfigError::Code::WriteFailed,
            "Failed to write " + path.string()
        });
    }
    return {};
}

}  // namespace voxel_stack::core
