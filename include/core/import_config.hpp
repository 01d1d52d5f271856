/**
 * @file import_config.hpp
 * @brief Policy constants of stack assembly and their JSON persistence
 * @details Collects the thresholds used by slice ordering (irregularity
 *          multiplier, rounding precision, tolerances), the rounding
 *          convention of discrete physical units, and the logging setup of
 *          an import run. Configurations round-trip through JSON files.
 *
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <filesystem>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/logging.hpp"
#include "core/physical_unit.hpp"

namespace voxel_stack::core {

/**
 * @brief Thresholds used while ordering slices and resolving spacing
 */
struct AssemblyConfig {
    /// Gap / smallest-gap ratio above which spacing is declared irregular
    double irregularityThreshold = 1.2;

    /// Decimal places used when rounding spacing and positions
    int roundingDecimals = 5;

    /// Tolerance for "resolved spacing equals nominal spacing"
    double spacingTolerance = 1e-5;

    /// Distance below which two slice origins are considered coincident
    double positionTolerance = 1e-6;

    [[nodiscard]] bool isValid() const noexcept {
        return irregularityThreshold > 1.0
            && roundingDecimals >= 0 && roundingDecimals <= 12
            && spacingTolerance > 0.0
            && positionTolerance > 0.0;
    }
};

/**
 * @brief Full configuration of a volume import
 */
struct ImportConfig {
    AssemblyConfig assembly;

    /// Convention used when snapping discrete units (e.g. HU) to integers
    RoundingMode roundingMode = RoundingMode::HalfAwayFromZero;

    logging::LogConfig log;
};

/// Error types for configuration loading
struct ConfigError {
    enum class Code {
        FileNotFound,
        ParseFailed,
        InvalidValue,
        WriteFailed
    };

    Code code = Code::ParseFailed;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::FileNotFound: return "File not found: " + message;
            case Code::ParseFailed: return "Parse failed: " + message;
            case Code::InvalidValue: return "Invalid value: " + message;
            case Code::WriteFailed: return "Write failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Serialize a configuration to JSON
 */
[[nodiscard]] nlohmann::json toJson(const ImportConfig& config);

/**
 * @brief Build a configuration from JSON
 *
 * Missing keys keep their defaults, unknown keys are ignored.
 *
 * @param json Parsed JSON object
 * @return Configuration, or InvalidValue if a value has the wrong type or
 *         fails validation
 */
[[nodiscard]] std::expected<ImportConfig, ConfigError>
importConfigFromJson(const nlohmann::json& json);

/**
 * @brief Load a configuration file
 * @param path JSON file
 * @return Configuration on success
 */
[[nodiscard]] std::expected<ImportConfig, ConfigError>
loadImportConfig(const std::filesystem::path& path);

/**
 * @brief Write a configuration file (pretty-printed JSON)
 */
[[nodiscard]] std::expected<void, ConfigError>
saveImportConfig(const ImportConfig& config, const std::filesystem::path& path);

}  // namespace voxel_stack::core
