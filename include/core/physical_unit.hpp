// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file physical_unit.hpp
 * @brief Physical intensity units and stored-value conversion
 * @details Describes the calibrated intensity scales an imaging modality can
 *          define (Hounsfield units for CT, standardised uptake values for
 *          PET), the rounding applied to keep discrete units on their integer
 *          grid, and the DICOM rescale formula that maps stored pixel values
 *          onto the unit.
 *
 * @since 1.0.0
 */

#pragma once

#include <cmath>
#include <limits>
#include <string>

namespace voxel_stack::core {

/**
 * @brief Reference Hounsfield Unit (HU) values
 *
 * Values are approximate and may vary by scanner and imaging protocol.
 */
namespace hounsfield {

/// Air HU value, the lowest realistic CT measurement
constexpr double Air = -1000.0;

/// Water HU value (by definition)
constexpr double Water = 0.0;

/// Minimum valid HU value (theoretical)
constexpr double MinHU = -1024.0;

/// Maximum valid HU value for typical CT
constexpr double MaxHU = 3071.0;

/**
 * @brief Check if HU value is within valid range
 * @param hu Hounsfield Unit value
 * @return true if value is valid
 */
constexpr bool isValidHU(double hu) {
    return hu >= MinHU && hu <= MaxHU;
}

} // namespace hounsfield

/// Rounding used to snap values onto a discrete unit
enum class RoundingMode {
    HalfAwayFromZero,  ///< 2.5 -> 3, -0.5 -> -1
    HalfToEven         ///< 2.5 -> 2, -0.5 -> 0
};

/**
 * @brief Round a value to the nearest integer
 * @param value Value to round
 * @param mode Tie-breaking convention
 * @return Rounded value
 */
double roundToInteger(double value, RoundingMode mode);

std::string toString(RoundingMode mode);

/// Parse "half_away_from_zero" or "half_to_even"; false on unknown names
bool roundingModeFromString(const std::string& name, RoundingMode& mode);

/**
 * @brief Calibrated intensity unit of a modality
 */
struct PhysicalUnit {
    std::string name;

    /// Lowest realistic value on this scale
    double lowestIntensity = 0.0;

    /// Whether stored values must be whole numbers of the unit
    bool discrete = false;

    RoundingMode rounding = RoundingMode::HalfAwayFromZero;

    /// Hounsfield units: discrete, floor at air
    static PhysicalUnit hounsfield(RoundingMode rounding = RoundingMode::HalfAwayFromZero);

    /// Standardised uptake value: continuous, floor at zero
    static PhysicalUnit standardisedUptakeValue();

    /// Snap a value onto the unit (identity for continuous units)
    [[nodiscard]] double snap(double value) const {
        return discrete ? roundToInteger(value, rounding) : value;
    }
};

/**
 * @brief Converts stored pixel values onto a physical unit
 *
 * Uses the DICOM rescale formula:
 *   Value = StoredValue × RescaleSlope + RescaleIntercept
 */
class StoredValueConverter {
public:
    /**
     * @brief Rescale parameters extracted from DICOM
     */
    struct RescaleParameters {
        double slope = 1.0;
        double intercept = 0.0;

        /// Check if parameters are valid (slope must be non-zero)
        [[nodiscard]] bool isValid() const {
            return std::abs(slope) > std::numeric_limits<double>::epsilon();
        }

        /// Whether applying these parameters leaves values unchanged
        [[nodiscard]] bool isIdentity() const {
            return slope == 1.0 && intercept == 0.0;
        }
    };

    /**
     * @brief Convert a single stored value
     * @param storedValue Raw pixel value
     * @param slope Rescale slope (0028,1053)
     * @param intercept Rescale intercept (0028,1052)
     * @return Value on the physical unit
     */
    static double convert(double storedValue, double slope, double intercept);

    static double convert(double storedValue, const RescaleParameters& params);

    /**
     * @brief Validate rescale parameters
     * @param slope Rescale slope
     * @param intercept Rescale intercept
     * @return true if slope is non-zero and both values are finite
     */
    static bool validateParameters(double slope, double intercept);
};

} // namespace voxel_stack::core
