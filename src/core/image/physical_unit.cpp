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

#include "core/physical_unit.hpp"

#include <cmath>

namespace voxel_stack::core {

double roundToInteger(double value, RoundingMode mode) {
    if (mode == RoundingMode::HalfAwayFromZero) {
        return std::round(value);
    }

    const double floorValue = std::floor(value);
    const double fraction = value - floorValue;
    if (fraction < 0.5) {
        return floorValue;
    }
    if (fraction > 0.5) {
        return floorValue + 1.0;
    }
    // Exact tie: pick the even neighbour
    return std::fmod(floorValue, 2.0) == 0.0 ? floorValue : floorValue + 1.0;
}

std::string toString(RoundingMode mode) {
    switch (mode) {
        case RoundingMode::HalfAwayFromZero: return "half_away_from_zero";
        case RoundingMode::HalfToEven: return "half_to_even";
    }
    return "half_away_from_zero";
}

bool roundingModeFromString(const std::string& name, RoundingMode& mode) {
    if (name == "half_away_from_zero") {
        mode = RoundingMode::HalfAwayFromZero;
        return true;
    }
    if (name == "half_to_even") {
        mode = RoundingMode::HalfToEven;
        return true;
    }
    return false;
}

PhysicalUnit PhysicalUnit::hounsfield(RoundingMode rounding) {
    return PhysicalUnit{"HU", hounsfield::Air, true, rounding};
}

PhysicalUnit PhysicalUnit::standardisedUptakeValue() {
    return PhysicalUnit{"SUV", 0.0, false, RoundingMode::HalfAwayFromZero};
}

double StoredValueConverter::convert(double storedValue, double slope, double intercept) {
    return storedValue * slope + intercept;
}

double StoredValueConverter::convert(double storedValue, const RescaleParameters& params) {
    return convert(storedValue, params.slope, params.intercept);
}

bool StoredValueConverter::validateParameters(double slope, double intercept) {
    // Check for NaN or infinity
    if (!std::isfinite(slope) || !std::isfinite(intercept)) {
        return false;
    }

    // Slope must be non-zero
    if (std::abs(slope) < std::numeric_limits<double>::epsilon()) {
        return false;
    }

    return true;
}

} // namespace voxel_stack::core
