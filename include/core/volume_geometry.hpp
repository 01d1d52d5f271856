/**
 * @file volume_geometry.hpp
 * @brief Geometry of a volume assembled from a stack of 2-D slices
 * @details All vectors are in canonical (z, y, x) axis order. The z-row of
 *          the orientation is derived from the measured slice positions, not
 *          copied from any slice's direction cosines.
 */

#pragma once

#include <array>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

namespace voxel_stack::core {

using Vector3 = std::array<double, 3>;
using Matrix3 = std::array<std::array<double, 3>, 3>;

/// Number of voxels along (z, y, x): (slices, rows, columns)
using Dimension = std::array<std::size_t, 3>;

/// Identity direction cosines
constexpr Matrix3 kIdentityMatrix = {{
    {1.0, 0.0, 0.0},
    {0.0, 1.0, 0.0},
    {0.0, 0.0, 1.0}
}};

/**
 * @brief Geometric descriptor of an assembled volume
 *
 * Produced once by StackAssembler and copied by value into every image that
 * is derived from it.
 */
struct VolumeGeometry {
    Vector3 origin = {0.0, 0.0, 0.0};
    Vector3 spacing = {1.0, 1.0, 1.0};
    Matrix3 orientation = kIdentityMatrix;
    Dimension dimension = {0, 0, 0};

    /// Cumulative along-slice offsets, only present for irregular stacks
    std::optional<std::vector<double>> slicePositions;

    [[nodiscard]] std::size_t voxelCount() const noexcept {
        return dimension[0] * dimension[1] * dimension[2];
    }

    [[nodiscard]] bool isIrregular() const noexcept {
        return slicePositions.has_value();
    }

    bool operator==(const VolumeGeometry&) const = default;
};

/// Round to a fixed number of decimal places (half away from zero)
inline double roundToDecimals(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

/// Reverse a source-order (x, y, z) triple into canonical (z, y, x) order
constexpr Vector3 toCanonicalOrder(const Vector3& source) noexcept {
    return {source[2], source[1], source[0]};
}

}  // namespace voxel_stack::core
