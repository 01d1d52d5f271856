#include "core/orientation_resolver.hpp"

#include <algorithm>
#include <limits>

namespace voxel_stack::core {

OrientationResolver::OrientationResolver(AssemblyConfig config)
    : config_(config) {}

Matrix3 OrientationResolver::toCanonicalDirection(const Matrix3& source) noexcept {
    // Reversing the flattened 3x3 matrix maps element (i, j) to (2 - i, 2 - j)
    Matrix3 canonical{};
    for (size_t i = 0; i < 3; ++i) {
        for (size_t j = 0; j < 3; ++j) {
            canonical[i][j] = source[2 - i][2 - j];
        }
    }
    return canonical;
}

Matrix3 OrientationResolver::resolve(const SliceOrdering& ordering) const {
    if (ordering.slices.empty()) {
        return kIdentityMatrix;
    }

    Matrix3 orientation = toCanonicalDirection(ordering.slices.front().direction);

    if (ordering.positions.size() < 2 || ordering.sliceSpacing <= 0.0) {
        return orientation;
    }

    // Smallest delta per axis, so that a leading missing slice does not
    // inflate the slice direction
    for (size_t axis = 0; axis < 3; ++axis) {
        double minDelta = std::numeric_limits<double>::max();
        for (size_t i = 1; i < ordering.positions.size(); ++i) {
            minDelta = std::min(minDelta,
                ordering.positions[i][axis] - ordering.positions[i - 1][axis]);
        }
        orientation[0][axis] =
            roundToDecimals(minDelta, config_.roundingDecimals) / ordering.sliceSpacing;
    }

    return orientation;
}

}  // namespace voxel_stack::core
