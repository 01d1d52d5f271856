#pragma once

#include "core/import_config.hpp"
#include "core/slice_ordering_resolver.hpp"
#include "core/volume_geometry.hpp"

namespace voxel_stack::core {

/**
 * @brief Derives the canonical orientation matrix of a slice stack
 *
 * The in-plane rows come from the first slice's direction cosines with the
 * flattened matrix reversed into canonical order. The z-row is recomputed
 * from the measured slice positions: per axis, the smallest consecutive
 * position delta, divided by the resolved slice spacing.
 */
class OrientationResolver {
public:
    explicit OrientationResolver(AssemblyConfig config = {});

    /**
     * @brief Compute the orientation of an ordered stack
     * @param ordering Output of SliceOrderingResolver (at least one slice)
     * @return Orientation in canonical (z, y, x) order
     */
    [[nodiscard]] Matrix3 resolve(const SliceOrdering& ordering) const;

    /// Reverse the flattened source-order direction matrix into canonical order
    [[nodiscard]] static Matrix3 toCanonicalDirection(const Matrix3& source) noexcept;

private:
    AssemblyConfig config_;
};

}  // namespace voxel_stack::core
