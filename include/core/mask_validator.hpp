#pragma once

#include <cstddef>
#include <expected>
#include <string>

#include "core/volume_geometry.hpp"
#include "core/volumetric_image.hpp"

namespace voxel_stack::core {

/**
 * @brief Checks that a mask is a usable binary region of interest
 *
 * A valid mask matches the image dimension, contains only 0 and 1, and
 * selects at least one voxel.
 */
class MaskValidator {
public:
    /**
     * @brief Validate a mask against an image dimension
     * @param mask Mask grid (ITK size (x, y, z))
     * @param dimension Image dimension in canonical (z, y, x) order
     * @param maskName Name used in error messages
     * @return Number of selected voxels, or InvalidMask / DimensionMismatch
     */
    [[nodiscard]] static std::expected<std::size_t, ImageError>
    validate(const MaskImageType* mask, const Dimension& dimension,
             const std::string& maskName = "mask");

    /// Whether the mask holds only 0s and 1s
    [[nodiscard]] static bool isBinary(const MaskImageType* mask);
};

}  // namespace voxel_stack::core
