/**
 * @file intensity_transform.hpp
 * @brief Intensity normalisation and scaling of volumetric images
 * @details Transforms consume the image they operate on and hand back the
 *          resulting image. Identity requests return the very same image.
 *          Any real change yields a new image with a new voxel grid; a
 *          PhysicalUnitImage is demoted to a GenericImage because the values
 *          no longer map onto its unit.
 *
 *          Transforms are atomic: on failure no image is created and the
 *          argument is left untouched.
 *
 * @since 1.0.0
 */

#pragma once

#include <array>
#include <expected>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

#include "core/volumetric_image.hpp"

namespace voxel_stack::core {

enum class NormalisationMethod {
    None,
    Range,
    RelativeRange,
    QuantileRange,
    Standardisation
};

/// Configuration name of a method ("none", "range", ...)
std::string toString(NormalisationMethod method);

/**
 * @brief Parse a normalisation method name
 * @return Method, or InvalidConfiguration for unrecognised names
 */
[[nodiscard]] std::expected<NormalisationMethod, ImageError>
normalisationMethodFromString(std::string_view name);

/// All recognised method names
[[nodiscard]] std::vector<std::string> supportedNormalisationMethods();

/// Pair of bounds; NaN marks an open or data-derived bound
using IntensityBounds = std::array<double, 2>;

constexpr IntensityBounds kUnsetBounds = {
    std::numeric_limits<double>::quiet_NaN(),
    std::numeric_limits<double>::quiet_NaN()
};

/**
 * @brief Parameters of an intensity normalisation
 */
struct NormalisationParameters {
    NormalisationMethod method = NormalisationMethod::None;

    /// Range: absolute bounds. RelativeRange: fractions of the data range.
    /// QuantileRange: quantiles. NaN selects the method's default.
    IntensityBounds intensityRange = kUnsetBounds;

    /// Clipping applied to normalised values; NaN leaves that side open
    IntensityBounds saturationRange = kUnsetBounds;

    /// Optional mask restricting the voxels the statistics are taken from
    MaskImageType::Pointer mask;

    /**
     * @brief Check method-specific bounds
     * @return InvalidConfiguration describing the first malformed bound
     */
    [[nodiscard]] std::expected<void, ImageError> validate() const;
};

/**
 * @brief Normalise the intensities of an image
 *
 * @param image Image to transform, consumed on success
 * @param params Normalisation parameters
 * @return The same image for NormalisationMethod::None, otherwise a new
 *         GenericImage carrying the source's geometry and diagnostics
 */
[[nodiscard]] std::expected<VolumetricImage, ImageError>
normaliseIntensities(VolumetricImage&& image, const NormalisationParameters& params);

/**
 * @brief Normalise using a method name
 *
 * Fails with InvalidConfiguration when the name is not one of
 * supportedNormalisationMethods().
 */
[[nodiscard]] std::expected<VolumetricImage, ImageError>
normaliseIntensities(VolumetricImage&& image,
                     std::string_view method,
                     IntensityBounds intensityRange = kUnsetBounds,
                     IntensityBounds saturationRange = kUnsetBounds,
                     MaskImageType::Pointer mask = nullptr);

/**
 * @brief Multiply all voxel values by a factor
 *
 * @param image Image to transform, consumed on success
 * @param scale Finite, non-zero factor
 * @return The same image for scale 1.0, otherwise a new GenericImage
 */
[[nodiscard]] std::expected<VolumetricImage, ImageError>
scaleIntensities(VolumetricImage&& image, double scale);

}  // namespace voxel_stack::core
