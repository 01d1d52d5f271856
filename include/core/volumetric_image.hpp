/**
 * @file volumetric_image.hpp
 * @brief Volumetric image entities and their intensity semantics
 * @details A volume is either a PhysicalUnitImage, whose voxel values map
 *          one-to-one onto a calibrated unit (e.g. Hounsfield units), or a
 *          GenericImage on an arbitrary scale. Both share the geometry and
 *          voxel storage of ImageBase. Intensity transforms that break the
 *          unit mapping return a GenericImage built by template copy; there
 *          is no way back to a PhysicalUnitImage.
 *
 * ## Ownership
 * - Images are movable but not copyable; every image owns its voxel grid
 * - clone() makes a deep copy
 *
 * @since 1.0.0
 */

#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <itkImage.h>

#include "core/physical_unit.hpp"
#include "core/slice_metadata.hpp"
#include "core/volume_geometry.hpp"

namespace voxel_stack::core {

/// Binary region-of-interest mask, same ITK layout as VoxelImageType
using MaskImageType = itk::Image<unsigned char, 3>;

/// Whether voxel values still correspond 1:1 to a physical unit
enum class IntensityKind {
    ExactPhysicalUnit,
    ArbitraryScale
};

enum class Modality {
    Generic,
    CT,
    PET,
    MR
};

std::string toString(IntensityKind kind);
std::string toString(Modality modality);

/// Error result of image construction and intensity transforms
struct ImageError {
    enum class Code {
        InvalidInput,
        DimensionMismatch,
        InvalidConfiguration,
        InvalidMask,
        ProcessingFailed
    };

    Code code = Code::InvalidInput;
    std::string message;

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::InvalidInput: return "Invalid input: " + message;
            case Code::DimensionMismatch: return "Dimension mismatch: " + message;
            case Code::InvalidConfiguration: return "Invalid configuration: " + message;
            case Code::InvalidMask: return "Invalid mask: " + message;
            case Code::ProcessingFailed: return "Processing failed: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Voxel grid, geometry and diagnostics shared by all image variants
 */
class ImageBase {
public:
    ImageBase(const ImageBase&) = delete;
    ImageBase& operator=(const ImageBase&) = delete;
    ImageBase(ImageBase&&) noexcept = default;
    ImageBase& operator=(ImageBase&&) noexcept = default;

    /// Voxel grid; ITK index (x, y, z) addresses canonical voxel (z, y, x)
    [[nodiscard]] VoxelImageType::ConstPointer voxelGrid() const { return voxels_.GetPointer(); }

    /// Value of canonical voxel (z, y, x)
    [[nodiscard]] float voxel(std::size_t z, std::size_t y, std::size_t x) const;

    [[nodiscard]] const VolumeGeometry& geometry() const noexcept { return geometry_; }
    [[nodiscard]] const Dimension& dimension() const noexcept { return geometry_.dimension; }
    [[nodiscard]] const Vector3& origin() const noexcept { return geometry_.origin; }
    [[nodiscard]] const Vector3& spacing() const noexcept { return geometry_.spacing; }
    [[nodiscard]] const Matrix3& orientation() const noexcept { return geometry_.orientation; }
    [[nodiscard]] const std::optional<std::vector<double>>& slicePositions() const noexcept {
        return geometry_.slicePositions;
    }

    [[nodiscard]] Modality modality() const noexcept { return modality_; }

    /// Messages accumulated while importing and transforming this image
    [[nodiscard]] const std::vector<std::string>& diagnostics() const noexcept { return diagnostics_; }

    void addDiagnostic(std::string message) { diagnostics_.push_back(std::move(message)); }

protected:
    ImageBase(VoxelImageType::Pointer voxels, VolumeGeometry geometry, Modality modality);
    ~ImageBase() = default;

    /// Copy geometry, modality and diagnostics by value from another image
    void copyFromTemplate(const ImageBase& source);

    /// Check that a voxel grid is present and matches the geometry's dimension
    static std::expected<void, ImageError>
    checkVoxelData(const VoxelImageType* voxels, const Dimension& dimension);

    /// Deep copy of the voxel grid
    [[nodiscard]] VoxelImageType::Pointer duplicateVoxels() const;

    VoxelImageType::Pointer voxels_;
    VolumeGeometry geometry_;
    Modality modality_ = Modality::Generic;
    std::vector<std::string> diagnostics_;
};

/**
 * @brief Image on an arbitrary intensity scale
 */
class GenericImage : public ImageBase {
public:
    /**
     * @brief Create an image from a voxel grid and its geometry
     * @return Image, or DimensionMismatch if the grid does not match
     */
    [[nodiscard]] static std::expected<GenericImage, ImageError>
    create(VoxelImageType::Pointer voxels, VolumeGeometry geometry,
           Modality modality = Modality::Generic);

    /**
     * @brief Create an image that takes everything but its voxels from a template
     *
     * Geometry, modality and diagnostics are copied by value from the
     * template; later changes to either image do not affect the other.
     */
    [[nodiscard]] static std::expected<GenericImage, ImageError>
    fromTemplate(VoxelImageType::Pointer voxels, const ImageBase& source);

    [[nodiscard]] static constexpr IntensityKind intensityKind() noexcept {
        return IntensityKind::ArbitraryScale;
    }

    /// Arbitrary scales have no lowest realistic value
    [[nodiscard]] std::optional<double> defaultLowestIntensity() const noexcept {
        return std::nullopt;
    }

    [[nodiscard]] std::expected<void, ImageError> setVoxelData(VoxelImageType::Pointer voxels);

    [[nodiscard]] GenericImage clone() const;

private:
    GenericImage(VoxelImageType::Pointer voxels, VolumeGeometry geometry, Modality modality);
};

/**
 * @brief Image whose voxel values are measurements on a physical unit
 *
 * For discrete units every assignment of voxel data rounds the values to
 * whole units using the unit's rounding convention.
 */
class PhysicalUnitImage : public ImageBase {
public:
    /**
     * @brief Create an image on a physical unit
     *
     * Takes ownership of the voxel grid; values are snapped to the unit.
     */
    [[nodiscard]] static std::expected<PhysicalUnitImage, ImageError>
    create(VoxelImageType::Pointer voxels, VolumeGeometry geometry,
           Modality modality, PhysicalUnit unit);

    [[nodiscard]] static constexpr IntensityKind intensityKind() noexcept {
        return IntensityKind::ExactPhysicalUnit;
    }

    [[nodiscard]] const PhysicalUnit& unit() const noexcept { return unit_; }

    [[nodiscard]] std::optional<double> defaultLowestIntensity() const noexcept {
        return unit_.lowestIntensity;
    }

    /// Replace the voxel grid; values are snapped to the unit
    [[nodiscard]] std::expected<void, ImageError> setVoxelData(VoxelImageType::Pointer voxels);

    [[nodiscard]] PhysicalUnitImage clone() const;

private:
    PhysicalUnitImage(VoxelImageType::Pointer voxels, VolumeGeometry geometry,
                      Modality modality, PhysicalUnit unit);

    void snapToUnit();

    PhysicalUnit unit_;
};

/// An image in one of its two intensity states
using VolumetricImage = std::variant<PhysicalUnitImage, GenericImage>;

[[nodiscard]] const ImageBase& baseOf(const VolumetricImage& image);
[[nodiscard]] ImageBase& baseOf(VolumetricImage& image);

[[nodiscard]] IntensityKind intensityKind(const VolumetricImage& image);

[[nodiscard]] std::optional<double> defaultLowestIntensity(const VolumetricImage& image);

[[nodiscard]] VolumetricImage clone(const VolumetricImage& image);

/**
 * @brief Create the image variant a modality calls for
 *
 * CT becomes a PhysicalUnitImage in Hounsfield units, PET a PhysicalUnitImage
 * in SUV; all other modalities become a GenericImage.
 */
[[nodiscard]] std::expected<VolumetricImage, ImageError>
makeVolumetricImage(Modality modality, VoxelImageType::Pointer voxels, VolumeGeometry geometry,
                    RoundingMode rounding = RoundingMode::HalfAwayFromZero);

}  // namespace voxel_stack::core
