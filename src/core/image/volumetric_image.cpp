#include "core/volumetric_image.hpp"

#include <itkImageDuplicator.h>

namespace voxel_stack::core {

std::string toString(IntensityKind kind) {
    switch (kind) {
        case IntensityKind::ExactPhysicalUnit: return "exact_physical_unit";
        case IntensityKind::ArbitraryScale: return "arbitrary_scale";
    }
    return "arbitrary_scale";
}

std::string toString(Modality modality) {
    switch (modality) {
        case Modality::Generic: return "generic";
        case Modality::CT: return "CT";
        case Modality::PET: return "PET";
        case Modality::MR: return "MR";
    }
    return "generic";
}

// =============================================================================
// ImageBase
// =============================================================================

ImageBase::ImageBase(VoxelImageType::Pointer voxels, VolumeGeometry geometry, Modality modality)
    : voxels_(std::move(voxels))
    , geometry_(std::move(geometry))
    , modality_(modality) {}

float ImageBase::voxel(std::size_t z, std::size_t y, std::size_t x) const {
    VoxelImageType::IndexType index;
    index[0] = static_cast<itk::IndexValueType>(x);
    index[1] = static_cast<itk::IndexValueType>(y);
    index[2] = static_cast<itk::IndexValueType>(z);
    return voxels_->GetPixel(index);
}

void ImageBase::copyFromTemplate(const ImageBase& source) {
    geometry_.origin = source.geometry_.origin;
    geometry_.spacing = source.geometry_.spacing;
    geometry_.orientation = source.geometry_.orientation;
    geometry_.dimension = source.geometry_.dimension;
    geometry_.slicePositions = source.geometry_.slicePositions;
    modality_ = source.modality_;
    diagnostics_ = source.diagnostics_;
}

std::expected<void, ImageError>
ImageBase::checkVoxelData(const VoxelImageType* voxels, const Dimension& dimension) {
    if (!voxels) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidInput,
            "Voxel grid is null"
        });
    }

    auto size = voxels->GetLargestPossibleRegion().GetSize();
    if (size[0] != dimension[2] || size[1] != dimension[1] || size[2] != dimension[0]) {
        return std::unexpected(ImageError{
            ImageError::Code::DimensionMismatch,
            "Voxel grid size " + std::to_string(size[2]) + "x" + std::to_string(size[1]) + "x"
                + std::to_string(size[0]) + " does not match dimension "
                + std::to_string(dimension[0]) + "x" + std::to_string(dimension[1]) + "x"
                + std::to_string(dimension[2])
        });
    }
    return {};
}

VoxelImageType::Pointer ImageBase::duplicateVoxels() const {
    using DuplicatorType = itk::ImageDuplicator<VoxelImageType>;
    auto duplicator = DuplicatorType::New();
    duplicator->SetInputImage(voxels_);
    duplicator->Update();
    return duplicator->GetOutput();
}

// =============================================================================
// GenericImage
// =============================================================================

GenericImage::GenericImage(VoxelImageType::Pointer voxels, VolumeGeometry geometry, Modality modality)
    : ImageBase(std::move(voxels), std::move(geometry), modality) {}

std::expected<GenericImage, ImageError>
GenericImage::create(VoxelImageType::Pointer voxels, VolumeGeometry geometry, Modality modality) {
    if (auto valid = checkVoxelData(voxels.GetPointer(), geometry.dimension); !valid) {
        return std::unexpected(valid.error());
    }
    return GenericImage(std::move(voxels), std::move(geometry), modality);
}

std::expected<GenericImage, ImageError>
GenericImage::fromTemplate(VoxelImageType::Pointer voxels, const ImageBase& source) {
    if (auto valid = checkVoxelData(voxels.GetPointer(), source.dimension()); !valid) {
        return std::unexpected(valid.error());
    }
    GenericImage image(std::move(voxels), VolumeGeometry{}, Modality::Generic);
    image.copyFromTemplate(source);
    return image;
}

std::expected<void, ImageError> GenericImage::setVoxelData(VoxelImageType::Pointer voxels) {
    if (auto valid = checkVoxelData(voxels.GetPointer(), geometry_.dimension); !valid) {
        return std::unexpected(valid.error());
    }
    voxels_ = std::move(voxels);
    return {};
}

GenericImage GenericImage::clone() const {
    GenericImage copy(duplicateVoxels(), VolumeGeometry{}, Modality::Generic);
    copy.copyFromTemplate(*this);
    return copy;
}

// =============================================================================
// PhysicalUnitImage
// =============================================================================

PhysicalUnitImage::PhysicalUnitImage(VoxelImageType::Pointer voxels, VolumeGeometry geometry,
                                     Modality modality, PhysicalUnit unit)
    : ImageBase(std::move(voxels), std::move(geometry), modality)
    , unit_(std::move(unit)) {}

std::expected<PhysicalUnitImage, ImageError>
PhysicalUnitImage::create(VoxelImageType::Pointer voxels, VolumeGeometry geometry,
                          Modality modality, PhysicalUnit unit) {
    if (auto valid = checkVoxelData(voxels.GetPointer(), geometry.dimension); !valid) {
        return std::unexpected(valid.error());
    }
    PhysicalUnitImage image(std::move(voxels), std::move(geometry), modality, std::move(unit));
    image.snapToUnit();
    return image;
}

std::expected<void, ImageError> PhysicalUnitImage::setVoxelData(VoxelImageType::Pointer voxels) {
    if (auto valid = checkVoxelData(voxels.GetPointer(), geometry_.dimension); !valid) {
        return std::unexpected(valid.error());
    }
    voxels_ = std::move(voxels);
    snapToUnit();
    return {};
}

PhysicalUnitImage PhysicalUnitImage::clone() const {
    PhysicalUnitImage copy(duplicateVoxels(), VolumeGeometry{}, modality_, unit_);
    copy.copyFromTemplate(*this);
    return copy;
}

void PhysicalUnitImage::snapToUnit() {
    if (!unit_.discrete || !voxels_) {
        return;
    }

    float* buffer = voxels_->GetBufferPointer();
    const std::size_t count = voxels_->GetPixelContainer()->Size();
    for (std::size_t i = 0; i < count; ++i) {
        buffer[i] = static_cast<float>(unit_.snap(buffer[i]));
    }
    voxels_->Modified();
}

// =============================================================================
// Variant helpers
// =============================================================================

const ImageBase& baseOf(const VolumetricImage& image) {
    return std::visit([](const auto& img) -> const ImageBase& { return img; }, image);
}

ImageBase& baseOf(VolumetricImage& image) {
    return std::visit([](auto& img) -> ImageBase& { return img; }, image);
}

IntensityKind intensityKind(const VolumetricImage& image) {
    return std::visit([](const auto& img) { return img.intensityKind(); }, image);
}

std::optional<double> defaultLowestIntensity(const VolumetricImage& image) {
    return std::visit([](const auto& img) { return img.defaultLowestIntensity(); }, image);
}

VolumetricImage clone(const VolumetricImage& image) {
    return std::visit([](const auto& img) -> VolumetricImage { return img.clone(); }, image);
}

std::expected<VolumetricImage, ImageError>
makeVolumetricImage(Modality modality, VoxelImageType::Pointer voxels, VolumeGeometry geometry,
                    RoundingMode rounding) {
    switch (modality) {
        case Modality::CT: {
            auto image = PhysicalUnitImage::create(
                std::move(voxels), std::move(geometry), modality, PhysicalUnit::hounsfield(rounding));
            if (!image) {
                return std::unexpected(image.error());
            }
            return VolumetricImage(std::move(*image));
        }
        case Modality::PET: {
            auto image = PhysicalUnitImage::create(
                std::move(voxels), std::move(geometry), modality,
                PhysicalUnit::standardisedUptakeValue());
            if (!image) {
                return std::unexpected(image.error());
            }
            return VolumetricImage(std::move(*image));
        }
        case Modality::Generic:
        case Modality::MR:
            break;
    }

    auto image = GenericImage::create(std::move(voxels), std::move(geometry), modality);
    if (!image) {
        return std::unexpected(image.error());
    }
    return VolumetricImage(std::move(*image));
}

}  // namespace voxel_stack::core
