#include "core/mask_validator.hpp"
#include "core/logging.hpp"

#include <itkImageRegionConstIterator.h>

namespace voxel_stack::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MaskValidator");
    return logger;
}

std::string notBinaryMessage(const std::string& maskName, const std::string& reason) {
    return "'" + maskName + "' is not a mask consisting of 0s and 1s: " + reason;
}
}

bool MaskValidator::isBinary(const MaskImageType* mask) {
    if (!mask) {
        return false;
    }
    itk::ImageRegionConstIterator<MaskImageType> it(mask, mask->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        if (it.Get() > 1) {
            return false;
        }
    }
    return true;
}

std::expected<std::size_t, ImageError>
MaskValidator::validate(const MaskImageType* mask, const Dimension& dimension,
                        const std::string& maskName) {
    if (!mask) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidMask,
            notBinaryMessage(maskName, "no mask data")
        });
    }

    auto size = mask->GetLargestPossibleRegion().GetSize();
    if (size[0] != dimension[2] || size[1] != dimension[1] || size[2] != dimension[0]) {
        return std::unexpected(ImageError{
            ImageError::Code::DimensionMismatch,
            "'" + maskName + "' does not match the image dimension"
        });
    }

    std::size_t selected = 0;
    itk::ImageRegionConstIterator<MaskImageType> it(mask, mask->GetLargestPossibleRegion());
    for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
        const auto value = it.Get();
        if (value > 1) {
            return std::unexpected(ImageError{
                ImageError::Code::InvalidMask,
                notBinaryMessage(maskName, "found value " + std::to_string(value))
            });
        }
        selected += value;
    }

    if (selected == 0) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidMask,
            notBinaryMessage(maskName, "the mask is empty")
        });
    }

    getLogger()->debug("Mask '{}' selects {} voxels", maskName, selected);
    return selected;
}

}  // namespace voxel_stack::core
