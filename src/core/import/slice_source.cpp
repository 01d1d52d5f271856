#include "core/slice_metadata.hpp"

#include <utility>

namespace voxel_stack::core {

InMemorySliceSource::InMemorySliceSource(SliceMetadata slice)
    : slice_(std::move(slice))
{
}

std::expected<void, SliceSourceError> InMemorySliceSource::loadMetadata()
{
    if (slice_.pixelData && (slice_.size[0] == 0 || slice_.size[1] == 0)) {
        auto gridSize = slice_.pixelData->GetLargestPossibleRegion().GetSize();
        slice_.size = {gridSize[0], gridSize[1], 1};
    }

    if (slice_.size[0] == 0 || slice_.size[1] == 0) {
        return std::unexpected(SliceSourceError{
            "Slice " + std::to_string(slice_.originalIndex) + " has no grid size"
        });
    }
    return {};
}

std::expected<void, SliceSourceError> InMemorySliceSource::loadData()
{
    if (!slice_.pixelData) {
        return std::unexpected(SliceSourceError{
            "Slice " + std::to_string(slice_.originalIndex) + " has no pixel data"
        });
    }
    return {};
}

}  // namespace voxel_stack::core
