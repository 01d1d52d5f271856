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

/**
 * @file slice_metadata.hpp
 * @brief Per-slice positional metadata and the slice reader interface
 * @details SliceMetadata is filled in by a file reader (DICOM, NIfTI, ...)
 *          and consumed read-only by the stack assembly core. Vectors are in
 *          the reader's source axis order (x, y, z).
 *
 * ## Thread Safety
 * - A slice source is used by a single import task at a time
 * - SliceMetadata is safe to read from any thread once loaded
 */

#pragma once

#include <array>
#include <cstddef>
#include <expected>
#include <string>

#include <itkImage.h>

#include "core/physical_unit.hpp"
#include "core/volume_geometry.hpp"

namespace voxel_stack::core {

/// 2-D pixel grid of one slice
using SliceImageType = itk::Image<float, 2>;

/// 3-D voxel grid of an assembled volume, ITK index (x, y, z)
using VoxelImageType = itk::Image<float, 3>;

/// Positional descriptor of one slice, in source (x, y, z) order
struct SliceMetadata {
    Vector3 origin = {0.0, 0.0, 0.0};
    Vector3 spacing = {1.0, 1.0, 1.0};

    /// Row-major direction cosines
    Matrix3 direction = kIdentityMatrix;

    /// Grid size (columns, rows, 1)
    std::array<std::size_t, 3> size = {0, 0, 1};

    /// Pixel grid, null until the source's data has been loaded
    SliceImageType::Pointer pixelData;

    /// Stored value to physical unit mapping applied when stacking
    StoredValueConverter::RescaleParameters rescale;

    /// Position in the input collection before sorting
    std::size_t originalIndex = 0;

    [[nodiscard]] std::size_t columns() const noexcept { return size[0]; }
    [[nodiscard]] std::size_t rows() const noexcept { return size[1]; }
};

/// Failure reported by a slice reader
struct SliceSourceError {
    std::string message;
};

/**
 * @brief Interface of the external slice reader
 *
 * Both load calls are idempotent and only populate the slice held by the
 * source. loadMetadata() fills the positional fields and size, loadData()
 * fills pixelData.
 */
class ISliceSource {
public:
    virtual ~ISliceSource() = default;

    [[nodiscard]] virtual std::expected<void, SliceSourceError> loadMetadata() = 0;

    [[nodiscard]] virtual std::expected<void, SliceSourceError> loadData() = 0;

    [[nodiscard]] virtual const SliceMetadata& metadata() const = 0;
};

/**
 * @brief Slice source over an already decoded slice
 *
 * Used by readers that decode eagerly and by tests. loadData() fails when
 * no pixel grid was supplied.
 */
class InMemorySliceSource : public ISliceSource {
public:
    explicit InMemorySliceSource(SliceMetadata slice);

    [[nodiscard]] std::expected<void, SliceSourceError> loadMetadata() override;

    [[nodiscard]] std::expected<void, SliceSourceError> loadData() override;

    [[nodiscard]] const SliceMetadata& metadata() const override { return slice_; }

private:
    SliceMetadata slice_;
};

}  // namespace voxel_stack::core
