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
 * @file stack_assembler.hpp
 * @brief Assembly of a 3-D volume geometry from unordered 2-D slices
 * @details Combines slice ordering, spacing resolution and orientation
 *          recomputation into a single VolumeGeometry, validates it, and
 *          stacks the slices' pixel grids into one voxel grid.
 *
 * ## Thread Safety
 * - assemble() and stackPixelData() are const and keep no state between
 *   calls; independent volumes may be assembled concurrently
 * - Diagnostics are reported only to the sink passed in by the caller
 *
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <vector>

#include "core/assembly_error.hpp"
#include "core/diagnostics.hpp"
#include "core/import_config.hpp"
#include "core/slice_metadata.hpp"
#include "core/volume_geometry.hpp"

namespace voxel_stack::core {

/// Geometry of an assembled stack together with its slices in sorted order
struct AssembledStack {
    VolumeGeometry geometry;
    std::vector<SliceMetadata> slices;
};

/**
 * @brief Assembles slice metadata into a validated volume geometry
 *
 * @code
 * StackAssembler assembler;
 * CollectingDiagnosticsSink diagnostics;
 * auto stack = assembler.assemble(slices, diagnostics);
 * if (stack) {
 *     auto voxels = assembler.stackPixelData(*stack);
 * }
 * @endcode
 */
class StackAssembler {
public:
    explicit StackAssembler(AssemblyConfig config = {});

    /**
     * @brief Order the slices and build the volume geometry
     *
     * Origin is the first sorted slice's canonical origin, dimension is
     * (slice count, rows, columns), spacing and orientation come from the
     * ordering and orientation resolvers. The result is validated with
     * check() before it is returned.
     *
     * @param slices Slice metadata in arbitrary order (pixel data optional)
     * @param sink Receives non-fatal diagnostics (irregular spacing, ...)
     * @return Assembled stack, or an error for empty input, coincident or
     *         inconsistent slices
     */
    [[nodiscard]] std::expected<AssembledStack, AssemblyError>
    assemble(std::vector<SliceMetadata> slices, DiagnosticsSink& sink) const;

    /**
     * @brief Stack the sorted slices' pixel grids into a voxel grid
     *
     * Each slice's rescale parameters are applied while copying. The ITK
     * image carries the spacing and origin in ITK (x, y, z) order.
     *
     * @param stack Output of assemble() with pixel data loaded
     * @return Voxel grid with ITK size (columns, rows, slices)
     */
    [[nodiscard]] std::expected<VoxelImageType::Pointer, AssemblyError>
    stackPixelData(const AssembledStack& stack) const;

    /**
     * @brief Validate sorted slices against their geometry
     *
     * Fails with GeometryMismatch when slices differ in in-plane size, when
     * positions are not strictly increasing in canonical (z, y, x) order, or
     * when spacing or dimension components are not positive.
     */
    [[nodiscard]] static std::expected<void, AssemblyError>
    check(const std::vector<SliceMetadata>& sortedSlices, const VolumeGeometry& geometry);

    [[nodiscard]] const AssemblyConfig& config() const noexcept { return config_; }

private:
    AssemblyConfig config_;
};

}  // namespace voxel_stack::core
