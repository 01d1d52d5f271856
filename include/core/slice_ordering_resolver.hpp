#pragma once

#include <expected>
#include <optional>
#include <vector>

#include "core/assembly_error.hpp"
#include "core/diagnostics.hpp"
#include "core/import_config.hpp"
#include "core/slice_metadata.hpp"
#include "core/volume_geometry.hpp"

namespace voxel_stack::core {

/**
 * @brief Slices in ascending spatial order with the resolved slice spacing
 */
struct SliceOrdering {
    /// Slices sorted ascending by canonical (z, y, x) origin
    std::vector<SliceMetadata> slices;

    /// Canonical (z, y, x) origin of each sorted slice
    std::vector<Vector3> positions;

    /// Euclidean distances between consecutive sorted origins (N - 1 values)
    std::vector<double> gaps;

    /// Each gap divided by the smallest gap
    std::vector<double> multipliers;

    /// Resolved inter-slice spacing
    double sliceSpacing = 1.0;

    /// Canonical voxel spacing: resolved z with the first slice's in-plane spacing
    Vector3 spacing = {1.0, 1.0, 1.0};

    /// Cumulative positions of the slices, only set when spacing is irregular
    std::optional<std::vector<double>> slicePositions;

    [[nodiscard]] bool isIrregular() const noexcept { return slicePositions.has_value(); }
};

/**
 * @brief Orders an unordered slice collection and derives its slice spacing
 *
 * Slices are sorted by their origin reversed into canonical (z, y, x) order.
 * The slice spacing is the mean of the gaps that are within the
 * irregularity threshold of the smallest gap; larger gaps are treated as
 * missing slices, reported through the diagnostics sink and recorded as
 * cumulative slice positions for downstream interpolation.
 *
 * A single slice keeps its own nominal spacing.
 */
class SliceOrderingResolver {
public:
    explicit SliceOrderingResolver(AssemblyConfig config = {});

    /**
     * @brief Sort slices and resolve spacing
     * @param slices Slices in arbitrary order
     * @param sink Receives the irregular spacing diagnostic
     * @return Ordering, or EmptyInput / GeometryMismatch (coincident origins)
     */
    [[nodiscard]] std::expected<SliceOrdering, AssemblyError>
    resolve(std::vector<SliceMetadata> slices, DiagnosticsSink& sink) const;

    [[nodiscard]] const AssemblyConfig& config() const noexcept { return config_; }

private:
    AssemblyConfig config_;
};

}  // namespace voxel_stack::core
