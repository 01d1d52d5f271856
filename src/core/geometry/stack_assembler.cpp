#include "core/stack_assembler.hpp"
#include "core/logging.hpp"
#include "core/orientation_resolver.hpp"
#include "core/slice_ordering_resolver.hpp"

#include <cmath>
#include <sstream>

#include <itkImageRegionConstIteratorWithIndex.h>

namespace voxel_stack::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("StackAssembler");
    return logger;
}

constexpr double kUnitNormTolerance = 1e-3;

std::string formatSize(std::size_t columns, std::size_t rows) {
    return std::to_string(columns) + "x" + std::to_string(rows);
}

double rowNorm(const std::array<double, 3>& row) {
    return std::sqrt(row[0] * row[0] + row[1] * row[1] + row[2] * row[2]);
}

}  // anonymous namespace

StackAssembler::StackAssembler(AssemblyConfig config)
    : config_(config) {}

std::expected<AssembledStack, AssemblyError>
StackAssembler::assemble(std::vector<SliceMetadata> slices, DiagnosticsSink& sink) const {
    getLogger()->debug("Assembling stack of {} slices", slices.size());

    SliceOrderingResolver orderingResolver(config_);
    auto ordering = orderingResolver.resolve(std::move(slices), sink);
    if (!ordering) {
        getLogger()->error("Slice ordering failed: {}", ordering.error().message);
        return std::unexpected(ordering.error());
    }

    OrientationResolver orientationResolver(config_);

    AssembledStack stack;
    const auto& first = ordering->slices.front();
    stack.geometry.origin = ordering->positions.front();
    stack.geometry.spacing = ordering->spacing;
    stack.geometry.orientation = orientationResolver.resolve(*ordering);
    stack.geometry.dimension = {ordering->slices.size(), first.rows(), first.columns()};
    stack.geometry.slicePositions = ordering->slicePositions;
    stack.slices = std::move(ordering->slices);

    if (auto valid = check(stack.slices, stack.geometry); !valid) {
        getLogger()->error("Stack validation failed: {}", valid.error().message);
        return std::unexpected(valid.error());
    }

    const double norm = rowNorm(stack.geometry.orientation[0]);
    if (std::abs(norm - 1.0) > kUnitNormTolerance) {
        std::ostringstream oss;
        oss << "Slice direction derived from slice positions has norm " << norm
            << " instead of 1";
        sink.report(Diagnostic{Diagnostic::Code::OrientationNotUnitNorm, oss.str(), {norm}});
    }

    getLogger()->info("Assembled volume {}x{}x{}, spacing [{:.5f}, {:.5f}, {:.5f}]",
                      stack.geometry.dimension[0], stack.geometry.dimension[1],
                      stack.geometry.dimension[2], stack.geometry.spacing[0],
                      stack.geometry.spacing[1], stack.geometry.spacing[2]);
    return stack;
}

std::expected<void, AssemblyError>
StackAssembler::check(const std::vector<SliceMetadata>& sortedSlices, const VolumeGeometry& geometry) {
    if (sortedSlices.empty()) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::EmptyInput,
            "No slices in stack"
        });
    }

    const auto& reference = sortedSlices.front();
    for (const auto& slice : sortedSlices) {
        if (slice.columns() != reference.columns() || slice.rows() != reference.rows()) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::GeometryMismatch,
                "Slice " + std::to_string(slice.originalIndex) + " has in-plane size "
                    + formatSize(slice.columns(), slice.rows()) + " but slice "
                    + std::to_string(reference.originalIndex) + " has "
                    + formatSize(reference.columns(), reference.rows())
            });
        }
    }

    for (size_t i = 1; i < sortedSlices.size(); ++i) {
        auto previous = toCanonicalOrder(sortedSlices[i - 1].origin);
        auto current = toCanonicalOrder(sortedSlices[i].origin);
        if (!(previous < current)) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::GeometryMismatch,
                "Slice positions are not strictly increasing between slices "
                    + std::to_string(sortedSlices[i - 1].originalIndex) + " and "
                    + std::to_string(sortedSlices[i].originalIndex)
            });
        }
    }

    for (double s : geometry.spacing) {
        if (!std::isfinite(s) || s <= 0.0) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::GeometryMismatch,
                "Resolved spacing must be positive, got " + std::to_string(s)
            });
        }
    }

    for (std::size_t d : geometry.dimension) {
        if (d == 0) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::GeometryMismatch,
                "Volume dimension must be positive in every direction"
            });
        }
    }

    if (geometry.dimension[0] != sortedSlices.size()) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::GeometryMismatch,
            "Dimension along z does not match the slice count"
        });
    }

    return {};
}

std::expected<VoxelImageType::Pointer, AssemblyError>
StackAssembler::stackPixelData(const AssembledStack& stack) const {
    if (auto valid = check(stack.slices, stack.geometry); !valid) {
        return std::unexpected(valid.error());
    }

    const auto& geometry = stack.geometry;
    const std::size_t rows = geometry.dimension[1];
    const std::size_t columns = geometry.dimension[2];

    for (const auto& slice : stack.slices) {
        if (!slice.pixelData) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::PixelDataMismatch,
                "Pixel data of slice " + std::to_string(slice.originalIndex) + " is not loaded"
            });
        }
        auto size = slice.pixelData->GetLargestPossibleRegion().GetSize();
        if (size[0] != columns || size[1] != rows) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::PixelDataMismatch,
                "Pixel grid of slice " + std::to_string(slice.originalIndex) + " is "
                    + formatSize(size[0], size[1]) + ", metadata declares "
                    + formatSize(columns, rows)
            });
        }
        if (!StoredValueConverter::validateParameters(slice.rescale.slope, slice.rescale.intercept)) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::InvalidConfiguration,
                "Invalid rescale parameters on slice " + std::to_string(slice.originalIndex)
            });
        }
    }

    try {
        auto volume = VoxelImageType::New();

        VoxelImageType::SizeType size;
        size[0] = columns;
        size[1] = rows;
        size[2] = geometry.dimension[0];

        VoxelImageType::IndexType start;
        start.Fill(0);

        VoxelImageType::RegionType region;
        region.SetSize(size);
        region.SetIndex(start);
        volume->SetRegions(region);

        VoxelImageType::SpacingType spacing;
        spacing[0] = geometry.spacing[2];
        spacing[1] = geometry.spacing[1];
        spacing[2] = geometry.spacing[0];
        volume->SetSpacing(spacing);

        VoxelImageType::PointType origin;
        origin[0] = geometry.origin[2];
        origin[1] = geometry.origin[1];
        origin[2] = geometry.origin[0];
        volume->SetOrigin(origin);

        volume->Allocate();

        float* buffer = volume->GetBufferPointer();
        const std::size_t sliceStride = rows * columns;

        for (std::size_t z = 0; z < stack.slices.size(); ++z) {
            const auto& slice = stack.slices[z];
            float* sliceBuffer = buffer + z * sliceStride;

            using IteratorType = itk::ImageRegionConstIteratorWithIndex<SliceImageType>;
            IteratorType it(slice.pixelData, slice.pixelData->GetLargestPossibleRegion());
            const auto sliceStart = slice.pixelData->GetLargestPossibleRegion().GetIndex();

            for (it.GoToBegin(); !it.IsAtEnd(); ++it) {
                auto idx = it.GetIndex();
                auto x = static_cast<std::size_t>(idx[0] - sliceStart[0]);
                auto y = static_cast<std::size_t>(idx[1] - sliceStart[1]);
                double value = it.Get();
                if (!slice.rescale.isIdentity()) {
                    value = StoredValueConverter::convert(value, slice.rescale);
                }
                sliceBuffer[y * columns + x] = static_cast<float>(value);
            }
        }

        return volume;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::InternalError,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
    catch (const std::exception& e) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::InternalError,
            std::string("Standard exception: ") + e.what()
        });
    }
}

}  // namespace voxel_stack::core
