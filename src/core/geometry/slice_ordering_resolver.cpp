#include "core/slice_ordering_resolver.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace voxel_stack::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("SliceOrderingResolver");
    return logger;
}

double distance(const Vector3& a, const Vector3& b) {
    const double dz = b[0] - a[0];
    const double dy = b[1] - a[1];
    const double dx = b[2] - a[2];
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

std::string formatValues(const std::vector<double>& values) {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << values[i];
    }
    oss << "]";
    return oss.str();
}

std::string formatPosition(const Vector3& position) {
    std::ostringstream oss;
    oss << "(z=" << position[0] << ", y=" << position[1] << ", x=" << position[2] << ")";
    return oss.str();
}

}  // anonymous namespace

SliceOrderingResolver::SliceOrderingResolver(AssemblyConfig config)
    : config_(config) {}

std::expected<SliceOrdering, AssemblyError>
SliceOrderingResolver::resolve(std::vector<SliceMetadata> slices, DiagnosticsSink& sink) const {
    if (slices.empty()) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::EmptyInput,
            "No slices to order"
        });
    }

    if (!config_.isValid()) {
        return std::unexpected(AssemblyError{
            AssemblyError::Code::InvalidConfiguration,
            "Assembly thresholds out of range"
        });
    }

    // Sort by canonical origin; stable so identical positions keep input order
    std::stable_sort(slices.begin(), slices.end(),
        [](const SliceMetadata& a, const SliceMetadata& b) {
            return toCanonicalOrder(a.origin) < toCanonicalOrder(b.origin);
        });

    SliceOrdering ordering;
    ordering.positions.reserve(slices.size());
    for (const auto& slice : slices) {
        ordering.positions.push_back(toCanonicalOrder(slice.origin));
    }

    const Vector3 nominalSpacing = toCanonicalOrder(slices.front().spacing);

    if (slices.size() == 1) {
        ordering.sliceSpacing = nominalSpacing[0];
        ordering.spacing = nominalSpacing;
        ordering.slices = std::move(slices);
        return ordering;
    }

    ordering.gaps.reserve(slices.size() - 1);
    for (size_t i = 1; i < slices.size(); ++i) {
        double gap = distance(ordering.positions[i - 1], ordering.positions[i]);
        if (gap <= config_.positionTolerance) {
            return std::unexpected(AssemblyError{
                AssemblyError::Code::GeometryMismatch,
                "Slices " + std::to_string(slices[i - 1].originalIndex) + " and "
                    + std::to_string(slices[i].originalIndex)
                    + " share the same position " + formatPosition(ordering.positions[i])
            });
        }
        ordering.gaps.push_back(gap);
    }

    const double minGap = *std::min_element(ordering.gaps.begin(), ordering.gaps.end());

    ordering.multipliers.reserve(ordering.gaps.size());
    for (double gap : ordering.gaps) {
        ordering.multipliers.push_back(gap / minGap);
    }

    const bool irregular = std::any_of(ordering.multipliers.begin(), ordering.multipliers.end(),
        [this](double m) { return m > config_.irregularityThreshold; });

    if (irregular) {
        std::vector<double> distinct;
        distinct.reserve(ordering.gaps.size());
        for (double gap : ordering.gaps) {
            distinct.push_back(roundToDecimals(gap, config_.roundingDecimals));
        }
        std::sort(distinct.begin(), distinct.end());
        distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());

        Diagnostic diagnostic;
        diagnostic.code = Diagnostic::Code::IrregularSliceSpacing;
        diagnostic.message =
            "Inconsistent distance between slice origins of subsequent slices: "
            + formatValues(distinct)
            + ". Slices cannot be aligned correctly, which is likely due to missing slices. "
              "Interpolation of the missing slices will be attempted.";
        diagnostic.values = distinct;
        sink.report(diagnostic);

        std::vector<double> positions;
        positions.reserve(slices.size());
        positions.push_back(0.0);
        for (double gap : ordering.gaps) {
            positions.push_back(positions.back() + roundToDecimals(gap, config_.roundingDecimals));
        }
        ordering.slicePositions = std::move(positions);
    }

    // Mean of the regular gaps; the smallest gap always qualifies
    double regularSum = 0.0;
    size_t regularCount = 0;
    for (size_t i = 0; i < ordering.gaps.size(); ++i) {
        if (ordering.multipliers[i] <= config_.irregularityThreshold) {
            regularSum += ordering.gaps[i];
            ++regularCount;
        }
    }
    ordering.sliceSpacing = roundToDecimals(
        regularSum / static_cast<double>(regularCount), config_.roundingDecimals);

    if (std::abs(nominalSpacing[0] - ordering.sliceSpacing) <= config_.spacingTolerance) {
        ordering.spacing = nominalSpacing;
    } else {
        ordering.spacing = {ordering.sliceSpacing, nominalSpacing[1], nominalSpacing[2]};
    }

    getLogger()->debug("Ordered {} slices, slice spacing {} (nominal {}), irregular: {}",
                       slices.size(), ordering.sliceSpacing, nominalSpacing[0], irregular);

    ordering.slices = std::move(slices);
    return ordering;
}

}  // namespace voxel_stack::core
