#include "core/intensity_transform.hpp"
#include "core/logging.hpp"
#include "core/mask_validator.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

#include <itkImageDuplicator.h>
#include <itkShiftScaleImageFilter.h>

namespace voxel_stack::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("IntensityTransform");
    return logger;
}

constexpr IntensityBounds kDefaultQuantileRange = {0.025, 0.975};

/// Linear transform applied to every voxel: (x - offset) / divisor
struct LinearMapping {
    double offset = 0.0;
    double divisor = 1.0;
    bool degenerate = false;
};

std::expected<void, ImageError> invalid(const std::string& message) {
    return std::unexpected(ImageError{ImageError::Code::InvalidConfiguration, message});
}

std::string formatBounds(const IntensityBounds& bounds) {
    std::ostringstream oss;
    oss << "[" << bounds[0] << ", " << bounds[1] << "]";
    return oss.str();
}

std::expected<void, ImageError> checkOrdered(const IntensityBounds& bounds, const std::string& name) {
    if (!std::isnan(bounds[0]) && !std::isnan(bounds[1]) && bounds[0] >= bounds[1]) {
        return invalid(name + " " + formatBounds(bounds) + " must be strictly increasing");
    }
    return {};
}

std::expected<void, ImageError> checkFraction(const IntensityBounds& bounds, const std::string& name) {
    for (double bound : bounds) {
        if (!std::isnan(bound) && (bound < 0.0 || bound > 1.0)) {
            return invalid(name + " " + formatBounds(bounds) + " must lie within [0, 1]");
        }
    }
    return checkOrdered(bounds, name);
}

/// Voxel values inside the mask, or all values without a mask
std::vector<double> collectValues(const VoxelImageType* voxels, const MaskImageType* mask) {
    const float* buffer = voxels->GetBufferPointer();
    const std::size_t count = voxels->GetPixelContainer()->Size();

    std::vector<double> values;
    values.reserve(mask ? 0 : count);

    const unsigned char* maskBuffer = mask ? mask->GetBufferPointer() : nullptr;
    for (std::size_t i = 0; i < count; ++i) {
        if (maskBuffer == nullptr || maskBuffer[i] == 1) {
            values.push_back(buffer[i]);
        }
    }
    return values;
}

/// Quantile with linear interpolation between order statistics
double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.size() == 1) {
        return sorted.front();
    }
    const double position = q * static_cast<double>(sorted.size() - 1);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const std::size_t upper = std::min(lower + 1, sorted.size() - 1);
    const double fraction = position - static_cast<double>(lower);
    return sorted[lower] + fraction * (sorted[upper] - sorted[lower]);
}

LinearMapping rangeMapping(double lower, double upper) {
    LinearMapping mapping;
    mapping.offset = lower;
    mapping.divisor = upper - lower;
    mapping.degenerate = !(mapping.divisor > 0.0);
    return mapping;
}

LinearMapping computeMapping(const NormalisationParameters& params, std::vector<double> values) {
    const auto [minIt, maxIt] = std::minmax_element(values.begin(), values.end());
    const double dataMin = *minIt;
    const double dataMax = *maxIt;
    const auto& range = params.intensityRange;

    switch (params.method) {
        case NormalisationMethod::Range: {
            double lower = std::isnan(range[0]) ? dataMin : range[0];
            double upper = std::isnan(range[1]) ? dataMax : range[1];
            return rangeMapping(lower, upper);
        }
        case NormalisationMethod::RelativeRange: {
            double lowerFraction = std::isnan(range[0]) ? 0.0 : range[0];
            double upperFraction = std::isnan(range[1]) ? 1.0 : range[1];
            double span = dataMax - dataMin;
            return rangeMapping(dataMin + lowerFraction * span, dataMin + upperFraction * span);
        }
        case NormalisationMethod::QuantileRange: {
            double lowerQuantile = std::isnan(range[0]) ? kDefaultQuantileRange[0] : range[0];
            double upperQuantile = std::isnan(range[1]) ? kDefaultQuantileRange[1] : range[1];
            std::sort(values.begin(), values.end());
            return rangeMapping(quantile(values, lowerQuantile), quantile(values, upperQuantile));
        }
        case NormalisationMethod::Standardisation: {
            const double n = static_cast<double>(values.size());
            const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
            double sumSquares = 0.0;
            for (double v : values) {
                sumSquares += (v - mean) * (v - mean);
            }
            LinearMapping mapping;
            mapping.offset = mean;
            mapping.divisor = std::sqrt(sumSquares / n);
            mapping.degenerate = !(mapping.divisor > 0.0);
            return mapping;
        }
        case NormalisationMethod::None:
            break;
    }
    return LinearMapping{};
}

VoxelImageType::Pointer duplicate(const VoxelImageType* voxels) {
    using DuplicatorType = itk::ImageDuplicator<VoxelImageType>;
    auto duplicator = DuplicatorType::New();
    duplicator->SetInputImage(voxels);
    duplicator->Update();
    return duplicator->GetOutput();
}

std::expected<VolumetricImage, ImageError>
toGenericImage(VoxelImageType::Pointer voxels, const ImageBase& source) {
    auto result = GenericImage::fromTemplate(std::move(voxels), source);
    if (!result) {
        return std::unexpected(result.error());
    }
    return VolumetricImage(std::move(*result));
}

}  // anonymous namespace

std::string toString(NormalisationMethod method) {
    switch (method) {
        case NormalisationMethod::None: return "none";
        case NormalisationMethod::Range: return "range";
        case NormalisationMethod::RelativeRange: return "relative_range";
        case NormalisationMethod::QuantileRange: return "quantile_range";
        case NormalisationMethod::Standardisation: return "standardisation";
    }
    return "none";
}

std::expected<NormalisationMethod, ImageError>
normalisationMethodFromString(std::string_view name) {
    for (auto method : {NormalisationMethod::None, NormalisationMethod::Range,
                        NormalisationMethod::RelativeRange, NormalisationMethod::QuantileRange,
                        NormalisationMethod::Standardisation}) {
        if (name == toString(method)) {
            return method;
        }
    }

    std::string known;
    for (const auto& supported : supportedNormalisationMethods()) {
        known += known.empty() ? supported : ", " + supported;
    }
    return std::unexpected(ImageError{
        ImageError::Code::InvalidConfiguration,
        "Unknown normalisation method '" + std::string(name) + "', expected one of: " + known
    });
}

std::vector<std::string> supportedNormalisationMethods() {
    return {"none", "range", "relative_range", "quantile_range", "standardisation"};
}

std::expected<void, ImageError> NormalisationParameters::validate() const {
    for (double bound : intensityRange) {
        if (std::isinf(bound)) {
            return invalid("Intensity range " + formatBounds(intensityRange) + " must be finite");
        }
    }

    switch (method) {
        case NormalisationMethod::None:
            return {};
        case NormalisationMethod::Range:
            if (auto ordered = checkOrdered(intensityRange, "Intensity range"); !ordered) {
                return ordered;
            }
            break;
        case NormalisationMethod::RelativeRange:
            if (auto fraction = checkFraction(intensityRange, "Relative intensity range"); !fraction) {
                return fraction;
            }
            break;
        case NormalisationMethod::QuantileRange:
            if (auto fraction = checkFraction(intensityRange, "Quantile range"); !fraction) {
                return fraction;
            }
            break;
        case NormalisationMethod::Standardisation:
            break;
    }

    return checkOrdered(saturationRange, "Saturation range");
}

std::expected<VolumetricImage, ImageError>
normaliseIntensities(VolumetricImage&& image, const NormalisationParameters& params) {
    if (auto valid = params.validate(); !valid) {
        return std::unexpected(valid.error());
    }

    if (params.method == NormalisationMethod::None) {
        return std::move(image);
    }

    const ImageBase& source = baseOf(image);
    auto sourceVoxels = source.voxelGrid();
    if (!sourceVoxels) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidInput,
            "Image has no voxel data"
        });
    }

    if (params.mask) {
        auto selected = MaskValidator::validate(params.mask.GetPointer(), source.dimension());
        if (!selected) {
            return std::unexpected(selected.error());
        }
    }

    try {
        auto values = collectValues(sourceVoxels.GetPointer(), params.mask.GetPointer());
        if (values.empty()) {
            return std::unexpected(ImageError{
                ImageError::Code::InvalidInput,
                "Image contains no voxels"
            });
        }

        const LinearMapping mapping = computeMapping(params, std::move(values));

        auto output = duplicate(sourceVoxels.GetPointer());
        float* buffer = output->GetBufferPointer();
        const std::size_t count = output->GetPixelContainer()->Size();
        const auto& saturation = params.saturationRange;

        for (std::size_t i = 0; i < count; ++i) {
            double value = mapping.degenerate
                ? 0.0
                : (static_cast<double>(buffer[i]) - mapping.offset) / mapping.divisor;
            if (!std::isnan(saturation[0])) {
                value = std::max(value, saturation[0]);
            }
            if (!std::isnan(saturation[1])) {
                value = std::min(value, saturation[1]);
            }
            buffer[i] = static_cast<float>(value);
        }

        auto result = toGenericImage(output, source);
        if (!result) {
            return result;
        }

        if (mapping.degenerate) {
            std::ostringstream oss;
            oss << "Intensity span for " << toString(params.method)
                << " normalisation is degenerate (offset " << mapping.offset
                << ", span " << mapping.divisor << "); normalised intensities were set to 0";
            baseOf(*result).addDiagnostic(oss.str());
            getLogger()->debug("{}", oss.str());
        }

        getLogger()->debug("Normalised {} image using '{}'",
                           toString(source.modality()), toString(params.method));
        return result;
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ImageError{
            ImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

std::expected<VolumetricImage, ImageError>
normaliseIntensities(VolumetricImage&& image,
                     std::string_view method,
                     IntensityBounds intensityRange,
                     IntensityBounds saturationRange,
                     MaskImageType::Pointer mask) {
    auto parsed = normalisationMethodFromString(method);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    NormalisationParameters params;
    params.method = *parsed;
    params.intensityRange = intensityRange;
    params.saturationRange = saturationRange;
    params.mask = std::move(mask);
    return normaliseIntensities(std::move(image), params);
}

std::expected<VolumetricImage, ImageError>
scaleIntensities(VolumetricImage&& image, double scale) {
    if (!std::isfinite(scale) || scale == 0.0) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidConfiguration,
            "Scale factor must be finite and non-zero, got " + std::to_string(scale)
        });
    }

    if (scale == 1.0) {
        return std::move(image);
    }

    const ImageBase& source = baseOf(image);
    auto sourceVoxels = source.voxelGrid();
    if (!sourceVoxels) {
        return std::unexpected(ImageError{
            ImageError::Code::InvalidInput,
            "Image has no voxel data"
        });
    }

    try {
        using ScaleFilterType = itk::ShiftScaleImageFilter<VoxelImageType, VoxelImageType>;
        auto scaleFilter = ScaleFilterType::New();
        scaleFilter->SetInput(sourceVoxels);
        scaleFilter->SetShift(0.0);
        scaleFilter->SetScale(scale);
        scaleFilter->Update();

        VoxelImageType::Pointer output = scaleFilter->GetOutput();
        output->DisconnectPipeline();

        getLogger()->debug("Scaled {} image by {}", toString(source.modality()), scale);
        return toGenericImage(output, source);
    }
    catch (const itk::ExceptionObject& e) {
        return std::unexpected(ImageError{
            ImageError::Code::ProcessingFailed,
            std::string("ITK exception: ") + e.GetDescription()
        });
    }
}

}  // namespace voxel_stack::core
