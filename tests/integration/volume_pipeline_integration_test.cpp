/**
 * @file volume_pipeline_integration_test.cpp
 * @brief End-to-end pipeline: slice sources to assembled CT volume to
 *        normalised and scaled images
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <optional>
#include <random>

#include "core/intensity_transform.hpp"
#include "core/volume_importer.hpp"
#include "../test_utils/slice_generator.hpp"

namespace voxel_stack::core {
namespace {

using test_utils::createMask;
using test_utils::createRampSliceImage;
using test_utils::createSlice;
using test_utils::createSources;
using test_utils::setMaskVoxel;

class VolumePipelineIntegrationTest : public ::testing::Test {
protected:
    static constexpr size_t kColumns = 16;
    static constexpr size_t kRows = 12;

    /// Shuffled CT stack at z = 0, 2.5, ..., with slice at index `missing` removed
    SliceSourceList createShuffledCtStack(size_t sliceCount, std::optional<size_t> missing) {
        std::vector<SliceMetadata> slices;
        for (size_t i = 0; i < sliceCount; ++i) {
            if (missing && *missing == i) {
                continue;
            }
            auto slice = createSlice({-120.0, 80.0, 2.5 * static_cast<double>(i)},
                                     kColumns, kRows, {0.75, 0.75, 2.5});
            slice.pixelData = createRampSliceImage(kColumns, kRows, 1024.0f * (i % 2));
            slice.rescale = {1.0, -1024.0};
            slices.push_back(std::move(slice));
        }

        std::mt19937 rng(42);
        std::shuffle(slices.begin(), slices.end(), rng);
        return createSources(std::move(slices));
    }

    VolumeImporter importer;
};

TEST_F(VolumePipelineIntegrationTest, RegularStackThroughTransforms) {
    CollectingDiagnosticsSink sink;
    auto sources = createShuffledCtStack(10, std::nullopt);

    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_TRUE(image.has_value()) << image.error().toString();
    EXPECT_EQ(sink.count(), 0u);

    const auto geometry = baseOf(*image).geometry();
    EXPECT_EQ(geometry.dimension, (Dimension{10, kRows, kColumns}));
    EXPECT_EQ(geometry.origin, (Vector3{0.0, 80.0, -120.0}));
    EXPECT_EQ(geometry.spacing, (Vector3{2.5, 0.75, 0.75}));
    EXPECT_FALSE(geometry.isIrregular());
    EXPECT_DOUBLE_EQ(*defaultLowestIntensity(*image), -1000.0);

    // Even slices were stored at 0 offset, odd slices at 1024, both rescaled by -1024
    EXPECT_FLOAT_EQ(baseOf(*image).voxel(0, 0, 0), -1024.0f);
    EXPECT_FLOAT_EQ(baseOf(*image).voxel(1, 0, 1), 1.0f);

    auto normalised = normaliseIntensities(std::move(*image), "range", kUnsetBounds, {0.0, 1.0});
    ASSERT_TRUE(normalised.has_value());
    EXPECT_EQ(intensityKind(*normalised), IntensityKind::ArbitraryScale);
    EXPECT_EQ(baseOf(*normalised).geometry(), geometry);
    EXPECT_NEAR(baseOf(*normalised).voxel(0, 0, 0), 0.0, 1e-6);

    auto scaled = scaleIntensities(std::move(*normalised), 1000.0);
    ASSERT_TRUE(scaled.has_value());
    EXPECT_EQ(baseOf(*scaled).geometry(), geometry);
}

TEST_F(VolumePipelineIntegrationTest, MissingSliceThroughTransforms) {
    CollectingDiagnosticsSink sink;
    auto sources = createShuffledCtStack(8, 4);

    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_TRUE(image.has_value());

    EXPECT_EQ(sink.count(Diagnostic::Code::IrregularSliceSpacing), 1u);
    EXPECT_EQ(baseOf(*image).dimension()[0], 7u);
    EXPECT_DOUBLE_EQ(baseOf(*image).spacing()[0], 2.5);
    ASSERT_TRUE(baseOf(*image).slicePositions().has_value());
    EXPECT_EQ(*baseOf(*image).slicePositions(),
              (std::vector<double>{0.0, 2.5, 5.0, 7.5, 12.5, 15.0, 17.5}));

    auto mask = createMask(baseOf(*image).dimension());
    setMaskVoxel(mask, 3, 6, 8);

    auto normalised = normaliseIntensities(std::move(*image), "standardisation",
                                           kUnsetBounds, kUnsetBounds, mask);
    ASSERT_TRUE(normalised.has_value());

    // Irregular-spacing note carried over, degenerate single-voxel statistics added
    const auto& diagnostics = baseOf(*normalised).diagnostics();
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_NE(diagnostics.front().find("Inconsistent distance"), std::string::npos);
    EXPECT_TRUE(baseOf(*normalised).slicePositions().has_value());
}

TEST_F(VolumePipelineIntegrationTest, BatchOfIndependentSubjects) {
    std::vector<VolumeRequest> requests;
    for (size_t subject = 0; subject < 6; ++subject) {
        auto missing = subject % 3 == 0 ? std::optional<size_t>(3) : std::nullopt;
        requests.push_back({createShuffledCtStack(6 + subject, missing), Modality::CT});
    }

    auto results = importer.importBatch(std::move(requests));
    ASSERT_EQ(results.size(), 6u);

    for (size_t subject = 0; subject < results.size(); ++subject) {
        ASSERT_TRUE(results[subject].image.has_value()) << "subject " << subject;
        const size_t expectedSlices = 6 + subject - (subject % 3 == 0 ? 1 : 0);
        EXPECT_EQ(baseOf(*results[subject].image).dimension()[0], expectedSlices);
        EXPECT_EQ(results[subject].diagnostics.size(), subject % 3 == 0 ? 1u : 0u);
    }
}

}  // namespace
}  // namespace voxel_stack::core
