#include "core/volume_importer.hpp"

#include "../test_utils/slice_generator.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <latch>
#include <thread>
#include <vector>

namespace voxel_stack::core {
namespace {

using test_utils::createAxialStack;
using test_utils::createSlice;
using test_utils::createSliceImage;
using test_utils::createSources;

// =============================================================================
// InMemorySliceSource
// =============================================================================

TEST(InMemorySliceSourceTest, MetadataSizeDerivedFromPixelData) {
    SliceMetadata slice;
    slice.pixelData = createSliceImage(7, 5);

    InMemorySliceSource source(slice);
    ASSERT_TRUE(source.loadMetadata().has_value());
    EXPECT_EQ(source.metadata().columns(), 7u);
    EXPECT_EQ(source.metadata().rows(), 5u);
    EXPECT_TRUE(source.loadData().has_value());
}

TEST(InMemorySliceSourceTest, LoadsAreIdempotent) {
    InMemorySliceSource source(createSlice({0.0, 0.0, 1.0}));
    ASSERT_TRUE(source.loadMetadata().has_value());
    ASSERT_TRUE(source.loadMetadata().has_value());
    ASSERT_TRUE(source.loadData().has_value());
    ASSERT_TRUE(source.loadData().has_value());
    EXPECT_EQ(source.metadata().columns(), 4u);
}

TEST(InMemorySliceSourceTest, MissingSizeFails) {
    SliceMetadata slice;
    slice.originalIndex = 3;

    InMemorySliceSource source(slice);
    auto result = source.loadMetadata();
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("Slice 3"), std::string::npos);
}

TEST(InMemorySliceSourceTest, MissingPixelDataFails) {
    auto slice = createSlice({0.0, 0.0, 0.0});
    slice.pixelData = nullptr;

    InMemorySliceSource source(slice);
    EXPECT_TRUE(source.loadMetadata().has_value());
    EXPECT_FALSE(source.loadData().has_value());
}

// =============================================================================
// VolumeImporter
// =============================================================================

class VolumeImporterTest : public ::testing::Test {
protected:
    /// Slices at the given z with pixel value z * 10 + 0.5
    SliceSourceList createCtSources(const std::vector<double>& zPositions) {
        auto slices = createAxialStack(zPositions);
        for (auto& slice : slices) {
            slice.rescale = {1.0, 0.5};
        }
        return createSources(std::move(slices));
    }

    VolumeImporter importer;
    CollectingDiagnosticsSink sink;
};

TEST_F(VolumeImporterTest, ImportsCtVolume) {
    auto sources = createCtSources({1.0, 0.0, 2.0});

    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_TRUE(image.has_value()) << image.error().toString();

    ASSERT_TRUE(std::holds_alternative<PhysicalUnitImage>(*image));
    EXPECT_EQ(intensityKind(*image), IntensityKind::ExactPhysicalUnit);

    const auto& base = baseOf(*image);
    EXPECT_EQ(base.dimension(), (Dimension{3, 3, 4}));
    EXPECT_EQ(base.spacing(), (Vector3{1.0, 0.5, 0.5}));
    EXPECT_EQ(base.orientation(), kIdentityMatrix);
    EXPECT_EQ(base.modality(), Modality::CT);

    // 0.5, 10.5, 20.5 rounded half away from zero
    EXPECT_FLOAT_EQ(base.voxel(0, 0, 0), 1.0f);
    EXPECT_FLOAT_EQ(base.voxel(1, 2, 3), 11.0f);
    EXPECT_FLOAT_EQ(base.voxel(2, 1, 1), 21.0f);

    EXPECT_TRUE(base.diagnostics().empty());
    EXPECT_EQ(sink.count(), 0u);
}

TEST_F(VolumeImporterTest, RoundingModeFromConfig) {
    ImportConfig config;
    config.roundingMode = RoundingMode::HalfToEven;
    VolumeImporter evenImporter(config);

    auto sources = createCtSources({0.0, 1.0});
    auto image = evenImporter.importVolume(sources, Modality::CT, sink);
    ASSERT_TRUE(image.has_value());

    EXPECT_FLOAT_EQ(baseOf(*image).voxel(0, 0, 0), 0.0f);
    EXPECT_FLOAT_EQ(baseOf(*image).voxel(1, 0, 0), 10.0f);
}

TEST_F(VolumeImporterTest, PetKeepsContinuousValues) {
    auto sources = createCtSources({0.0, 1.0});
    auto image = importer.importVolume(sources, Modality::PET, sink);
    ASSERT_TRUE(image.has_value());

    EXPECT_EQ(intensityKind(*image), IntensityKind::ExactPhysicalUnit);
    EXPECT_FLOAT_EQ(baseOf(*image).voxel(1, 0, 0), 10.5f);
}

TEST_F(VolumeImporterTest, MrBecomesGenericImage) {
    auto sources = createCtSources({0.0, 1.0});
    auto image = importer.importVolume(sources, Modality::MR, sink);
    ASSERT_TRUE(image.has_value());

    EXPECT_TRUE(std::holds_alternative<GenericImage>(*image));
    EXPECT_FLOAT_EQ(baseOf(*image).voxel(0, 0, 0), 0.5f);
}

TEST_F(VolumeImporterTest, IrregularSpacingReportedToSinkAndImage) {
    auto sources = createCtSources({0.0, 1.0, 3.0});

    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_TRUE(image.has_value());

    EXPECT_EQ(sink.count(Diagnostic::Code::IrregularSliceSpacing), 1u);
    ASSERT_EQ(baseOf(*image).diagnostics().size(), 1u);
    EXPECT_EQ(baseOf(*image).diagnostics().front(), sink.diagnostics().front().message);

    ASSERT_TRUE(baseOf(*image).slicePositions().has_value());
    EXPECT_EQ(*baseOf(*image).slicePositions(), (std::vector<double>{0.0, 1.0, 3.0}));
}

TEST_F(VolumeImporterTest, EmptySourcesFail) {
    SliceSourceList sources;
    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, AssemblyError::Code::EmptyInput);
}

TEST_F(VolumeImporterTest, MetadataFailureReported) {
    std::vector<SliceMetadata> slices = createAxialStack({0.0, 1.0});
    slices[1] = SliceMetadata{};

    auto sources = createSources(std::move(slices));
    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, AssemblyError::Code::SliceLoadFailed);
}

TEST_F(VolumeImporterTest, DataFailureReported) {
    auto slices = createAxialStack({0.0, 1.0});
    slices[0].pixelData = nullptr;

    auto sources = createSources(std::move(slices));
    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, AssemblyError::Code::SliceLoadFailed);
}

TEST_F(VolumeImporterTest, PixelGridMismatchReported) {
    auto slices = createAxialStack({0.0, 1.0});
    slices[1].pixelData = createSliceImage(5, 3);

    auto sources = createSources(std::move(slices));
    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, AssemblyError::Code::PixelDataMismatch);
}

TEST_F(VolumeImporterTest, DuplicatePositionsFail) {
    auto sources = createCtSources({0.0, 1.0, 1.0});
    auto image = importer.importVolume(sources, Modality::CT, sink);
    ASSERT_FALSE(image.has_value());
    EXPECT_EQ(image.error().code, AssemblyError::Code::GeometryMismatch);
}

TEST_F(VolumeImporterTest, ProgressReported) {
    std::vector<size_t> progress;
    importer.setProgressCallback([&progress](size_t current, size_t, const std::string&) {
        progress.push_back(current);
    });

    auto sources = createCtSources({0.0, 1.0});
    ASSERT_TRUE(importer.importVolume(sources, Modality::CT, sink).has_value());

    ASSERT_FALSE(progress.empty());
    EXPECT_EQ(progress.front(), 0u);
    EXPECT_EQ(progress.back(), 100u);
    EXPECT_TRUE(std::is_sorted(progress.begin(), progress.end()));
}

TEST_F(VolumeImporterTest, AsyncImport) {
    auto future = importer.importVolumeAsync(createCtSources({2.0, 0.0, 1.0}), Modality::CT, sink);
    auto image = future.get();
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(baseOf(*image).dimension()[0], 3u);
}

TEST_F(VolumeImporterTest, BatchIsolatesFailures) {
    std::vector<VolumeRequest> requests;
    requests.push_back({createCtSources({0.0, 1.0, 2.0}), Modality::CT});
    requests.push_back({createCtSources({0.0, 0.0}), Modality::CT});
    requests.push_back({createCtSources({0.0, 1.0, 3.0}), Modality::MR});

    auto results = importer.importBatch(std::move(requests));
    ASSERT_EQ(results.size(), 3u);

    ASSERT_TRUE(results[0].image.has_value());
    EXPECT_TRUE(results[0].diagnostics.empty());

    ASSERT_FALSE(results[1].image.has_value());
    EXPECT_EQ(results[1].image.error().code, AssemblyError::Code::GeometryMismatch);

    ASSERT_TRUE(results[2].image.has_value());
    EXPECT_EQ(intensityKind(*results[2].image), IntensityKind::ArbitraryScale);
    ASSERT_EQ(results[2].diagnostics.size(), 1u);
    EXPECT_EQ(results[2].diagnostics.front().code, Diagnostic::Code::IrregularSliceSpacing);
}

TEST_F(VolumeImporterTest, ConcurrentImportsUseSeparateSinks) {
    constexpr int kThreadCount = 4;

    std::vector<SliceSourceList> sourceLists;
    for (int i = 0; i < kThreadCount; ++i) {
        // Odd volumes miss a slice
        sourceLists.push_back(i % 2 == 0 ? createCtSources({0.0, 1.0, 2.0, 3.0})
                                         : createCtSources({0.0, 1.0, 3.0, 4.0}));
    }

    std::vector<CollectingDiagnosticsSink> sinks(kThreadCount);
    std::latch startLatch(kThreadCount);
    std::atomic<int> succeeded{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreadCount; ++i) {
        threads.emplace_back([&, i] {
            startLatch.arrive_and_wait();
            auto image = importer.importVolume(sourceLists[i], Modality::CT, sinks[i]);
            if (image) {
                succeeded.fetch_add(1);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(succeeded.load(), kThreadCount);
    for (int i = 0; i < kThreadCount; ++i) {
        EXPECT_EQ(sinks[i].count(), i % 2 == 0 ? 0u : 1u) << "volume " << i;
    }
}

}  // namespace
}  // namespace voxel_stack::core
