#include <gtest/gtest.h>

#include "core/orientation_resolver.hpp"
#include "../test_utils/slice_generator.hpp"

using namespace voxel_stack::core;
using namespace voxel_stack::test_utils;

class OrientationResolverTest : public ::testing::Test {
protected:
    static constexpr double kTolerance = 1e-9;

    SliceOrderingResolver orderingResolver;
    OrientationResolver orientationResolver;
    NullDiagnosticsSink sink;

    static void expectMatrixNear(const Matrix3& actual, const Matrix3& expected) {
        for (size_t i = 0; i < 3; ++i) {
            for (size_t j = 0; j < 3; ++j) {
                EXPECT_NEAR(actual[i][j], expected[i][j], kTolerance)
                    << "element (" << i << ", " << j << ")";
            }
        }
    }
};

TEST_F(OrientationResolverTest, CanonicalDirectionReversesFlattenedMatrix) {
    Matrix3 source = {{
        {1.0, 2.0, 3.0},
        {4.0, 5.0, 6.0},
        {7.0, 8.0, 9.0}
    }};

    Matrix3 expected = {{
        {9.0, 8.0, 7.0},
        {6.0, 5.0, 4.0},
        {3.0, 2.0, 1.0}
    }};

    expectMatrixNear(OrientationResolver::toCanonicalDirection(source), expected);
    expectMatrixNear(OrientationResolver::toCanonicalDirection(kIdentityMatrix), kIdentityMatrix);
}

TEST_F(OrientationResolverTest, AxialStackGivesIdentity) {
    auto ordering = orderingResolver.resolve(createAxialStack({2.0, 0.0, 1.0}), sink);
    ASSERT_TRUE(ordering.has_value());

    expectMatrixNear(orientationResolver.resolve(*ordering), kIdentityMatrix);
}

TEST_F(OrientationResolverTest, IrregularStackUsesSmallestDelta) {
    // Leading gap of 3 must not stretch the slice direction
    auto ordering = orderingResolver.resolve(createAxialStack({0.0, 3.0, 4.0, 5.0}), sink);
    ASSERT_TRUE(ordering.has_value());
    ASSERT_TRUE(ordering->isIrregular());

    auto orientation = orientationResolver.resolve(*ordering);
    EXPECT_NEAR(orientation[0][0], 1.0, kTolerance);
    EXPECT_NEAR(orientation[0][1], 0.0, kTolerance);
    EXPECT_NEAR(orientation[0][2], 0.0, kTolerance);
}

TEST_F(OrientationResolverTest, InPlaneRowsComeFromDirectionCosines) {
    // Rotated in-plane axes (source order rows x, y, z)
    Matrix3 direction = {{
        {0.0, 1.0, 0.0},
        {-1.0, 0.0, 0.0},
        {0.0, 0.0, 1.0}
    }};

    auto slices = createAxialStack({0.0, 1.0, 2.0});
    for (auto& slice : slices) {
        slice.direction = direction;
    }

    auto ordering = orderingResolver.resolve(std::move(slices), sink);
    ASSERT_TRUE(ordering.has_value());

    auto orientation = orientationResolver.resolve(*ordering);
    auto canonical = OrientationResolver::toCanonicalDirection(direction);

    expectMatrixNear(orientation, Matrix3{{
        {1.0, 0.0, 0.0},
        canonical[1],
        canonical[2]
    }});
}

TEST_F(OrientationResolverTest, ObliqueStackNormalisedBySpacing) {
    std::vector<SliceMetadata> slices;
    for (int i = 0; i < 3; ++i) {
        auto slice = createSlice({0.0, 4.0 * i, 3.0 * i});
        slice.originalIndex = static_cast<size_t>(i);
        slices.push_back(std::move(slice));
    }

    auto ordering = orderingResolver.resolve(std::move(slices), sink);
    ASSERT_TRUE(ordering.has_value());

    auto orientation = orientationResolver.resolve(*ordering);
    EXPECT_NEAR(orientation[0][0], 0.6, kTolerance);
    EXPECT_NEAR(orientation[0][1], 0.8, kTolerance);
    EXPECT_NEAR(orientation[0][2], 0.0, kTolerance);
}

TEST_F(OrientationResolverTest, ResolvingTwiceIsIdempotent) {
    auto first = orderingResolver.resolve(createAxialStack({4.0, 0.0, 1.0, 2.0}), sink);
    ASSERT_TRUE(first.has_value());
    auto firstOrientation = orientationResolver.resolve(*first);

    // Re-run on the already ordered slices
    auto second = orderingResolver.resolve(first->slices, sink);
    ASSERT_TRUE(second.has_value());
    auto secondOrientation = orientationResolver.resolve(*second);

    expectMatrixNear(secondOrientation, firstOrientation);
    expectMatrixNear(orientationResolver.resolve(*first), firstOrientation);
}

TEST_F(OrientationResolverTest, SingleSliceKeepsDirection) {
    auto ordering = orderingResolver.resolve(createAxialStack({3.0}), sink);
    ASSERT_TRUE(ordering.has_value());

    expectMatrixNear(orientationResolver.resolve(*ordering), kIdentityMatrix);
}
