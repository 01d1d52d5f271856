#include <gtest/gtest.h>

#include "core/mask_validator.hpp"
#include "../test_utils/slice_generator.hpp"

using namespace voxel_stack::core;
using namespace voxel_stack::test_utils;

class MaskValidatorTest : public ::testing::Test {
protected:
    const Dimension dimension = {3, 4, 5};
};

TEST_F(MaskValidatorTest, CountsSelectedVoxels) {
    auto mask = createMask(dimension);
    setMaskVoxel(mask, 0, 0, 0);
    setMaskVoxel(mask, 2, 3, 4);
    setMaskVoxel(mask, 1, 2, 3);

    auto result = MaskValidator::validate(mask, dimension);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 3u);
    EXPECT_TRUE(MaskValidator::isBinary(mask));
}

TEST_F(MaskValidatorTest, FullMaskSelectsEverything) {
    auto result = MaskValidator::validate(createMask(dimension, 1), dimension);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 60u);
}

TEST_F(MaskValidatorTest, EmptyMaskRejected) {
    auto result = MaskValidator::validate(createMask(dimension), dimension, "roi");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ImageError::Code::InvalidMask);
    EXPECT_EQ(result.error().message,
              "'roi' is not a mask consisting of 0s and 1s: the mask is empty");
}

TEST_F(MaskValidatorTest, NonBinaryValueRejected) {
    auto mask = createMask(dimension, 1);
    setMaskVoxel(mask, 1, 1, 1, 255);

    EXPECT_FALSE(MaskValidator::isBinary(mask));

    auto result = MaskValidator::validate(mask, dimension);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ImageError::Code::InvalidMask);
    EXPECT_NE(result.error().message.find("found value 255"), std::string::npos);
}

TEST_F(MaskValidatorTest, NullMaskRejected) {
    auto result = MaskValidator::validate(nullptr, dimension);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ImageError::Code::InvalidMask);
    EXPECT_FALSE(MaskValidator::isBinary(nullptr));
}

TEST_F(MaskValidatorTest, DimensionMismatchRejected) {
    // Same voxel count, transposed axes
    auto result = MaskValidator::validate(createMask({5, 4, 3}, 1), dimension);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ImageError::Code::DimensionMismatch);
}
