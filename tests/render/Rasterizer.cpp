#include <render/Rasterizer.hpp>

#include <gtest/gtest.h>

static Polygon square(double x0, double y0, double x1, double y1) {
    return Polygon{{x0, y0}, {x1, y0}, {x1, y1}, {x0, y1}};
}

TEST(Rasterizer, fillsAlignedSquareExactly) {
    const auto MASK = NRasterizer::fill({square(10, 10, 20, 20)}, 32, 32);

    EXPECT_FLOAT_EQ(MASK.at(10, 10), 1.F);
    EXPECT_FLOAT_EQ(MASK.at(19, 19), 1.F);
    EXPECT_FLOAT_EQ(MASK.at(15, 12), 1.F);

    EXPECT_FLOAT_EQ(MASK.at(9, 15), 0.F);
    EXPECT_FLOAT_EQ(MASK.at(20, 15), 0.F);
    EXPECT_FLOAT_EQ(MASK.at(15, 20), 0.F);
}

TEST(Rasterizer, partialHorizontalCoverage) {
    const auto MASK = NRasterizer::fill({square(10.5, 10, 20, 20)}, 32, 32);

    EXPECT_NEAR(MASK.at(10, 15), 0.5F, 1e-5);
    EXPECT_FLOAT_EQ(MASK.at(11, 15), 1.F);
}

TEST(Rasterizer, evenOddLeavesHole) {
    const auto MASK = NRasterizer::fill({square(0, 0, 20, 20), square(5, 5, 15, 15)}, 32, 32);

    EXPECT_FLOAT_EQ(MASK.at(2, 2), 1.F);
    EXPECT_FLOAT_EQ(MASK.at(10, 10), 0.F);
}

TEST(Rasterizer, expandGrowsOuterAndShrinksHole) {
    const auto GROWN = NRasterizer::expand({square(10, 10, 20, 20), square(13, 13, 17, 17)}, 1.0);
    ASSERT_EQ(GROWN.size(), 2u);

    const auto MASK = NRasterizer::fill(GROWN, 32, 32);

    // outer edge moved out by one pixel
    EXPECT_FLOAT_EQ(MASK.at(9, 15), 1.F);
    EXPECT_FLOAT_EQ(MASK.at(8, 15), 0.F);

    // hole edge moved in by one pixel
    EXPECT_FLOAT_EQ(MASK.at(13, 15), 1.F);
    EXPECT_FLOAT_EQ(MASK.at(14, 15), 0.F);
}

TEST(Rasterizer, ringIsOutlineOnly) {
    const auto INNER = NRasterizer::fill({square(10, 10, 20, 20)}, 32, 32);
    const auto OUTER = NRasterizer::fill(NRasterizer::expand({square(10, 10, 20, 20)}, 2.0), 32, 32);
    const auto RING  = NRasterizer::ring(OUTER, INNER);

    EXPECT_FLOAT_EQ(RING.at(15, 15), 0.F);
    EXPECT_FLOAT_EQ(RING.at(8, 15), 1.F);
    EXPECT_FLOAT_EQ(RING.at(21, 15), 1.F);
    EXPECT_FLOAT_EQ(RING.at(5, 15), 0.F);
}

TEST(Rasterizer, compositeIsPremultiplied) {
    CPixelBuffer buf(4, 4);
    auto         mask = NRasterizer::fill({square(0, 0, 4, 4)}, 4, 4);

    NRasterizer::composite(buf, mask, CColor{1.F, 0.F, 0.F, 0.5F});

    const uint32_t PX = buf.pixels()[0];
    const uint32_t A  = PX >> 24;
    const uint32_t R  = (PX >> 16) & 0xFF;

    EXPECT_NEAR(A, 128, 1);
    EXPECT_NEAR(R, 128, 1);
    EXPECT_EQ(PX & 0xFFFF, 0u);
}

TEST(Rasterizer, applyAlphaZeroClearsEverything) {
    CPixelBuffer buf(8, 8);
    auto         mask = NRasterizer::fill({square(0, 0, 8, 8)}, 8, 8);
    NRasterizer::composite(buf, mask, CColor{1.F, 1.F, 1.F, 1.F});

    NRasterizer::applyAlpha(buf, 0);

    for (const auto PX : buf.pixels()) {
        EXPECT_EQ(PX, 0u);
    }
}

TEST(Rasterizer, boxBlurSpreadsCoverage) {
    CPixelBuffer buf(16, 16);
    auto         mask = NRasterizer::fill({square(6, 6, 10, 10)}, 16, 16);
    NRasterizer::composite(buf, mask, CColor{0.F, 0.F, 0.F, 1.F});

    const auto BLURRED = NRasterizer::boxBlur(buf, 2);

    EXPECT_EQ(buf.pixels()[5 * 16 + 5] >> 24, 0u);
    EXPECT_GT(BLURRED.pixels()[5 * 16 + 5] >> 24, 0u);
    EXPECT_LT(BLURRED.pixels()[6 * 16 + 6] >> 24, 255u);
}
