#include <render/Synthesizer.hpp>
#include <render/ShapeCatalog.hpp>

#include <gtest/gtest.h>

#include <cmath>

TEST(Synthesizer, hotspotFollowsScaleForEveryType) {
    CSynthesizer synth;

    for (int i = 0; i < CURSOR_TYPE_COUNT; ++i) {
        const auto& SHAPE = shapeCatalog().get((eCursorType)i);

        for (const float SCALE : {0.5F, 1.F, 1.5F, 3.F}) {
            const auto RESULT = synth.synthesize(SHAPE, {.scale = SCALE});
            ASSERT_TRUE(RESULT.has_value()) << RESULT.error();

            EXPECT_EQ(RESULT->hotspot.x, std::round(SHAPE.hotspot.x * SCALE)) << cursorTypeToString(SHAPE.type) << " @ " << SCALE;
            EXPECT_EQ(RESULT->hotspot.y, std::round(SHAPE.hotspot.y * SCALE)) << cursorTypeToString(SHAPE.type) << " @ " << SCALE;

            // the hotspot always lands inside what the plane shows
            EXPECT_LT(RESULT->hotspot.x, RESULT->displaySize);
            EXPECT_LT(RESULT->hotspot.y, RESULT->displaySize);
        }
    }
}

TEST(Synthesizer, catalogHasEveryType) {
    for (int i = 0; i < CURSOR_TYPE_COUNT; ++i) {
        const auto& SHAPE = shapeCatalog().get((eCursorType)i);
        EXPECT_EQ(SHAPE.type, (eCursorType)i);
        EXPECT_FALSE(SHAPE.layers.empty());
    }
}

TEST(Synthesizer, idempotent) {
    CSynthesizer           synth;
    const SSynthesisParams PARAMS = {.scale = 2.F, .outline = 1.F, .frost = 40};

    const auto             A = synth.synthesize(shapeCatalog().get(CURSOR_GRAB), PARAMS);
    const auto             B = synth.synthesize(shapeCatalog().get(CURSOR_GRAB), PARAMS);

    ASSERT_TRUE(A && B);
    EXPECT_EQ(A->pixels, B->pixels);
    EXPECT_EQ(A->hotspot, B->hotspot);
}

TEST(Synthesizer, outputIsPremultiplied) {
    CSynthesizer synth;
    const auto   RESULT = synth.synthesize(shapeCatalog().get(CURSOR_DEFAULT), {.scale = 1.5F, .alpha = 180});
    ASSERT_TRUE(RESULT);
    ASSERT_EQ(RESULT->pixels.size(), (size_t)CURSOR_BUFFER_SIZE * CURSOR_BUFFER_SIZE);

    bool anyVisible = false;
    for (const auto PX : RESULT->pixels) {
        const uint32_t A = PX >> 24;
        EXPECT_LE((PX >> 16) & 0xFF, A);
        EXPECT_LE((PX >> 8) & 0xFF, A);
        EXPECT_LE(PX & 0xFF, A);
        EXPECT_LE(A, 180u);
        anyVisible = anyVisible || A > 0;
    }

    EXPECT_TRUE(anyVisible);
}

TEST(Synthesizer, zeroAlphaIsFullyTransparent) {
    CSynthesizer synth;
    const auto   RESULT = synth.synthesize(shapeCatalog().get(CURSOR_WAIT), {.scale = 2.F, .alpha = 0});
    ASSERT_TRUE(RESULT);

    for (const auto PX : RESULT->pixels) {
        ASSERT_EQ(PX, 0u);
    }
}

TEST(Synthesizer, displaySizePicksSmallestFit) {
    const auto& SHAPE = shapeCatalog().get(CURSOR_DEFAULT);

    EXPECT_EQ(CSynthesizer::displaySizeFor(SHAPE, 1.F, 256), 64u);
    EXPECT_EQ(CSynthesizer::displaySizeFor(SHAPE, 5.F, 256), 128u);
    EXPECT_EQ(CSynthesizer::displaySizeFor(SHAPE, 10.F, 256), 256u);

    // capped by the device, never below 64
    EXPECT_EQ(CSynthesizer::displaySizeFor(SHAPE, 10.F, 64), 64u);
    EXPECT_EQ(CSynthesizer::displaySizeFor(SHAPE, 10.F, 32), 64u);
}

TEST(Synthesizer, scaleIsClamped) {
    CSynthesizer synth;
    const auto&  SHAPE = shapeCatalog().get(CURSOR_POINTER);

    const auto   OVERSIZED  = synth.synthesize(SHAPE, {.scale = 50.F});
    const auto   TEN   = synth.synthesize(SHAPE, {.scale = 10.F});
    ASSERT_TRUE(OVERSIZED && TEN);

    EXPECT_EQ(OVERSIZED->hotspot, TEN->hotspot);
    EXPECT_EQ(OVERSIZED->pixels, TEN->pixels);
}
