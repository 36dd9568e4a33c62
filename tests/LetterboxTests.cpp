#include <gtest/gtest.h>

#include "engine/render/Letterbox.hpp"
#include "engine/render/Palette.hpp"

using engine::render::ComputeLetterbox;
using engine::render::Letterbox;

TEST(Letterbox, ExactMultipleFillsTheFramebuffer)
{
    const Letterbox box = ComputeLetterbox(768, 576, 256, 192);
    EXPECT_EQ(box.scale, 3);
    EXPECT_EQ(box.x, 0);
    EXPECT_EQ(box.y, 0);
    EXPECT_EQ(box.width, 768);
    EXPECT_EQ(box.height, 576);
}

TEST(Letterbox, WideFramebufferIsPillarboxed)
{
    const Letterbox box = ComputeLetterbox(1920, 1080, 256, 192);
    EXPECT_EQ(box.scale, 5);
    EXPECT_EQ(box.width, 1280);
    EXPECT_EQ(box.height, 960);
    EXPECT_EQ(box.x, 320);
    EXPECT_EQ(box.y, 60);
}

TEST(Letterbox, SmallFramebufferFallsBackToFractionalFit)
{
    const Letterbox box = ComputeLetterbox(128, 192, 256, 192);
    EXPECT_EQ(box.scale, 0);
    EXPECT_EQ(box.width, 128);
    EXPECT_EQ(box.height, 96);
    EXPECT_EQ(box.y, 48);
}

TEST(Letterbox, DegenerateSizesYieldEmptyBox)
{
    const Letterbox box = ComputeLetterbox(0, 576, 256, 192);
    EXPECT_EQ(box.width, 0);
    EXPECT_EQ(box.height, 0);
}

TEST(Palette, ConvertsHexToUnitRgb)
{
    using engine::render::PaletteColor;
    EXPECT_EQ(engine::render::PaletteHex(PaletteColor::Black), 0x000000U);
    const glm::vec3 white = engine::render::PaletteRgb(PaletteColor::White);
    EXPECT_FLOAT_EQ(white.r, 238.0F / 255.0F);
    EXPECT_FLOAT_EQ(white.g, 238.0F / 255.0F);
    EXPECT_FLOAT_EQ(white.b, 238.0F / 255.0F);
    EXPECT_EQ(engine::render::PaletteHex(PaletteColor::Count), 0x000000U);
}
