#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace engine::render
{
/// Built-in 3x5 bitmap font laid out on a 4x6 cell. Lowercase letters draw as uppercase.
class PixelFont
{
public:
    static constexpr int kGlyphWidth = 3;
    static constexpr int kGlyphHeight = 5;
    static constexpr int kAdvanceX = 4;
    static constexpr int kAdvanceY = 6;

    /// One row per entry; bit 2 is the leftmost column.
    using Glyph = std::array<std::uint8_t, kGlyphHeight>;

    [[nodiscard]] static bool HasGlyph(char c);
    /// Unknown characters map to '?'.
    [[nodiscard]] static const Glyph& GetGlyph(char c);
    [[nodiscard]] static bool IsPixelSet(const Glyph& glyph, int column, int row);

    /// Widest line in pixels; lines split on '\n'.
    [[nodiscard]] static int TextWidth(const std::string& text, int scale = 1);
    [[nodiscard]] static int TextHeight(const std::string& text, int scale = 1);
};
} // namespace engine::render
