#include "engine/render/PixelFont.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace engine::render
{
namespace
{
using Glyph = PixelFont::Glyph;

const std::unordered_map<char, Glyph> kGlyphs{
    {' ', {0, 0, 0, 0, 0}},
    {'0', {7, 5, 5, 5, 7}},
    {'1', {2, 6, 2, 2, 7}},
    {'2', {7, 1, 7, 4, 7}},
    {'3', {7, 1, 7, 1, 7}},
    {'4', {5, 5, 7, 1, 1}},
    {'5', {7, 4, 7, 1, 7}},
    {'6', {7, 4, 7, 5, 7}},
    {'7', {7, 1, 1, 1, 1}},
    {'8', {7, 5, 7, 5, 7}},
    {'9', {7, 5, 7, 1, 7}},
    {'A', {2, 5, 7, 5, 5}},
    {'B', {6, 5, 6, 5, 6}},
    {'C', {3, 4, 4, 4, 3}},
    {'D', {6, 5, 5, 5, 6}},
    {'E', {7, 4, 6, 4, 7}},
    {'F', {7, 4, 6, 4, 4}},
    {'G', {3, 4, 5, 5, 3}},
    {'H', {5, 5, 7, 5, 5}},
    {'I', {7, 2, 2, 2, 7}},
    {'J', {1, 1, 1, 5, 2}},
    {'K', {5, 5, 6, 5, 5}},
    {'L', {4, 4, 4, 4, 7}},
    {'M', {5, 7, 7, 5, 5}},
    {'N', {6, 5, 5, 5, 5}},
    {'O', {2, 5, 5, 5, 2}},
    {'P', {6, 5, 6, 4, 4}},
    {'Q', {2, 5, 5, 6, 3}},
    {'R', {6, 5, 6, 5, 5}},
    {'S', {3, 4, 2, 1, 6}},
    {'T', {7, 2, 2, 2, 2}},
    {'U', {5, 5, 5, 5, 7}},
    {'V', {5, 5, 5, 5, 2}},
    {'W', {5, 5, 7, 7, 5}},
    {'X', {5, 5, 2, 5, 5}},
    {'Y', {5, 5, 2, 2, 2}},
    {'Z', {7, 1, 2, 4, 7}},
    {'.', {0, 0, 0, 0, 2}},
    {',', {0, 0, 0, 2, 4}},
    {':', {0, 2, 0, 2, 0}},
    {'!', {2, 2, 2, 0, 2}},
    {'?', {7, 1, 2, 0, 2}},
    {'-', {0, 0, 7, 0, 0}},
    {'+', {0, 2, 7, 2, 0}},
    {'=', {0, 7, 0, 7, 0}},
    {'/', {1, 1, 2, 4, 4}},
    {'(', {1, 2, 2, 2, 1}},
    {')', {4, 2, 2, 2, 4}},
    {'<', {1, 2, 4, 2, 1}},
    {'>', {4, 2, 1, 2, 4}},
    {'_', {0, 0, 0, 0, 7}},
    {'\'', {2, 2, 0, 0, 0}},
    {'#', {5, 7, 5, 7, 5}},
    {'%', {5, 1, 2, 4, 5}},
    {'*', {5, 2, 7, 2, 5}},
};

char Normalize(char c)
{
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}
} // namespace

bool PixelFont::HasGlyph(char c)
{
    return kGlyphs.find(Normalize(c)) != kGlyphs.end();
}

const PixelFont::Glyph& PixelFont::GetGlyph(char c)
{
    const auto it = kGlyphs.find(Normalize(c));
    if (it == kGlyphs.end())
    {
        return kGlyphs.at('?');
    }
    return it->second;
}

bool PixelFont::IsPixelSet(const Glyph& glyph, int column, int row)
{
    if (column < 0 || column >= kGlyphWidth || row < 0 || row >= kGlyphHeight)
    {
        return false;
    }
    const unsigned bits = glyph[static_cast<std::size_t>(row)];
    return ((bits >> static_cast<unsigned>(kGlyphWidth - 1 - column)) & 1U) != 0U;
}

int PixelFont::TextWidth(const std::string& text, int scale)
{
    int widest = 0;
    int current = 0;
    for (const char c : text)
    {
        if (c == '\n')
        {
            widest = std::max(widest, current);
            current = 0;
            continue;
        }
        ++current;
    }
    widest = std::max(widest, current);
    // No trailing gap after the last glyph.
    return widest == 0 ? 0 : (widest * kAdvanceX - 1) * scale;
}

int PixelFont::TextHeight(const std::string& text, int scale)
{
    if (text.empty())
    {
        return 0;
    }
    const int lines = 1 + static_cast<int>(std::count(text.begin(), text.end(), '\n'));
    return (lines * kAdvanceY - 1) * scale;
}
} // namespace engine::render
