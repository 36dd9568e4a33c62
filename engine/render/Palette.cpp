#include "engine/render/Palette.hpp"

#include <array>
#include <cstddef>

namespace engine::render
{
namespace
{
constexpr std::array<std::uint32_t, static_cast<std::size_t>(PaletteColor::Count)> kPalette{
    0x000000U, 0x2B335FU, 0x7E2072U, 0x19959CU,
    0x8B4852U, 0x395C98U, 0xA9C1FFU, 0xEEEEEEU,
    0xD4186CU, 0xD38441U, 0xE9C35BU, 0x70C6A9U,
    0x7696DEU, 0xA3A3A3U, 0xFF9798U, 0xEDC7B0U,
};
} // namespace

std::uint32_t PaletteHex(PaletteColor color)
{
    const auto index = static_cast<std::size_t>(color);
    return index < kPalette.size() ? kPalette[index] : kPalette[0];
}

glm::vec3 PaletteRgb(PaletteColor color)
{
    const std::uint32_t hex = PaletteHex(color);
    return glm::vec3{
        static_cast<float>((hex >> 16U) & 0xFFU) / 255.0F,
        static_cast<float>((hex >> 8U) & 0xFFU) / 255.0F,
        static_cast<float>(hex & 0xFFU) / 255.0F,
    };
}
} // namespace engine::render
