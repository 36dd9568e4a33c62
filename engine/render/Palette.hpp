#pragma once

#include <cstdint>

#include <glm/vec3.hpp>

namespace engine::render
{
/// The fixed 16-color retro palette. Every draw call picks one of these.
enum class PaletteColor : std::uint8_t
{
    Black = 0,
    Navy,
    Purple,
    Teal,
    Brown,
    DarkBlue,
    LightBlue,
    White,
    Red,
    Orange,
    Yellow,
    Green,
    Blue,
    Gray,
    Pink,
    Peach,
    Count
};

[[nodiscard]] std::uint32_t PaletteHex(PaletteColor color);
[[nodiscard]] glm::vec3 PaletteRgb(PaletteColor color);
} // namespace engine::render
