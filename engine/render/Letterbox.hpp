#pragma once

namespace engine::render
{
/// Framebuffer rectangle the logical canvas is drawn into, in GL viewport coordinates.
struct Letterbox
{
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
    /// Integer pixel scale; 0 when the framebuffer is smaller than the canvas and a fractional fit is used.
    int scale = 0;
};

[[nodiscard]] Letterbox ComputeLetterbox(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight);
} // namespace engine::render
