#include "engine/render/Letterbox.hpp"

#include <algorithm>

namespace engine::render
{
Letterbox ComputeLetterbox(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight)
{
    Letterbox box;
    if (framebufferWidth <= 0 || framebufferHeight <= 0 || logicalWidth <= 0 || logicalHeight <= 0)
    {
        return box;
    }

    const int scale = std::min(framebufferWidth / logicalWidth, framebufferHeight / logicalHeight);
    if (scale >= 1)
    {
        box.scale = scale;
        box.width = logicalWidth * scale;
        box.height = logicalHeight * scale;
    }
    else
    {
        const float fit = std::min(
            static_cast<float>(framebufferWidth) / static_cast<float>(logicalWidth),
            static_cast<float>(framebufferHeight) / static_cast<float>(logicalHeight)
        );
        box.width = std::max(1, static_cast<int>(static_cast<float>(logicalWidth) * fit));
        box.height = std::max(1, static_cast<int>(static_cast<float>(logicalHeight) * fit));
    }

    box.x = (framebufferWidth - box.width) / 2;
    box.y = (framebufferHeight - box.height) / 2;
    return box;
}
} // namespace engine::render
