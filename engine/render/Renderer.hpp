#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec2.hpp>
#include <glm/vec3.hpp>

#include "engine/render/Letterbox.hpp"
#include "engine/render/Palette.hpp"

namespace engine::render
{
/// Batched flat-color quad renderer for a fixed-size logical pixel canvas.
///
/// Draw calls only append vertices; everything is uploaded and drawn in one
/// pass by EndFrame. Coordinates are logical pixels with the origin top-left.
class Renderer
{
public:
    bool Initialize(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight);
    void Shutdown();

    void SetViewport(int framebufferWidth, int framebufferHeight);

    void BeginFrame(PaletteColor borderColor, PaletteColor clearColor);
    void EndFrame();

    void DrawRect(int x, int y, int width, int height, PaletteColor color);
    void DrawRectOutline(int x, int y, int width, int height, PaletteColor color);
    void DrawText(int x, int y, const std::string& text, PaletteColor color, int scale = 1);
    void DrawTextCentered(int centerX, int y, const std::string& text, PaletteColor color, int scale = 1);

    [[nodiscard]] const Letterbox& GetLetterbox() const { return m_letterbox; }
    [[nodiscard]] int LogicalWidth() const { return m_logicalWidth; }
    [[nodiscard]] int LogicalHeight() const { return m_logicalHeight; }
    [[nodiscard]] std::size_t LastFrameQuadCount() const { return m_lastFrameQuadCount; }

private:
    struct QuadVertex
    {
        glm::vec2 position;
        glm::vec3 color;
    };

    static unsigned int CompileShader(unsigned int type, const char* source);
    static unsigned int CreateProgram(const char* vertexSource, const char* fragmentSource);

    unsigned int m_program = 0;
    unsigned int m_vao = 0;
    unsigned int m_vbo = 0;
    std::size_t m_vboCapacityBytes = 0;
    int m_projectionLocation = -1;

    int m_framebufferWidth = 0;
    int m_framebufferHeight = 0;
    int m_logicalWidth = 256;
    int m_logicalHeight = 192;
    Letterbox m_letterbox{};
    glm::mat4 m_projection{1.0F};

    std::vector<QuadVertex> m_vertices;
    std::size_t m_lastFrameQuadCount = 0;
};
} // namespace engine::render
