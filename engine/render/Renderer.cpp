#include "engine/render/Renderer.hpp"

#include <algorithm>
#include <iostream>

#include <glad/glad.h>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include "engine/render/PixelFont.hpp"

namespace engine::render
{
namespace
{
constexpr const char* kQuadVertexShader = R"(
#version 450 core
layout (location = 0) in vec2 aPosition;
layout (location = 1) in vec3 aColor;

uniform mat4 uProjection;

out vec3 vColor;

void main()
{
    vColor = aColor;
    gl_Position = uProjection * vec4(aPosition, 0.0, 1.0);
}
)";

constexpr const char* kQuadFragmentShader = R"(
#version 450 core
in vec3 vColor;
out vec4 FragColor;

void main()
{
    FragColor = vec4(vColor, 1.0);
}
)";
} // namespace

bool Renderer::Initialize(int framebufferWidth, int framebufferHeight, int logicalWidth, int logicalHeight)
{
    m_logicalWidth = std::max(1, logicalWidth);
    m_logicalHeight = std::max(1, logicalHeight);
    m_projection = glm::ortho(0.0F, static_cast<float>(m_logicalWidth), static_cast<float>(m_logicalHeight), 0.0F, -1.0F, 1.0F);

    m_vertices.reserve(6U * 4096U);

    m_program = CreateProgram(kQuadVertexShader, kQuadFragmentShader);
    if (m_program == 0)
    {
        return false;
    }

    glGenVertexArrays(1, &m_vao);
    glGenBuffers(1, &m_vbo);

    glBindVertexArray(m_vao);
    glBindBuffer(GL_ARRAY_BUFFER, m_vbo);
    m_vboCapacityBytes = 256U * 1024U;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_vboCapacityBytes), nullptr, GL_STREAM_DRAW);

    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, sizeof(QuadVertex), reinterpret_cast<void*>(offsetof(QuadVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(QuadVertex), reinterpret_cast<void*>(offsetof(QuadVertex, color)));
    glEnableVertexAttribArray(1);

    glBindBuffer(GL_ARRAY_BUFFER, 0);
    glBindVertexArray(0);

    m_projectionLocation = glGetUniformLocation(m_program, "uProjection");

    glDisable(GL_DEPTH_TEST);
    SetViewport(framebufferWidth, framebufferHeight);
    return true;
}

void Renderer::Shutdown()
{
    if (m_vbo != 0)
    {
        glDeleteBuffers(1, &m_vbo);
        m_vbo = 0;
    }
    if (m_vao != 0)
    {
        glDeleteVertexArrays(1, &m_vao);
        m_vao = 0;
    }
    if (m_program != 0)
    {
        glDeleteProgram(m_program);
        m_program = 0;
    }
}

void Renderer::SetViewport(int framebufferWidth, int framebufferHeight)
{
    m_framebufferWidth = framebufferWidth;
    m_framebufferHeight = framebufferHeight;
    m_letterbox = ComputeLetterbox(framebufferWidth, framebufferHeight, m_logicalWidth, m_logicalHeight);
}

void Renderer::BeginFrame(PaletteColor borderColor, PaletteColor clearColor)
{
    m_vertices.clear();

    glDisable(GL_SCISSOR_TEST);
    glViewport(0, 0, m_framebufferWidth, m_framebufferHeight);
    const glm::vec3 border = PaletteRgb(borderColor);
    glClearColor(border.r, border.g, border.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);

    // Canvas area only.
    glEnable(GL_SCISSOR_TEST);
    glScissor(m_letterbox.x, m_letterbox.y, m_letterbox.width, m_letterbox.height);
    glViewport(m_letterbox.x, m_letterbox.y, m_letterbox.width, m_letterbox.height);
    const glm::vec3 clear = PaletteRgb(clearColor);
    glClearColor(clear.r, clear.g, clear.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT);
}

void Renderer::EndFrame()
{
    m_lastFrameQuadCount = m_vertices.size() / 6U;

    if (!m_vertices.empty())
    {
        glUseProgram(m_program);
        glUniformMatrix4fv(m_projectionLocation, 1, GL_FALSE, glm::value_ptr(m_projection));

        glBindVertexArray(m_vao);
        glBindBuffer(GL_ARRAY_BUFFER, m_vbo);

        const std::size_t bytes = m_vertices.size() * sizeof(QuadVertex);
        if (bytes <= m_vboCapacityBytes)
        {
            // Orphan the existing buffer to avoid GPU sync stalls.
            glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_vboCapacityBytes), nullptr, GL_STREAM_DRAW);
        }
        else
        {
            std::size_t newCapacity = std::max<std::size_t>(m_vboCapacityBytes, 64U * 1024U);
            while (newCapacity < bytes)
            {
                newCapacity *= 2U;
            }
            glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(newCapacity), nullptr, GL_STREAM_DRAW);
            m_vboCapacityBytes = newCapacity;
        }
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes), m_vertices.data());
        glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(m_vertices.size()));

        glBindBuffer(GL_ARRAY_BUFFER, 0);
        glBindVertexArray(0);
    }

    glDisable(GL_SCISSOR_TEST);
    glViewport(0, 0, m_framebufferWidth, m_framebufferHeight);
}

void Renderer::DrawRect(int x, int y, int width, int height, PaletteColor color)
{
    if (width <= 0 || height <= 0)
    {
        return;
    }

    const glm::vec3 rgb = PaletteRgb(color);
    const float left = static_cast<float>(x);
    const float top = static_cast<float>(y);
    const float right = static_cast<float>(x + width);
    const float bottom = static_cast<float>(y + height);

    m_vertices.push_back(QuadVertex{{left, top}, rgb});
    m_vertices.push_back(QuadVertex{{right, top}, rgb});
    m_vertices.push_back(QuadVertex{{right, bottom}, rgb});
    m_vertices.push_back(QuadVertex{{left, top}, rgb});
    m_vertices.push_back(QuadVertex{{right, bottom}, rgb});
    m_vertices.push_back(QuadVertex{{left, bottom}, rgb});
}

void Renderer::DrawRectOutline(int x, int y, int width, int height, PaletteColor color)
{
    DrawRect(x, y, width, 1, color);
    DrawRect(x, y + height - 1, width, 1, color);
    DrawRect(x, y + 1, 1, height - 2, color);
    DrawRect(x + width - 1, y + 1, 1, height - 2, color);
}

void Renderer::DrawText(int x, int y, const std::string& text, PaletteColor color, int scale)
{
    scale = std::max(1, scale);
    int penX = x;
    int penY = y;
    for (const char c : text)
    {
        if (c == '\n')
        {
            penX = x;
            penY += PixelFont::kAdvanceY * scale;
            continue;
        }

        const PixelFont::Glyph& glyph = PixelFont::GetGlyph(c);
        for (int row = 0; row < PixelFont::kGlyphHeight; ++row)
        {
            for (int column = 0; column < PixelFont::kGlyphWidth; ++column)
            {
                if (PixelFont::IsPixelSet(glyph, column, row))
                {
                    DrawRect(penX + column * scale, penY + row * scale, scale, scale, color);
                }
            }
        }
        penX += PixelFont::kAdvanceX * scale;
    }
}

void Renderer::DrawTextCentered(int centerX, int y, const std::string& text, PaletteColor color, int scale)
{
    DrawText(centerX - PixelFont::TextWidth(text, scale) / 2, y, text, color, scale);
}

unsigned int Renderer::CompileShader(unsigned int type, const char* source)
{
    const unsigned int shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, nullptr);
    glCompileShader(shader);

    int success = 0;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(std::max(1, logLength)), '\0');
        glGetShaderInfoLog(shader, logLength, nullptr, log.data());
        std::cerr << "[Renderer] Shader compile error: " << log << "\n";
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

unsigned int Renderer::CreateProgram(const char* vertexSource, const char* fragmentSource)
{
    const unsigned int vertexShader = CompileShader(GL_VERTEX_SHADER, vertexSource);
    const unsigned int fragmentShader = CompileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (vertexShader == 0 || fragmentShader == 0)
    {
        if (vertexShader != 0)
        {
            glDeleteShader(vertexShader);
        }
        if (fragmentShader != 0)
        {
            glDeleteShader(fragmentShader);
        }
        return 0;
    }

    const unsigned int program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(std::max(1, logLength)), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        std::cerr << "[Renderer] Program link error: " << log << "\n";
        glDeleteProgram(program);
        return 0;
    }

    return program;
}
} // namespace engine::render
