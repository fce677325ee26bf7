#include "engine/render/Renderer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <string>

#include <glad/glad.h>

#include <glm/gtc/type_ptr.hpp>

namespace engine::render
{
namespace
{
constexpr const char* kLineVertexShader = R"(
#version 450 core
layout (location = 0) in vec3 aPosition;
layout (location = 1) in vec3 aColor;

uniform mat4 uViewProjection;

out vec3 vColor;

void main()
{
    vColor = aColor;
    gl_Position = uViewProjection * vec4(aPosition, 1.0);
}
)";

constexpr const char* kLineFragmentShader = R"(
#version 450 core
in vec3 vColor;
out vec4 FragColor;

void main()
{
    FragColor = vec4(vColor, 1.0);
}
)";

constexpr float kTwoPi = 6.28318530718F;
} // namespace

bool Renderer::Initialize()
{
    glEnable(GL_DEPTH_TEST);

    m_lineVertices.reserve(8192);
    m_overlayLineVertices.reserve(2048);

    m_lineProgram = CreateProgram(kLineVertexShader, kLineFragmentShader);
    if (m_lineProgram == 0)
    {
        return false;
    }
    m_lineViewProjLocation = glGetUniformLocation(m_lineProgram, "uViewProjection");

    glGenVertexArrays(1, &m_lineVao);
    glGenBuffers(1, &m_lineVbo);

    glBindVertexArray(m_lineVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);
    m_lineVboCapacityBytes = 512U * 1024U;
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_lineVboCapacityBytes), nullptr, GL_STREAM_DRAW);

    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, position)));
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 3, GL_FLOAT, GL_FALSE, sizeof(LineVertex), reinterpret_cast<void*>(offsetof(LineVertex, color)));
    glEnableVertexAttribArray(1);

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);
    return true;
}

void Renderer::Shutdown()
{
    if (m_lineVbo != 0)
    {
        glDeleteBuffers(1, &m_lineVbo);
        m_lineVbo = 0;
    }
    if (m_lineVao != 0)
    {
        glDeleteVertexArrays(1, &m_lineVao);
        m_lineVao = 0;
    }
    if (m_lineProgram != 0)
    {
        glDeleteProgram(m_lineProgram);
        m_lineProgram = 0;
    }
    m_lineVboCapacityBytes = 0;
}

void Renderer::SetViewport(int width, int height) const
{
    glViewport(0, 0, width, height);
}

void Renderer::BeginFrame(const glm::vec3& clearColor)
{
    m_lineVertices.clear();
    m_overlayLineVertices.clear();

    glClearColor(clearColor.r, clearColor.g, clearColor.b, 1.0F);
    glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);
}

void Renderer::EnsureLineCapacity(std::size_t requiredBytes)
{
    if (requiredBytes <= m_lineVboCapacityBytes)
    {
        // Orphan the existing buffer to avoid GPU sync stalls.
        glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(m_lineVboCapacityBytes), nullptr, GL_STREAM_DRAW);
        return;
    }

    std::size_t newCapacity = std::max<std::size_t>(m_lineVboCapacityBytes, 64U * 1024U);
    while (newCapacity < requiredBytes)
    {
        newCapacity *= 2U;
    }
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(newCapacity), nullptr, GL_STREAM_DRAW);
    m_lineVboCapacityBytes = newCapacity;
}

void Renderer::EndFrame(const glm::mat4& viewProjection)
{
    const bool hasLines = !m_lineVertices.empty();
    const bool hasOverlay = !m_overlayLineVertices.empty();
    if (!hasLines && !hasOverlay)
    {
        return;
    }

    glUseProgram(m_lineProgram);
    glUniformMatrix4fv(m_lineViewProjLocation, 1, GL_FALSE, glm::value_ptr(viewProjection));
    glBindVertexArray(m_lineVao);
    glBindBuffer(GL_ARRAY_BUFFER, m_lineVbo);

    const std::size_t lineBytes = m_lineVertices.size() * sizeof(LineVertex);
    const std::size_t overlayBytes = m_overlayLineVertices.size() * sizeof(LineVertex);

    // Single orphan + upload for both line arrays.
    EnsureLineCapacity(lineBytes + overlayBytes);
    if (hasLines)
    {
        glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(lineBytes), m_lineVertices.data());
    }
    if (hasOverlay)
    {
        glBufferSubData(GL_ARRAY_BUFFER, static_cast<GLintptr>(lineBytes), static_cast<GLsizeiptr>(overlayBytes), m_overlayLineVertices.data());
    }

    if (hasLines)
    {
        glDrawArrays(GL_LINES, 0, static_cast<GLsizei>(m_lineVertices.size()));
    }
    if (hasOverlay)
    {
        glDisable(GL_DEPTH_TEST);
        glDrawArrays(GL_LINES, static_cast<GLint>(m_lineVertices.size()), static_cast<GLsizei>(m_overlayLineVertices.size()));
        glEnable(GL_DEPTH_TEST);
    }

    glBindVertexArray(0);
    glUseProgram(0);
}

void Renderer::PushLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color, bool overlay)
{
    std::vector<LineVertex>& target = overlay ? m_overlayLineVertices : m_lineVertices;
    target.push_back(LineVertex{from, color});
    target.push_back(LineVertex{to, color});
}

void Renderer::DrawLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color)
{
    PushLine(from, to, color, false);
}

void Renderer::DrawOverlayLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color)
{
    PushLine(from, to, color, true);
}

void Renderer::DrawWireBox(const glm::vec3& center, const glm::vec3& halfExtents, const glm::vec3& color)
{
    const std::array<glm::vec3, 8> corners = {
        center + glm::vec3{-halfExtents.x, -halfExtents.y, -halfExtents.z},
        center + glm::vec3{+halfExtents.x, -halfExtents.y, -halfExtents.z},
        center + glm::vec3{+halfExtents.x, -halfExtents.y, +halfExtents.z},
        center + glm::vec3{-halfExtents.x, -halfExtents.y, +halfExtents.z},
        center + glm::vec3{-halfExtents.x, +halfExtents.y, -halfExtents.z},
        center + glm::vec3{+halfExtents.x, +halfExtents.y, -halfExtents.z},
        center + glm::vec3{+halfExtents.x, +halfExtents.y, +halfExtents.z},
        center + glm::vec3{-halfExtents.x, +halfExtents.y, +halfExtents.z},
    };

    auto edge = [&](int a, int b) { DrawLine(corners[static_cast<size_t>(a)], corners[static_cast<size_t>(b)], color); };

    edge(0, 1); edge(1, 2); edge(2, 3); edge(3, 0);
    edge(4, 5); edge(5, 6); edge(6, 7); edge(7, 4);
    edge(0, 4); edge(1, 5); edge(2, 6); edge(3, 7);
}

void Renderer::DrawGrid(int halfSize, float step, const glm::vec3& majorColor, const glm::vec3& minorColor)
{
    const float range = static_cast<float>(halfSize) * step;
    for (int i = -halfSize; i <= halfSize; ++i)
    {
        const float value = static_cast<float>(i) * step;
        const bool major = (i % 5) == 0;
        const glm::vec3 color = major ? majorColor : minorColor;

        DrawLine(glm::vec3{-range, 0.0F, value}, glm::vec3{range, 0.0F, value}, color);
        DrawLine(glm::vec3{value, 0.0F, -range}, glm::vec3{value, 0.0F, range}, color);
    }
}

void Renderer::DrawCircle(
    const glm::vec3& center,
    float radius,
    int segments,
    const glm::vec3& color,
    bool overlay
)
{
    if (segments < 3 || radius <= 0.0F)
    {
        return;
    }

    const float step = kTwoPi / static_cast<float>(segments);
    glm::vec3 prev = center + glm::vec3{radius, 0.0F, 0.0F};
    for (int i = 1; i <= segments; ++i)
    {
        const float angle = step * static_cast<float>(i);
        const glm::vec3 curr = center + glm::vec3{std::cos(angle) * radius, 0.0F, std::sin(angle) * radius};
        PushLine(prev, curr, color, overlay);
        prev = curr;
    }
}

void Renderer::DrawWireSphere(
    const glm::vec3& center,
    float radius,
    int segments,
    const glm::vec3& color,
    bool overlay
)
{
    if (segments < 3 || radius <= 0.0F)
    {
        return;
    }

    // Three great circles, one per axis plane.
    const float step = kTwoPi / static_cast<float>(segments);
    for (int i = 0; i < segments; ++i)
    {
        const float a0 = step * static_cast<float>(i);
        const float a1 = step * static_cast<float>(i + 1);
        const float c0 = std::cos(a0) * radius;
        const float s0 = std::sin(a0) * radius;
        const float c1 = std::cos(a1) * radius;
        const float s1 = std::sin(a1) * radius;

        PushLine(center + glm::vec3{c0, 0.0F, s0}, center + glm::vec3{c1, 0.0F, s1}, color, overlay);
        PushLine(center + glm::vec3{c0, s0, 0.0F}, center + glm::vec3{c1, s1, 0.0F}, color, overlay);
        PushLine(center + glm::vec3{0.0F, c0, s0}, center + glm::vec3{0.0F, c1, s1}, color, overlay);
    }
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
        std::string log(static_cast<size_t>(std::max(logLength, 1)), '\0');
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
    glDeleteShader(vertexShader);
    glDeleteShader(fragmentShader);

    int success = 0;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (success == GL_FALSE)
    {
        int logLength = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &logLength);
        std::string log(static_cast<size_t>(std::max(logLength, 1)), '\0');
        glGetProgramInfoLog(program, logLength, nullptr, log.data());
        std::cerr << "[Renderer] Program link error: " << log << "\n";
        glDeleteProgram(program);
        return 0;
    }

    return program;
}
} // namespace engine::render
