#pragma once

#include <cstddef>
#include <vector>

#include <glm/mat4x4.hpp>
#include <glm/vec3.hpp>

namespace engine::render
{
// Immediate-mode line renderer. Draw calls queue vertices, EndFrame uploads and draws them.
class Renderer
{
public:
    bool Initialize();
    void Shutdown();

    void SetViewport(int width, int height) const;

    void BeginFrame(const glm::vec3& clearColor);
    void EndFrame(const glm::mat4& viewProjection);

    void DrawLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color);
    // Drawn after the scene with the depth test disabled.
    void DrawOverlayLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color);
    void DrawWireBox(const glm::vec3& center, const glm::vec3& halfExtents, const glm::vec3& color);
    void DrawGrid(int halfSize, float step, const glm::vec3& majorColor, const glm::vec3& minorColor);
    void DrawCircle(
        const glm::vec3& center,
        float radius,
        int segments,
        const glm::vec3& color,
        bool overlay = false
    );
    void DrawWireSphere(
        const glm::vec3& center,
        float radius,
        int segments,
        const glm::vec3& color,
        bool overlay = false
    );

    [[nodiscard]] std::size_t QueuedLineVertexCount() const { return m_lineVertices.size() + m_overlayLineVertices.size(); }

private:
    struct LineVertex
    {
        glm::vec3 position{0.0F};
        glm::vec3 color{1.0F};
    };

    static unsigned int CompileShader(unsigned int type, const char* source);
    static unsigned int CreateProgram(const char* vertexSource, const char* fragmentSource);

    void PushLine(const glm::vec3& from, const glm::vec3& to, const glm::vec3& color, bool overlay);
    void EnsureLineCapacity(std::size_t requiredBytes);

    unsigned int m_lineProgram = 0;
    unsigned int m_lineVao = 0;
    unsigned int m_lineVbo = 0;
    std::size_t m_lineVboCapacityBytes = 0;
    int m_lineViewProjLocation = -1;

    std::vector<LineVertex> m_lineVertices;
    std::vector<LineVertex> m_overlayLineVertices;
};
} // namespace engine::render
