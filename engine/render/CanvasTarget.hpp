#pragma once

#include <glad/glad.h>

namespace engine::render
{
// Offscreen low-resolution render target. The scene is drawn at
// framebuffer / scale pixels and upscaled to the window with nearest filtering.
class CanvasTarget
{
public:
    CanvasTarget() = default;
    ~CanvasTarget();

    CanvasTarget(const CanvasTarget&) = delete;
    CanvasTarget& operator=(const CanvasTarget&) = delete;

    bool Create(int framebufferWidth, int framebufferHeight, float scale);
    void Destroy();
    bool Resize(int framebufferWidth, int framebufferHeight, float scale);

    void Bind() const;
    void Unbind() const;
    void BlitToScreen(int screenWidth, int screenHeight) const;

    [[nodiscard]] bool IsValid() const { return m_valid; }
    [[nodiscard]] int Width() const { return m_width; }
    [[nodiscard]] int Height() const { return m_height; }
    [[nodiscard]] float Scale() const { return m_scale; }
    [[nodiscard]] GLuint ColorTexture() const { return m_colorTex; }

    [[nodiscard]] static int ScaledExtent(int framebufferExtent, float scale);

private:
    bool CreateAttachments();
    void DestroyAttachments();

    GLuint m_fbo = 0;
    GLuint m_colorTex = 0;
    GLuint m_depthRbo = 0;
    int m_width = 0;
    int m_height = 0;
    float m_scale = 1.0F;
    bool m_valid = false;
};
} // namespace engine::render
