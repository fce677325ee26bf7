#include "engine/render/CanvasTarget.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace engine::render
{
CanvasTarget::~CanvasTarget()
{
    Destroy();
}

int CanvasTarget::ScaledExtent(int framebufferExtent, float scale)
{
    const float safeScale = std::max(1.0F, scale);
    return std::max(1, static_cast<int>(std::floor(static_cast<float>(framebufferExtent) / safeScale)));
}

bool CanvasTarget::Create(int framebufferWidth, int framebufferHeight, float scale)
{
    if (m_fbo != 0)
    {
        Destroy();
    }

    m_scale = std::max(1.0F, scale);
    m_width = ScaledExtent(framebufferWidth, m_scale);
    m_height = ScaledExtent(framebufferHeight, m_scale);

    glGenFramebuffers(1, &m_fbo);
    glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);
    m_valid = CreateAttachments();
    glBindFramebuffer(GL_FRAMEBUFFER, 0);

    if (!m_valid)
    {
        return false;
    }

    std::cout << "[Canvas] Created " << m_width << "x" << m_height << " (scale " << m_scale << ")\n";
    return true;
}

bool CanvasTarget::CreateAttachments()
{
    glGenTextures(1, &m_colorTex);
    glBindTexture(GL_TEXTURE_2D, m_colorTex);
    glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA8, m_width, m_height, 0, GL_RGBA, GL_UNSIGNED_BYTE, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);

    glGenRenderbuffers(1, &m_depthRbo);
    glBindRenderbuffer(GL_RENDERBUFFER, m_depthRbo);
    glRenderbufferStorage(GL_RENDERBUFFER, GL_DEPTH_COMPONENT24, m_width, m_height);
    glBindRenderbuffer(GL_RENDERBUFFER, 0);

    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, m_colorTex, 0);
    glFramebufferRenderbuffer(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_RENDERBUFFER, m_depthRbo);

    static const GLenum drawBuffers[] = {GL_COLOR_ATTACHMENT0};
    glDrawBuffers(1, drawBuffers);

    const GLenum status = glCheckFramebufferStatus(GL_FRAMEBUFFER);
    if (status != GL_FRAMEBUFFER_COMPLETE)
    {
        std::cerr << "[Canvas] Framebuffer incomplete, status 0x" << std::hex << status << std::dec << "\n";
        return false;
    }
    return true;
}

void CanvasTarget::DestroyAttachments()
{
    if (m_colorTex != 0)
    {
        glDeleteTextures(1, &m_colorTex);
        m_colorTex = 0;
    }
    if (m_depthRbo != 0)
    {
        glDeleteRenderbuffers(1, &m_depthRbo);
        m_depthRbo = 0;
    }
}

void CanvasTarget::Destroy()
{
    DestroyAttachments();
    if (m_fbo != 0)
    {
        glDeleteFramebuffers(1, &m_fbo);
        m_fbo = 0;
    }
    m_valid = false;
    m_width = 0;
    m_height = 0;
}

bool CanvasTarget::Resize(int framebufferWidth, int framebufferHeight, float scale)
{
    const float safeScale = std::max(1.0F, scale);
    const int width = ScaledExtent(framebufferWidth, safeScale);
    const int height = ScaledExtent(framebufferHeight, safeScale);
    if (m_valid && width == m_width && height == m_height)
    {
        m_scale = safeScale;
        return true;
    }

    if (m_fbo == 0)
    {
        return Create(framebufferWidth, framebufferHeight, safeScale);
    }

    m_scale = safeScale;
    m_width = width;
    m_height = height;

    glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);
    DestroyAttachments();
    m_valid = CreateAttachments();
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    return m_valid;
}

void CanvasTarget::Bind() const
{
    glBindFramebuffer(GL_FRAMEBUFFER, m_fbo);
    glViewport(0, 0, m_width, m_height);
}

void CanvasTarget::Unbind() const
{
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
}

void CanvasTarget::BlitToScreen(int screenWidth, int screenHeight) const
{
    glBindFramebuffer(GL_READ_FRAMEBUFFER, m_fbo);
    glBindFramebuffer(GL_DRAW_FRAMEBUFFER, 0);
    glBlitFramebuffer(0, 0, m_width, m_height, 0, 0, screenWidth, screenHeight, GL_COLOR_BUFFER_BIT, GL_NEAREST);
    glBindFramebuffer(GL_READ_FRAMEBUFFER, 0);
}
} // namespace engine::render
