#include "ui/DebugOverlay.hpp"

#include <iostream>

#include "engine/platform/Window.hpp"

#if BUILD_WITH_IMGUI
#include <imgui.h>
#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#endif

namespace ui
{
bool DebugOverlay::Initialize(engine::platform::Window& window)
{
#if BUILD_WITH_IMGUI
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window.NativeHandle(), true) || !ImGui_ImplOpenGL3_Init("#version 450"))
    {
        std::cerr << "[DebugOverlay] Failed to initialize ImGui backends.\n";
        ImGui::DestroyContext();
        return false;
    }
    m_initialized = true;
#else
    (void)window;
    std::cout << "[DebugOverlay] Built without ImGui, HUD disabled.\n";
#endif
    return true;
}

void DebugOverlay::Shutdown()
{
#if BUILD_WITH_IMGUI
    if (m_initialized)
    {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        m_initialized = false;
    }
#endif
}

void DebugOverlay::BeginFrame()
{
#if BUILD_WITH_IMGUI
    if (!m_initialized)
    {
        return;
    }
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
#endif
}

bool DebugOverlay::WantsMouseCapture() const
{
#if BUILD_WITH_IMGUI
    return m_initialized && ImGui::GetIO().WantCaptureMouse;
#else
    return false;
#endif
}

void DebugOverlay::Render(const DebugOverlayContext& context, float fps)
{
#if BUILD_WITH_IMGUI
    if (!m_initialized)
    {
        return;
    }

    if (m_visible)
    {
        ImGui::SetNextWindowBgAlpha(0.46F);
        ImGui::SetNextWindowPos(ImVec2(10.0F, 10.0F), ImGuiCond_FirstUseEver);
        if (ImGui::Begin("Dispel", nullptr, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoFocusOnAppearing))
        {
            const std::size_t pathPoints = context.path != nullptr ? context.path->size() : 0U;
            ImGui::Text("FPS: %.1f", fps);
            ImGui::Text("Mode: %s%s", context.modeName.c_str(), context.paused ? " (paused)" : "");
            ImGui::Text("Path: %zu / %d points", pathPoints, context.minPoints);
            ImGui::Text("Last dispel: %d", context.lastDispelCount);
            ImGui::Text("Total dispelled: %d", context.totalDispelled);
            ImGui::Text("Targets alive: %zu", context.liveTargets);
            ImGui::Text("Canvas: %dx%d (x%.1f)", context.canvasWidth, context.canvasHeight, context.canvasScale);
            if (context.pointer.has_value())
            {
                ImGui::Text("Pointer: %.0f, %.0f", context.pointer->x, context.pointer->y);
            }
            else
            {
                ImGui::TextUnformatted("Pointer: -");
            }
            ImGui::Separator();
            ImGui::TextUnformatted("LMB: arm / draw   RMB: cancel   Esc: pause   F1: HUD");
        }
        ImGui::End();

        // Raw window-space path, useful when the canvas feedback is hard to read.
        if (context.path != nullptr && context.path->size() >= 2U)
        {
            ImDrawList* fg = ImGui::GetForegroundDrawList();
            for (std::size_t i = 1; i < context.path->size(); ++i)
            {
                const glm::vec2& p0 = (*context.path)[i - 1U];
                const glm::vec2& p1 = (*context.path)[i];
                fg->AddLine(ImVec2{p0.x, p0.y}, ImVec2{p1.x, p1.y}, IM_COL32(255, 200, 90, 160), 1.0F);
            }
            const glm::vec2& start = context.path->front();
            fg->AddCircle(ImVec2{start.x, start.y}, context.closureDistance, IM_COL32(130, 195, 255, 120), 24, 1.0F);
        }
    }

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
#else
    (void)context;
    (void)fps;
#endif
}
} // namespace ui
