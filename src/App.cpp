#include "App.h"
#include "../lib/ribbon-core/PairSetFile.h"

#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

#include <iostream>
#include <algorithm>
#include <thread>
#include <chrono>
#include <cstring>

// ============================================================
// Init
// ============================================================

bool App::init(int width, int height, const std::string& title,
               const std::string& pairSetPath, const std::string& themePath)
{
    if (!glfwInit()) { std::cerr << "[App] glfwInit failed\n"; return false; }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_SAMPLES, 4);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);
#endif

    m_window = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!m_window) { glfwTerminate(); return false; }

    glfwMakeContextCurrent(m_window);
    glfwSwapInterval(1);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        std::cerr << "[App] GLAD init failed\n"; return false;
    }

    glfwSetWindowUserPointer(m_window, this);
    glfwSetKeyCallback(m_window, cbKey);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    ImGui_ImplGlfw_InitForOpenGL(m_window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    m_ui.init();

    // Palette swatches + quick theme switch, right of the built-in controls.
    m_ui.registerToolbarSection({
        "palette",
        [this]() {
            const ImGuiColorEditFlags kSwatch =
                ImGuiColorEditFlags_NoTooltip | ImGuiColorEditFlags_NoDragDrop;
            auto swatch = [&](const char* id, const glm::vec4& c) {
                ImGui::ColorButton(id, ImVec4{c.r, c.g, c.b, c.a}, kSwatch, {14.f, 14.f});
                ImGui::SameLine(0.f, 3.f);
            };
            swatch("##add", m_palette.addition);
            swatch("##del", m_palette.deletion);
            swatch("##chg", m_palette.change);
            ImGui::SameLine();
            bool light = m_uiState.preset == ribbon::ThemePreset::Light;
            if (ImGui::Button(light ? " LIGHT " : " DARK ")) {
                m_uiState.preset = light ? ribbon::ThemePreset::Dark
                                         : ribbon::ThemePreset::Light;
                m_uiState.presetChanged = true;
            }
        }
    });

    // ---- Initial data ------------------------------------------------------
    m_palette = ribbon::RibbonTheme::preset(m_uiState.preset);
    if (!themePath.empty()) {
        strncpy(m_uiState.themePathInput, themePath.c_str(),
                sizeof(m_uiState.themePathInput) - 1);
        if (loadTheme(themePath)) m_uiState.themePath = themePath;
    }

    m_pairs = ribbon::PairSetFile::sample();
    if (!pairSetPath.empty()) {
        strncpy(m_uiState.pairPathInput, pairSetPath.c_str(),
                sizeof(m_uiState.pairPathInput) - 1);
        if (loadPairSet(pairSetPath)) m_uiState.pairSetPath = pairSetPath;
    }
    m_uiState.pairCount = (int)m_pairs.size();

    m_fpsTime = glfwGetTime();
    return true;
}

// ============================================================
// Loading
// ============================================================

bool App::loadPairSet(const std::string& path)
{
    ribbon::PairSequence loaded;
    if (!ribbon::PairSetFile::load(path, loaded)) {
        ViewerUI::postStatus(m_uiState, ribbon::PairSetFile::lastError(), true, 5.0);
        return false;
    }
    m_pairs = std::move(loaded);
    m_uiState.pairCount = (int)m_pairs.size();
    ViewerUI::postStatus(m_uiState,
        "Loaded " + std::to_string(m_pairs.size()) + " pairs", false);
    return true;
}

bool App::loadTheme(const std::string& path)
{
    if (!ribbon::RibbonTheme::load(path, m_palette, m_uiState.preset)) {
        ViewerUI::postStatus(m_uiState, ribbon::RibbonTheme::lastError(), true, 5.0);
        return false;
    }
    ViewerUI::postStatus(m_uiState, "Theme loaded", false);
    return true;
}

void App::applyPreset()
{
    // A loaded theme file is re-read on top of the new base preset so
    // its explicit colors survive the switch.
    m_palette = ribbon::RibbonTheme::preset(m_uiState.preset);
    if (!m_uiState.themePath.empty())
        loadTheme(m_uiState.themePath);

    std::cout << "[App] Theme preset: "
              << ribbon::RibbonTheme::presetName(m_uiState.preset) << "\n";
}

// ============================================================
// Run
// ============================================================

void App::run()
{
    while (!glfwWindowShouldClose(m_window) && !m_uiState.wantQuit)
    {
        double now = glfwGetTime();

        m_fpsFrames++;
        if (now - m_fpsTime >= 1.0) {
            m_uiState.fps = (float)(m_fpsFrames / (now - m_fpsTime));
            m_fpsFrames   = 0;
            m_fpsTime     = now;
        }

        glfwPollEvents();
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        m_input.update();
        update();
        render();

        glfwSwapBuffers(m_window);

        // Minimised windows report a zero framebuffer; don't spin.
        int fw = 0, fh = 0;
        glfwGetFramebufferSize(m_window, &fw, &fh);
        if (fw == 0 || fh == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

// ============================================================
// Update — drain UI requests
// ============================================================

void App::update()
{
    if (m_uiState.openPairSet) {
        m_uiState.openPairSet = false;
        std::string path = m_uiState.pairPathInput;
        if (loadPairSet(path))
            m_uiState.pairSetPath = path;
    }

    if (m_uiState.reloadPairSet) {
        m_uiState.reloadPairSet = false;
        if (!m_uiState.pairSetPath.empty())
            loadPairSet(m_uiState.pairSetPath);
    }

    if (m_uiState.useSample) {
        m_uiState.useSample = false;
        m_pairs = ribbon::PairSetFile::sample();
        m_uiState.pairSetPath.clear();
        m_uiState.pairCount = (int)m_pairs.size();
        ViewerUI::postStatus(m_uiState, "Using built-in sample", false);
    }

    if (m_uiState.loadTheme) {
        m_uiState.loadTheme = false;
        std::string path = m_uiState.themePathInput;
        if (loadTheme(path))
            m_uiState.themePath = path;
    }

    if (m_uiState.presetChanged) {
        m_uiState.presetChanged = false;
        applyPreset();
    }

    m_uiState.lineHeight = std::clamp(m_uiState.lineHeight,
                                      ViewerUIState::kMinLineHeight,
                                      ViewerUIState::kMaxLineHeight);
}

// ============================================================
// Render
// ============================================================

void App::render()
{
    int fw, fh;
    glfwGetFramebufferSize(m_window, &fw, &fh);
    glViewport(0, 0, fw, fh);
    glClearColor(0.08f, 0.09f, 0.10f, 1.f);
    glClear(GL_COLOR_BUFFER_BIT);

    m_ui.render(m_uiState);
    m_panel.drawPanel(m_uiState, m_pairs, m_palette);

    ImGui::Render();
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
}

// ============================================================
// Shutdown
// ============================================================

void App::shutdown()
{
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(m_window);
    glfwTerminate();
}

// ============================================================
// Input callbacks
// ============================================================

void App::cbKey(GLFWwindow* w,int k,int s,int a,int m)
{ static_cast<App*>(glfwGetWindowUserPointer(w))->onKey(k,s,a,m); }

void App::onKey(int key, int /*sc*/, int action, int mods)
{
    if (action != GLFW_PRESS) return;
    if (mods & (GLFW_MOD_CONTROL | GLFW_MOD_ALT | GLFW_MOD_SUPER)) return;
    if (!m_input.viewerOwnsKeyboard()) return;

    if (key == GLFW_KEY_F)
        m_uiState.isFluidMode = !m_uiState.isFluidMode;

    if (key == GLFW_KEY_T) {
        m_uiState.preset = (m_uiState.preset == ribbon::ThemePreset::Light)
            ? ribbon::ThemePreset::Dark : ribbon::ThemePreset::Light;
        m_uiState.presetChanged = true;
    }

    if (key == GLFW_KEY_R && !m_uiState.pairSetPath.empty())
        m_uiState.reloadPairSet = true;
}
