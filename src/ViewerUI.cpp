#include "ViewerUI.h"
#include <imgui.h>
#include <algorithm>
#include <cstdio>
#include <cstring>

void ViewerUI::init()
{
    ImGui::StyleColorsDark();
    ImGuiStyle& s = ImGui::GetStyle();
    s.WindowRounding    = 4.f;
    s.FrameRounding     = 3.f;
    s.GrabRounding      = 3.f;
    s.WindowBorderSize  = 1.f;
    s.FrameBorderSize   = 0.f;
    s.ItemSpacing       = {8.f, 5.f};

    ImVec4* c = s.Colors;
    c[ImGuiCol_WindowBg]       = {0.13f, 0.14f, 0.17f, 1.f};
    c[ImGuiCol_MenuBarBg]      = {0.10f, 0.11f, 0.13f, 1.f};
    c[ImGuiCol_Header]         = {0.22f, 0.40f, 0.72f, 0.6f};
    c[ImGuiCol_HeaderHovered]  = {0.28f, 0.50f, 0.90f, 0.7f};
    c[ImGuiCol_Button]         = {0.20f, 0.38f, 0.68f, 0.8f};
    c[ImGuiCol_ButtonHovered]  = {0.28f, 0.50f, 0.90f, 1.f};
    c[ImGuiCol_FrameBg]        = {0.18f, 0.19f, 0.23f, 1.f};
    c[ImGuiCol_FrameBgHovered] = {0.24f, 0.26f, 0.32f, 1.f};
}

void ViewerUI::render(ViewerUIState& state)
{
    drawMainMenuBar(state);
    state.menuBarHeight = ImGui::GetFrameHeight();
    drawToolbar(state);
    drawStatusBar(state);
    drawPathPrompts(state);
    drawStatusToast(state);
}

void ViewerUI::postStatus(ViewerUIState& state, const std::string& msg,
                          bool isError, double seconds)
{
    state.statusMsg     = msg;
    state.statusIsError = isError;
    state.statusExpiry  = ImGui::GetTime() + seconds;
}

// ============================================================
// Main menu bar
// ============================================================

void ViewerUI::drawMainMenuBar(ViewerUIState& state)
{
    if (!ImGui::BeginMainMenuBar()) return;

    if (ImGui::BeginMenu("File"))
    {
        if (ImGui::MenuItem("Open Pair Set..."))
            m_openPairPrompt = true;

        if (ImGui::MenuItem("Reload", "R", false, !state.pairSetPath.empty()))
            state.reloadPairSet = true;

        if (ImGui::MenuItem("Use Built-in Sample"))
            state.useSample = true;

        ImGui::Separator();
        if (ImGui::MenuItem("Quit", "Alt+F4"))
            state.wantQuit = true;
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("View"))
    {
        if (ImGui::MenuItem("Fluid Ribbons", "F", state.isFluidMode))
            state.isFluidMode = true;
        if (ImGui::MenuItem("Block Ribbons", "F", !state.isFluidMode))
            state.isFluidMode = false;
        ImGui::EndMenu();
    }

    if (ImGui::BeginMenu("Theme"))
    {
        bool light = state.preset == ribbon::ThemePreset::Light;
        if (ImGui::MenuItem("Light", "T", light) && !light) {
            state.preset = ribbon::ThemePreset::Light;
            state.presetChanged = true;
        }
        if (ImGui::MenuItem("Dark", "T", !light) && light) {
            state.preset = ribbon::ThemePreset::Dark;
            state.presetChanged = true;
        }
        ImGui::Separator();
        if (ImGui::MenuItem("Load Theme File..."))
            m_openThemePrompt = true;
        ImGui::EndMenu();
    }

    ImGui::EndMainMenuBar();
}

// ============================================================
// Toolbar section registration
// ============================================================

void ViewerUI::registerToolbarSection(ToolbarSection section)
{
    m_toolbarSections.push_back(std::move(section));
}

// ============================================================
// Toolbar
// ============================================================

void ViewerUI::drawToolbar(ViewerUIState& state)
{
    float menuH = ImGui::GetFrameHeight();
    ImGui::SetNextWindowPos({0.f, menuH});
    ImGui::SetNextWindowSize({ImGui::GetIO().DisplaySize.x, state.toolbarHeight});
    ImGui::SetNextWindowBgAlpha(0.85f);
    ImGui::Begin("##toolbar", nullptr,
        ImGuiWindowFlags_NoDecoration    |
        ImGuiWindowFlags_NoMove          |
        ImGuiWindowFlags_NoScrollbar     |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // ---- FLUID / BLOCKS ----------------------------------------------------
    const ImVec4 kActive   = {0.22f, 0.40f, 0.72f, 1.f};
    const ImVec4 kInactive = {0.18f, 0.19f, 0.23f, 1.f};

    ImGui::PushStyleColor(ImGuiCol_Button, state.isFluidMode ? kActive : kInactive);
    if (ImGui::Button(" FLUID "))
        state.isFluidMode = true;
    ImGui::PopStyleColor();
    ImGui::SameLine(0.f, 2.f);
    ImGui::PushStyleColor(ImGuiCol_Button, state.isFluidMode ? kInactive : kActive);
    if (ImGui::Button(" BLOCKS "))
        state.isFluidMode = false;
    ImGui::PopStyleColor();

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    // ---- Row height --------------------------------------------------------
    ImGui::TextDisabled("row");
    ImGui::SameLine();
    ImGui::SetNextItemWidth(120.f);
    ImGui::SliderFloat("##lineheight", &state.lineHeight,
                       ViewerUIState::kMinLineHeight, ViewerUIState::kMaxLineHeight,
                       "%.0f px");
    ImGui::SameLine();

    // ---- Registered external sections -------------------------------------
    for (auto& section : m_toolbarSections)
    {
        ImGui::TextDisabled("|");
        ImGui::SameLine();
        ImGui::PushID(section.name.c_str());
        section.draw();
        ImGui::PopID();
        ImGui::SameLine();
    }

    ImGui::End();
}

// ============================================================
// Status bar — always-docked bottom strip
// ============================================================

void ViewerUI::drawStatusBar(ViewerUIState& state)
{
    ImGuiIO& io = ImGui::GetIO();
    float sbH   = state.statusBarHeight;

    ImGui::SetNextWindowPos({0.f, io.DisplaySize.y - sbH});
    ImGui::SetNextWindowSize({io.DisplaySize.x, sbH});
    ImGui::SetNextWindowBgAlpha(1.0f);

    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding,  {6.f, 3.f});
    ImGui::PushStyleVar(ImGuiStyleVar_WindowMinSize,  {0.f, 0.f});
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.f);
    ImGui::PushStyleColor(ImGuiCol_WindowBg, ImVec4{0.08f, 0.09f, 0.10f, 1.f});

    ImGui::Begin("##statusbar", nullptr,
        ImGuiWindowFlags_NoDecoration    |
        ImGuiWindowFlags_NoMove          |
        ImGuiWindowFlags_NoScrollbar     |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    // Left: pair set name
    {
        const char* name = state.pairSetPath.empty()
            ? "sample"
            : state.pairSetPath.c_str();
        // Strip directory, show filename only
        const char* slash = std::max(
            strrchr(name, '/'), strrchr(name, '\\'));
        if (slash) name = slash + 1;

        ImGui::PushStyleColor(ImGuiCol_Text, ImVec4{0.55f, 0.65f, 0.80f, 1.f});
        ImGui::Text("%s", name);
        ImGui::PopStyleColor();
    }

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    ImGui::Text("%d pairs  /  %d ribbons in view",
                state.pairCount, state.lastStats.ribbonsPainted);

    ImGui::SameLine();
    ImGui::TextDisabled("|");
    ImGui::SameLine();

    // Mode
    ImVec4 modeCol = state.isFluidMode ? ImVec4{0.6f, 0.8f, 1.0f, 1.f}
                                       : ImVec4{0.6f, 0.6f, 0.6f, 1.f};
    ImGui::PushStyleColor(ImGuiCol_Text, modeCol);
    ImGui::Text("%s  %s", state.isFluidMode ? "FLUID" : "BLOCKS",
                ribbon::RibbonTheme::presetName(state.preset));
    ImGui::PopStyleColor();

    // Right: FPS, right-aligned
    char fpsBuf[32];
    snprintf(fpsBuf, sizeof(fpsBuf), "%.0f fps", state.fps);
    float fpsW = ImGui::CalcTextSize(fpsBuf).x + 12.f;
    ImGui::SameLine(io.DisplaySize.x - fpsW);
    ImGui::TextDisabled("%s", fpsBuf);

    ImGui::End();
    ImGui::PopStyleColor();
    ImGui::PopStyleVar(3);
}

// ============================================================
// Path prompts — typed paths for pair set / theme files
// ============================================================

static bool pathPrompt(const char* id, const char* title, char* buf, size_t bufSize)
{
    bool accepted = false;
    ImGui::SetNextWindowSize({480.f, 0.f});
    if (ImGui::BeginPopupModal(id, nullptr, ImGuiWindowFlags_NoSavedSettings))
    {
        ImGui::TextDisabled("%s", title);
        ImGui::SetNextItemWidth(-1.f);
        if (ImGui::IsWindowAppearing()) ImGui::SetKeyboardFocusHere();
        bool enter = ImGui::InputText("##path", buf, bufSize,
                                      ImGuiInputTextFlags_EnterReturnsTrue);

        if ((ImGui::Button("Open") || enter) && buf[0]) {
            accepted = true;
            ImGui::CloseCurrentPopup();
        }
        ImGui::SameLine();
        if (ImGui::Button("Cancel"))
            ImGui::CloseCurrentPopup();
        ImGui::EndPopup();
    }
    return accepted;
}

void ViewerUI::drawPathPrompts(ViewerUIState& state)
{
    if (m_openPairPrompt)  { ImGui::OpenPopup("Open Pair Set");   m_openPairPrompt  = false; }
    if (m_openThemePrompt) { ImGui::OpenPopup("Load Theme File"); m_openThemePrompt = false; }

    if (pathPrompt("Open Pair Set", "Path to a pair set (.json)",
                   state.pairPathInput, sizeof(state.pairPathInput)))
        state.openPairSet = true;
    if (pathPrompt("Load Theme File", "Path to a theme (.json)",
                   state.themePathInput, sizeof(state.themePathInput)))
        state.loadTheme = true;
}

// ============================================================
// Status toast
// ============================================================

void ViewerUI::drawStatusToast(ViewerUIState& state)
{
    if (state.statusMsg.empty()) return;

    double now    = ImGui::GetTime();
    double remain = state.statusExpiry - now;
    if (remain <= 0.0) { state.statusMsg.clear(); return; }

    float alpha = (remain < 0.5) ? (float)(remain / 0.5) : 1.0f;

    ImGuiIO& io = ImGui::GetIO();
    ImGui::SetNextWindowPos({io.DisplaySize.x * 0.5f, io.DisplaySize.y - 50.f},
                            ImGuiCond_Always, {0.5f, 1.0f});
    ImGui::SetNextWindowBgAlpha(0.75f * alpha);
    ImGui::SetNextWindowSize({0, 0});
    ImGui::Begin("##status_toast", nullptr,
        ImGuiWindowFlags_NoDecoration   |
        ImGuiWindowFlags_NoInputs       |
        ImGuiWindowFlags_NoNav          |
        ImGuiWindowFlags_NoMove         |
        ImGuiWindowFlags_NoSavedSettings|
        ImGuiWindowFlags_AlwaysAutoResize);

    ImVec4 col = state.statusIsError ? ImVec4{1.f, 0.45f, 0.4f, 1.f}
                                     : ImVec4{0.4f, 1.f, 0.5f, 1.f};
    ImGui::PushStyleVar(ImGuiStyleVar_Alpha, alpha);
    ImGui::TextColored(col, "%s", state.statusMsg.c_str());
    ImGui::PopStyleVar();
    ImGui::End();
}
