#pragma once
#include "../lib/ribbon-core/RibbonRenderer.h"
#include "../lib/ribbon-core/RibbonTheme.h"
#include <functional>
#include <string>
#include <vector>

// ============================================================
// ToolbarSection
// ============================================================
// External modules register toolbar sections at startup via
// ViewerUI::registerToolbarSection(). Sections are drawn after the built-in
// controls, in registration order, each preceded by a separator.
struct ToolbarSection
{
    std::string           name;
    std::function<void()> draw;
};

// ============================================================
// ViewerUIState
// ============================================================
// Everything the menus and toolbar can change. App owns it, the UI writes
// requests into it, App drains the requests each frame.
struct ViewerUIState
{
    // ---- Ribbon style ------------------------------------------------------
    bool               isFluidMode = true;
    float              lineHeight  = 22.f;
    ribbon::ThemePreset preset     = ribbon::ThemePreset::Dark;

    static constexpr float kMinLineHeight = 16.f;
    static constexpr float kMaxLineHeight = 40.f;

    // ---- Stats (written by App / panel each frame) -------------------------
    float               fps       = 0.f;
    int                 pairCount = 0;
    ribbon::RibbonStats lastStats;

    // ---- Layout constants — read by panels to position themselves ----------
    float menuBarHeight   = 0.f;
    float toolbarHeight   = 40.f;
    float statusBarHeight = 22.f;

    // ---- File requests — set by menu, drained by App each frame ------------
    // The paths name what is currently loaded; a request reads its path from
    // the matching prompt buffer and only replaces the path on success.
    std::string pairSetPath;       // empty = built-in sample
    std::string themePath;         // empty = preset only
    bool        openPairSet  = false;
    bool        reloadPairSet = false;
    bool        useSample    = false;
    bool        loadTheme    = false;
    bool        presetChanged = false;

    // Text buffers for the path prompts
    char pairPathInput[512]  = {};
    char themePathInput[512] = {};

    // ---- Status message shown briefly after load ---------------------------
    std::string statusMsg;
    bool        statusIsError = false;
    double      statusExpiry  = 0.0;

    bool wantQuit = false;
};

// ============================================================
// ViewerUI
// ============================================================
class ViewerUI
{
public:
    void init();
    void render(ViewerUIState& state);

    // Register a toolbar section from an external module.
    // Call once at startup.
    void registerToolbarSection(ToolbarSection section);

    // Show a status toast for `seconds`.
    static void postStatus(ViewerUIState& state, const std::string& msg,
                           bool isError, double seconds = 3.0);

private:
    std::vector<ToolbarSection> m_toolbarSections;

    bool m_openPairPrompt  = false;
    bool m_openThemePrompt = false;

    void drawMainMenuBar(ViewerUIState& state);
    void drawToolbar    (ViewerUIState& state);
    void drawStatusBar  (ViewerUIState& state);
    void drawPathPrompts(ViewerUIState& state);
    void drawStatusToast(ViewerUIState& state);
};
