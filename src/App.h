#pragma once
#include <glad/glad.h>
#include "ViewerUI.h"
#include "InputRouter.h"
#include "../lib/ribbon-core/DiffPair.h"
#include "../lib/ribbon-core/RibbonTheme.h"
#include "../lib/ribbon-ui/SplitDiffPanel.h"
#include <GLFW/glfw3.h>
#include <string>

class App
{
public:
    // pairSetPath / themePath may be empty (built-in sample / preset).
    bool init(int width, int height, const std::string& title,
              const std::string& pairSetPath, const std::string& themePath);
    void run();
    void shutdown();

private:
    GLFWwindow*            m_window = nullptr;
    ViewerUI               m_ui;
    ViewerUIState          m_uiState;
    InputRouter            m_input;
    ribbon::SplitDiffPanel m_panel;

    ribbon::PairSequence   m_pairs;
    ribbon::RibbonPalette  m_palette;

    double m_fpsTime   = 0.0;
    int    m_fpsFrames = 0;

    // Keep the current data when a load fails.
    bool loadPairSet(const std::string& path);
    bool loadTheme  (const std::string& path);
    void applyPreset();

    void update();
    void render();

    static void cbKey(GLFWwindow*, int, int, int, int);
    void onKey(int key, int scancode, int action, int mods);
};
