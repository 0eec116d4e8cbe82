#pragma once

// InputRouter decides who owns the keyboard each frame.
//
// RULE:
//   - If an ImGui widget has keyboard focus (e.g. a path prompt's InputText)
//     → ImGui owns the keyboard and viewer shortcuts are ignored.
//   - Otherwise the viewer's single-key shortcuts (F, T, R) apply.
//
// GLFW callbacks fire first. We check ImGui's WantCaptureKeyboard flag
// AFTER ImGui::NewFrame() has been called (that's when it is accurate for
// the current frame).

class InputRouter
{
public:
    // Call once per frame after ImGui::NewFrame()
    void update();

    bool viewerOwnsKeyboard() const { return m_viewerOwnsKeyboard; }

private:
    bool m_viewerOwnsKeyboard = true;
};
