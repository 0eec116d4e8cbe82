#include "InputRouter.h"
#include <imgui.h>

void InputRouter::update()
{
    // WantCaptureKeyboard = an ImGui widget has keyboard focus, or a modal
    // popup is open.
    m_viewerOwnsKeyboard = !ImGui::GetIO().WantCaptureKeyboard;
}
