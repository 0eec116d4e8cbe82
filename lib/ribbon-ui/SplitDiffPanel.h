#pragma once
// SplitDiffPanel — side-by-side diff view with connection ribbons.
//
//   +----------------------+---------+----------------------+
//   | old text (left)      | ribbons | new text (right)     |
//   +----------------------+---------+----------------------+
//
// Both text columns and the ribbon channel share one row height and one
// vertical scroll, so row i of the pair sequence sits at i * lineHeight in
// all three. Only rows inside the scrolled viewport are drawn; the ribbon
// renderer receives the same visible row window.
//
// Usage:
//   SplitDiffPanel panel;
//   panel.drawPanel(uiState, pairs, palette);   // from App::render()
//
// Reads the pair sequence as const. Writes uiState.lastStats.

#include "../ribbon-core/DiffPair.h"
#include "../ribbon-core/RibbonTheme.h"
#include "../../src/ViewerUI.h"
#include <imgui.h>

namespace ribbon {

class SplitDiffPanel
{
public:
    void drawPanel(ViewerUIState& state,
                   const PairSequence& pairs,
                   const RibbonPalette& palette);

private:
    // Gutter for line numbers inside each text column.
    static constexpr float kNumberGutter = 44.f;
    static constexpr float kTextPadding  = 6.f;

    // Draw one column's row (line number + text) clipped to [x0, x1].
    static void drawLineCell(ImDrawList* dl, const LineRecord& line, bool isLeft,
                             float x0, float x1, float y, float lineHeight,
                             const RibbonPalette& palette);

    static void drawHunkHeaderRow(ImDrawList* dl, const std::string& text,
                                  float x0, float x1, float y, float lineHeight);
};

} // namespace ribbon
