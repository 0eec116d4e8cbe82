#pragma once
// RibbonRenderer — paints the connection ribbons for a split diff view.
//
// One call per frame. Walks the pair sequence top to bottom keeping a
// vertical cursor; every row advances the cursor by lineHeight whether or
// not a ribbon is painted, so the overlay stays aligned with text panels
// that use the same row height and ordering.
//
// Rows are skipped (no paint) when:
//   - connectionType is None
//   - neither side has content (malformed; skipped silently)
//
// Per painted ribbon, in order:
//   1. fill        3-stop horizontal gradient, opacity 0.1 / 0.2 / 0.1
//   2. top border  opacity 0.6, width 1.5, round caps
//   3. bottom border (same)
//   4. left tick   x = leftEnd,    opacity 0.3, width 0.5
//   5. right tick  x = rightStart, same
//
// Stateless: nothing is kept between calls.
//
// No OpenGL, no ImGui, no GLFW dependency.

#include "DiffPair.h"
#include "DrawSurface.h"
#include "RibbonGeometry.h"
#include "RibbonTheme.h"
#include <cstddef>
#include <limits>

namespace ribbon {

// ============================================================
// RowRange
// ============================================================
// Half-open [first, last) row window. Clamped to the sequence on use.
struct RowRange {
    size_t first = 0;
    size_t last  = std::numeric_limits<size_t>::max();

    static RowRange all() { return {}; }
};

// ============================================================
// RibbonStats
// ============================================================
// Summary of one draw call, for status display.
struct RibbonStats {
    int   rowsVisited     = 0;
    int   ribbonsPainted  = 0;
    int   skippedNone     = 0;   // connectionType == None
    int   skippedEmpty    = 0;   // neither side present
    float cursorY         = 0.f; // offset after the last visited row
};

// ============================================================
// RibbonRenderer
// ============================================================
class RibbonRenderer
{
public:
    static constexpr float kFillEdgeOpacity   = 0.1f;
    static constexpr float kFillCenterOpacity = 0.2f;
    static constexpr float kBorderOpacity     = 0.6f;
    static constexpr float kBorderWidth       = 1.5f;
    static constexpr float kTickOpacity       = 0.3f;
    static constexpr float kTickWidth         = 0.5f;

    // Draw every connected row of `pairs` in `range` onto `surface`.
    static RibbonStats draw(const PairSequence& pairs,
                            float               lineHeight,
                            bool                isFluidMode,
                            float               viewWidth,
                            const RibbonPalette& palette,
                            DrawSurface&        surface,
                            RowRange            range = RowRange::all());

    // Paint one ribbon whose band starts at yPosition.
    static void drawRibbon(const RibbonLayout& layout,
                           float               yPosition,
                           const glm::vec4&    color,
                           DrawSurface&        surface);

    // Fill gradient for a ribbon spanning [leftEnd, rightStart] at height y.
    static LinearGradient fillGradient(const RibbonBand& band, const glm::vec4& color);

    // Vertical offset of row `index`.
    static float rowOffset(size_t index, float lineHeight) { return (float)index * lineHeight; }
};

} // namespace ribbon
