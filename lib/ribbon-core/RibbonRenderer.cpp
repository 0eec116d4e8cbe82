#include "RibbonRenderer.h"
#include <algorithm>

namespace ribbon {

// ============================================================
// draw — vertical cursor dispatch
// ============================================================

RibbonStats RibbonRenderer::draw(const PairSequence&  pairs,
                                 float                lineHeight,
                                 bool                 isFluidMode,
                                 float                viewWidth,
                                 const RibbonPalette& palette,
                                 DrawSurface&         surface,
                                 RowRange             range)
{
    RibbonStats stats;

    const size_t first = std::min(range.first, pairs.size());
    const size_t last  = std::max(first, std::min(range.last, pairs.size()));

    RibbonLayout layout;
    layout.lineHeight  = lineHeight;
    layout.viewWidth   = viewWidth;
    layout.isFluidMode = isFluidMode;

    // Rows above the window still occupy their height.
    float y = rowOffset(first, lineHeight);

    for (size_t i = first; i < last; ++i) {
        const DiffPairWithConnection& pair = pairs[i];
        ++stats.rowsVisited;

        if (pair.connectionType == ConnectionType::None) {
            ++stats.skippedNone;
            y += lineHeight;
            continue;
        }

        RowSides sides = pair.sides();
        if (sides == RowSides::Neither) {
            ++stats.skippedEmpty;
            y += lineHeight;
            continue;
        }

        drawRibbon(layout, y, palette.colorFor(sides), surface);
        ++stats.ribbonsPainted;
        y += lineHeight;
    }

    stats.cursorY = y;
    return stats;
}

// ============================================================
// drawRibbon — one band: fill, borders, ticks
// ============================================================

LinearGradient RibbonRenderer::fillGradient(const RibbonBand& band, const glm::vec4& color)
{
    float midY = (band.topY + band.bottomY) * 0.5f;

    LinearGradient g;
    g.start = {band.leftEnd,    midY};
    g.end   = {band.rightStart, midY};
    g.stops = {
        {0.0f, withOpacity(color, kFillEdgeOpacity)},
        {0.5f, withOpacity(color, kFillCenterOpacity)},
        {1.0f, withOpacity(color, kFillEdgeOpacity)},
    };
    return g;
}

void RibbonRenderer::drawRibbon(const RibbonLayout& layout,
                                float               yPosition,
                                const glm::vec4&    color,
                                DrawSurface&        surface)
{
    RibbonGeometry geo = RibbonGeometry::build(layout, yPosition);

    replayPath(geo.fillPath, surface);
    surface.fillWithGradient(fillGradient(geo.band, color));

    StrokeStyle border;
    border.color = withOpacity(color, kBorderOpacity);
    border.width = kBorderWidth;
    border.cap   = LineCap::Round;

    replayPath(geo.topBorder, surface);
    surface.strokeWithStyle(border);
    replayPath(geo.bottomBorder, surface);
    surface.strokeWithStyle(border);

    StrokeStyle tick;
    tick.color = withOpacity(color, kTickOpacity);
    tick.width = kTickWidth;

    replayPath(geo.leftTick, surface);
    surface.strokeWithStyle(tick);
    replayPath(geo.rightTick, surface);
    surface.strokeWithStyle(tick);
}

} // namespace ribbon
