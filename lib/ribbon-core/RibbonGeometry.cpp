#include "RibbonGeometry.h"

namespace ribbon {

// ============================================================
// RibbonPath
// ============================================================

int RibbonPath::count(SegmentKind kind) const
{
    int n = 0;
    for (auto& s : segments) if (s.kind == kind) ++n;
    return n;
}

std::vector<glm::vec2> RibbonPath::anchors() const
{
    std::vector<glm::vec2> pts;
    pts.reserve(segments.size());
    for (auto& s : segments)
        if (s.kind != SegmentKind::Close) pts.push_back(s.to);
    return pts;
}

void replayPath(const RibbonPath& path, DrawSurface& surface)
{
    surface.beginPath();
    for (auto& s : path.segments) {
        switch (s.kind) {
            case SegmentKind::Move:  surface.moveTo(s.to);              break;
            case SegmentKind::Line:  surface.lineTo(s.to);              break;
            case SegmentKind::Cubic: surface.curveTo(s.c1, s.c2, s.to); break;
            case SegmentKind::Close: surface.closePath();               break;
        }
    }
}

// ============================================================
// Edge helpers
// ============================================================
// Append the horizontal edge at height y, travelling from fromX to toX.
// Fluid edges are cubics with control points pulled cpX towards the middle
// from each end, which gives the symmetric S profile.
static void appendEdge(RibbonPath& path, float fromX, float toX, float y,
                       float cpX, bool fluid)
{
    if (!fluid) {
        path.lineTo({toX, y});
        return;
    }
    float dir = (toX >= fromX) ? 1.f : -1.f;
    path.curveTo({fromX + dir * cpX, y},
                 {toX   - dir * cpX, y},
                 {toX, y});
}

static RibbonPath borderPath(float leftEnd, float rightStart, float y,
                             float cpX, bool fluid)
{
    RibbonPath p;
    p.moveTo({leftEnd, y});
    appendEdge(p, leftEnd, rightStart, y, cpX, fluid);
    return p;
}

static RibbonPath tickPath(float x, float topY, float bottomY)
{
    RibbonPath p;
    p.moveTo({x, topY});
    p.lineTo({x, bottomY});
    return p;
}

// ============================================================
// RibbonGeometry::build
// ============================================================

RibbonGeometry RibbonGeometry::build(const RibbonLayout& layout, float yPosition)
{
    RibbonGeometry g;
    g.fluid = layout.isFluidMode;

    RibbonBand& b = g.band;
    b.topY       = yPosition;
    b.bottomY    = yPosition + layout.lineHeight;
    b.leftEnd    = leftEnd(layout.viewWidth);
    b.rightStart = rightStart(layout.viewWidth);

    const float cpX = kRibbonGap * kControlFactor;

    // Fill: top edge -> down the right side -> bottom edge back -> close.
    g.fillPath.moveTo(b.topLeft());
    appendEdge(g.fillPath, b.leftEnd, b.rightStart, b.topY, cpX, g.fluid);
    g.fillPath.lineTo(b.bottomRight());
    appendEdge(g.fillPath, b.rightStart, b.leftEnd, b.bottomY, cpX, g.fluid);
    g.fillPath.close();

    g.topBorder    = borderPath(b.leftEnd, b.rightStart, b.topY,    cpX, g.fluid);
    g.bottomBorder = borderPath(b.leftEnd, b.rightStart, b.bottomY, cpX, g.fluid);

    g.leftTick  = tickPath(b.leftEnd,    b.topY, b.bottomY);
    g.rightTick = tickPath(b.rightStart, b.topY, b.bottomY);

    return g;
}

} // namespace ribbon
