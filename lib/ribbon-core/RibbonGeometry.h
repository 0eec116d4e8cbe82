#pragma once
// RibbonGeometry — the shape of one connection ribbon.
//
// A ribbon occupies one row of the split view. Horizontally it spans the
// channel between the two text panels:
//
//        left panel     |<-- kRibbonGap -->|     right panel
//                    leftEnd    centerX    rightStart
//
//   topY    +-----------+~~~~~~~~~~~~~~~~~~+-----------+
//           |           |      fill        |           |
//   bottomY +-----------+~~~~~~~~~~~~~~~~~~+-----------+
//                       ^ tick        tick ^
//
// Fluid mode joins the corners with cubic Bezier edges whose control points
// sit kControlFactor * kRibbonGap inside the channel; blocks mode uses
// straight segments. The four corners are identical in both modes.
//
// Geometry is plain data so it can be checked without a surface; replayPath()
// feeds a path to a DrawSurface.
//
// No OpenGL, no ImGui, no GLFW dependency.

#include "DrawSurface.h"
#include <glm/glm.hpp>
#include <vector>

namespace ribbon {

// ============================================================
// PathSegment / RibbonPath
// ============================================================
enum class SegmentKind {
    Move,
    Line,
    Cubic,
    Close,
};

struct PathSegment {
    SegmentKind kind = SegmentKind::Move;
    glm::vec2   c1   = {0.f, 0.f};   // Cubic only
    glm::vec2   c2   = {0.f, 0.f};   // Cubic only
    glm::vec2   to   = {0.f, 0.f};   // unused for Close
};

struct RibbonPath {
    std::vector<PathSegment> segments;

    void moveTo(const glm::vec2& p)  { segments.push_back({SegmentKind::Move, {}, {}, p}); }
    void lineTo(const glm::vec2& p)  { segments.push_back({SegmentKind::Line, {}, {}, p}); }
    void curveTo(const glm::vec2& c1, const glm::vec2& c2, const glm::vec2& p)
    {
        segments.push_back({SegmentKind::Cubic, c1, c2, p});
    }
    void close() { segments.push_back({SegmentKind::Close, {}, {}, {}}); }

    bool isClosed() const { return !segments.empty() && segments.back().kind == SegmentKind::Close; }
    int  count(SegmentKind kind) const;

    // End points of every Move/Line/Cubic segment, in order.
    std::vector<glm::vec2> anchors() const;
};

// Issue beginPath + the path's segments on the surface (no paint call).
void replayPath(const RibbonPath& path, DrawSurface& surface);

// ============================================================
// RibbonLayout
// ============================================================
// Per draw call. lineHeight and viewWidth are expected to be positive;
// they are not validated.
struct RibbonLayout {
    float lineHeight  = 22.f;
    float viewWidth   = 800.f;
    bool  isFluidMode = true;
};

// ============================================================
// RibbonBand
// ============================================================
struct RibbonBand {
    float topY       = 0.f;
    float bottomY    = 0.f;
    float leftEnd    = 0.f;
    float rightStart = 0.f;

    glm::vec2 topLeft()     const { return {leftEnd,    topY}; }
    glm::vec2 topRight()    const { return {rightStart, topY}; }
    glm::vec2 bottomRight() const { return {rightStart, bottomY}; }
    glm::vec2 bottomLeft()  const { return {leftEnd,    bottomY}; }
};

// ============================================================
// RibbonGeometry
// ============================================================
struct RibbonGeometry {
    static constexpr float kRibbonGap      = 60.f;
    static constexpr float kControlFactor  = 0.5f;

    RibbonBand band;
    bool       fluid = true;

    RibbonPath fillPath;       // closed
    RibbonPath topBorder;      // left -> right
    RibbonPath bottomBorder;   // left -> right
    RibbonPath leftTick;       // vertical at leftEnd
    RibbonPath rightTick;      // vertical at rightStart

    // Horizontal channel for a view of the given width.
    static float centerX(float viewWidth)    { return viewWidth * 0.5f; }
    static float leftEnd(float viewWidth)    { return centerX(viewWidth) - kRibbonGap * 0.5f; }
    static float rightStart(float viewWidth) { return centerX(viewWidth) + kRibbonGap * 0.5f; }

    // Build the ribbon whose band starts at yPosition.
    static RibbonGeometry build(const RibbonLayout& layout, float yPosition);
};

} // namespace ribbon
