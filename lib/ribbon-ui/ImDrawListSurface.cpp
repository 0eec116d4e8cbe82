#include "ImDrawListSurface.h"
#include <imgui_internal.h>
#include <algorithm>
#include <cmath>

namespace ribbon {

// Bezier flattening: roughly one segment per kCurveStepPx of control
// polygon length, clamped.
static constexpr float kCurveStepPx     = 3.f;
static constexpr int   kCurveMinSegments = 6;
static constexpr int   kCurveMaxSegments = 64;

ImDrawListSurface::ImDrawListSurface(ImDrawList* drawList, ImVec2 origin)
    : m_dl(drawList), m_origin(origin)
{
}

ImU32 ImDrawListSurface::toImColor(const glm::vec4& c)
{
    return ImGui::ColorConvertFloat4ToU32(ImVec4{c.r, c.g, c.b, c.a});
}

// ============================================================
// Path construction
// ============================================================

void ImDrawListSurface::beginPath()
{
    m_subPaths.clear();
    m_current = {0.f, 0.f};
}

ImDrawListSurface::SubPath& ImDrawListSurface::openSubPath()
{
    // A drawing command without a preceding moveTo starts at the current point.
    if (m_subPaths.empty() || m_subPaths.back().closed) {
        m_subPaths.push_back({});
        m_subPaths.back().points.push_back(toScreen(m_current));
    }
    return m_subPaths.back();
}

void ImDrawListSurface::moveTo(const glm::vec2& p)
{
    m_subPaths.push_back({});
    m_subPaths.back().points.push_back(toScreen(p));
    m_current = p;
}

void ImDrawListSurface::lineTo(const glm::vec2& p)
{
    openSubPath().points.push_back(toScreen(p));
    m_current = p;
}

void ImDrawListSurface::curveTo(const glm::vec2& c1, const glm::vec2& c2,
                                const glm::vec2& p)
{
    SubPath& sp = openSubPath();

    ImVec2 p0 = toScreen(m_current);
    ImVec2 p1 = toScreen(c1);
    ImVec2 p2 = toScreen(c2);
    ImVec2 p3 = toScreen(p);

    float polyLen = glm::length(c1 - m_current) + glm::length(c2 - c1) + glm::length(p - c2);
    int segments  = std::clamp((int)std::ceil(polyLen / kCurveStepPx),
                               kCurveMinSegments, kCurveMaxSegments);

    for (int i = 1; i <= segments; ++i)
        sp.points.push_back(ImBezierCubicCalc(p0, p1, p2, p3, (float)i / (float)segments));

    m_current = p;
}

void ImDrawListSurface::closePath()
{
    if (m_subPaths.empty()) return;
    SubPath& sp = m_subPaths.back();
    sp.closed = true;
    // Drop a duplicated end point so the closing edge is not zero length.
    if (sp.points.size() > 1) {
        ImVec2 a = sp.points.front(), b = sp.points.back();
        if (a.x == b.x && a.y == b.y) sp.points.pop_back();
    }
    // Subsequent commands continue from the start of the closed subpath.
    if (!sp.points.empty())
        m_current = {sp.points.front().x - m_origin.x, sp.points.front().y - m_origin.y};
}

// ============================================================
// Fill
// ============================================================

void ImDrawListSurface::shadeVertices(int firstVtx, const LinearGradient& gradient)
{
    for (int i = firstVtx; i < m_dl->VtxBuffer.Size; ++i) {
        ImDrawVert& v = m_dl->VtxBuffer[i];
        float fringe  = (float)((v.col >> IM_COL32_A_SHIFT) & 0xFF) / 255.f;

        glm::vec4 c = gradient.sampleAt({v.pos.x - m_origin.x, v.pos.y - m_origin.y});
        c.a *= fringe;
        v.col = toImColor(c);
    }
}

// Insert a vertex wherever an edge crosses a gradient stop, so per-vertex
// shading reproduces every stop. Inserted points are collinear with their
// edge; convexity is unchanged.
static std::vector<ImVec2> splitAtStops(const std::vector<ImVec2>& pts,
                                        const LinearGradient& gradient, ImVec2 origin)
{
    glm::vec2 axis = gradient.end - gradient.start;
    float len2 = glm::dot(axis, axis);
    if (len2 <= 0.f || gradient.stops.size() < 3) return pts;

    auto param = [&](ImVec2 p) {
        glm::vec2 local{p.x - origin.x, p.y - origin.y};
        return glm::dot(local - gradient.start, axis) / len2;
    };

    std::vector<ImVec2> out;
    out.reserve(pts.size() * 2);
    for (size_t i = 0; i < pts.size(); ++i) {
        ImVec2 a = pts[i];
        ImVec2 b = pts[(i + 1) % pts.size()];
        out.push_back(a);

        float ta = param(a), tb = param(b);
        if (std::fabs(tb - ta) < 1e-6f) continue;

        // Inner stops only; the end stops sit on the clamp boundary.
        if (ta < tb) {
            for (size_t k = 1; k + 1 < gradient.stops.size(); ++k) {
                float t = gradient.stops[k].offset;
                if (t <= ta || t >= tb) continue;
                float f = (t - ta) / (tb - ta);
                out.push_back({a.x + (b.x - a.x) * f, a.y + (b.y - a.y) * f});
            }
        } else {
            for (size_t k = gradient.stops.size() - 2; k >= 1; --k) {
                float t = gradient.stops[k].offset;
                if (t < ta && t > tb) {
                    float f = (t - ta) / (tb - ta);
                    out.push_back({a.x + (b.x - a.x) * f, a.y + (b.y - a.y) * f});
                }
            }
        }
    }
    return out;
}

void ImDrawListSurface::fillWithGradient(const LinearGradient& gradient)
{
    for (auto& sp : m_subPaths) {
        if (sp.points.size() < 3) continue;

        std::vector<ImVec2> pts = splitAtStops(sp.points, gradient, m_origin);
        int firstVtx = m_dl->VtxBuffer.Size;
        m_dl->AddConvexPolyFilled(pts.data(), (int)pts.size(), IM_COL32_WHITE);
        shadeVertices(firstVtx, gradient);
    }
    m_subPaths.clear();
}

// ============================================================
// Stroke
// ============================================================

static ImVec2 extendPast(ImVec2 from, ImVec2 to, float by)
{
    float dx = to.x - from.x, dy = to.y - from.y;
    float len = std::sqrt(dx * dx + dy * dy);
    if (len < 1e-4f) return to;
    return {to.x + dx / len * by, to.y + dy / len * by};
}

void ImDrawListSurface::strokeWithStyle(const StrokeStyle& style)
{
    ImU32 col = toImColor(style.color);
    float halfW = style.width * 0.5f;

    for (auto& sp : m_subPaths) {
        if (sp.points.size() < 2) continue;

        std::vector<ImVec2> pts = sp.points;
        if (!sp.closed && style.cap == LineCap::Square) {
            pts.front() = extendPast(pts[1], pts.front(), halfW);
            pts.back()  = extendPast(pts[pts.size() - 2], pts.back(), halfW);
        }

        m_dl->AddPolyline(pts.data(), (int)pts.size(), col,
                          sp.closed ? ImDrawFlags_Closed : ImDrawFlags_None,
                          style.width);

        if (!sp.closed && style.cap == LineCap::Round) {
            m_dl->AddCircleFilled(pts.front(), halfW, col);
            m_dl->AddCircleFilled(pts.back(),  halfW, col);
        }
    }
    m_subPaths.clear();
}

} // namespace ribbon
