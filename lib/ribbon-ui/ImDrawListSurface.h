#pragma once
// ImDrawListSurface — ribbon::DrawSurface on top of a Dear ImGui ImDrawList.
//
// Usage (inside an ImGui window):
//   ImDrawListSurface surface(ImGui::GetWindowDrawList(),
//                             ImGui::GetCursorScreenPos());
//   RibbonRenderer::draw(pairs, lineH, fluid, width, palette, surface);
//
// Local coordinates are translated by `origin` into screen space.
//
// Limits of the ImDrawList backend:
//   - Fills are convex only (AddConvexPolyFilled). Ribbon fills always are.
//   - Gradients are applied per vertex after tessellation. Fill outlines
//     are split where they cross an inner stop so every stop lands on a
//     vertex; between vertices the color is interpolated linearly.

#include "../ribbon-core/DrawSurface.h"
#include <imgui.h>
#include <vector>

namespace ribbon {

class ImDrawListSurface : public DrawSurface
{
public:
    ImDrawListSurface(ImDrawList* drawList, ImVec2 origin);

    void beginPath() override;
    void moveTo(const glm::vec2& p) override;
    void lineTo(const glm::vec2& p) override;
    void curveTo(const glm::vec2& c1, const glm::vec2& c2,
                 const glm::vec2& p) override;
    void closePath() override;

    void fillWithGradient(const LinearGradient& gradient) override;
    void strokeWithStyle(const StrokeStyle& style) override;

    static ImU32 toImColor(const glm::vec4& c);

private:
    struct SubPath {
        std::vector<ImVec2> points;   // screen space
        bool                closed = false;
    };

    ImDrawList*          m_dl;
    ImVec2               m_origin;
    std::vector<SubPath> m_subPaths;
    glm::vec2            m_current = {0.f, 0.f};   // local space

    ImVec2   toScreen(const glm::vec2& p) const { return {m_origin.x + p.x, m_origin.y + p.y}; }
    SubPath& openSubPath();

    // Recolor vertices [firstVtx, end) by the gradient, keeping the
    // anti-aliasing fringe alpha that ImGui wrote.
    void shadeVertices(int firstVtx, const LinearGradient& gradient);
};

} // namespace ribbon
