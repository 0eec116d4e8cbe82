#include "SplitDiffPanel.h"
#include "ImDrawListSurface.h"
#include "../ribbon-core/RibbonGeometry.h"
#include "../ribbon-core/RibbonRenderer.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace ribbon {

// ============================================================
// Colour palette
// ============================================================
static const ImU32 kColText       = IM_COL32(210, 215, 225, 255);
static const ImU32 kColLineNumber = IM_COL32(110, 115, 135, 255);
static const ImU32 kColHunkBg     = IM_COL32(40,  48,  70,  255);
static const ImU32 kColHunkText   = IM_COL32(140, 170, 230, 255);
static const ImU32 kColChannelBg  = IM_COL32(22,  24,  30,  255);

// Row tint behind added / deleted text.
static constexpr float kRowTintOpacity = 0.12f;

// ============================================================
// Row cells
// ============================================================

void SplitDiffPanel::drawLineCell(ImDrawList* dl, const LineRecord& line, bool isLeft,
                                  float x0, float x1, float y, float lineHeight,
                                  const RibbonPalette& palette)
{
    if (line.kind != LineKind::Context) {
        const glm::vec4& base = (line.kind == LineKind::Addition) ? palette.addition
                                                                  : palette.deletion;
        dl->AddRectFilled({x0, y}, {x1, y + lineHeight},
                          ImDrawListSurface::toImColor(withOpacity(base, kRowTintOpacity)));
    }

    float textY = y + (lineHeight - ImGui::GetFontSize()) * 0.5f;

    dl->PushClipRect({x0, y}, {x1, y + lineHeight}, true);

    const std::optional<int>& number = isLeft ? line.oldLineNumber : line.newLineNumber;
    if (number) {
        char buf[16];
        snprintf(buf, sizeof(buf), "%d", *number);
        float w = ImGui::CalcTextSize(buf).x;
        dl->AddText({x0 + kNumberGutter - w, textY}, kColLineNumber, buf);
    }

    const char* text = line.content.c_str();
    dl->AddText({x0 + kNumberGutter + kTextPadding, textY}, kColText,
                text, text + line.content.size());

    dl->PopClipRect();
}

void SplitDiffPanel::drawHunkHeaderRow(ImDrawList* dl, const std::string& text,
                                       float x0, float x1, float y, float lineHeight)
{
    dl->AddRectFilled({x0, y}, {x1, y + lineHeight}, kColHunkBg);
    float textY = y + (lineHeight - ImGui::GetFontSize()) * 0.5f;
    dl->PushClipRect({x0, y}, {x1, y + lineHeight}, true);
    dl->AddText({x0 + kTextPadding, textY}, kColHunkText,
                text.c_str(), text.c_str() + text.size());
    dl->PopClipRect();
}

// ============================================================
// Main panel entry point
// ============================================================

void SplitDiffPanel::drawPanel(ViewerUIState& state,
                               const PairSequence& pairs,
                               const RibbonPalette& palette)
{
    // Fill the space between the toolbar and the status bar
    ImGuiIO& io = ImGui::GetIO();
    float topY   = state.menuBarHeight + state.toolbarHeight;
    float botY   = io.DisplaySize.y - state.statusBarHeight;
    float height = botY - topY;

    ImGui::SetNextWindowPos ({0.f, topY});
    ImGui::SetNextWindowSize({io.DisplaySize.x, height});
    ImGui::SetNextWindowBgAlpha(1.f);

    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 0.f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, {0.f, 0.f});
    ImGui::PushStyleColor(ImGuiCol_WindowBg, ImVec4{0.12f, 0.13f, 0.16f, 1.f});

    ImGui::Begin("##splitdiff", nullptr,
        ImGuiWindowFlags_NoTitleBar      |
        ImGuiWindowFlags_NoResize        |
        ImGuiWindowFlags_NoMove          |
        ImGuiWindowFlags_NoCollapse      |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);

    const float lineH     = state.lineHeight;
    const float viewWidth = ImGui::GetContentRegionAvail().x;
    const float leftEnd   = RibbonGeometry::leftEnd(viewWidth);
    const float rightStart = RibbonGeometry::rightStart(viewWidth);

    // Content origin at scroll 0 (already offset by the current scroll)
    ImVec2 origin = ImGui::GetCursorScreenPos();
    ImDrawList* dl = ImGui::GetWindowDrawList();

    // ---- Visible row window ------------------------------------------------
    float scrollY = ImGui::GetScrollY();
    float viewH   = ImGui::GetWindowHeight();
    size_t first  = (size_t)std::max(0.f, std::floor(scrollY / lineH));
    size_t last   = std::min(pairs.size(), (size_t)std::ceil((scrollY + viewH) / lineH) + 1);
    first = std::min(first, last);

    // ---- Ribbon channel background ----------------------------------------
    ImVec2 winPos = ImGui::GetWindowPos();
    dl->AddRectFilled({origin.x + leftEnd,    winPos.y},
                      {origin.x + rightStart, winPos.y + viewH},
                      kColChannelBg);

    // ---- Text columns ------------------------------------------------------
    for (size_t i = first; i < last; ++i) {
        const DiffPairWithConnection& pair = pairs[i];
        float y = origin.y + (float)i * lineH;

        if (pair.hunkHeader && !pair.left && !pair.right) {
            drawHunkHeaderRow(dl, *pair.hunkHeader, origin.x, origin.x + viewWidth, y, lineH);
            continue;
        }
        if (pair.left)
            drawLineCell(dl, *pair.left, true,
                         origin.x, origin.x + leftEnd, y, lineH, palette);
        if (pair.right)
            drawLineCell(dl, *pair.right, false,
                         origin.x + rightStart, origin.x + viewWidth, y, lineH, palette);
    }

    // ---- Ribbons -----------------------------------------------------------
    ImDrawListSurface surface(dl, origin);
    RowRange visible;
    visible.first = first;
    visible.last  = last;
    state.lastStats = RibbonRenderer::draw(pairs, lineH, state.isFluidMode,
                                           viewWidth, palette, surface, visible);

    // Reserve the full content height so the window scrolls
    ImGui::Dummy({viewWidth, (float)pairs.size() * lineH});

    ImGui::End();
    ImGui::PopStyleColor();
    ImGui::PopStyleVar(3);
}

} // namespace ribbon
