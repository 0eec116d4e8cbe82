#pragma once
// DrawSurface — immediate-mode 2D path canvas the ribbon renderer paints into.
//
// Usage per shape:
//   surface.beginPath();
//   surface.moveTo(...); surface.lineTo(...); surface.curveTo(...);
//   surface.closePath();                 // optional
//   surface.fillWithGradient(gradient);  // or strokeWithStyle(style)
//
// Painting consumes the current path. Coordinates are in the surface's local
// space: (0,0) is the top-left of the drawing region, y grows downward.
// Colors are straight (non-premultiplied) RGBA in 0..1.
//
// No OpenGL, no ImGui, no GLFW dependency.

#include <glm/glm.hpp>
#include <vector>

namespace ribbon {

// ============================================================
// Paint descriptions
// ============================================================

struct GradientStop {
    float     offset = 0.f;   // 0..1 along start -> end
    glm::vec4 color  = {0.f, 0.f, 0.f, 1.f};
};

struct LinearGradient {
    glm::vec2                 start = {0.f, 0.f};
    glm::vec2                 end   = {1.f, 0.f};
    std::vector<GradientStop> stops;   // ascending offsets

    // Color at parameter t (clamped to [0,1]), linear between stops.
    glm::vec4 sample(float t) const;

    // Color at point p, projected onto the start -> end axis.
    glm::vec4 sampleAt(const glm::vec2& p) const;
};

enum class LineCap {
    Butt,
    Round,
    Square,
};

struct StrokeStyle {
    glm::vec4 color = {0.f, 0.f, 0.f, 1.f};
    float     width = 1.f;
    LineCap   cap   = LineCap::Butt;
};

// ============================================================
// DrawSurface
// ============================================================
class DrawSurface
{
public:
    virtual ~DrawSurface() = default;

    virtual void beginPath() = 0;
    virtual void moveTo(const glm::vec2& p) = 0;
    virtual void lineTo(const glm::vec2& p) = 0;
    // Cubic Bezier from the current point through c1, c2 to p.
    virtual void curveTo(const glm::vec2& c1, const glm::vec2& c2,
                         const glm::vec2& p) = 0;
    virtual void closePath() = 0;

    virtual void fillWithGradient(const LinearGradient& gradient) = 0;
    virtual void strokeWithStyle(const StrokeStyle& style) = 0;
};

// Helper for color-with-opacity: keeps rgb, multiplies alpha.
inline glm::vec4 withOpacity(const glm::vec4& color, float opacity)
{
    return {color.r, color.g, color.b, color.a * opacity};
}

} // namespace ribbon
