#include "DrawSurface.h"
#include <algorithm>

namespace ribbon {

glm::vec4 LinearGradient::sample(float t) const
{
    if (stops.empty()) return {0.f, 0.f, 0.f, 0.f};

    t = std::clamp(t, 0.f, 1.f);
    if (t <= stops.front().offset) return stops.front().color;
    if (t >= stops.back().offset)  return stops.back().color;

    for (size_t i = 1; i < stops.size(); ++i) {
        const GradientStop& a = stops[i - 1];
        const GradientStop& b = stops[i];
        if (t > b.offset) continue;

        float span = b.offset - a.offset;
        if (span <= 0.f) return b.color;
        return glm::mix(a.color, b.color, (t - a.offset) / span);
    }
    return stops.back().color;
}

glm::vec4 LinearGradient::sampleAt(const glm::vec2& p) const
{
    glm::vec2 axis = end - start;
    float len2 = glm::dot(axis, axis);
    // Degenerate axis: the whole region takes the first stop.
    if (len2 <= 0.f) return sample(0.f);
    return sample(glm::dot(p - start, axis) / len2);
}

} // namespace ribbon
