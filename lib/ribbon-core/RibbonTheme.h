#pragma once
// RibbonTheme — the three ribbon colors and where they come from.
//
// The renderer never reads global theme state. Callers build a RibbonPalette
// (from a preset, a theme file, or by hand) and pass it into each draw.
//
// Theme file format:
//   {
//     "base":     "dark",          // optional: preset used for missing keys
//     "addition": "#34C759",
//     "deletion": "#FF3B30",
//     "change":   "#569CD6"
//   }
//
// No OpenGL, no ImGui, no GLFW dependency.

#include "DiffPair.h"
#include <glm/glm.hpp>
#include <string>

namespace ribbon {

// ============================================================
// RibbonPalette
// ============================================================
struct RibbonPalette {
    glm::vec4 addition = {0.f, 0.f, 0.f, 1.f};
    glm::vec4 deletion = {0.f, 0.f, 0.f, 1.f};
    glm::vec4 change   = {0.f, 0.f, 0.f, 1.f};

    // Ribbon color for a row. Both -> change, LeftOnly -> deletion,
    // RightOnly -> addition. Neither is never painted; it maps to change.
    const glm::vec4& colorFor(RowSides sides) const;
};

enum class ThemePreset {
    Light,
    Dark,
};

// ============================================================
// RibbonTheme
// ============================================================
class RibbonTheme
{
public:
    static RibbonPalette preset(ThemePreset which);

    static const char* presetName(ThemePreset which);
    static bool        parsePresetName(const std::string& name, ThemePreset& out);

    // Load a theme file into `palette`. Keys missing from the file come from
    // the file's "base" preset, or from `fallback` when it has none.
    // On failure `palette` is left untouched and lastError() explains why.
    static bool load(const std::string& path,
                     RibbonPalette&     palette,
                     ThemePreset        fallback = ThemePreset::Dark);

    // Same as load() for an in-memory document. `source` names it in errors.
    static bool loadFromString(const std::string& json,
                               RibbonPalette&     palette,
                               ThemePreset        fallback = ThemePreset::Dark,
                               const std::string& source   = "<memory>");

    static const std::string& lastError() { return s_error; }

private:
    static std::string s_error;
};

// "#RGB", "#RRGGBB" or "#RRGGBBAA"; '#' optional, hex digits in any case.
bool parseHexColor(const std::string& text, glm::vec4& out);

// "#RRGGBBAA", upper case.
std::string hexColorString(const glm::vec4& color);

} // namespace ribbon
