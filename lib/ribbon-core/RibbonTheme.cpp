#include "RibbonTheme.h"
#include "JsonValue.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <iostream>

namespace ribbon {

std::string RibbonTheme::s_error;

// ============================================================
// RibbonPalette
// ============================================================

const glm::vec4& RibbonPalette::colorFor(RowSides sides) const
{
    switch (sides) {
        case RowSides::LeftOnly:  return deletion;
        case RowSides::RightOnly: return addition;
        case RowSides::Both:
        case RowSides::Neither:   break;
    }
    return change;
}

// ============================================================
// Hex colors
// ============================================================

static int hexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    c = (char)std::tolower((unsigned char)c);
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

bool parseHexColor(const std::string& text, glm::vec4& out)
{
    std::string h = (!text.empty() && text[0] == '#') ? text.substr(1) : text;
    if (h.size() != 3 && h.size() != 6 && h.size() != 8) return false;

    int digits[8] = {};
    for (size_t i = 0; i < h.size(); ++i) {
        digits[i] = hexDigit(h[i]);
        if (digits[i] < 0) return false;
    }

    int r, g, b, a = 255;
    if (h.size() == 3) {
        r = digits[0] * 17;
        g = digits[1] * 17;
        b = digits[2] * 17;
    } else {
        r = digits[0] * 16 + digits[1];
        g = digits[2] * 16 + digits[3];
        b = digits[4] * 16 + digits[5];
        if (h.size() == 8) a = digits[6] * 16 + digits[7];
    }

    out = glm::vec4(r, g, b, a) / 255.f;
    return true;
}

std::string hexColorString(const glm::vec4& color)
{
    auto byte = [](float v) {
        float c = v < 0.f ? 0.f : (v > 1.f ? 1.f : v);
        return (int)std::lround(c * 255.f);
    };
    char buf[16];
    snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X",
             byte(color.r), byte(color.g), byte(color.b), byte(color.a));
    return buf;
}

// ============================================================
// Presets
// ============================================================
// Addition / deletion are the macOS system green and red; change is the
// "info" accent of each base theme.

static glm::vec4 hex(const char* s)
{
    glm::vec4 c{0.f, 0.f, 0.f, 1.f};
    parseHexColor(s, c);
    return c;
}

RibbonPalette RibbonTheme::preset(ThemePreset which)
{
    RibbonPalette p;
    p.addition = hex("#34C759");
    p.deletion = hex("#FF3B30");
    p.change   = (which == ThemePreset::Light) ? hex("#2196F3") : hex("#569CD6");
    return p;
}

const char* RibbonTheme::presetName(ThemePreset which)
{
    return which == ThemePreset::Light ? "light" : "dark";
}

bool RibbonTheme::parsePresetName(const std::string& name, ThemePreset& out)
{
    if      (name == "light") out = ThemePreset::Light;
    else if (name == "dark")  out = ThemePreset::Dark;
    else return false;
    return true;
}

// ============================================================
// Loading
// ============================================================

bool RibbonTheme::load(const std::string& path,
                       RibbonPalette&     palette,
                       ThemePreset        fallback)
{
    std::string text;
    if (!readTextFile(path, text)) {
        s_error = "Cannot open: " + path;
        std::cerr << "[RibbonTheme] " << s_error << "\n";
        return false;
    }
    if (!loadFromString(text, palette, fallback, path)) return false;

    std::cout << "[RibbonTheme] Loaded theme from: " << path << "\n";
    return true;
}

bool RibbonTheme::loadFromString(const std::string& json,
                                 RibbonPalette&     palette,
                                 ThemePreset        fallback,
                                 const std::string& source)
{
    JsonValue root;
    std::string err;
    if (!parseJson(json, root, err)) {
        s_error = "Invalid JSON in " + source + ": " + err;
        std::cerr << "[RibbonTheme] " << s_error << "\n";
        return false;
    }
    if (!root.isObject()) {
        s_error = "Theme root must be an object in: " + source;
        std::cerr << "[RibbonTheme] " << s_error << "\n";
        return false;
    }

    ThemePreset base = fallback;
    if (root.has("base")) {
        if (!parsePresetName(root["base"].str(), base)) {
            s_error = "Unknown base theme \"" + root["base"].str() + "\" in: " + source;
            std::cerr << "[RibbonTheme] " << s_error << "\n";
            return false;
        }
    }

    RibbonPalette result = preset(base);

    struct Slot { const char* key; glm::vec4* color; };
    const Slot slots[] = {
        {"addition", &result.addition},
        {"deletion", &result.deletion},
        {"change",   &result.change},
    };
    for (auto& slot : slots) {
        if (!root.has(slot.key)) continue;
        const JsonValue& v = root[slot.key];
        if (!v.isString() || !parseHexColor(v.str(), *slot.color)) {
            s_error = std::string("Bad color for \"") + slot.key + "\" in: " + source;
            std::cerr << "[RibbonTheme] " << s_error << "\n";
            return false;
        }
    }

    palette = result;
    s_error.clear();
    return true;
}

} // namespace ribbon
