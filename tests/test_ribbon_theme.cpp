#include <gtest/gtest.h>

#include "../lib/ribbon-core/RibbonTheme.h"

#include <filesystem>
#include <fstream>

using namespace ribbon;

namespace
{
glm::vec4 rgb(int r, int g, int b, int a = 255)
{
    return glm::vec4(r, g, b, a) / 255.f;
}

void expectColor(const glm::vec4& actual, const glm::vec4& expected)
{
    EXPECT_NEAR(actual.r, expected.r, 1e-5f);
    EXPECT_NEAR(actual.g, expected.g, 1e-5f);
    EXPECT_NEAR(actual.b, expected.b, 1e-5f);
    EXPECT_NEAR(actual.a, expected.a, 1e-5f);
}
} // namespace

// ============================================================
// Hex colors
// ============================================================

TEST(HexColor, ParsesAllForms)
{
    glm::vec4 c;
    ASSERT_TRUE(parseHexColor("#34C759", c));
    expectColor(c, rgb(0x34, 0xC7, 0x59));

    ASSERT_TRUE(parseHexColor("ff3b30", c));
    expectColor(c, rgb(0xFF, 0x3B, 0x30));

    ASSERT_TRUE(parseHexColor("#0f8", c));
    expectColor(c, rgb(0x00, 0xFF, 0x88));

    ASSERT_TRUE(parseHexColor("#2196F380", c));
    expectColor(c, rgb(0x21, 0x96, 0xF3, 0x80));
}

TEST(HexColor, RejectsMalformed)
{
    glm::vec4 c{0.25f, 0.25f, 0.25f, 1.f};
    const glm::vec4 before = c;
    for (const char* bad : {"", "#", "#12", "#1234", "#12345", "#GG0000", "red", "#1234567"})
        EXPECT_FALSE(parseHexColor(bad, c)) << bad;
    EXPECT_EQ(c, before);
}

TEST(HexColor, FormatsUpperCaseWithAlpha)
{
    EXPECT_EQ(hexColorString(rgb(0x56, 0x9C, 0xD6)), "#569CD6FF");
    EXPECT_EQ(hexColorString({2.f, -1.f, 0.f, 0.f}), "#FF000000");

    glm::vec4 back;
    ASSERT_TRUE(parseHexColor(hexColorString(rgb(0x12, 0x34, 0x56, 0x78)), back));
    expectColor(back, rgb(0x12, 0x34, 0x56, 0x78));
}

// ============================================================
// Presets
// ============================================================

TEST(RibbonTheme, PresetColors)
{
    RibbonPalette light = RibbonTheme::preset(ThemePreset::Light);
    RibbonPalette dark  = RibbonTheme::preset(ThemePreset::Dark);

    expectColor(light.addition, rgb(0x34, 0xC7, 0x59));
    expectColor(light.deletion, rgb(0xFF, 0x3B, 0x30));
    expectColor(light.change,   rgb(0x21, 0x96, 0xF3));

    expectColor(dark.addition, light.addition);
    expectColor(dark.deletion, light.deletion);
    expectColor(dark.change,   rgb(0x56, 0x9C, 0xD6));
}

TEST(RibbonTheme, PresetNames)
{
    ThemePreset p = ThemePreset::Dark;
    EXPECT_TRUE(RibbonTheme::parsePresetName("light", p));
    EXPECT_EQ(p, ThemePreset::Light);
    EXPECT_STREQ(RibbonTheme::presetName(p), "light");
    EXPECT_TRUE(RibbonTheme::parsePresetName(RibbonTheme::presetName(ThemePreset::Dark), p));
    EXPECT_EQ(p, ThemePreset::Dark);
    EXPECT_FALSE(RibbonTheme::parsePresetName("Solarized", p));
}

TEST(RibbonPalette, ColorForSides)
{
    RibbonPalette p = RibbonTheme::preset(ThemePreset::Light);
    EXPECT_EQ(p.colorFor(RowSides::Both),      p.change);
    EXPECT_EQ(p.colorFor(RowSides::LeftOnly),  p.deletion);
    EXPECT_EQ(p.colorFor(RowSides::RightOnly), p.addition);
}

// ============================================================
// Theme documents
// ============================================================

TEST(RibbonTheme, MissingKeysComeFromBase)
{
    RibbonPalette palette;
    ASSERT_TRUE(RibbonTheme::loadFromString(
        R"({ "base": "light", "change": "#112233" })", palette, ThemePreset::Dark));

    expectColor(palette.change,   rgb(0x11, 0x22, 0x33));
    expectColor(palette.addition, RibbonTheme::preset(ThemePreset::Light).addition);
    EXPECT_TRUE(RibbonTheme::lastError().empty());
}

TEST(RibbonTheme, FallbackUsedWithoutBase)
{
    RibbonPalette palette;
    ASSERT_TRUE(RibbonTheme::loadFromString("{}", palette, ThemePreset::Light));
    expectColor(palette.change, RibbonTheme::preset(ThemePreset::Light).change);

    ASSERT_TRUE(RibbonTheme::loadFromString("{}", palette, ThemePreset::Dark));
    expectColor(palette.change, RibbonTheme::preset(ThemePreset::Dark).change);
}

TEST(RibbonTheme, FailuresLeavePaletteUntouched)
{
    const RibbonPalette original = RibbonTheme::preset(ThemePreset::Light);

    struct Case { const char* json; const char* expectInError; };
    const Case cases[] = {
        {"{ \"addition\": ",                     "Invalid JSON"},
        {"[1, 2, 3]",                            "must be an object"},
        {R"({ "base": "sepia" })",               "sepia"},
        {R"({ "deletion": "#XYZ" })",            "deletion"},
        {R"({ "change": 42 })",                  "change"},
    };

    for (auto& c : cases) {
        RibbonPalette palette = original;
        EXPECT_FALSE(RibbonTheme::loadFromString(c.json, palette, ThemePreset::Dark, "case"))
            << c.json;
        EXPECT_EQ(palette.change,   original.change);
        EXPECT_EQ(palette.addition, original.addition);
        EXPECT_NE(RibbonTheme::lastError().find(c.expectInError), std::string::npos)
            << RibbonTheme::lastError();
    }
}

TEST(RibbonTheme, LoadsFromFile)
{
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / "ribbon_theme_test.json";
    {
        std::ofstream f(path);
        f << R"({ "base": "dark", "addition": "#00FF00", "deletion": "#F00" })";
    }

    RibbonPalette palette;
    ASSERT_TRUE(RibbonTheme::load(path.string(), palette, ThemePreset::Light));
    expectColor(palette.addition, rgb(0, 255, 0));
    expectColor(palette.deletion, rgb(255, 0, 0));
    expectColor(palette.change,   rgb(0x56, 0x9C, 0xD6));

    std::filesystem::remove(path);
}

TEST(RibbonTheme, MissingFileReportsPath)
{
    RibbonPalette palette;
    EXPECT_FALSE(RibbonTheme::load("/nonexistent/theme.json", palette));
    EXPECT_NE(RibbonTheme::lastError().find("/nonexistent/theme.json"), std::string::npos);
}
