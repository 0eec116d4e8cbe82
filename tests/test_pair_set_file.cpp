#include <gtest/gtest.h>

#include "../lib/ribbon-core/PairSetFile.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

using namespace ribbon;

namespace
{
constexpr const char* kTwoHunkSet = R"({
  "pairs": [
    { "id": 10, "hunkHeader": "@@ -1,2 +1,2 @@" },
    { "id": 11, "connection": "change",
      "left":  { "kind": "deletion", "content": "int a = 1;", "oldLine": 1 },
      "right": { "kind": "addition", "content": "int a = 2;", "newLine": 1 } },
    { "id": 12, "connection": "none",
      "left":  { "content": "return a;", "oldLine": 2, "newLine": 2 },
      "right": { "content": "return a;", "oldLine": 2, "newLine": 2 } },
    { "id": 20, "connection": "addition",
      "right": { "kind": "addition", "content": "// new", "newLine": 3 } },
    { "id": 21, "connection": "deletion",
      "left":  { "kind": "deletion", "content": "// old", "oldLine": 3 } }
  ]
})";
} // namespace

// ============================================================
// Name tables
// ============================================================

TEST(DiffPair, ConnectionNames)
{
    for (ConnectionType t : {ConnectionType::None, ConnectionType::Addition,
                             ConnectionType::Deletion, ConnectionType::Change}) {
        ConnectionType back = ConnectionType::None;
        ASSERT_TRUE(parseConnectionType(connectionTypeName(t), back));
        EXPECT_EQ(back, t);
    }
    ConnectionType out = ConnectionType::Change;
    EXPECT_FALSE(parseConnectionType("Change", out));
    EXPECT_EQ(out, ConnectionType::Change);
}

TEST(DiffPair, LineKindNames)
{
    LineKind k = LineKind::Context;
    EXPECT_TRUE(parseLineKind("deletion", k));
    EXPECT_EQ(k, LineKind::Deletion);
    EXPECT_STREQ(lineKindName(LineKind::Addition), "addition");
    EXPECT_FALSE(parseLineKind("moved", k));
}

TEST(DiffPair, SidesFromPresence)
{
    DiffPairWithConnection p;
    EXPECT_EQ(p.sides(), RowSides::Neither);
    p.left = LineRecord{};
    EXPECT_EQ(p.sides(), RowSides::LeftOnly);
    p.right = LineRecord{};
    EXPECT_EQ(p.sides(), RowSides::Both);
    p.left.reset();
    EXPECT_EQ(p.sides(), RowSides::RightOnly);
}

// ============================================================
// Loading
// ============================================================

TEST(PairSetFile, ReadsEntriesInOrder)
{
    PairSequence pairs;
    ASSERT_TRUE(PairSetFile::loadFromString(kTwoHunkSet, pairs)) << PairSetFile::lastError();
    ASSERT_EQ(pairs.size(), 5u);

    EXPECT_EQ(pairs[0].id, 10);
    ASSERT_TRUE(pairs[0].hunkHeader.has_value());
    EXPECT_EQ(*pairs[0].hunkHeader, "@@ -1,2 +1,2 @@");
    EXPECT_EQ(pairs[0].connectionType, ConnectionType::None);
    EXPECT_EQ(pairs[0].sides(), RowSides::Neither);

    const DiffPairWithConnection& change = pairs[1];
    EXPECT_EQ(change.connectionType, ConnectionType::Change);
    ASSERT_TRUE(change.left && change.right);
    EXPECT_EQ(change.left->kind, LineKind::Deletion);
    EXPECT_EQ(change.left->content, "int a = 1;");
    EXPECT_EQ(change.left->oldLineNumber, 1);
    EXPECT_FALSE(change.left->newLineNumber.has_value());
    EXPECT_EQ(change.right->newLineNumber, 1);
    EXPECT_FALSE(change.hunkHeader.has_value());

    EXPECT_EQ(pairs[2].left->kind, LineKind::Context);
    EXPECT_EQ(pairs[3].sides(), RowSides::RightOnly);
    EXPECT_EQ(pairs[4].sides(), RowSides::LeftOnly);
    EXPECT_EQ(pairs[4].connectionType, ConnectionType::Deletion);
}

TEST(PairSetFile, PresenceAndConnectionAreNotCrossChecked)
{
    // A "change" row with one side is accepted as-is.
    PairSequence pairs;
    ASSERT_TRUE(PairSetFile::loadFromString(
        R"({ "pairs": [ { "id": 1, "connection": "change", "left": { "content": "x" } } ] })",
        pairs));
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].connectionType, ConnectionType::Change);
    EXPECT_EQ(pairs[0].sides(), RowSides::LeftOnly);
}

TEST(PairSetFile, EmptyArrayIsValid)
{
    PairSequence pairs = PairSetFile::sample();
    ASSERT_TRUE(PairSetFile::loadFromString(R"({ "pairs": [] })", pairs));
    EXPECT_TRUE(pairs.empty());
}

TEST(PairSetFile, RejectsBadDocuments)
{
    struct Case { const char* json; const char* expectInError; };
    const Case cases[] = {
        {"{ \"pairs\": [",                                          "Invalid JSON"},
        {R"({ "rows": [] })",                                       "Missing \"pairs\""},
        {R"({ "pairs": {} })",                                      "Missing \"pairs\""},
        {R"({ "pairs": [ 5 ] })",                                   "Pair 0"},
        {R"({ "pairs": [ { "connection": "none" } ] })",            "\"id\""},
        {R"({ "pairs": [ { "id": 1, "connection": "moved" } ] })",  "moved"},
        {R"({ "pairs": [ { "id": 1, "left": { "kind": "x" } } ] })", "left: unknown line kind"},
        {R"({ "pairs": [ { "id": 1, "right": "text" } ] })",        "right: line must be an object"},
        {R"({ "pairs": [ { "id": 3 }, { "id": 3 } ] })",            "Duplicate pair id 3"},
        {R"({ "pairs": [ { "id": 1 }, { "id": 1.5 } ] })",          "Pair 1 in case: \"id\" must be an integer"},
        {R"({ "pairs": [ { "id": 1e20 }, { "id": 3e20 } ] })",      "Pair 0 in case: \"id\" must be an integer"},
        {R"({ "pairs": [ { "id": -3e9 } ] })",                      "\"id\" must be an integer"},
        {R"({ "pairs": [ { "id": 1, "left": { "oldLine": 2.5 } } ] })",
                                                                    "left: \"oldLine\" must be an integer"},
        {R"({ "pairs": [ { "id": 1, "right": { "newLine": 1e12 } } ] })",
                                                                    "right: \"newLine\" must be an integer"},
    };

    const PairSequence original = PairSetFile::sample();
    for (auto& c : cases) {
        PairSequence pairs = original;
        EXPECT_FALSE(PairSetFile::loadFromString(c.json, pairs, "case")) << c.json;
        EXPECT_EQ(pairs.size(), original.size());
        EXPECT_NE(PairSetFile::lastError().find(c.expectInError), std::string::npos)
            << PairSetFile::lastError();
    }
}

TEST(PairSetFile, LoadsFromFile)
{
    std::filesystem::path path =
        std::filesystem::temp_directory_path() / "ribbon_pairs_test.json";
    {
        std::ofstream f(path);
        f << kTwoHunkSet;
    }

    PairSequence pairs;
    ASSERT_TRUE(PairSetFile::load(path.string(), pairs));
    EXPECT_EQ(pairs.size(), 5u);
    EXPECT_TRUE(PairSetFile::lastError().empty());

    std::filesystem::remove(path);
}

TEST(PairSetFile, MissingFileFails)
{
    PairSequence pairs;
    EXPECT_FALSE(PairSetFile::load("/nonexistent/pairs.json", pairs));
    EXPECT_NE(PairSetFile::lastError().find("Cannot open"), std::string::npos);
}

// ============================================================
// Built-in sample
// ============================================================

TEST(PairSetFile, SampleIsWellFormed)
{
    PairSequence s = PairSetFile::sample();
    ASSERT_EQ(s.size(), 15u);

    std::set<int> ids;
    int headers = 0, ribbons = 0;
    for (auto& p : s) {
        EXPECT_TRUE(ids.insert(p.id).second) << "duplicate id " << p.id;
        if (p.hunkHeader) {
            ++headers;
            EXPECT_EQ(p.connectionType, ConnectionType::None);
        }
        if (p.connectionType != ConnectionType::None && p.sides() != RowSides::Neither)
            ++ribbons;

        // Connection agrees with presence throughout the sample.
        switch (p.connectionType) {
            case ConnectionType::Change:   EXPECT_EQ(p.sides(), RowSides::Both);      break;
            case ConnectionType::Deletion: EXPECT_EQ(p.sides(), RowSides::LeftOnly);  break;
            case ConnectionType::Addition: EXPECT_EQ(p.sides(), RowSides::RightOnly); break;
            case ConnectionType::None:     break;
        }
    }
    EXPECT_EQ(headers, 2);
    EXPECT_EQ(ribbons, 6);
}
