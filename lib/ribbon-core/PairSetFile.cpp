#include "PairSetFile.h"
#include "JsonValue.h"
#include <climits>
#include <cmath>
#include <iostream>
#include <set>

namespace ribbon {

std::string PairSetFile::s_error;

// ============================================================
// Helpers
// ============================================================

// Whole number inside int range.
static bool readInt(const JsonValue& v, const char* key, int& out, std::string& err)
{
    double n = v.num();
    if (std::floor(n) != n || n < (double)INT_MIN || n > (double)INT_MAX) {
        err = std::string("\"") + key + "\" must be an integer";
        return false;
    }
    out = (int)n;
    return true;
}

static bool readLine(const JsonValue& jl, LineRecord& line, std::string& err)
{
    if (!jl.isObject()) { err = "line must be an object"; return false; }

    if (jl.has("kind") && !parseLineKind(jl["kind"].str(), line.kind)) {
        err = "unknown line kind \"" + jl["kind"].str() + "\"";
        return false;
    }
    line.content = jl["content"].str();
    int number = 0;
    if (jl["oldLine"].isNumber()) {
        if (!readInt(jl["oldLine"], "oldLine", number, err)) return false;
        line.oldLineNumber = number;
    }
    if (jl["newLine"].isNumber()) {
        if (!readInt(jl["newLine"], "newLine", number, err)) return false;
        line.newLineNumber = number;
    }
    return true;
}

static bool readPair(const JsonValue& jp, DiffPairWithConnection& pair, std::string& err)
{
    if (!jp.isObject())          { err = "entry must be an object"; return false; }
    if (!jp["id"].isNumber())    { err = "missing numeric \"id\"";  return false; }
    if (!readInt(jp["id"], "id", pair.id, err)) return false;

    if (jp.has("connection") &&
        !parseConnectionType(jp["connection"].str(), pair.connectionType)) {
        err = "unknown connection \"" + jp["connection"].str() + "\"";
        return false;
    }

    if (jp["hunkHeader"].isString()) pair.hunkHeader = jp["hunkHeader"].str();

    if (!jp["left"].isNull()) {
        LineRecord line;
        if (!readLine(jp["left"], line, err)) { err = "left: " + err; return false; }
        pair.left = line;
    }
    if (!jp["right"].isNull()) {
        LineRecord line;
        if (!readLine(jp["right"], line, err)) { err = "right: " + err; return false; }
        pair.right = line;
    }
    return true;
}

// ============================================================
// Load
// ============================================================

bool PairSetFile::load(const std::string& path, PairSequence& pairs)
{
    std::string text;
    if (!readTextFile(path, text)) {
        s_error = "Cannot open: " + path;
        std::cerr << "[PairSetFile] " << s_error << "\n";
        return false;
    }
    if (!loadFromString(text, pairs, path)) return false;

    std::cout << "[PairSetFile] Loaded " << pairs.size()
              << " pairs from: " << path << "\n";
    return true;
}

bool PairSetFile::loadFromString(const std::string& json,
                                 PairSequence&      pairs,
                                 const std::string& source)
{
    JsonValue root;
    std::string err;
    if (!parseJson(json, root, err)) {
        s_error = "Invalid JSON in " + source + ": " + err;
        std::cerr << "[PairSetFile] " << s_error << "\n";
        return false;
    }

    const JsonValue& arr = root["pairs"];
    if (!arr.isArray()) {
        s_error = "Missing \"pairs\" array in: " + source;
        std::cerr << "[PairSetFile] " << s_error << "\n";
        return false;
    }

    PairSequence result;
    result.reserve(arr.size());
    std::set<int> seenIds;

    for (size_t i = 0; i < arr.size(); ++i) {
        DiffPairWithConnection pair;
        if (!readPair(arr[i], pair, err)) {
            s_error = "Pair " + std::to_string(i) + " in " + source + ": " + err;
            std::cerr << "[PairSetFile] " << s_error << "\n";
            return false;
        }
        if (!seenIds.insert(pair.id).second) {
            s_error = "Duplicate pair id " + std::to_string(pair.id) + " in: " + source;
            std::cerr << "[PairSetFile] " << s_error << "\n";
            return false;
        }
        result.push_back(std::move(pair));
    }

    pairs = std::move(result);
    s_error.clear();
    return true;
}

// ============================================================
// Sample
// ============================================================

static LineRecord ctx(int oldNo, int newNo, const char* text)
{
    LineRecord l;
    l.kind = LineKind::Context;
    l.content = text;
    l.oldLineNumber = oldNo;
    l.newLineNumber = newNo;
    return l;
}

static LineRecord del(int oldNo, const char* text)
{
    LineRecord l;
    l.kind = LineKind::Deletion;
    l.content = text;
    l.oldLineNumber = oldNo;
    return l;
}

static LineRecord add(int newNo, const char* text)
{
    LineRecord l;
    l.kind = LineKind::Addition;
    l.content = text;
    l.newLineNumber = newNo;
    return l;
}

PairSequence PairSetFile::sample()
{
    PairSequence s;
    int id = 0;

    auto header = [&](const char* text) {
        DiffPairWithConnection p;
        p.id = ++id;
        p.hunkHeader = std::string(text);
        s.push_back(p);
    };
    auto row = [&](std::optional<LineRecord> l, std::optional<LineRecord> r,
                   ConnectionType type) {
        DiffPairWithConnection p;
        p.id = ++id;
        p.left = std::move(l);
        p.right = std::move(r);
        p.connectionType = type;
        s.push_back(p);
    };

    header("@@ -1,8 +1,7 @@");
    row(ctx(1, 1, "#include <vector>"),                 ctx(1, 1, "#include <vector>"),                 ConnectionType::None);
    row(ctx(2, 2, ""),                                  ctx(2, 2, ""),                                  ConnectionType::None);
    row(del(3, "int sum(std::vector<int> v) {"),        add(3, "int sum(const std::vector<int>& v) {"), ConnectionType::Change);
    row(del(4, "    int total = 0;"),                   add(4, "    int total{0};"),                    ConnectionType::Change);
    row(ctx(5, 5, "    for (int x : v) total += x;"),   ctx(5, 5, "    for (int x : v) total += x;"),   ConnectionType::None);
    row(del(6, "    printf(\"%d\\n\", total);"),        std::nullopt,                                   ConnectionType::Deletion);
    row(ctx(7, 6, "    return total;"),                 ctx(7, 6, "    return total;"),                 ConnectionType::None);
    row(ctx(8, 7, "}"),                                 ctx(8, 7, "}"),                                 ConnectionType::None);
    header("@@ -20,3 +19,4 @@");
    row(ctx(20, 19, "int main() {"),                    ctx(20, 19, "int main() {"),                    ConnectionType::None);
    row(std::nullopt,                                   add(20, "    std::vector<int> v{1, 2, 3};"),    ConnectionType::Addition);
    row(std::nullopt,                                   add(21, "    return sum(v) == 6 ? 0 : 1;"),     ConnectionType::Addition);
    row(del(21, "    return 0;"),                       std::nullopt,                                   ConnectionType::Deletion);
    row(ctx(22, 22, "}"),                               ctx(22, 22, "}"),                               ConnectionType::None);
    return s;
}

} // namespace ribbon
