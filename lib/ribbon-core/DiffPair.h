#pragma once
// DiffPair — row-aligned pairing of an old-side line with a new-side line.
//
// A split diff view is a sequence of rows. Each row holds at most one line
// from the old file (left) and at most one from the new file (right), plus a
// connection type that says how the two relate. The pairing itself is
// computed elsewhere; this module only describes it.
//
// No OpenGL, no ImGui, no GLFW dependency.

#include <optional>
#include <string>
#include <vector>

namespace ribbon {

// ============================================================
// LineKind
// ============================================================
enum class LineKind {
    Context,
    Addition,
    Deletion,
};

// ============================================================
// LineRecord
// ============================================================
// One line of file content as shown in a text panel.
struct LineRecord {
    LineKind           kind = LineKind::Context;
    std::string        content;
    std::optional<int> oldLineNumber;   // 1-based, absent on added lines
    std::optional<int> newLineNumber;   // 1-based, absent on deleted lines
};

// ============================================================
// ConnectionType
// ============================================================
// none = no ribbon is drawn for this row.
enum class ConnectionType {
    None,
    Addition,
    Deletion,
    Change,
};

// ============================================================
// RowSides
// ============================================================
// Which sides of a row carry content.
enum class RowSides {
    Neither,
    LeftOnly,
    RightOnly,
    Both,
};

// ============================================================
// DiffPairWithConnection
// ============================================================
// Sequence order is display order, top to bottom. Every entry occupies
// exactly one row whether or not a ribbon is drawn for it.
struct DiffPairWithConnection {
    int                        id = 0;
    std::optional<LineRecord>  left;
    std::optional<LineRecord>  right;
    std::optional<std::string> hunkHeader;
    ConnectionType             connectionType = ConnectionType::None;

    RowSides sides() const;
};

using PairSequence = std::vector<DiffPairWithConnection>;

// Name <-> enum helpers. Names are lower-case: "none", "addition", ...
const char* connectionTypeName(ConnectionType type);
bool        parseConnectionType(const std::string& name, ConnectionType& out);

const char* lineKindName(LineKind kind);
bool        parseLineKind(const std::string& name, LineKind& out);

} // namespace ribbon
