#include "DiffPair.h"

namespace ribbon {

RowSides DiffPairWithConnection::sides() const
{
    if (left && right) return RowSides::Both;
    if (left)          return RowSides::LeftOnly;
    if (right)         return RowSides::RightOnly;
    return RowSides::Neither;
}

// ============================================================
// Name tables
// ============================================================

const char* connectionTypeName(ConnectionType type)
{
    switch (type) {
        case ConnectionType::None:     return "none";
        case ConnectionType::Addition: return "addition";
        case ConnectionType::Deletion: return "deletion";
        case ConnectionType::Change:   return "change";
    }
    return "none";
}

bool parseConnectionType(const std::string& name, ConnectionType& out)
{
    if      (name == "none")     out = ConnectionType::None;
    else if (name == "addition") out = ConnectionType::Addition;
    else if (name == "deletion") out = ConnectionType::Deletion;
    else if (name == "change")   out = ConnectionType::Change;
    else return false;
    return true;
}

const char* lineKindName(LineKind kind)
{
    switch (kind) {
        case LineKind::Context:  return "context";
        case LineKind::Addition: return "addition";
        case LineKind::Deletion: return "deletion";
    }
    return "context";
}

bool parseLineKind(const std::string& name, LineKind& out)
{
    if      (name == "context")  out = LineKind::Context;
    else if (name == "addition") out = LineKind::Addition;
    else if (name == "deletion") out = LineKind::Deletion;
    else return false;
    return true;
}

} // namespace ribbon
