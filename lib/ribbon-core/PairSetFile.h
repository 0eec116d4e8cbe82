#pragma once
// PairSetFile — reads a pre-computed pair sequence from JSON.
//
// The pairing is produced elsewhere (a diff tool, a test fixture); this
// only deserializes it. Format:
//
//   {
//     "pairs": [
//       { "id": 1, "hunkHeader": "@@ -1,3 +1,3 @@", "connection": "none" },
//       { "id": 2, "connection": "change",
//         "left":  { "kind": "deletion", "content": "old", "oldLine": 1 },
//         "right": { "kind": "addition", "content": "new", "newLine": 1 } }
//     ]
//   }
//
// Array order is display order. "connection" defaults to "none", a line's
// "kind" to "context". Ids must be unique but need not be contiguous.
//
// No OpenGL, no ImGui, no GLFW dependency.

#include "DiffPair.h"
#include <string>

namespace ribbon {

class PairSetFile
{
public:
    // Load into `pairs`. On failure `pairs` is left untouched.
    static bool load(const std::string& path, PairSequence& pairs);

    static bool loadFromString(const std::string& json,
                               PairSequence&      pairs,
                               const std::string& source = "<memory>");

    // Built-in demonstration set: one hunk with context, a change block,
    // a pure deletion and a pure addition.
    static PairSequence sample();

    static const std::string& lastError() { return s_error; }

private:
    static std::string s_error;
};

} // namespace ribbon
