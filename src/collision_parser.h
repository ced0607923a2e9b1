#ifndef COLINSPECT_COLLISION_PARSER_H
#define COLINSPECT_COLLISION_PARSER_H

#include <cstddef>
#include <string>

#include "collision_types.h"
#include "preprocessor.h"

// =============================================================================
// Collision Grammar Parser
// =============================================================================
//
// Recovers vertices and triangles from collision source text:
//
//   COL_VERTEX(-1024, 0, 512),         vertex, indexed in order of appearance
//   COL_TRI_INIT(SURFACE_BURNING, 2),  surface type for the following triangles
//   COL_TRI(0, 1, 2),                  triangle from three vertex indices
//
// Vertices are found by a scan of the whole text (a declaration may span
// lines). Surface markers and triangles are read line by line, in order.
//
// A triangle referring to a vertex that does not exist is dropped; such
// statements come from the other build variant's vertex table. A statement
// with a malformed number ("12abc", "0x1F", out of range) is dropped and
// counted. Recovering no triangles at all is a failure: it nearly always means
// the variant or the grammar did not match the file.
//
// =============================================================================

namespace CollisionMacros {
    constexpr const char* VERTEX = "COL_VERTEX";
    constexpr const char* TRI_INIT = "COL_TRI_INIT";
    constexpr const char* TRI = "COL_TRI";
}

enum class ParseError {
    NONE,
    PREPROCESS_FAILED,  // Conditional directives are malformed
    EMPTY_RESULT        // No triangle was recovered
};

const char* parseErrorName(ParseError error);

// What happened during one parse
struct ParseReport {
    ParseError error = ParseError::NONE;
    PreprocessResult preprocess;          // Detail when error == PREPROCESS_FAILED
    size_t vertexStatements = 0;          // Well-formed COL_VERTEX statements
    size_t triangleStatements = 0;        // Well-formed COL_TRI statements
    size_t surfaceMarkers = 0;            // Well-formed COL_TRI_INIT statements
    size_t droppedTriangles = 0;          // COL_TRI with an out-of-range index
    size_t malformedStatements = 0;       // Statements dropped for a bad number
};

// Parse already-preprocessed text into set (set is cleared first)
// Returns false with report.error == EMPTY_RESULT if no triangle was accepted
bool parseCollision(const std::string& text, CollisionSet& set, ParseReport& report);

// Preprocess for one variant, then parse
bool parseCollisionSource(const std::string& text, Variant variant,
                          CollisionSet& set, ParseReport& report);

#endif // COLINSPECT_COLLISION_PARSER_H
