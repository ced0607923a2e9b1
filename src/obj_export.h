#ifndef COLINSPECT_OBJ_EXPORT_H
#define COLINSPECT_OBJ_EXPORT_H

#include <ostream>
#include <string>

#include "collision_types.h"

// =============================================================================
// Wavefront OBJ Export
// =============================================================================
//
// Writes a collision set as a plain OBJ mesh:
//
//   # Collision mesh export
//   # 3 vertices, 1 triangles
//
//   v 0 0 0
//   ...
//
//   f 1 2 3
//
// Face indices are 1-based and come straight from the triangles' vertex
// indices, so duplicate vertex positions are preserved.
//
// =============================================================================

void writeObj(const CollisionSet& set, std::ostream& out);

// Write to a file
// Returns true on success
bool exportObj(const CollisionSet& set, const std::string& path);

#endif // COLINSPECT_OBJ_EXPORT_H
