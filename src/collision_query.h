#ifndef COLINSPECT_COLLISION_QUERY_H
#define COLINSPECT_COLLISION_QUERY_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "collision_types.h"

// =============================================================================
// Collision Queries
// =============================================================================
//
// Lookups and statistics over a parsed set. Triangles are always reported by
// ordinal (their position in source order), which is the identifier a viewer
// uses to find the triangle again.
//
// =============================================================================

struct OrientationCounts {
    size_t floors = 0;
    size_t walls = 0;
    size_t ceilings = 0;
};

// Surface type -> triangle ordinals, each list in source order
std::map<std::string, std::vector<size_t>> groupBySurfaceType(const CollisionSet& set);

// Surface type -> number of triangles
std::map<std::string, size_t> countSurfaceTypes(const CollisionSet& set);

OrientationCounts countOrientations(const ClassifiedCollisionSet& classified);

// Triangles with a corner at (x, y, z). With tolerance > 0, any corner within
// that Euclidean distance counts.
std::vector<size_t> findTrianglesByVertex(const CollisionSet& set, int32_t x, int32_t y, int32_t z,
                                          double tolerance = 0.0);

// Triangles whose centroid lies within radius of the point
std::vector<size_t> findTrianglesNearPoint(const CollisionSet& set, double x, double y, double z,
                                           double radius);

// Distinct surface types (sorted) of the triangles found by findTrianglesByVertex
std::vector<std::string> surfaceTypesAt(const CollisionSet& set, int32_t x, int32_t y, int32_t z,
                                        double tolerance = 0.0);

// Multi-line description of one triangle: surface type, orientation,
// corners, and both normals to 10 decimal places.
// Returns an empty string if ordinal is out of range.
std::string formatTriangleReport(const ClassifiedCollisionSet& classified, size_t ordinal);

#endif // COLINSPECT_COLLISION_QUERY_H
