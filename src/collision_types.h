#ifndef COLINSPECT_COLLISION_TYPES_H
#define COLINSPECT_COLLISION_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "math3d.h"

// =============================================================================
// Collision Data Structures
// =============================================================================
//
// A collision source unit (a level area, or one object in object-local
// coordinates) is described by:
// - Vertices: ordered (x, y, z) integer coordinates, referenced by index
// - Triangles: three vertex indices and a surface type token
//
// Vertex and triangle order is source order. A triangle's ordinal is the
// stable identifier used to look it up again later, so neither list is ever
// reordered.
//
// =============================================================================

// Surface type applied to triangles that appear before any COL_TRI_INIT
constexpr const char* DEFAULT_SURFACE_TYPE = "SURFACE_DEFAULT";

// A single collision vertex
struct Vertex {
    int32_t x;
    int32_t y;
    int32_t z;
};

inline bool operator==(const Vertex& a, const Vertex& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vertex& a, const Vertex& b) {
    return !(a == b);
}

// A collision triangle (indices into the owning set's vertex list)
struct Triangle {
    uint32_t vertex0;
    uint32_t vertex1;
    uint32_t vertex2;
    std::string surfaceType;
};

// Unit surface normal with f32 components
struct NormalVector {
    float x;
    float y;
    float z;
};

// Geometric category of a triangle, derived from its normal's Y component
enum class OrientationClass {
    FLOOR,
    WALL,
    CEILING
};

// Lower-case name ("floor", "wall", "ceiling")
const char* orientationClassName(OrientationClass orientation);

// =============================================================================
// CollisionSet - vertices and triangles of one source unit
// =============================================================================

class CollisionSet {
public:
    CollisionSet() = default;

    // Append a vertex, returns its index
    uint32_t addVertex(const Vertex& vertex);

    // Append a triangle
    // Returns false (and stores nothing) if any index is out of range
    bool addTriangle(const Triangle& triangle);

    const std::vector<Vertex>& vertices() const { return vertexList; }
    const std::vector<Triangle>& triangles() const { return triangleList; }

    size_t vertexCount() const { return vertexList.size(); }
    size_t triangleCount() const { return triangleList.size(); }

    // The three corners of a triangle
    const Vertex& corner0(const Triangle& triangle) const { return vertexList[triangle.vertex0]; }
    const Vertex& corner1(const Triangle& triangle) const { return vertexList[triangle.vertex1]; }
    const Vertex& corner2(const Triangle& triangle) const { return vertexList[triangle.vertex2]; }

    // Centroid of a triangle
    Vec3 centroid(const Triangle& triangle) const;

    void clear();

private:
    std::vector<Vertex> vertexList;
    std::vector<Triangle> triangleList;
};

// =============================================================================
// Classified triangles
// =============================================================================
//
// Each triangle carries two normals:
// - exactNormal: bit-exact replica of the game engine calculation, the only one
//   used for classification
// - referenceNormal: ordinary double-precision normal, for display and
//   comparison
//
// =============================================================================

struct ClassifiedTriangle {
    Triangle triangle;
    NormalVector exactNormal;
    Vec3 referenceNormal;
    OrientationClass orientation;
};

struct ClassifiedCollisionSet {
    std::vector<Vertex> vertices;
    std::vector<ClassifiedTriangle> triangles;
};

// =============================================================================
// Object placement
// =============================================================================

// One instance of an object model placed by the level script.
// Angles are in degrees and are kept exactly as written (not normalised).
struct ObjectPlacement {
    std::string modelName;  // Symbol without the MODEL_ prefix
    int32_t x;
    int32_t y;
    int32_t z;
    int32_t angleX;
    int32_t angleY;
    int32_t angleZ;
};

#endif // COLINSPECT_COLLISION_TYPES_H
