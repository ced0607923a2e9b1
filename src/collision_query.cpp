#include "collision_query.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdarg>
#include <cstdio>
#include <set>

namespace {

double distance(const Vertex& v, double x, double y, double z) {
    double dx = v.x - x;
    double dy = v.y - y;
    double dz = v.z - z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

bool cornerMatches(const Vertex& v, int32_t x, int32_t y, int32_t z, double tolerance) {
    if (tolerance == 0.0) {
        return v.x == x && v.y == y && v.z == z;
    }
    return distance(v, x, y, z) <= tolerance;
}

// "SURFACE_HARD_NOT_SLIPPERY" -> "SURFACE HARD NOT SLIPPERY"
std::string readableSurfaceName(const std::string& surfaceType) {
    std::string name = surfaceType;
    std::replace(name.begin(), name.end(), '_', ' ');
    return name;
}

// -0.0 prints as "-0.0000000000"
double withoutNegativeZero(double value) {
    return value + 0.0;
}

// printf-style append of one line
void appendLine(std::string& out, const char* format, ...) {
    char buffer[256];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);
    out += buffer;
    out += '\n';
}

} // namespace

std::map<std::string, std::vector<size_t>> groupBySurfaceType(const CollisionSet& set) {
    std::map<std::string, std::vector<size_t>> groups;
    const std::vector<Triangle>& triangles = set.triangles();
    for (size_t i = 0; i < triangles.size(); i++) {
        groups[triangles[i].surfaceType].push_back(i);
    }
    return groups;
}

std::map<std::string, size_t> countSurfaceTypes(const CollisionSet& set) {
    std::map<std::string, size_t> counts;
    for (const Triangle& triangle : set.triangles()) {
        counts[triangle.surfaceType]++;
    }
    return counts;
}

OrientationCounts countOrientations(const ClassifiedCollisionSet& classified) {
    OrientationCounts counts;
    for (const ClassifiedTriangle& entry : classified.triangles) {
        switch (entry.orientation) {
            case OrientationClass::FLOOR:
                counts.floors++;
                break;
            case OrientationClass::WALL:
                counts.walls++;
                break;
            case OrientationClass::CEILING:
                counts.ceilings++;
                break;
        }
    }
    return counts;
}

std::vector<size_t> findTrianglesByVertex(const CollisionSet& set, int32_t x, int32_t y, int32_t z,
                                          double tolerance) {
    std::vector<size_t> found;
    const std::vector<Triangle>& triangles = set.triangles();

    for (size_t i = 0; i < triangles.size(); i++) {
        const Triangle& t = triangles[i];
        if (cornerMatches(set.corner0(t), x, y, z, tolerance)
            || cornerMatches(set.corner1(t), x, y, z, tolerance)
            || cornerMatches(set.corner2(t), x, y, z, tolerance)) {
            found.push_back(i);
        }
    }
    return found;
}

std::vector<size_t> findTrianglesNearPoint(const CollisionSet& set, double x, double y, double z,
                                           double radius) {
    std::vector<size_t> found;
    const std::vector<Triangle>& triangles = set.triangles();
    const Vec3 point(x, y, z);

    for (size_t i = 0; i < triangles.size(); i++) {
        if ((set.centroid(triangles[i]) - point).length() <= radius) {
            found.push_back(i);
        }
    }
    return found;
}

std::vector<std::string> surfaceTypesAt(const CollisionSet& set, int32_t x, int32_t y, int32_t z,
                                        double tolerance) {
    std::set<std::string> types;
    for (size_t ordinal : findTrianglesByVertex(set, x, y, z, tolerance)) {
        types.insert(set.triangles()[ordinal].surfaceType);
    }
    return std::vector<std::string>(types.begin(), types.end());
}

std::string formatTriangleReport(const ClassifiedCollisionSet& classified, size_t ordinal) {
    if (ordinal >= classified.triangles.size()) {
        return std::string();
    }

    const ClassifiedTriangle& entry = classified.triangles[ordinal];
    const Triangle& t = entry.triangle;
    const Vertex& v1 = classified.vertices[t.vertex0];
    const Vertex& v2 = classified.vertices[t.vertex1];
    const Vertex& v3 = classified.vertices[t.vertex2];

    std::string orientation = orientationClassName(entry.orientation);
    orientation[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(orientation[0])));

    std::string out;
    appendLine(out, "Triangle %zu", ordinal);
    appendLine(out, "  Surface type:  %s", readableSurfaceName(t.surfaceType).c_str());
    appendLine(out, "  Geometry type: %s", orientation.c_str());
    appendLine(out, "  V1: (%d, %d, %d)", v1.x, v1.y, v1.z);
    appendLine(out, "  V2: (%d, %d, %d)", v2.x, v2.y, v2.z);
    appendLine(out, "  V3: (%d, %d, %d)", v3.x, v3.y, v3.z);
    appendLine(out, "  Engine normal:    (%.10f, %.10f, %.10f)",
               withoutNegativeZero(entry.exactNormal.x),
               withoutNegativeZero(entry.exactNormal.y),
               withoutNegativeZero(entry.exactNormal.z));
    appendLine(out, "  Reference normal: (%.10f, %.10f, %.10f)",
               withoutNegativeZero(entry.referenceNormal.x),
               withoutNegativeZero(entry.referenceNormal.y),
               withoutNegativeZero(entry.referenceNormal.z));
    return out;
}
