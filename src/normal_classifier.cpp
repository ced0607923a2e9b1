#include "normal_classifier.h"
#include "numeric_replica.h"

#include <cmath>

// =============================================================================
// Bit-exact normal
// =============================================================================
//
// Products of two f32 values are exact in double, so each of
//
//   nx = f32( f32(y2-y1) * f32(z3-z2) - f32(z2-z1) * f32(y3-y2) )
//
// rounds exactly once, after the subtraction. The squared components are
// rounded individually before they are summed.
//
// =============================================================================

NormalVector computeBitExactNormal(const Vertex& v1, const Vertex& v2, const Vertex& v3) {
    const int32_t x1 = truncateToInt32(static_cast<int64_t>(v1.x));
    const int32_t y1 = truncateToInt32(static_cast<int64_t>(v1.y));
    const int32_t z1 = truncateToInt32(static_cast<int64_t>(v1.z));

    const int32_t x2 = truncateToInt32(static_cast<int64_t>(v2.x));
    const int32_t y2 = truncateToInt32(static_cast<int64_t>(v2.y));
    const int32_t z2 = truncateToInt32(static_cast<int64_t>(v2.z));

    const int32_t x3 = truncateToInt32(static_cast<int64_t>(v3.x));
    const int32_t y3 = truncateToInt32(static_cast<int64_t>(v3.y));
    const int32_t z3 = truncateToInt32(static_cast<int64_t>(v3.z));

    // Edge terms, v2 - v1 and v3 - v2
    const double dx21 = roundToFloat32(subtractInt32(x2, x1));
    const double dy21 = roundToFloat32(subtractInt32(y2, y1));
    const double dz21 = roundToFloat32(subtractInt32(z2, z1));

    const double dx32 = roundToFloat32(subtractInt32(x3, x2));
    const double dy32 = roundToFloat32(subtractInt32(y3, y2));
    const double dz32 = roundToFloat32(subtractInt32(z3, z2));

    float nx = roundToFloat32(dy21 * dz32 - dz21 * dy32);
    float ny = roundToFloat32(dz21 * dx32 - dx21 * dz32);
    float nz = roundToFloat32(dx21 * dy32 - dy21 * dx32);

    const double sumOfSquares = static_cast<double>(multiplyFloat32(nx, nx))
                              + static_cast<double>(multiplyFloat32(ny, ny))
                              + static_cast<double>(multiplyFloat32(nz, nz));
    float mag = roundToFloat32(std::sqrt(static_cast<double>(roundToFloat32(sumOfSquares))));

    if (mag < ClassifierConstants::MIN_MAGNITUDE) {
        return ClassifierConstants::FALLBACK_NORMAL;
    }

    // The engine multiplies by the f32 reciprocal rather than dividing
    const float invMag = roundToFloat32(1.0 / static_cast<double>(mag));

    NormalVector normal;
    normal.x = multiplyFloat32(nx, invMag);
    normal.y = multiplyFloat32(ny, invMag);
    normal.z = multiplyFloat32(nz, invMag);
    return normal;
}

NormalVector computeBitExactNormal(const CollisionSet& set, const Triangle& triangle) {
    return computeBitExactNormal(set.corner0(triangle), set.corner1(triangle), set.corner2(triangle));
}

// =============================================================================
// Reference normal
// =============================================================================

static Vec3 toVec3(const Vertex& v) {
    return Vec3(v.x, v.y, v.z);
}

Vec3 computeReferenceNormal(const Vertex& v1, const Vertex& v2, const Vertex& v3) {
    Vec3 edge1 = toVec3(v2) - toVec3(v1);
    Vec3 edge2 = toVec3(v3) - toVec3(v1);
    return edge1.cross(edge2).normalized();
}

Vec3 computeReferenceNormal(const CollisionSet& set, const Triangle& triangle) {
    return computeReferenceNormal(set.corner0(triangle), set.corner1(triangle), set.corner2(triangle));
}

// =============================================================================
// Classification
// =============================================================================

OrientationClass classifyNormal(const NormalVector& normal) {
    const double y = normal.y;
    if (y > ClassifierConstants::ORIENTATION_THRESHOLD) {
        return OrientationClass::FLOOR;
    }
    if (y < -ClassifierConstants::ORIENTATION_THRESHOLD) {
        return OrientationClass::CEILING;
    }
    return OrientationClass::WALL;
}

ClassifiedCollisionSet classifyCollisionSet(const CollisionSet& set) {
    ClassifiedCollisionSet classified;
    classified.vertices = set.vertices();
    classified.triangles.reserve(set.triangleCount());

    for (const Triangle& triangle : set.triangles()) {
        ClassifiedTriangle entry;
        entry.triangle = triangle;
        entry.exactNormal = computeBitExactNormal(set, triangle);
        entry.referenceNormal = computeReferenceNormal(set, triangle);
        entry.orientation = classifyNormal(entry.exactNormal);
        classified.triangles.push_back(entry);
    }
    return classified;
}
