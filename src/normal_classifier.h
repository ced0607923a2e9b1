#ifndef COLINSPECT_NORMAL_CLASSIFIER_H
#define COLINSPECT_NORMAL_CLASSIFIER_H

#include "collision_types.h"
#include "math3d.h"

// =============================================================================
// Normal Classifier
// =============================================================================
//
// Recomputes each triangle's face normal the way the game engine
// does when it loads collision surfaces, then sorts the triangle into floor,
// wall or ceiling from the normal's Y component.
//
// The engine's normal is not the textbook one:
// - The cross product is (v2 - v1) x (v3 - v2), not (v2 - v1) x (v3 - v1)
// - Differences are 32-bit integers, everything after that is f32 and is
//   rounded after each step
// - Near-zero magnitudes fall back to straight up (0, 1, 0)
//
// This is the only implementation of these rules in the project. Anything
// that shows or uses a normal takes it from classifyCollisionSet().
//
// =============================================================================

namespace ClassifierConstants {
    // |normal.y| must exceed this to count as a floor or ceiling
    constexpr double ORIENTATION_THRESHOLD = 0.01;

    // Magnitudes below this are treated as degenerate triangles
    constexpr double MIN_MAGNITUDE = 0.0001;

    constexpr NormalVector FALLBACK_NORMAL = {0.0f, 1.0f, 0.0f};
}

// Bit-exact engine normal
NormalVector computeBitExactNormal(const Vertex& v1, const Vertex& v2, const Vertex& v3);
NormalVector computeBitExactNormal(const CollisionSet& set, const Triangle& triangle);

// Ordinary double-precision normal of (v2 - v1) x (v3 - v1).
// Zero vector for degenerate triangles. For display only.
Vec3 computeReferenceNormal(const Vertex& v1, const Vertex& v2, const Vertex& v3);
Vec3 computeReferenceNormal(const CollisionSet& set, const Triangle& triangle);

// floor: y > 0.01, ceiling: y < -0.01, otherwise wall
OrientationClass classifyNormal(const NormalVector& normal);

// Classify every triangle of a set, preserving order
ClassifiedCollisionSet classifyCollisionSet(const CollisionSet& set);

#endif // COLINSPECT_NORMAL_CLASSIFIER_H
