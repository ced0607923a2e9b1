#ifndef COLINSPECT_NUMERIC_REPLICA_H
#define COLINSPECT_NUMERIC_REPLICA_H

#include <cmath>
#include <cstdint>

// =============================================================================
// Numeric Replica
// =============================================================================
//
// Primitives that reproduce the integer and single-precision behaviour of the
// target platform:
//
// - Vertex coordinates are read as native signed 32-bit integers. Values that
//   do not fit wrap around (two's complement), they are never clamped.
//
// - Surface normals are computed in f32. Every intermediate result has to be
//   rounded to binary32 before it feeds the next operation, otherwise the
//   last bits of the normal drift and triangles near the classification
//   thresholds change category.
//
// The build compiles with -ffp-contract=off so that expressions such as
// a * b - c * d are never fused into a single FMA.
//
// =============================================================================

namespace NumericConstants {
    constexpr double TWO_POW_32 = 4294967296.0;
    constexpr double TWO_POW_31 = 2147483648.0;
}

// Wrap a 64-bit integer to its low 32 bits, reinterpreted as signed
inline int32_t truncateToInt32(int64_t value) {
    uint32_t bits = static_cast<uint32_t>(value);
    if (bits <= 0x7FFFFFFFu) {
        return static_cast<int32_t>(bits);
    }
    // Avoid implementation-defined unsigned -> signed narrowing
    return -static_cast<int32_t>(~bits) - 1;
}

// Truncate toward zero, then wrap modulo 2^32 into the signed range.
// NaN and infinities become 0.
inline int32_t truncateToInt32(double value) {
    if (!std::isfinite(value)) {
        return 0;
    }

    double t = std::trunc(value);
    double m = std::fmod(t, NumericConstants::TWO_POW_32);
    if (m < 0.0) {
        m += NumericConstants::TWO_POW_32;
    }
    if (m >= NumericConstants::TWO_POW_31) {
        m -= NumericConstants::TWO_POW_32;
    }
    return static_cast<int32_t>(m);
}

// Round to the nearest binary32 value (ties to even)
inline float roundToFloat32(double value) {
    return static_cast<float>(value);
}

// 32-bit signed subtraction with wrap-around, as the target CPU performs it
inline int32_t subtractInt32(int32_t a, int32_t b) {
    return truncateToInt32(static_cast<int64_t>(a) - static_cast<int64_t>(b));
}

// f32 * f32 evaluated exactly in double, then rounded once
inline float multiplyFloat32(float a, float b) {
    return roundToFloat32(static_cast<double>(a) * static_cast<double>(b));
}

#endif // COLINSPECT_NUMERIC_REPLICA_H
