#include "math3d.h"

namespace {
    constexpr double PI = 3.14159265358979323846;
}

Vec3 Vec3::normalized() const {
    double len = length();
    if (len == 0.0) {
        return Vec3();
    }
    return Vec3(x / len, y / len, z / len);
}

double degreesToRadians(double degrees) {
    return degrees * (PI / 180.0);
}

// =============================================================================
// Axis rotations
// =============================================================================
//
// Each matrix is written column by column:
//
//   Rx = [ 1  0   0 ]    Ry = [  c  0  s ]    Rz = [ c  -s  0 ]
//        [ 0  c  -s ]         [  0  1  0 ]         [ s   c  0 ]
//        [ 0  s   c ]         [ -s  0  c ]         [ 0   0  1 ]
//
// =============================================================================

Mat3x3 rotationX(double radians) {
    double c = std::cos(radians);
    double s = std::sin(radians);
    return Mat3x3(
        Vec3(1.0, 0.0, 0.0),
        Vec3(0.0, c, s),
        Vec3(0.0, -s, c)
    );
}

Mat3x3 rotationY(double radians) {
    double c = std::cos(radians);
    double s = std::sin(radians);
    return Mat3x3(
        Vec3(c, 0.0, -s),
        Vec3(0.0, 1.0, 0.0),
        Vec3(s, 0.0, c)
    );
}

Mat3x3 rotationZ(double radians) {
    double c = std::cos(radians);
    double s = std::sin(radians);
    return Mat3x3(
        Vec3(c, s, 0.0),
        Vec3(-s, c, 0.0),
        Vec3(0.0, 0.0, 1.0)
    );
}

Mat3x3 eulerRotationXYZ(double degreesX, double degreesY, double degreesZ) {
    // Intrinsic X-Y-Z: the Z rotation is applied to the vertex first
    return rotationX(degreesToRadians(degreesX))
         * rotationY(degreesToRadians(degreesY))
         * rotationZ(degreesToRadians(degreesZ));
}

Vec3 rotateThenTranslate(const Mat3x3& rotation, const Vec3& translation, const Vec3& local) {
    return rotation * local + translation;
}
