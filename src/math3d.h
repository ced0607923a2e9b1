#ifndef COLINSPECT_MATH3D_H
#define COLINSPECT_MATH3D_H

#include <cmath>

// =============================================================================
// 3D Vector and Matrix Math
// =============================================================================
//
// Double-precision vectors and 3x3 matrices. Used for the reference normal
// and for placing object-local geometry in the world.
//
// Placement uses the renderer's convention for Euler angles: intrinsic X, then
// Y, then Z. The rotation matrix is therefore
//
//   R = Rx(angleX) * Ry(angleY) * Rz(angleZ)
//
// and a local vertex v ends up at  position + R * v.
//
// =============================================================================

struct Vec3 {
    double x, y, z;

    constexpr Vec3() : x(0.0), y(0.0), z(0.0) {}
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& other) const {
        return Vec3(x + other.x, y + other.y, z + other.z);
    }

    constexpr Vec3 operator-(const Vec3& other) const {
        return Vec3(x - other.x, y - other.y, z - other.z);
    }

    constexpr Vec3 operator-() const {
        return Vec3(-x, -y, -z);
    }

    constexpr Vec3 operator*(double scalar) const {
        return Vec3(x * scalar, y * scalar, z * scalar);
    }

    constexpr Vec3& operator+=(const Vec3& other) {
        x += other.x; y += other.y; z += other.z;
        return *this;
    }

    constexpr double dot(const Vec3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    constexpr Vec3 cross(const Vec3& other) const {
        return Vec3(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        );
    }

    double length() const {
        return std::sqrt(dot(*this));
    }

    // Unit vector in the same direction, or the zero vector if length is 0
    Vec3 normalized() const;
};

// =============================================================================
// Mat3x3 - 3x3 matrix stored as three column vectors
// =============================================================================
//
//   [ col[0].x  col[1].x  col[2].x ]
//   [ col[0].y  col[1].y  col[2].y ]
//   [ col[0].z  col[1].z  col[2].z ]
//
// =============================================================================

struct Mat3x3 {
    Vec3 col[3];

    Mat3x3() = default;

    constexpr Mat3x3(const Vec3& c0, const Vec3& c1, const Vec3& c2)
        : col{c0, c1, c2} {}

    static Mat3x3 identity() {
        return Mat3x3(
            Vec3(1.0, 0.0, 0.0),
            Vec3(0.0, 1.0, 0.0),
            Vec3(0.0, 0.0, 1.0)
        );
    }

    // result = M * v
    Vec3 operator*(const Vec3& v) const {
        return Vec3(
            col[0].x * v.x + col[1].x * v.y + col[2].x * v.z,
            col[0].y * v.x + col[1].y * v.y + col[2].y * v.z,
            col[0].z * v.x + col[1].z * v.y + col[2].z * v.z
        );
    }

    // result = M * other
    Mat3x3 operator*(const Mat3x3& other) const {
        Mat3x3 result;
        for (int c = 0; c < 3; c++) {
            result.col[c] = (*this) * other.col[c];
        }
        return result;
    }
};

// =============================================================================
// Rotations
// =============================================================================

double degreesToRadians(double degrees);

// Right-handed rotations about a single axis (angles in radians)
Mat3x3 rotationX(double radians);
Mat3x3 rotationY(double radians);
Mat3x3 rotationZ(double radians);

// Intrinsic XYZ Euler rotation from angles in degrees: Rx * Ry * Rz
Mat3x3 eulerRotationXYZ(double degreesX, double degreesY, double degreesZ);

// Rotate a local point, then translate it
Vec3 rotateThenTranslate(const Mat3x3& rotation, const Vec3& translation, const Vec3& local);

#endif // COLINSPECT_MATH3D_H
