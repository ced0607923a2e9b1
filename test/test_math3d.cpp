#include <cstdio>
#include <cstdlib>
#include <cmath>
#include "../src/math3d.h"

// =============================================================================
// Simple Test Framework
// =============================================================================

static int testsRun = 0;
static int testsPassed = 0;
static int testsFailed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::printf("  %s... ", #name); \
    int failedBefore = testsFailed; \
    testsRun++; \
    test_##name(); \
    if (testsFailed == failedBefore) { \
        testsPassed++; \
        std::printf("PASSED\n"); \
    } \
} while(0)

#define ASSERT(cond) do { \
    if (!(cond)) { \
        std::printf("FAILED\n    Assertion failed: %s\n    at %s:%d\n", \
                    #cond, __FILE__, __LINE__); \
        testsFailed++; \
        return; \
    } \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        std::printf("FAILED\n    Expected %s == %s\n    at %s:%d\n", \
                    #a, #b, __FILE__, __LINE__); \
        testsFailed++; \
        return; \
    } \
} while(0)

#define ASSERT_NEAR(a, b, tolerance) do { \
    if (std::fabs((a) - (b)) > (tolerance)) { \
        std::printf("FAILED\n    Expected %s ~= %s (tolerance %f)\n    Got %f vs %f\n    at %s:%d\n", \
                    #a, #b, (double)(tolerance), (double)(a), (double)(b), __FILE__, __LINE__); \
        testsFailed++; \
        return; \
    } \
} while(0)

// =============================================================================
// Vec3 Tests
// =============================================================================

TEST(vec3_construction) {
    Vec3 zero;
    ASSERT_EQ(zero.x, 0.0);
    ASSERT_EQ(zero.y, 0.0);
    ASSERT_EQ(zero.z, 0.0);

    Vec3 v(1.5, -2.0, 3.0);
    ASSERT_EQ(v.x, 1.5);
    ASSERT_EQ(v.y, -2.0);
    ASSERT_EQ(v.z, 3.0);
}

TEST(vec3_arithmetic) {
    Vec3 a(1.0, 2.0, 3.0);
    Vec3 b(4.0, 5.0, 6.0);

    Vec3 sum = a + b;
    ASSERT_EQ(sum.x, 5.0);
    ASSERT_EQ(sum.y, 7.0);
    ASSERT_EQ(sum.z, 9.0);

    Vec3 diff = b - a;
    ASSERT_EQ(diff.x, 3.0);
    ASSERT_EQ(diff.y, 3.0);
    ASSERT_EQ(diff.z, 3.0);

    Vec3 neg = -a;
    ASSERT_EQ(neg.x, -1.0);
    ASSERT_EQ(neg.z, -3.0);

    Vec3 scaled = a * 2.0;
    ASSERT_EQ(scaled.y, 4.0);

    a += b;
    ASSERT_EQ(a.x, 5.0);
}

TEST(vec3_dot_and_cross) {
    Vec3 x(1.0, 0.0, 0.0);
    Vec3 y(0.0, 1.0, 0.0);

    ASSERT_EQ(x.dot(y), 0.0);
    ASSERT_EQ(x.dot(x), 1.0);

    Vec3 z = x.cross(y);
    ASSERT_EQ(z.x, 0.0);
    ASSERT_EQ(z.y, 0.0);
    ASSERT_EQ(z.z, 1.0);

    // Anticommutative
    Vec3 negZ = y.cross(x);
    ASSERT_EQ(negZ.z, -1.0);
}

TEST(vec3_length_and_normalized) {
    Vec3 v(3.0, 4.0, 0.0);
    ASSERT_NEAR(v.length(), 5.0, 1e-12);

    Vec3 n = v.normalized();
    ASSERT_NEAR(n.x, 0.6, 1e-12);
    ASSERT_NEAR(n.y, 0.8, 1e-12);
    ASSERT_NEAR(n.length(), 1.0, 1e-12);
}

TEST(vec3_normalized_zero_is_zero) {
    Vec3 n = Vec3().normalized();
    ASSERT_EQ(n.x, 0.0);
    ASSERT_EQ(n.y, 0.0);
    ASSERT_EQ(n.z, 0.0);
}

// =============================================================================
// Mat3x3 Tests
// =============================================================================

TEST(mat3x3_identity_multiply_vector) {
    Vec3 v(7.0, -3.0, 2.0);
    Vec3 r = Mat3x3::identity() * v;
    ASSERT_EQ(r.x, 7.0);
    ASSERT_EQ(r.y, -3.0);
    ASSERT_EQ(r.z, 2.0);
}

TEST(mat3x3_columns_are_images_of_axes) {
    Mat3x3 m(Vec3(1.0, 2.0, 3.0), Vec3(4.0, 5.0, 6.0), Vec3(7.0, 8.0, 9.0));
    Vec3 r = m * Vec3(0.0, 1.0, 0.0);
    ASSERT_EQ(r.x, 4.0);
    ASSERT_EQ(r.y, 5.0);
    ASSERT_EQ(r.z, 6.0);

    Vec3 s = m * Vec3(1.0, 1.0, 1.0);
    ASSERT_EQ(s.x, 12.0);
    ASSERT_EQ(s.y, 15.0);
    ASSERT_EQ(s.z, 18.0);
}

TEST(mat3x3_multiply_matrices) {
    Mat3x3 a = rotationZ(degreesToRadians(90.0));
    Mat3x3 b = rotationZ(degreesToRadians(-90.0));
    Mat3x3 product = a * b;

    Vec3 r = product * Vec3(1.0, 2.0, 3.0);
    ASSERT_NEAR(r.x, 1.0, 1e-12);
    ASSERT_NEAR(r.y, 2.0, 1e-12);
    ASSERT_NEAR(r.z, 3.0, 1e-12);
}

// =============================================================================
// Rotation Tests
// =============================================================================

TEST(degrees_to_radians) {
    ASSERT_NEAR(degreesToRadians(180.0), 3.14159265358979323846, 1e-15);
    ASSERT_NEAR(degreesToRadians(-90.0), -1.5707963267948966, 1e-15);
}

TEST(rotation_x_90) {
    // Right-handed: +Y goes to +Z
    Vec3 r = rotationX(degreesToRadians(90.0)) * Vec3(0.0, 1.0, 0.0);
    ASSERT_NEAR(r.x, 0.0, 1e-12);
    ASSERT_NEAR(r.y, 0.0, 1e-12);
    ASSERT_NEAR(r.z, 1.0, 1e-12);
}

TEST(rotation_y_90) {
    // +X goes to -Z
    Vec3 r = rotationY(degreesToRadians(90.0)) * Vec3(1.0, 0.0, 0.0);
    ASSERT_NEAR(r.x, 0.0, 1e-12);
    ASSERT_NEAR(r.y, 0.0, 1e-12);
    ASSERT_NEAR(r.z, -1.0, 1e-12);
}

TEST(rotation_z_90) {
    // +X goes to +Y
    Vec3 r = rotationZ(degreesToRadians(90.0)) * Vec3(1.0, 0.0, 0.0);
    ASSERT_NEAR(r.x, 0.0, 1e-12);
    ASSERT_NEAR(r.y, 1.0, 1e-12);
    ASSERT_NEAR(r.z, 0.0, 1e-12);
}

TEST(euler_xyz_applies_z_first) {
    // Z takes +X to +Y, then X takes +Y to +Z
    Vec3 r = eulerRotationXYZ(90.0, 0.0, 90.0) * Vec3(1.0, 0.0, 0.0);
    ASSERT_NEAR(r.x, 0.0, 1e-12);
    ASSERT_NEAR(r.y, 0.0, 1e-12);
    ASSERT_NEAR(r.z, 1.0, 1e-12);
}

TEST(euler_zero_is_identity) {
    Vec3 r = eulerRotationXYZ(0.0, 0.0, 0.0) * Vec3(5.0, -6.0, 7.0);
    ASSERT_EQ(r.x, 5.0);
    ASSERT_EQ(r.y, -6.0);
    ASSERT_EQ(r.z, 7.0);
}

TEST(rotation_preserves_length) {
    Vec3 v(100.0, -250.0, 33.0);
    Vec3 r = eulerRotationXYZ(17.0, 230.0, -45.0) * v;
    ASSERT_NEAR(r.length(), v.length(), 1e-9);
}

TEST(rotate_then_translate) {
    Mat3x3 rotation = eulerRotationXYZ(0.0, 90.0, 0.0);
    Vec3 r = rotateThenTranslate(rotation, Vec3(10.0, 20.0, 30.0), Vec3(1.0, 0.0, 0.0));
    ASSERT_NEAR(r.x, 10.0, 1e-12);
    ASSERT_NEAR(r.y, 20.0, 1e-12);
    ASSERT_NEAR(r.z, 29.0, 1e-12);
}

int main() {
    std::printf("Math3D Unit Tests\n");
    std::printf("=================\n\n");

    std::printf("Vec3 tests:\n");
    RUN_TEST(vec3_construction);
    RUN_TEST(vec3_arithmetic);
    RUN_TEST(vec3_dot_and_cross);
    RUN_TEST(vec3_length_and_normalized);
    RUN_TEST(vec3_normalized_zero_is_zero);

    std::printf("\nMat3x3 tests:\n");
    RUN_TEST(mat3x3_identity_multiply_vector);
    RUN_TEST(mat3x3_columns_are_images_of_axes);
    RUN_TEST(mat3x3_multiply_matrices);

    std::printf("\nRotation tests:\n");
    RUN_TEST(degrees_to_radians);
    RUN_TEST(rotation_x_90);
    RUN_TEST(rotation_y_90);
    RUN_TEST(rotation_z_90);
    RUN_TEST(euler_xyz_applies_z_first);
    RUN_TEST(euler_zero_is_identity);
    RUN_TEST(rotation_preserves_length);
    RUN_TEST(rotate_then_translate);

    std::printf("\n=================\n");
    std::printf("Tests: %d total, %d passed, %d failed\n",
                testsRun, testsPassed, testsFailed);

    return testsFailed > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
