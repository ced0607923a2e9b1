#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <string>
#include "../src/collision_query.h"
#include "../src/normal_classifier.h"

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

namespace {

// A floor, a wall and a ceiling sharing the origin
//
//   0: floor   SURFACE_DEFAULT
//   1: wall    SURFACE_BURNING
//   2: ceiling SURFACE_DEFAULT
//   3: floor   SURFACE_HARD_NOT_SLIPPERY, far away
CollisionSet makeRoom() {
    CollisionSet set;
    set.addVertex({0, 0, 0});
    set.addVertex({100, 0, 0});
    set.addVertex({0, 100, 0});
    set.addVertex({0, 0, 100});
    set.addVertex({5000, 0, 5000});
    set.addVertex({5000, 0, 5300});
    set.addVertex({5300, 0, 5000});
    set.addTriangle({0, 3, 1, "SURFACE_DEFAULT"});
    set.addTriangle({0, 1, 2, "SURFACE_BURNING"});
    set.addTriangle({0, 1, 3, "SURFACE_DEFAULT"});
    set.addTriangle({4, 5, 6, "SURFACE_HARD_NOT_SLIPPERY"});
    return set;
}

} // namespace

// =============================================================================
// Statistics tests
// =============================================================================

TEST(group_by_surface_type) {
    CollisionSet set = makeRoom();
    std::map<std::string, std::vector<size_t>> groups = groupBySurfaceType(set);

    ASSERT_EQ(groups.size(), 3u);
    ASSERT_EQ(groups["SURFACE_DEFAULT"].size(), 2u);
    ASSERT_EQ(groups["SURFACE_DEFAULT"][0], 0u);
    ASSERT_EQ(groups["SURFACE_DEFAULT"][1], 2u);
    ASSERT_EQ(groups["SURFACE_BURNING"][0], 1u);
}

TEST(count_surface_types) {
    std::map<std::string, size_t> counts = countSurfaceTypes(makeRoom());
    ASSERT_EQ(counts["SURFACE_DEFAULT"], 2u);
    ASSERT_EQ(counts["SURFACE_BURNING"], 1u);
    ASSERT_EQ(counts["SURFACE_HARD_NOT_SLIPPERY"], 1u);
}

TEST(count_orientations) {
    OrientationCounts counts = countOrientations(classifyCollisionSet(makeRoom()));
    ASSERT_EQ(counts.floors, 2u);
    ASSERT_EQ(counts.walls, 1u);
    ASSERT_EQ(counts.ceilings, 1u);
}

TEST(count_orientations_empty) {
    OrientationCounts counts = countOrientations(ClassifiedCollisionSet());
    ASSERT_EQ(counts.floors + counts.walls + counts.ceilings, 0u);
}

// =============================================================================
// Lookup tests
// =============================================================================

TEST(find_by_exact_vertex) {
    CollisionSet set = makeRoom();

    std::vector<size_t> atOrigin = findTrianglesByVertex(set, 0, 0, 0);
    ASSERT_EQ(atOrigin.size(), 3u);
    ASSERT_EQ(atOrigin[0], 0u);
    ASSERT_EQ(atOrigin[2], 2u);

    std::vector<size_t> top = findTrianglesByVertex(set, 0, 100, 0);
    ASSERT_EQ(top.size(), 1u);
    ASSERT_EQ(top[0], 1u);

    ASSERT(findTrianglesByVertex(set, 1, 0, 0).empty());
}

TEST(find_by_vertex_with_tolerance) {
    CollisionSet set = makeRoom();
    ASSERT(findTrianglesByVertex(set, 5003, 0, 5004, 4.9).empty());

    std::vector<size_t> found = findTrianglesByVertex(set, 5003, 0, 5004, 5.0);
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[0], 3u);
}

TEST(find_near_point_uses_centroid) {
    CollisionSet set = makeRoom();

    // Centroid of triangle 3 is (5100, 0, 5100)
    std::vector<size_t> found = findTrianglesNearPoint(set, 5100.0, 10.0, 5100.0, 10.0);
    ASSERT_EQ(found.size(), 1u);
    ASSERT_EQ(found[0], 3u);

    // A corner is not enough
    ASSERT(findTrianglesNearPoint(set, 5000.0, 0.0, 5000.0, 50.0).empty());
}

TEST(surface_types_at_sorted_unique) {
    std::vector<std::string> types = surfaceTypesAt(makeRoom(), 0, 0, 0);
    ASSERT_EQ(types.size(), 2u);
    ASSERT_EQ(types[0], std::string("SURFACE_BURNING"));
    ASSERT_EQ(types[1], std::string("SURFACE_DEFAULT"));
}

// =============================================================================
// Report tests
// =============================================================================

TEST(triangle_report_format) {
    ClassifiedCollisionSet classified = classifyCollisionSet(makeRoom());
    std::string report = formatTriangleReport(classified, 3);

    std::string expected =
        "Triangle 3\n"
        "  Surface type:  SURFACE HARD NOT SLIPPERY\n"
        "  Geometry type: Floor\n"
        "  V1: (5000, 0, 5000)\n"
        "  V2: (5000, 0, 5300)\n"
        "  V3: (5300, 0, 5000)\n"
        "  Engine normal:    (0.0000000000, 1.0000000000, 0.0000000000)\n"
        "  Reference normal: (0.0000000000, 1.0000000000, 0.0000000000)\n";
    ASSERT_EQ(report, expected);
}

TEST(triangle_report_ceiling) {
    ClassifiedCollisionSet classified = classifyCollisionSet(makeRoom());
    std::string report = formatTriangleReport(classified, 2);
    ASSERT(report.find("Geometry type: Ceiling") != std::string::npos);
    ASSERT(report.find("Engine normal:    (0.0000000000, -1.0000000000, 0.0000000000)") != std::string::npos);
}

TEST(triangle_report_out_of_range) {
    ClassifiedCollisionSet classified = classifyCollisionSet(makeRoom());
    ASSERT(formatTriangleReport(classified, 4).empty());
}

int main() {
    std::printf("Collision Query Unit Tests\n");
    std::printf("==========================\n\n");

    std::printf("Statistics tests:\n");
    RUN_TEST(group_by_surface_type);
    RUN_TEST(count_surface_types);
    RUN_TEST(count_orientations);
    RUN_TEST(count_orientations_empty);

    std::printf("\nLookup tests:\n");
    RUN_TEST(find_by_exact_vertex);
    RUN_TEST(find_by_vertex_with_tolerance);
    RUN_TEST(find_near_point_uses_centroid);
    RUN_TEST(surface_types_at_sorted_unique);

    std::printf("\nReport tests:\n");
    RUN_TEST(triangle_report_format);
    RUN_TEST(triangle_report_ceiling);
    RUN_TEST(triangle_report_out_of_range);

    std::printf("\n==========================\n");
    std::printf("Tests: %d total, %d passed, %d failed\n",
                testsRun, testsPassed, testsFailed);

    return testsFailed > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
