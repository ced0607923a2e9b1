#include <cstdio>
#include <cstdlib>
#include <cmath>
#include <fstream>
#include <string>
#include "../src/log.h"
#include "../src/settings.h"

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

const char* TEST_PATH = "colinspect_test_settings.cfg";

void writeFile(const char* path, const std::string& contents) {
    std::ofstream file(path);
    file << contents;
}

} // namespace

TEST(defaults) {
    ToolSettings settings;
    ASSERT(settings.variant == Variant::US);
    ASSERT_EQ(settings.levelsPath, std::string("levels"));
    ASSERT_EQ(settings.exportPath, std::string("collision_mesh.obj"));
    ASSERT(!settings.verbose);
}

TEST(missing_file_gives_defaults) {
    ToolSettings settings = loadSettings("no_such_colinspect_settings.cfg");
    ASSERT(settings.variant == Variant::US);
    ASSERT_EQ(settings.levelsPath, std::string("levels"));
}

TEST(save_then_load) {
    ToolSettings saved;
    saved.variant = Variant::JP;
    saved.levelsPath = "/data/levels";
    saved.exportPath = "out/area.obj";
    saved.verbose = true;
    ASSERT(saveSettings(saved, TEST_PATH));

    ToolSettings loaded = loadSettings(TEST_PATH);
    ASSERT(loaded.variant == Variant::JP);
    ASSERT_EQ(loaded.levelsPath, std::string("/data/levels"));
    ASSERT_EQ(loaded.exportPath, std::string("out/area.obj"));
    ASSERT(loaded.verbose);
    std::remove(TEST_PATH);
}

TEST(comments_unknown_keys_and_bad_values) {
    writeFile(TEST_PATH,
              "# comment\n"
              "\n"
              "unknown=42\n"
              "not a setting\n"
              "variant=EU\n"
              "levelsPath=\n"
              "exportPath=mesh.obj\r\n"
              "verbose=0\n");

    ToolSettings loaded = loadSettings(TEST_PATH);
    ASSERT(loaded.variant == Variant::US);
    ASSERT_EQ(loaded.levelsPath, std::string("levels"));
    ASSERT_EQ(loaded.exportPath, std::string("mesh.obj"));
    ASSERT(!loaded.verbose);
    std::remove(TEST_PATH);
}

TEST(variant_case_insensitive) {
    writeFile(TEST_PATH, "variant=jp\n");
    ASSERT(loadSettings(TEST_PATH).variant == Variant::JP);
    std::remove(TEST_PATH);
}

TEST(settings_path_named_for_tool) {
    std::string path = getSettingsPath();
    ASSERT(path.size() >= 12);
    ASSERT_EQ(path.substr(path.size() - 12), std::string("settings.cfg"));
}

int main() {
    setLogVerbosity(false);

    std::printf("Settings Unit Tests\n");
    std::printf("===================\n\n");

    RUN_TEST(defaults);
    RUN_TEST(missing_file_gives_defaults);
    RUN_TEST(save_then_load);
    RUN_TEST(comments_unknown_keys_and_bad_values);
    RUN_TEST(variant_case_insensitive);
    RUN_TEST(settings_path_named_for_tool);

    std::printf("\n===================\n");
    std::printf("Tests: %d total, %d passed, %d failed\n",
                testsRun, testsPassed, testsFailed);

    return testsFailed > 0 ? EXIT_FAILURE : EXIT_SUCCESS;
}
