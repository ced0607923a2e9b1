#include <SDL.h>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <vector>
#include "collision_parser.h"
#include "collision_query.h"
#include "level_loader.h"
#include "log.h"
#include "normal_classifier.h"
#include "obj_export.h"
#include "settings.h"

// =============================================================================
// colinspect - collision source inspector
// Recovers collision geometry from decompiled level sources and classifies
// every triangle exactly as the game engine does
// =============================================================================

namespace {

// What the command line asked for
struct CommandLine {
    std::string collisionFile;
    std::string levelDir;
    int areaId = 1;
    std::string configPath;
    std::string variantText;
    std::string exportPath;
    bool exportRequested = false;
    bool stats = false;
    bool saveSettings = false;
    bool verbose = false;
    bool help = false;

    std::vector<long> triangles;

    bool find = false;
    int32_t findX = 0, findY = 0, findZ = 0;
    double findTolerance = 0.0;

    bool nearSearch = false;
    double nearX = 0.0, nearY = 0.0, nearZ = 0.0, nearRadius = 0.0;
};

void printUsage(const char* program) {
    std::printf("Usage: %s [options] <collision-file>\n", program);
    std::printf("       %s [options] --level <dir> [--area <n>]\n\n", program);
    std::printf("Options:\n");
    std::printf("  --variant US|JP        Build variant used to resolve VERSION_JP blocks\n");
    std::printf("  --stats                Surface type and floor/wall/ceiling counts\n");
    std::printf("  --triangle <n>         Report one triangle (repeatable)\n");
    std::printf("  --find x,y,z[,tol]     Triangles with a vertex at (or within tol of) a point\n");
    std::printf("  --near x,y,z,radius    Triangles whose centroid is within radius of a point\n");
    std::printf("  --export [file.obj]    Write the collision mesh as OBJ\n");
    std::printf("  --config <file>        Settings file to use\n");
    std::printf("  --save-settings        Store the effective settings\n");
    std::printf("  --verbose              Debug logging\n");
    std::printf("  --help                 Show this text\n");
}

bool parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool hasValue = (i + 1 < argc);

        if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            cmd.help = true;
        } else if (std::strcmp(arg, "--stats") == 0) {
            cmd.stats = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            cmd.verbose = true;
        } else if (std::strcmp(arg, "--save-settings") == 0) {
            cmd.saveSettings = true;
        } else if (std::strcmp(arg, "--variant") == 0 && hasValue) {
            cmd.variantText = argv[++i];
        } else if (std::strcmp(arg, "--config") == 0 && hasValue) {
            cmd.configPath = argv[++i];
        } else if (std::strcmp(arg, "--level") == 0 && hasValue) {
            cmd.levelDir = argv[++i];
        } else if (std::strcmp(arg, "--area") == 0 && hasValue) {
            cmd.areaId = std::atoi(argv[++i]);
            if (cmd.areaId <= 0) {
                SDL_LogError(LogCategory::TOOL, "Bad area number '%s'", argv[i]);
                return false;
            }
        } else if (std::strcmp(arg, "--triangle") == 0 && hasValue) {
            char* end = nullptr;
            long ordinal = std::strtol(argv[++i], &end, 10);
            if (end == argv[i] || *end != '\0' || ordinal < 0) {
                SDL_LogError(LogCategory::TOOL, "Bad triangle number '%s'", argv[i]);
                return false;
            }
            cmd.triangles.push_back(ordinal);
        } else if (std::strcmp(arg, "--find") == 0 && hasValue) {
            const char* value = argv[++i];
            int fields = std::sscanf(value, "%d,%d,%d,%lf",
                                     &cmd.findX, &cmd.findY, &cmd.findZ, &cmd.findTolerance);
            if (fields < 3 || cmd.findTolerance < 0.0) {
                SDL_LogError(LogCategory::TOOL, "Expected --find x,y,z[,tol], got '%s'", value);
                return false;
            }
            cmd.find = true;
        } else if (std::strcmp(arg, "--near") == 0 && hasValue) {
            const char* value = argv[++i];
            int fields = std::sscanf(value, "%lf,%lf,%lf,%lf",
                                     &cmd.nearX, &cmd.nearY, &cmd.nearZ, &cmd.nearRadius);
            if (fields != 4 || cmd.nearRadius < 0.0) {
                SDL_LogError(LogCategory::TOOL, "Expected --near x,y,z,radius, got '%s'", value);
                return false;
            }
            cmd.nearSearch = true;
        } else if (std::strcmp(arg, "--export") == 0) {
            cmd.exportRequested = true;
            if (hasValue && argv[i + 1][0] != '-') {
                cmd.exportPath = argv[++i];
            }
        } else if (arg[0] == '-') {
            SDL_LogError(LogCategory::TOOL, "Unknown option '%s'", arg);
            return false;
        } else if (cmd.collisionFile.empty()) {
            cmd.collisionFile = arg;
        } else {
            SDL_LogError(LogCategory::TOOL, "Unexpected argument '%s'", arg);
            return false;
        }
    }
    return true;
}

// Rebuild a plain set from classified data (for queries and export)
CollisionSet toCollisionSet(const ClassifiedCollisionSet& classified) {
    CollisionSet set;
    for (const Vertex& v : classified.vertices) {
        set.addVertex(v);
    }
    for (const ClassifiedTriangle& entry : classified.triangles) {
        if (!set.addTriangle(entry.triangle)) {
            SDL_LogWarn(LogCategory::TOOL, "Triangle with out-of-range vertex skipped");
        }
    }
    return set;
}

void printStats(const CollisionSet& set, const ClassifiedCollisionSet& classified) {
    std::printf("%zu vertices, %zu triangles\n", set.vertexCount(), set.triangleCount());

    OrientationCounts counts = countOrientations(classified);
    std::printf("  floors:   %zu\n", counts.floors);
    std::printf("  walls:    %zu\n", counts.walls);
    std::printf("  ceilings: %zu\n", counts.ceilings);

    std::printf("Surface types:\n");
    for (const auto& entry : countSurfaceTypes(set)) {
        std::printf("  %-40s %zu\n", entry.first.c_str(), entry.second);
    }
}

void printOrdinals(const char* title, const CollisionSet& set, const std::vector<size_t>& ordinals) {
    std::printf("%s: %zu triangles\n", title, ordinals.size());
    for (size_t ordinal : ordinals) {
        std::printf("  #%zu %s\n", ordinal, set.triangles()[ordinal].surfaceType.c_str());
    }
}

// Everything that works on the area (or single file) geometry
bool runQueries(const CommandLine& cmd, const ToolSettings& settings,
                const CollisionSet& set, const ClassifiedCollisionSet& classified) {
    bool ok = true;

    if (cmd.stats) {
        printStats(set, classified);
    }

    for (long ordinal : cmd.triangles) {
        std::string report = formatTriangleReport(classified, static_cast<size_t>(ordinal));
        if (report.empty()) {
            SDL_LogError(LogCategory::TOOL, "No triangle %ld (have %zu)", ordinal, set.triangleCount());
            ok = false;
            continue;
        }
        std::printf("%s", report.c_str());
    }

    if (cmd.find) {
        printOrdinals("Vertex match",
                      set, findTrianglesByVertex(set, cmd.findX, cmd.findY, cmd.findZ, cmd.findTolerance));
        std::vector<std::string> types = surfaceTypesAt(set, cmd.findX, cmd.findY, cmd.findZ, cmd.findTolerance);
        for (const std::string& type : types) {
            std::printf("  surface: %s\n", type.c_str());
        }
    }

    if (cmd.nearSearch) {
        printOrdinals("Near point",
                      set, findTrianglesNearPoint(set, cmd.nearX, cmd.nearY, cmd.nearZ, cmd.nearRadius));
    }

    if (cmd.exportRequested) {
        if (!exportObj(set, settings.exportPath)) {
            ok = false;
        }
    }

    return ok;
}

bool inspectFile(const CommandLine& cmd, const ToolSettings& settings) {
    std::string text;
    if (!readTextFile(cmd.collisionFile, text)) {
        SDL_LogError(LogCategory::TOOL, "Cannot read %s", cmd.collisionFile.c_str());
        return false;
    }

    CollisionSet set;
    ParseReport report;
    if (!parseCollisionSource(text, settings.variant, set, report)) {
        if (report.error == ParseError::PREPROCESS_FAILED) {
            SDL_LogError(LogCategory::TOOL, "%s:%zu: %s", cmd.collisionFile.c_str(),
                         report.preprocess.errorLine, preprocessErrorName(report.preprocess.error));
        } else {
            SDL_LogError(LogCategory::TOOL, "%s: %s", cmd.collisionFile.c_str(), parseErrorName(report.error));
        }
        return false;
    }

    if (report.droppedTriangles > 0 || report.malformedStatements > 0) {
        SDL_LogInfo(LogCategory::TOOL, "%s: dropped %zu triangles, %zu malformed statements",
                    cmd.collisionFile.c_str(), report.droppedTriangles, report.malformedStatements);
    }

    ClassifiedCollisionSet classified = classifyCollisionSet(set);
    return runQueries(cmd, settings, set, classified);
}

bool inspectLevel(const CommandLine& cmd, const ToolSettings& settings) {
    LevelScene scene;
    LoadError error;
    if (!loadLevel(cmd.levelDir, cmd.areaId, settings.variant, scene, error)) {
        SDL_LogError(LogCategory::TOOL, "Cannot load %s area %d: %s",
                     cmd.levelDir.c_str(), cmd.areaId, loadErrorName(error));
        return false;
    }

    if (cmd.stats) {
        std::printf("Level %s, area %d\n", scene.levelId.c_str(), scene.areaId);
    }

    CollisionSet set = toCollisionSet(scene.main);
    bool ok = runQueries(cmd, settings, set, scene.main);

    if (cmd.stats) {
        std::printf("Objects: %zu models, %zu instances\n", scene.models.size(), scene.instances.size());
        for (const ObjectInstance& instance : scene.instances) {
            const ObjectModel& model = scene.models[instance.modelIndex];
            OrientationCounts counts = countOrientations(model.collision);
            std::printf("  %-28s at (%d, %d, %d) angle (%d, %d, %d): %zu floors, %zu walls, %zu ceilings\n",
                        model.name.c_str(),
                        instance.placement.x, instance.placement.y, instance.placement.z,
                        instance.placement.angleX, instance.placement.angleY, instance.placement.angleZ,
                        counts.floors, counts.walls, counts.ceilings);
        }
    }

    return ok;
}

} // namespace

int main(int argc, char* argv[]) {
    // Custom categories start at CRITICAL priority until set
    setLogVerbosity(false);

    CommandLine cmd;
    if (!parseCommandLine(argc, argv, cmd)) {
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }

    if (cmd.help) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    // Settings file first, then command line overrides
    std::string configPath = cmd.configPath.empty() ? getSettingsPath() : cmd.configPath;
    ToolSettings settings = loadSettings(configPath);

    if (!cmd.variantText.empty()) {
        Variant variant;
        if (!parseVariant(cmd.variantText, variant)) {
            SDL_LogError(LogCategory::TOOL, "Unknown variant '%s' (expected US or JP)", cmd.variantText.c_str());
            return EXIT_FAILURE;
        }
        settings.variant = variant;
    }
    if (!cmd.exportPath.empty()) {
        settings.exportPath = cmd.exportPath;
    }
    if (cmd.verbose) {
        settings.verbose = true;
    }
    // A bare level id is looked up under the levels directory
    if (!cmd.levelDir.empty() && !settings.levelsPath.empty()) {
        std::string manifestPath = cmd.levelDir + "/" + LoaderConstants::MANIFEST_FILE;
        if (!std::ifstream(manifestPath).is_open()) {
            cmd.levelDir = settings.levelsPath + "/" + cmd.levelDir;
        }
    }

    setLogVerbosity(settings.verbose);
    SDL_LogDebug(LogCategory::TOOL, "Variant %s, settings from %s",
                 variantName(settings.variant), configPath.c_str());

    if (cmd.saveSettings) {
        if (!saveSettings(settings, configPath)) {
            return EXIT_FAILURE;
        }
        SDL_Log("Settings saved to: %s", configPath.c_str());
    }

    if (cmd.collisionFile.empty() && cmd.levelDir.empty()) {
        if (cmd.saveSettings) {
            return EXIT_SUCCESS;
        }
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (!cmd.collisionFile.empty() && !cmd.levelDir.empty()) {
        SDL_LogError(LogCategory::TOOL, "Give either a collision file or --level, not both");
        return EXIT_FAILURE;
    }

    bool ok = cmd.levelDir.empty() ? inspectFile(cmd, settings) : inspectLevel(cmd, settings);

    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
