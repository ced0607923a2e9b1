#ifndef COLINSPECT_LEVEL_LOADER_H
#define COLINSPECT_LEVEL_LOADER_H

#include <cstddef>
#include <string>
#include <vector>

#include "collision_types.h"
#include "level_manifest.h"
#include "preprocessor.h"

// =============================================================================
// Level Loader
// =============================================================================
//
// Assembles one area of a level:
// 1. The area's own collision file, preprocessed, parsed and classified.
//    This must succeed.
// 2. The level script (script.c), scanned for object placements.
// 3. Every manifest object belonging to the area: its collision file in
//    object-local coordinates plus one instance per resolved placement.
//
// A missing script or a broken object file only costs those objects; the
// area still loads.
//
// =============================================================================

namespace LoaderConstants {
    constexpr const char* MANIFEST_FILE = "level.cfg";
    constexpr const char* SCRIPT_FILE = "script.c";

    // Source files larger than this are refused
    constexpr size_t MAX_SOURCE_BYTES = 64 * 1024 * 1024;
}

enum class LoadError {
    NONE,
    MANIFEST_UNREADABLE,
    UNKNOWN_AREA,       // Area id not listed in the manifest
    FILE_UNREADABLE,    // Area collision file missing or too large
    PREPROCESS_FAILED,  // Area collision file has malformed directives
    EMPTY_RESULT        // Area collision file yielded no triangles
};

const char* loadErrorName(LoadError error);

// Collision of one object, in object-local coordinates
struct ObjectModel {
    std::string id;
    std::string name;
    ClassifiedCollisionSet collision;
};

// A placed copy of a model
struct ObjectInstance {
    size_t modelIndex;  // Into LevelScene::models
    ObjectPlacement placement;
};

struct LevelScene {
    std::string levelId;
    int areaId = 0;
    ClassifiedCollisionSet main;
    std::vector<ObjectModel> models;
    std::vector<ObjectInstance> instances;
};

// Read a whole file. Returns false (and logs) if it is missing or too large.
bool readTextFile(const std::string& path, std::string& text);

// Load one area. levelDir holds level.cfg, script.c and the collision files.
bool loadLevelArea(const LevelManifest& manifest, const std::string& levelDir, int areaId,
                   Variant variant, LevelScene& scene, LoadError& error);

// Read levelDir/level.cfg, then loadLevelArea
bool loadLevel(const std::string& levelDir, int areaId, Variant variant,
               LevelScene& scene, LoadError& error);

// A model's vertices moved to where an instance places them
std::vector<Vec3> worldVertices(const ObjectModel& model, const ObjectPlacement& placement);

#endif // COLINSPECT_LEVEL_LOADER_H
