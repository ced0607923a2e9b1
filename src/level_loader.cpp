#include "level_loader.h"
#include "collision_parser.h"
#include "log.h"
#include "normal_classifier.h"
#include "object_placement.h"

#include <fstream>
#include <sstream>

namespace {

std::string joinPath(const std::string& dir, const std::string& file) {
    if (dir.empty() || (!file.empty() && file[0] == '/')) {
        return file;
    }
    if (dir[dir.size() - 1] == '/') {
        return dir + file;
    }
    return dir + "/" + file;
}

// Script placements for the variant; empty table if the script is unusable
PlacementTable loadScriptPlacements(const std::string& levelDir, Variant variant) {
    std::string path = joinPath(levelDir, LoaderConstants::SCRIPT_FILE);
    std::string raw;
    if (!readTextFile(path, raw)) {
        SDL_LogWarn(LogCategory::LOADER, "No level script at %s, objects will not be placed", path.c_str());
        return PlacementTable();
    }

    std::string text;
    PreprocessResult result;
    if (!preprocessSource(raw, variant, text, result)) {
        SDL_LogWarn(LogCategory::LOADER, "%s:%zu: %s, objects will not be placed",
                    path.c_str(), result.errorLine, preprocessErrorName(result.error));
        return PlacementTable();
    }

    return parseObjectPlacements(text);
}

// Parse and classify one object's collision. Returns false to skip the object.
bool loadObjectModel(const ObjectDescriptor& descriptor, const std::string& levelDir,
                     Variant variant, ObjectModel& model) {
    if (descriptor.collisionFile.empty()) {
        SDL_LogWarn(LogCategory::LOADER, "Object '%s' has no collision file", descriptor.id.c_str());
        return false;
    }

    std::string path = joinPath(levelDir, descriptor.collisionFile);
    std::string text;
    if (!readTextFile(path, text)) {
        return false;
    }

    CollisionSet set;
    ParseReport report;
    if (!parseCollisionSource(text, variant, set, report)) {
        SDL_LogWarn(LogCategory::LOADER, "Skipping object '%s': %s",
                    descriptor.id.c_str(), parseErrorName(report.error));
        return false;
    }

    model.id = descriptor.id;
    model.name = descriptor.name.empty() ? descriptor.id : descriptor.name;
    model.collision = classifyCollisionSet(set);
    return true;
}

} // namespace

const char* loadErrorName(LoadError error) {
    switch (error) {
        case LoadError::NONE: return "none";
        case LoadError::MANIFEST_UNREADABLE: return "manifest unreadable";
        case LoadError::UNKNOWN_AREA: return "unknown area";
        case LoadError::FILE_UNREADABLE: return "file unreadable";
        case LoadError::PREPROCESS_FAILED: return "preprocess failed";
        case LoadError::EMPTY_RESULT: return "empty result";
    }
    return "unknown";
}

bool readTextFile(const std::string& path, std::string& text) {
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        SDL_LogWarn(LogCategory::LOADER, "Cannot open %s", path.c_str());
        return false;
    }

    file.seekg(0, std::ios::end);
    std::streamoff size = file.tellg();
    if (size < 0 || static_cast<unsigned long long>(size) > LoaderConstants::MAX_SOURCE_BYTES) {
        SDL_LogWarn(LogCategory::LOADER, "Refusing %s: larger than %zu bytes",
                    path.c_str(), LoaderConstants::MAX_SOURCE_BYTES);
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        SDL_LogWarn(LogCategory::LOADER, "Failed reading %s", path.c_str());
        return false;
    }

    text = contents.str();
    return true;
}

bool loadLevelArea(const LevelManifest& manifest, const std::string& levelDir, int areaId,
                   Variant variant, LevelScene& scene, LoadError& error) {
    scene = LevelScene();
    scene.levelId = manifest.id;
    scene.areaId = areaId;
    error = LoadError::NONE;

    const AreaEntry* area = manifest.findArea(areaId);
    if (area == nullptr || area->file.empty()) {
        SDL_LogError(LogCategory::LOADER, "Level '%s' has no area %d", manifest.id.c_str(), areaId);
        error = LoadError::UNKNOWN_AREA;
        return false;
    }

    // Area collision
    std::string areaPath = joinPath(levelDir, area->file);
    std::string areaText;
    if (!readTextFile(areaPath, areaText)) {
        SDL_LogError(LogCategory::LOADER, "Cannot read area collision %s", areaPath.c_str());
        error = LoadError::FILE_UNREADABLE;
        return false;
    }

    CollisionSet areaSet;
    ParseReport report;
    if (!parseCollisionSource(areaText, variant, areaSet, report)) {
        SDL_LogError(LogCategory::LOADER, "%s: %s", areaPath.c_str(), parseErrorName(report.error));
        error = (report.error == ParseError::PREPROCESS_FAILED)
            ? LoadError::PREPROCESS_FAILED
            : LoadError::EMPTY_RESULT;
        return false;
    }
    scene.main = classifyCollisionSet(areaSet);

    SDL_LogInfo(LogCategory::LOADER, "Level %s area %d: %zu vertices, %zu triangles",
                manifest.id.c_str(), areaId, scene.main.vertices.size(), scene.main.triangles.size());

    if (manifest.objects.empty()) {
        return true;
    }

    // Objects
    PlacementTable placements = loadScriptPlacements(levelDir, variant);

    for (const ObjectDescriptor& descriptor : manifest.objects) {
        if (descriptor.area != 0 && descriptor.area != areaId) {
            continue;
        }

        std::vector<ObjectPlacement> found = findObjectPlacements(placements, descriptor, manifest.id);
        if (found.empty()) {
            continue;
        }

        ObjectModel model;
        if (!loadObjectModel(descriptor, levelDir, variant, model)) {
            continue;
        }

        size_t modelIndex = scene.models.size();
        scene.models.push_back(model);
        for (const ObjectPlacement& placement : found) {
            ObjectInstance instance;
            instance.modelIndex = modelIndex;
            instance.placement = placement;
            scene.instances.push_back(instance);
        }

        SDL_LogDebug(LogCategory::LOADER, "Object %s: %zu triangles, %zu placements",
                     descriptor.id.c_str(), model.collision.triangles.size(), found.size());
    }

    SDL_LogInfo(LogCategory::LOADER, "Level %s area %d: %zu object models, %zu instances",
                manifest.id.c_str(), areaId, scene.models.size(), scene.instances.size());
    return true;
}

bool loadLevel(const std::string& levelDir, int areaId, Variant variant,
               LevelScene& scene, LoadError& error) {
    LevelManifest manifest;
    if (!loadLevelManifest(joinPath(levelDir, LoaderConstants::MANIFEST_FILE), manifest)) {
        error = LoadError::MANIFEST_UNREADABLE;
        return false;
    }
    return loadLevelArea(manifest, levelDir, areaId, variant, scene, error);
}

std::vector<Vec3> worldVertices(const ObjectModel& model, const ObjectPlacement& placement) {
    return placeVertices(placement, model.collision.vertices);
}
