#include "object_placement.h"
#include "log.h"
#include "macro_scanner.h"
#include "numeric_replica.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string toUpper(const std::string& s) {
    std::string result = s;
    for (char& c : result) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

// Skip "/*pos*/" or "pos:" style labels in front of a field
void skipFieldLabels(MacroScanner& scanner) {
    std::string label;
    while (scanner.readBlockComment(label) || scanner.readLabel(label)) {
    }
}

ScanStatus readTriple(MacroScanner& scanner, int32_t& a, int32_t& b, int32_t& c) {
    int64_t values[3] = {0, 0, 0};
    for (int i = 0; i < 3; i++) {
        if (i > 0 && !scanner.expect(',')) {
            return ScanStatus::NO_MATCH;
        }
        ScanStatus status = scanner.readInteger(true, values[i]);
        if (status != ScanStatus::MATCH) {
            return status;
        }
    }
    a = truncateToInt32(values[0]);
    b = truncateToInt32(values[1]);
    c = truncateToInt32(values[2]);
    return ScanStatus::MATCH;
}

// model, pos x/y/z, angle x/y/z; the rest of the statement is ignored
ScanStatus readPlacementFields(MacroScanner& scanner, ObjectPlacement& placement) {
    skipFieldLabels(scanner);

    std::string model;
    if (scanner.readIdentifier(model) != ScanStatus::MATCH) {
        return ScanStatus::NO_MATCH;
    }
    const std::string prefix = PlacementMacros::MODEL_PREFIX;
    if (model.size() <= prefix.size() || model.compare(0, prefix.size(), prefix) != 0) {
        return ScanStatus::NO_MATCH;
    }
    placement.modelName = model.substr(prefix.size());

    if (!scanner.expect(',')) {
        return ScanStatus::NO_MATCH;
    }
    skipFieldLabels(scanner);
    ScanStatus status = readTriple(scanner, placement.x, placement.y, placement.z);
    if (status != ScanStatus::MATCH) {
        return status;
    }

    if (!scanner.expect(',')) {
        return ScanStatus::NO_MATCH;
    }
    skipFieldLabels(scanner);
    return readTriple(scanner, placement.angleX, placement.angleY, placement.angleZ);
}

} // namespace

PlacementTable parseObjectPlacements(const std::string& scriptText) {
    static const char* const objectMacros[] = {
        PlacementMacros::OBJECT,
        PlacementMacros::OBJECT_WITH_ACTS
    };

    PlacementTable table;
    std::istringstream stream(scriptText);
    std::string line;
    size_t lineNumber = 0;
    size_t placementCount = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        MacroScanner scanner(line);

        while (scanner.seekMacro(objectMacros, 2, true)) {
            ObjectPlacement placement = {};
            ScanStatus status = readPlacementFields(scanner, placement);

            if (status == ScanStatus::MALFORMED) {
                SDL_LogWarn(LogCategory::PLACEMENT, "Malformed number in object placement on line %zu, ignored",
                            lineNumber);
                continue;
            }
            if (status == ScanStatus::MATCH) {
                table[placement.modelName].push_back(placement);
                placementCount++;
            }
        }
    }

    SDL_LogDebug(LogCategory::PLACEMENT, "Found %zu placements of %zu models",
                 placementCount, table.size());
    return table;
}

std::vector<std::string> candidateModelNames(const ObjectDescriptor& descriptor,
                                             const std::string& levelId) {
    const std::string level = toUpper(levelId);
    const std::string object = toUpper(descriptor.id);

    std::vector<std::string> candidates = descriptor.modelNames;
    candidates.push_back(level + "_" + object);
    candidates.push_back("LEVEL_GEOMETRY_" + object);
    candidates.push_back(object);

    // Drop repeats, keeping the first (highest priority) occurrence
    std::vector<std::string> unique;
    for (const std::string& name : candidates) {
        if (!name.empty() && std::find(unique.begin(), unique.end(), name) == unique.end()) {
            unique.push_back(name);
        }
    }
    return unique;
}

std::vector<ObjectPlacement> resolvePlacements(const PlacementTable& table,
                                               const std::vector<std::string>& candidates) {
    for (const std::string& name : candidates) {
        PlacementTable::const_iterator it = table.find(name);
        if (it != table.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return std::vector<ObjectPlacement>();
}

std::vector<ObjectPlacement> findObjectPlacements(const PlacementTable& table,
                                                  const ObjectDescriptor& descriptor,
                                                  const std::string& levelId) {
    std::vector<ObjectPlacement> placements =
        resolvePlacements(table, candidateModelNames(descriptor, levelId));

    if (placements.empty()) {
        SDL_LogInfo(LogCategory::PLACEMENT, "No placements found for %s, object not instantiated",
                    descriptor.id.c_str());
    } else {
        SDL_LogDebug(LogCategory::PLACEMENT, "%s placed %zu time(s) as MODEL_%s",
                     descriptor.id.c_str(), placements.size(), placements.front().modelName.c_str());
    }
    return placements;
}

// =============================================================================
// World transform
// =============================================================================

Mat3x3 placementRotation(const ObjectPlacement& placement) {
    return eulerRotationXYZ(placement.angleX, placement.angleY, placement.angleZ);
}

Vec3 placeVertex(const ObjectPlacement& placement, const Vertex& local) {
    return rotateThenTranslate(placementRotation(placement),
                               Vec3(placement.x, placement.y, placement.z),
                               Vec3(local.x, local.y, local.z));
}

std::vector<Vec3> placeVertices(const ObjectPlacement& placement, const std::vector<Vertex>& local) {
    const Mat3x3 rotation = placementRotation(placement);
    const Vec3 translation(placement.x, placement.y, placement.z);

    std::vector<Vec3> world;
    world.reserve(local.size());
    for (const Vertex& v : local) {
        world.push_back(rotateThenTranslate(rotation, translation, Vec3(v.x, v.y, v.z)));
    }
    return world;
}
