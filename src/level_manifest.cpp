#include "level_manifest.h"
#include "level_loader.h"
#include "log.h"

#include <cstdlib>
#include <sstream>

namespace {

AreaEntry& areaFor(LevelManifest& manifest, int areaId) {
    for (AreaEntry& area : manifest.areas) {
        if (area.id == areaId) {
            return area;
        }
    }
    manifest.areas.push_back(AreaEntry());
    manifest.areas.back().id = areaId;
    return manifest.areas.back();
}

ObjectDescriptor& objectFor(LevelManifest& manifest, const std::string& objectId) {
    for (ObjectDescriptor& object : manifest.objects) {
        if (object.id == objectId) {
            return object;
        }
    }
    manifest.objects.push_back(ObjectDescriptor());
    manifest.objects.back().id = objectId;
    return manifest.objects.back();
}

// Strictly positive decimal, 0 if not
int parseAreaNumber(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 6) {
        return 0;
    }
    return std::atoi(text.c_str());
}

// Split "prefix.<middle>.field" at the first and last dot
bool splitCompoundKey(const std::string& key, std::string& middle, std::string& field) {
    size_t first = key.find('.');
    size_t last = key.rfind('.');
    if (first == std::string::npos || last == first || last == first + 1) {
        return false;
    }
    middle = key.substr(first + 1, last - first - 1);
    field = key.substr(last + 1);
    return true;
}

} // namespace

const AreaEntry* LevelManifest::findArea(int areaId) const {
    for (const AreaEntry& area : areas) {
        if (area.id == areaId) {
            return &area;
        }
    }
    return nullptr;
}

bool parseLevelManifest(const std::string& text, LevelManifest& manifest) {
    manifest = LevelManifest();

    std::istringstream stream(text);
    std::string line;
    size_t lineNumber = 0;

    while (std::getline(stream, line)) {
        lineNumber++;
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            SDL_LogWarn(LogCategory::LOADER, "level.cfg:%zu: expected key=value", lineNumber);
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        if (key == "id") {
            manifest.id = value;
            continue;
        }
        if (key == "name") {
            manifest.name = value;
            continue;
        }

        std::string middle;
        std::string field;
        if (!splitCompoundKey(key, middle, field)) {
            SDL_LogDebug(LogCategory::LOADER, "level.cfg:%zu: ignoring key '%s'", lineNumber, key.c_str());
            continue;
        }

        if (key.compare(0, 5, "area.") == 0) {
            int areaId = parseAreaNumber(middle);
            if (areaId == 0) {
                SDL_LogWarn(LogCategory::LOADER, "level.cfg:%zu: bad area number '%s'",
                            lineNumber, middle.c_str());
                continue;
            }
            AreaEntry& area = areaFor(manifest, areaId);
            if (field == "file") {
                area.file = value;
            } else if (field == "name") {
                area.name = value;
            }
        } else if (key.compare(0, 7, "object.") == 0) {
            ObjectDescriptor& object = objectFor(manifest, middle);
            if (field == "file") {
                object.collisionFile = value;
            } else if (field == "name") {
                object.name = value;
            } else if (field == "area") {
                object.area = parseAreaNumber(value);
            } else if (field == "model") {
                if (!value.empty()) {
                    object.modelNames.push_back(value);
                }
            }
        } else {
            SDL_LogDebug(LogCategory::LOADER, "level.cfg:%zu: ignoring key '%s'", lineNumber, key.c_str());
        }
    }

    if (manifest.id.empty()) {
        SDL_LogError(LogCategory::LOADER, "Level manifest has no id");
        return false;
    }
    if (manifest.areas.empty()) {
        SDL_LogError(LogCategory::LOADER, "Level manifest '%s' lists no areas", manifest.id.c_str());
        return false;
    }
    return true;
}

bool loadLevelManifest(const std::string& path, LevelManifest& manifest) {
    std::string text;
    if (!readTextFile(path, text)) {
        return false;
    }
    return parseLevelManifest(text, manifest);
}
