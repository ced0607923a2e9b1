// settings.cpp
// Save and load tool settings

#include "settings.h"
#include "log.h"

#include <cstdlib>
#include <fstream>
#include <sys/stat.h>

// =============================================================================
// Settings path - use platform-appropriate location
// =============================================================================

std::string getSettingsPath() {
#if defined(__linux__)
    std::string base;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        base = xdg;
    } else {
        const char* home = std::getenv("HOME");
        if (home && home[0] != '\0') {
            base = std::string(home) + "/.config";
        }
    }
    if (!base.empty()) {
        std::string dir = base + "/colinspect";
        // Create directory if it doesn't exist
        mkdir(base.c_str(), 0755);
        mkdir(dir.c_str(), 0755);
        return dir + "/settings.cfg";
    }
#endif
    // Fallback to current directory
    return "settings.cfg";
}

// =============================================================================
// Save settings
// =============================================================================

bool saveSettings(const ToolSettings& settings, const std::string& path) {
    std::ofstream file(path);

    if (!file.is_open()) {
        SDL_LogWarn(LogCategory::TOOL, "Cannot write settings to %s", path.c_str());
        return false;
    }

    // Write settings in simple key=value format
    file << "# colinspect settings\n";
    file << "variant=" << variantName(settings.variant) << "\n";
    file << "levelsPath=" << settings.levelsPath << "\n";
    file << "exportPath=" << settings.exportPath << "\n";
    file << "verbose=" << (settings.verbose ? 1 : 0) << "\n";

    file.close();
    return !file.fail();
}

bool saveSettings(const ToolSettings& settings) {
    return saveSettings(settings, getSettingsPath());
}

// =============================================================================
// Load settings
// =============================================================================

ToolSettings loadSettings(const std::string& path) {
    ToolSettings settings;  // Start with defaults

    std::ifstream file(path);

    if (!file.is_open()) {
        // File doesn't exist, return defaults
        return settings;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line[line.size() - 1] == '\r') {
            line.erase(line.size() - 1);
        }

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Parse key=value
        size_t pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = line.substr(0, pos);
        std::string value = line.substr(pos + 1);

        // Parse each setting
        if (key == "variant") {
            Variant v;
            if (parseVariant(value, v)) {
                settings.variant = v;
            } else {
                SDL_LogWarn(LogCategory::TOOL, "Ignoring unknown variant '%s' in %s",
                            value.c_str(), path.c_str());
            }
        } else if (key == "levelsPath") {
            if (!value.empty()) {
                settings.levelsPath = value;
            }
        } else if (key == "exportPath") {
            if (!value.empty()) {
                settings.exportPath = value;
            }
        } else if (key == "verbose") {
            settings.verbose = (std::atoi(value.c_str()) != 0);
        }
    }

    file.close();
    return settings;
}

ToolSettings loadSettings() {
    return loadSettings(getSettingsPath());
}
