// settings.h
// Save and load tool settings

#ifndef COLINSPECT_SETTINGS_H
#define COLINSPECT_SETTINGS_H

#include <string>

#include "preprocessor.h"

// Settings structure containing all persistent tool options
struct ToolSettings {
    Variant variant;          // Build variant used to resolve VERSION_JP blocks
    std::string levelsPath;   // Directory holding one subdirectory per level
    std::string exportPath;   // Default OBJ export target
    bool verbose;             // Debug-level logging

    // Default values
    ToolSettings()
        : variant(Variant::US)
        , levelsPath("levels")
        , exportPath("collision_mesh.obj")
        , verbose(false)
    {}
};

// Get the path to the settings file
// On Linux: $XDG_CONFIG_HOME/colinspect/settings.cfg or ~/.config/colinspect/settings.cfg
// Elsewhere (or without a home directory): settings.cfg in the working directory
std::string getSettingsPath();

// Save settings to file
// Returns true on success
bool saveSettings(const ToolSettings& settings, const std::string& path);
bool saveSettings(const ToolSettings& settings);

// Load settings from file
// Returns default settings if file doesn't exist or can't be read
ToolSettings loadSettings(const std::string& path);
ToolSettings loadSettings();

#endif // COLINSPECT_SETTINGS_H
