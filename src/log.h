#ifndef COLINSPECT_LOG_H
#define COLINSPECT_LOG_H

#include <SDL.h>

// =============================================================================
// Logging
// =============================================================================
//
// All diagnostics go through SDL's log API (SDL_Log, SDL_LogWarn, ...).
// Each module logs under its own category so verbosity can be raised for one
// part of the pipeline at a time.
//
// =============================================================================

namespace LogCategory {
    constexpr int PARSER = SDL_LOG_CATEGORY_CUSTOM;
    constexpr int PLACEMENT = SDL_LOG_CATEGORY_CUSTOM + 1;
    constexpr int LOADER = SDL_LOG_CATEGORY_CUSTOM + 2;
    constexpr int TOOL = SDL_LOG_CATEGORY_CUSTOM + 3;
}

// Set all project categories to DEBUG (verbose) or INFO priority
void setLogVerbosity(bool verbose);

#endif // COLINSPECT_LOG_H
