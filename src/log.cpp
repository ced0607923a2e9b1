#include "log.h"

void setLogVerbosity(bool verbose) {
    SDL_LogPriority priority = verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_INFO;

    SDL_LogSetPriority(LogCategory::PARSER, priority);
    SDL_LogSetPriority(LogCategory::PLACEMENT, priority);
    SDL_LogSetPriority(LogCategory::LOADER, priority);
    SDL_LogSetPriority(LogCategory::TOOL, priority);
}
