/**
 * @file Config.cpp
 * @brief Configuration defaults
 */

#include "Config.h"

#include <cstdlib>

std::string defaultCacheRoot() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::string(home) + "/.local/share/assetsync/remote";
    }
    return "remote";
}
