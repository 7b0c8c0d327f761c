/**
 * @file SessionHooks.h
 * @brief Collaborators notified once the bootstrap package is on disk
 *
 * Called on the worker thread, right after the info package has been
 * extracted into the cache root. Implementations that touch caller-side
 * state must do their own synchronization.
 */

#ifndef ASSETSYNC_SESSION_HOOKS_H
#define ASSETSYNC_SESSION_HOOKS_H

#include <string>

class SessionHooks {
public:
    virtual ~SessionHooks() = default;

    // Library cache file is available (may be missing if the server sent none)
    virtual void onLibraryReady(const std::string& cacheFile) { (void)cacheFile; }

    // Score records are available
    virtual void onScoresReady(const std::string& scoreFile) { (void)scoreFile; }
};

#endif // ASSETSYNC_SESSION_HOOKS_H
