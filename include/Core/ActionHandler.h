#ifndef ACTIONHANDLER_H
#define ACTIONHANDLER_H

#include <string>

#include "Core/Message.h"

class MediaEngine;

// Handles every message that comes from the front end or the platform.
class ActionHandler {
public:
    void process_action(MediaEngine& engine, const EngineMessage& msg);

private:
    void handle_viewportChanged(MediaEngine& engine, int index);
    void handle_connectivityChanged(MediaEngine& engine, const ConnectivityState& state);
    void handle_invalidateCache(MediaEngine& engine, CacheCategory category, const std::string& id_prefix);
    void handle_playCurrent(MediaEngine& engine);
    void handle_pauseCurrent(MediaEngine& engine);
    void handle_pauseAll(MediaEngine& engine);
};

#endif // ACTIONHANDLER_H
