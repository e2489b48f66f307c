#ifndef SYSTEMHANDLER_H
#define SYSTEMHANDLER_H

#include "Core/Message.h"

class MediaEngine;

// Handles system-level and lifecycle messages
class SystemHandler {
public:
    void process_system(MediaEngine& engine, const EngineMessage& msg);

private:
    void handle_updateAndPoll(MediaEngine& engine);
    void handle_quit(MediaEngine& engine);
};

#endif // SYSTEMHANDLER_H
