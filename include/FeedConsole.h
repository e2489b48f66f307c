#ifndef FEEDCONSOLE_H
#define FEEDCONSOLE_H

#include <iosfwd>
#include <map>
#include <string>

#include "Core/Message.h"

class MediaEngine;
struct EngineSnapshot;

// Line-oriented front end: reads viewport and playback commands and
// forwards them to the engine as messages.
class FeedConsole {
  public:
    FeedConsole(MediaEngine& engine, std::istream& in, std::ostream& out);

    // Runs until "quit" or end of input.
    void run();
    // Returns false when the console should stop.
    bool handleLine(const std::string& line);

    void printHelp() const;
    void printStatus(const EngineSnapshot& snapshot) const;

  private:
    void moveBy(int delta);

    std::map<std::string, EngineMessage> m_input_handlers;
    MediaEngine& m_engine;
    std::istream& m_in;
    std::ostream& m_out;
};

#endif // FEEDCONSOLE_H
