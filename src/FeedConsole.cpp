#include "FeedConsole.h"

#include <iomanip>
#include <istream>
#include <ostream>
#include <sstream>

#include "EngineSnapshot.h"
#include "MediaEngine.h"

FeedConsole::FeedConsole(MediaEngine& engine, std::istream& in, std::ostream& out)
    : m_engine(engine), m_in(in), m_out(out) {
    m_input_handlers = {
        {"play", Msg::PlayCurrent{}},
        {"pause", Msg::PauseCurrent{}},
        {"pauseall", Msg::PauseAll{}},
        {"offline", Msg::ConnectivityChanged{ConnectivityState{.connected = false, .link_type = LinkType::None}}},
        {"online", Msg::ConnectivityChanged{ConnectivityState{.connected = true, .link_type = LinkType::Unknown}}},
        {"refresh", Msg::InvalidateCache{CacheCategory::MediaList, ""}},
    };
}

void FeedConsole::run() {
    std::string line;
    m_out << "> " << std::flush;
    while (!m_engine.getQuitFlag() && std::getline(m_in, line)) {
        if (!handleLine(line)) {
            break;
        }
        m_out << "> " << std::flush;
    }
}

bool FeedConsole::handleLine(const std::string& line) {
    std::istringstream words(line);
    std::string command;
    if (!(words >> command)) {
        return true;
    }

    if (command == "quit" || command == "q") {
        m_engine.post(Msg::Quit{});
        return false;
    }
    if (command == "help" || command == "?") {
        printHelp();
    } else if (command == "status") {
        printStatus(m_engine.createSnapshot());
    } else if (command == "next" || command == "n") {
        moveBy(1);
    } else if (command == "prev" || command == "p") {
        moveBy(-1);
    } else if (command == "goto" || command == "g") {
        int index;
        if (words >> index) {
            m_engine.onViewportChanged(index);
        } else {
            m_out << "usage: goto <index>" << std::endl;
        }
    } else if (m_input_handlers.count(command)) {
        m_engine.post(m_input_handlers.at(command));
    } else {
        m_out << "unknown command '" << command << "', try 'help'" << std::endl;
    }
    return true;
}

void FeedConsole::moveBy(int delta) {
    const auto snapshot = m_engine.createSnapshot();
    const int target = snapshot.viewport_index < 0 ? 0 : snapshot.viewport_index + delta;
    if (target < 0 || target >= (int) snapshot.item_count) {
        m_out << "already at the " << (delta > 0 ? "end" : "start") << " of the feed" << std::endl;
        return;
    }
    m_engine.onViewportChanged(target);
}

void FeedConsole::printHelp() const {
    m_out << "commands:\n"
          << "  goto <n>   show item n\n"
          << "  next, prev move one item down or up\n"
          << "  play       resume the visible item\n"
          << "  pause      pause the visible item\n"
          << "  pauseall   pause every player\n"
          << "  offline    simulate losing connectivity\n"
          << "  online     simulate regaining connectivity\n"
          << "  refresh    drop cached feed pages\n"
          << "  status     print the engine state\n"
          << "  quit" << std::endl;
}

void FeedConsole::printStatus(const EngineSnapshot& snapshot) const {
    m_out << "viewport " << snapshot.viewport_index << "/" << snapshot.item_count;
    if (!snapshot.current_media_id.empty()) {
        m_out << " (" << snapshot.current_media_id << ", " << to_string(snapshot.current_state) << ")";
    }
    m_out << (snapshot.autoplay ? "" : " [paused]") << "\n"
          << "network  " << to_string(snapshot.tier) << ", " << std::fixed << std::setprecision(1)
          << snapshot.speed_kbps << " KiB/s" << (snapshot.connected ? "" : " [offline]") << "\n"
          << "preload  '" << snapshot.preload_profile << "', epoch " << snapshot.epoch << "\n"
          << "pool     " << snapshot.slots.size() << " slots, " << snapshot.pool_stats.hits << " hits, "
          << snapshot.pool_stats.misses << " misses, " << snapshot.pool_stats.evictions << " evictions, "
          << snapshot.pool_stats.capacity_overflows << " overflows, " << snapshot.pool_stats.init_failures
          << " failures\n";
    for (const auto& slot : snapshot.slots) {
        m_out << "  [" << slot.index << "] " << slot.media_id << " " << to_string(slot.state)
              << (slot.pinned ? " pinned" : "") << "\n";
    }
    m_out << "streams  " << snapshot.active_streams << " active\n"
          << "metadata " << snapshot.cache_stats.entries << " entries, " << snapshot.cache_stats.hits << " hits, "
          << snapshot.cache_stats.misses << " misses, " << snapshot.cache_stats.stale_served << " stale"
          << std::endl;
}
