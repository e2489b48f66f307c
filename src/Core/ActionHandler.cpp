#include "Core/ActionHandler.h"

#include <spdlog/spdlog.h>

#include <mutex>
#include <type_traits>
#include <variant>

#include "Errors.h"
#include "MediaEngine.h"

void ActionHandler::process_action(MediaEngine& engine, const EngineMessage& msg) {
    std::visit(
        [this, &engine](auto&& arg) {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, Msg::ViewportChanged>)
                handle_viewportChanged(engine, arg.index);
            else if constexpr (std::is_same_v<T, Msg::ConnectivityChanged>)
                handle_connectivityChanged(engine, arg.state);
            else if constexpr (std::is_same_v<T, Msg::InvalidateCache>)
                handle_invalidateCache(engine, arg.category, arg.id_prefix);
            else if constexpr (std::is_same_v<T, Msg::PlayCurrent>)
                handle_playCurrent(engine);
            else if constexpr (std::is_same_v<T, Msg::PauseCurrent>)
                handle_pauseCurrent(engine);
            else if constexpr (std::is_same_v<T, Msg::PauseAll>)
                handle_pauseAll(engine);
        },
        msg);
}

void ActionHandler::handle_viewportChanged(MediaEngine& engine, int index) {
    const auto item_count = engine.m_feed.itemCount();
    if (index < 0 || index >= (int) item_count) {
        spdlog::warn("ActionHandler: viewport index {} is outside the feed of {} items", index, item_count);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        if (index == engine.m_session_state.viewport_index) {
            return;
        }
        engine.m_session_state.viewport_index = index;
        engine.m_session_state.autoplay = true;
        engine.m_session_state.viewport_changes++;
    }

    engine.m_scheduler.onViewportChanged(index);

    std::string media_id;
    try {
        if (auto item = engine.m_feed.itemAt(index)) {
            media_id = item->id;
        }
    } catch (const MediaError& e) {
        spdlog::warn("ActionHandler: metadata for index {} unavailable: {}", index, e.what());
    }
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        engine.m_session_state.current_media_id = media_id;
    }

    engine.applyPlayback();
    engine.m_needs_redraw = true;
}

void ActionHandler::handle_connectivityChanged(MediaEngine& engine, const ConnectivityState& state) {
    bool regained;
    int viewport;
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        regained = state.connected && !engine.m_session_state.connectivity.connected;
        engine.m_session_state.connectivity = state;
        viewport = engine.m_session_state.viewport_index;
    }
    spdlog::info("ActionHandler: connectivity {}", state.connected ? "available" : "lost");
    engine.m_estimator.onConnectivityChanged(state);

    // Preloads that failed while offline get another chance.
    if (regained && viewport >= 0) {
        engine.m_scheduler.onViewportChanged(viewport);
    }
    engine.m_needs_redraw = true;
}

void ActionHandler::handle_invalidateCache(MediaEngine& engine, CacheCategory category, const std::string& id_prefix) {
    const auto removed = engine.m_metadata_cache.invalidate(category, id_prefix);
    spdlog::info("ActionHandler: invalidated {} {} entries matching '{}'", removed, to_string(category), id_prefix);
    engine.m_needs_redraw = true;
}

void ActionHandler::handle_playCurrent(MediaEngine& engine) {
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        engine.m_session_state.autoplay = true;
    }
    engine.applyPlayback();
    engine.m_needs_redraw = true;
}

void ActionHandler::handle_pauseCurrent(MediaEngine& engine) {
    int viewport;
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        engine.m_session_state.autoplay = false;
        viewport = engine.m_session_state.viewport_index;
    }
    engine.m_pool.handle(viewport).pause();
    engine.m_needs_redraw = true;
}

void ActionHandler::handle_pauseAll(MediaEngine& engine) {
    {
        std::lock_guard<std::mutex> lock(engine.m_state_mutex);
        engine.m_session_state.autoplay = false;
    }
    engine.m_pool.pauseAll();
    engine.m_needs_redraw = true;
}
