#include "MediaEngine.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <variant>
#include <utility>

#include "Core/ActionHandler.h"
#include "Core/SystemHandler.h"
#include "Core/UpdateManager.h"
#include "PersistenceManager.h"

namespace {
    constexpr auto ACTOR_LOOP_TIMEOUT = std::chrono::milliseconds(100);
}

MediaEngine::MediaEngine(EngineConfig config, IFeedSource& upstream_feed, IHttpClient& http, IPlayerFactory& players)
    : m_config(std::move(config)),
      m_estimator(http, m_config.network),
      m_metadata_cache(m_config.metadata_cache),
      m_feed(upstream_feed, m_metadata_cache),
      m_fetch_cache(http, [this] { return m_estimator.currentTier(); }, m_config.fetch_cache),
      m_pool(players, &m_fetch_cache, m_config.pool),
      m_scheduler(m_pool, m_feed, m_executor, resolveProfile()),
      m_quit_flag(false),
      m_needs_redraw(true),
      m_shut_down(false) {
    m_tier_subscription = m_estimator.subscribe([this](QualityTier tier) {
        spdlog::info("MediaEngine: network tier is now {}", to_string(tier));
        m_needs_redraw = true;
    });

    m_action_handler = std::make_unique<ActionHandler>();
    m_system_handler = std::make_unique<SystemHandler>();
    m_update_manager = std::make_unique<UpdateManager>();

    spdlog::info("MediaEngine: {} device, pool capacity {}, init timeout {}ms, profile '{}'",
                 to_string(m_config.device_class), m_config.pool.capacity, m_config.pool.init_timeout.count(),
                 m_scheduler.profile().name);
    m_actor_thread = std::thread(&MediaEngine::actorLoop, this);
}

MediaEngine::~MediaEngine() { shutdown(); }

void MediaEngine::shutdown() {
    if (m_shut_down.exchange(true)) {
        return;
    }
    post(Msg::Quit{});
    if (m_actor_thread.joinable()) {
        m_actor_thread.join();
    }
    m_tier_subscription.reset();

    // Abandons in-flight initializations so waiting preload tasks return quickly.
    m_pool.clear();
    m_executor.waitAll();
    m_pool.clear();

    std::lock_guard<std::mutex> lock(m_state_mutex);
    if (!m_config.session_file.empty()) {
        PersistenceManager persistence(m_config.session_file);
        persistence.saveSession(m_session_state.current_media_id);
    }
    auto duration_seconds = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() -
                                                                             m_session_state.session_start_time)
                                .count();
    const auto pool_stats = m_pool.stats();
    const auto cache_stats = m_metadata_cache.stats();
    spdlog::info("MediaEngine: session over after {}s: {} viewport changes, {} playback starts, "
                 "pool {} hits / {} misses / {} evictions, metadata {} hits / {} misses",
                 duration_seconds, m_session_state.viewport_changes, m_session_state.playback_starts,
                 pool_stats.hits, pool_stats.misses, pool_stats.evictions, cache_stats.hits, cache_stats.misses);
}

void MediaEngine::post(EngineMessage message) {
    {
        std::lock_guard<std::mutex> lock(m_queue_mutex);
        m_message_queue.push_back(std::move(message));
    }
    m_queue_cond.notify_one();
}

std::atomic<bool>& MediaEngine::getQuitFlag() { return m_quit_flag; }
std::atomic<bool>& MediaEngine::getNeedsRedrawFlag() { return m_needs_redraw; }

void MediaEngine::actorLoop() {
    while (!m_quit_flag) {
        std::deque<EngineMessage> current_queue;
        {
            std::unique_lock<std::mutex> lock(m_queue_mutex);
            if (m_queue_cond.wait_for(lock, ACTOR_LOOP_TIMEOUT,
                                      [this] { return !m_message_queue.empty() || m_quit_flag; })) {
                current_queue.swap(m_message_queue);
            }
        }
        if (m_quit_flag)
            break;
        if (current_queue.empty()) {
            current_queue.push_back(Msg::UpdateAndPoll{});
        }
        for (auto& msg : current_queue) {
            try {
                if (std::holds_alternative<Msg::UpdateAndPoll>(msg) || std::holds_alternative<Msg::Quit>(msg)) {
                    m_system_handler->process_system(*this, msg);
                } else {
                    m_action_handler->process_action(*this, msg);
                }
            } catch (const std::exception& e) {
                spdlog::error("MediaEngine: message {} failed: {}", msg.index(), e.what());
            }
            if (m_quit_flag)
                break;
        }
    }
    m_pool.pauseAll();
}

EngineSnapshot MediaEngine::createSnapshot() const {
    EngineSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        snapshot.viewport_index = m_session_state.viewport_index;
        snapshot.current_media_id = m_session_state.current_media_id;
        snapshot.autoplay = m_session_state.autoplay;
        snapshot.connected = m_session_state.connectivity.connected;
    }
    snapshot.current_state = m_pool.handle(snapshot.viewport_index).state();
    snapshot.epoch = m_scheduler.epoch();
    snapshot.tier = m_estimator.currentTier();
    snapshot.speed_kbps = m_estimator.lastSpeedKbps();
    snapshot.preload_profile = m_scheduler.profile().name;
    snapshot.slots = m_pool.slots();
    snapshot.pool_stats = m_pool.stats();
    snapshot.cache_stats = m_metadata_cache.stats();
    snapshot.active_streams = m_fetch_cache.activeStreamCount();
    snapshot.item_count = m_feed.itemCount();
    return snapshot;
}

PlaybackHandle MediaEngine::acquire(int index) {
    auto item = m_feed.itemAt(index);
    if (!item) {
        throw std::out_of_range("MediaEngine: no feed item at index " + std::to_string(index));
    }
    return m_pool.acquire(index, *item);
}

void MediaEngine::applyPlayback() {
    int current;
    bool autoplay;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        current = m_session_state.viewport_index;
        autoplay = m_session_state.autoplay;
    }

    for (const auto& slot : m_pool.slots()) {
        if (slot.index != current && slot.state == PlaybackState::Playing) {
            try {
                m_pool.handle(slot.index).pause();
            } catch (const std::exception& e) {
                spdlog::warn("MediaEngine: could not pause index {}: {}", slot.index, e.what());
            }
        }
    }
    if (current < 0 || !autoplay) {
        return;
    }

    auto handle = m_pool.handle(current);
    const PlaybackState state = handle.state();
    if (state != PlaybackState::Ready && state != PlaybackState::Paused) {
        return;
    }
    try {
        if (handle.play()) {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_session_state.playback_starts++;
            spdlog::info("MediaEngine: playing index {} ({})", current, m_session_state.current_media_id);
            m_needs_redraw = true;
        }
    } catch (const std::exception& e) {
        spdlog::warn("MediaEngine: could not start index {}: {}", current, e.what());
    }
}

PreloadProfile MediaEngine::resolveProfile() const {
    if (m_config.preload_profile == "auto") {
        return m_config.device_class == DeviceClass::LowEnd ? Strategy::liteProfile() : Strategy::aggressiveProfile();
    }
    return Strategy::profileByName(m_config.preload_profile);
}

IFeedSource& MediaEngine::feed() { return m_feed; }
SwrCache& MediaEngine::metadataCache() { return m_metadata_cache; }
NetworkQualityEstimator& MediaEngine::estimator() { return m_estimator; }
ProgressiveFetchCache& MediaEngine::fetchCache() { return m_fetch_cache; }
ResourcePool& MediaEngine::pool() { return m_pool; }
PreloadScheduler& MediaEngine::scheduler() { return m_scheduler; }
