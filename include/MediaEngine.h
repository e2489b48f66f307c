#ifndef MEDIAENGINE_H
#define MEDIAENGINE_H

#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "Core/AsyncExecutor.h"
#include "Core/CachedFeedSource.h"
#include "Core/Message.h"
#include "Core/NetworkQualityEstimator.h"
#include "Core/PreloadScheduler.h"
#include "Core/ProgressiveFetchCache.h"
#include "Core/ResourcePool.h"
#include "Core/Subscription.h"
#include "Core/SwrCache.h"
#include "EngineConfig.h"
#include "EngineSnapshot.h"
#include "SessionState.h"

class ActionHandler;
class SystemHandler;
class UpdateManager;
class IHttpClient;
class IPlayerFactory;

/*!
@class MediaEngine
@brief The central actor owning the delivery pipeline.

The engine constructs the estimator, both caches, the resource pool and the
preload scheduler, and runs a dedicated thread that drains a message queue.
All viewport, playback and maintenance decisions are made on that thread.
Blocking work (probes, downloads, player initialization, cache refreshes)
runs on worker threads owned by the individual components.

Front ends talk to the engine only through post() and poll
createSnapshot(). The needs-redraw flag is raised whenever the snapshot
would differ from the previous one.
*/
class MediaEngine {
  public:
    MediaEngine(EngineConfig config, IFeedSource& upstream_feed, IHttpClient& http, IPlayerFactory& players);
    ~MediaEngine();

    MediaEngine(const MediaEngine&) = delete;
    MediaEngine& operator=(const MediaEngine&) = delete;

    void post(EngineMessage message);
    void onViewportChanged(int index) { post(Msg::ViewportChanged{index}); }
    void onConnectivityChanged(const ConnectivityState& state) { post(Msg::ConnectivityChanged{state}); }

    // Stops the actor, releases every player and waits for worker tasks. Idempotent.
    void shutdown();

    EngineSnapshot createSnapshot() const;
    std::atomic<bool>& getNeedsRedrawFlag();
    std::atomic<bool>& getQuitFlag();

    // Blocking acquisition for callers that need a handle right away.
    PlaybackHandle acquire(int index);

    IFeedSource& feed();
    SwrCache& metadataCache();
    NetworkQualityEstimator& estimator();
    ProgressiveFetchCache& fetchCache();
    ResourcePool& pool();
    PreloadScheduler& scheduler();
    const EngineConfig& config() const { return m_config; }

  private:
    friend class ActionHandler;
    friend class SystemHandler;
    friend class UpdateManager;

    void actorLoop();
    // Keeps the visible item playing when autoplay is on and pauses every other one.
    void applyPlayback();
    PreloadProfile resolveProfile() const;

    const EngineConfig m_config;

    // Core Components, in dependency order
    NetworkQualityEstimator m_estimator;
    SwrCache m_metadata_cache;
    CachedFeedSource m_feed;
    ProgressiveFetchCache m_fetch_cache;
    ResourcePool m_pool;
    AsyncExecutor m_executor;
    PreloadScheduler m_scheduler;
    Subscription m_tier_subscription;

    std::unique_ptr<ActionHandler> m_action_handler;
    std::unique_ptr<SystemHandler> m_system_handler;
    std::unique_ptr<UpdateManager> m_update_manager;

    // Encapsulated Engine State, guarded by m_state_mutex
    mutable std::mutex m_state_mutex;
    SessionState m_session_state;

    // Actor Model Internals
    std::atomic<bool> m_quit_flag;
    std::atomic<bool> m_needs_redraw;
    std::atomic<bool> m_shut_down;
    std::thread m_actor_thread;
    std::deque<EngineMessage> m_message_queue;
    std::mutex m_queue_mutex;
    std::condition_variable m_queue_cond;
};

#endif // MEDIAENGINE_H
