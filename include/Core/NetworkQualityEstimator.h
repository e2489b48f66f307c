#ifndef NETWORKQUALITYESTIMATOR_H
#define NETWORKQUALITYESTIMATOR_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>

#include "Core/Clock.h"
#include "Core/Subscription.h"

class IHttpClient;

enum class QualityTier {
    High,
    Medium,
    Low,
    VeryLow
};

const char* to_string(QualityTier tier);

enum class LinkType {
    Unknown,
    Wifi,
    Cellular,
    Ethernet,
    None
};

struct ConnectivityState {
    bool connected = true;
    LinkType link_type = LinkType::Unknown;
};

struct EstimatorSettings {
    std::string probe_url;
    std::size_t probe_bytes = 100 * 1024;
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::seconds probe_interval{30};
    // Ascending KiB/s thresholds for low, medium and high.
    double low_kbps = 100.0;
    double medium_kbps = 500.0;
    double high_kbps = 1000.0;
};

/*!
@class NetworkQualityEstimator
@brief Classifies measured throughput into a QualityTier.

A probe downloads a small payload and times it. Any failure of the probe
classifies the link as VeryLow. The tier is stored atomically so streaming
threads can re-read it on every buffering decision.
*/
class NetworkQualityEstimator {
  public:
    using TierObserver = std::function<void(QualityTier)>;

    NetworkQualityEstimator(IHttpClient& http, EstimatorSettings settings, SteadyNow now = realSteadyClock());
    ~NetworkQualityEstimator();

    NetworkQualityEstimator(const NetworkQualityEstimator&) = delete;
    NetworkQualityEstimator& operator=(const NetworkQualityEstimator&) = delete;

    // Runs one probe synchronously and publishes the result.
    QualityTier measure();

    // Periodic driver. Starts a background probe when the interval elapsed
    // and collects a finished one. Never blocks.
    void update();

    void onConnectivityChanged(const ConnectivityState& state);

    QualityTier currentTier() const;
    double lastSpeedKbps() const;
    bool isSlowNetwork() const;
    bool isProbeRunning() const;

    Subscription subscribe(TierObserver observer);

    static QualityTier classify(double kbps, const EstimatorSettings& settings);
    static std::size_t chunkSizeFor(QualityTier tier);
    static std::size_t initialBufferFor(QualityTier tier);

  private:
    void publish(QualityTier tier, double kbps);
    void startBackgroundProbe();

    IHttpClient& m_http;
    EstimatorSettings m_settings;
    SteadyNow m_now;

    std::atomic<QualityTier> m_tier;
    std::atomic<double> m_speed_kbps;

    mutable std::mutex m_probe_mutex;
    std::future<QualityTier> m_probe_future;
    std::chrono::steady_clock::time_point m_last_probe_start;
    bool m_has_probed = false;

    std::mutex m_observer_mutex;
    std::map<int, TierObserver> m_observers;
    int m_next_observer_id = 0;
};

#endif // NETWORKQUALITYESTIMATOR_H
