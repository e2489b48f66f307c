#include "Core/NetworkQualityEstimator.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

#include "Errors.h"
#include "Net/HttpClient.h"

namespace {
    constexpr std::size_t KIB = 1024;
    constexpr std::size_t MIB = 1024 * KIB;
    // Keeps the rate finite when a probe completes within one clock tick.
    constexpr double MIN_PROBE_SECONDS = 0.001;
}

const char* to_string(QualityTier tier) {
    switch (tier) {
    case QualityTier::High:
        return "high";
    case QualityTier::Medium:
        return "medium";
    case QualityTier::Low:
        return "low";
    case QualityTier::VeryLow:
        return "very-low";
    }
    return "unknown";
}

NetworkQualityEstimator::NetworkQualityEstimator(IHttpClient& http, EstimatorSettings settings, SteadyNow now)
    : m_http(http),
      m_settings(std::move(settings)),
      m_now(std::move(now)),
      m_tier(QualityTier::Medium),
      m_speed_kbps(0.0) {}

NetworkQualityEstimator::~NetworkQualityEstimator() {
    std::lock_guard<std::mutex> lock(m_probe_mutex);
    if (m_probe_future.valid()) {
        m_probe_future.wait();
    }
}

QualityTier NetworkQualityEstimator::classify(double kbps, const EstimatorSettings& settings) {
    if (kbps >= settings.high_kbps)
        return QualityTier::High;
    if (kbps >= settings.medium_kbps)
        return QualityTier::Medium;
    if (kbps >= settings.low_kbps)
        return QualityTier::Low;
    return QualityTier::VeryLow;
}

std::size_t NetworkQualityEstimator::chunkSizeFor(QualityTier tier) {
    switch (tier) {
    case QualityTier::High:
        return 128 * KIB;
    case QualityTier::Medium:
        return 64 * KIB;
    case QualityTier::Low:
        return 32 * KIB;
    case QualityTier::VeryLow:
        return 16 * KIB;
    }
    return 16 * KIB;
}

std::size_t NetworkQualityEstimator::initialBufferFor(QualityTier tier) {
    switch (tier) {
    case QualityTier::High:
        return 2 * MIB;
    case QualityTier::Medium:
        return 1 * MIB;
    case QualityTier::Low:
        return 512 * KIB;
    case QualityTier::VeryLow:
        return 256 * KIB;
    }
    return 256 * KIB;
}

QualityTier NetworkQualityEstimator::measure() {
    if (m_settings.probe_url.empty()) {
        spdlog::debug("NetworkQualityEstimator: no probe URL configured, keeping {}", to_string(currentTier()));
        return currentTier();
    }

    HttpRequest request{.url = m_settings.probe_url,
                        .range_start = std::nullopt,
                        .timeout = m_settings.probe_timeout,
                        .total_timeout = m_settings.probe_timeout};
    std::size_t received = 0;
    const auto start = m_now();

    try {
        int status = m_http.get(request, [&](const char*, std::size_t size) {
            received += size;
            return received < m_settings.probe_bytes;
        });
        if (status < 200 || status >= 300) {
            throw NetworkError(status, "probe returned HTTP " + std::to_string(status));
        }
    } catch (const MediaError& e) {
        spdlog::warn("NetworkQualityEstimator: probe failed ({}), classifying as very-low", e.what());
        publish(QualityTier::VeryLow, 0.0);
        return QualityTier::VeryLow;
    }

    const double seconds =
        std::max(MIN_PROBE_SECONDS, std::chrono::duration<double>(m_now() - start).count());
    const double kbps = (static_cast<double>(received) / KIB) / seconds;
    const QualityTier tier = classify(kbps, m_settings);
    spdlog::info("NetworkQualityEstimator: {} bytes in {:.3f}s = {:.1f} KiB/s -> {}", received, seconds, kbps,
                 to_string(tier));
    publish(tier, kbps);
    return tier;
}

void NetworkQualityEstimator::publish(QualityTier tier, double kbps) {
    m_speed_kbps = kbps;
    const QualityTier previous = m_tier.exchange(tier);
    if (previous == tier) {
        return;
    }

    std::vector<TierObserver> observers;
    {
        std::lock_guard<std::mutex> lock(m_observer_mutex);
        for (const auto& [id, observer] : m_observers) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(tier);
    }
}

void NetworkQualityEstimator::startBackgroundProbe() {
    // m_probe_mutex is held by the caller.
    m_last_probe_start = m_now();
    m_has_probed = true;
    m_probe_future = std::async(std::launch::async, [this] { return measure(); });
}

void NetworkQualityEstimator::update() {
    if (m_settings.probe_url.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_probe_mutex);
    if (m_probe_future.valid()) {
        if (m_probe_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            return;
        }
        m_probe_future.get();
    }
    if (!m_has_probed || m_now() - m_last_probe_start >= m_settings.probe_interval) {
        startBackgroundProbe();
    }
}

void NetworkQualityEstimator::onConnectivityChanged(const ConnectivityState& state) {
    if (!state.connected) {
        spdlog::info("NetworkQualityEstimator: connectivity lost, forcing very-low");
        publish(QualityTier::VeryLow, 0.0);
        return;
    }

    if (m_settings.probe_url.empty()) {
        publish(QualityTier::Medium, 0.0); // the unprobed default
        return;
    }
    std::lock_guard<std::mutex> lock(m_probe_mutex);
    if (m_probe_future.valid() &&
        m_probe_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return; // A probe is already on its way.
    }
    if (m_probe_future.valid()) {
        m_probe_future.get();
    }
    spdlog::info("NetworkQualityEstimator: connectivity changed, re-probing");
    startBackgroundProbe();
}

QualityTier NetworkQualityEstimator::currentTier() const { return m_tier.load(); }

double NetworkQualityEstimator::lastSpeedKbps() const { return m_speed_kbps.load(); }

bool NetworkQualityEstimator::isSlowNetwork() const {
    auto tier = currentTier();
    return tier == QualityTier::Low || tier == QualityTier::VeryLow;
}

bool NetworkQualityEstimator::isProbeRunning() const {
    std::lock_guard<std::mutex> lock(m_probe_mutex);
    return m_probe_future.valid() &&
           m_probe_future.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
}

Subscription NetworkQualityEstimator::subscribe(TierObserver observer) {
    std::lock_guard<std::mutex> lock(m_observer_mutex);
    const int id = m_next_observer_id++;
    m_observers.emplace(id, std::move(observer));
    return Subscription([this, id] {
        std::lock_guard<std::mutex> guard(m_observer_mutex);
        m_observers.erase(id);
    });
}
