#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include "Core/NetworkQualityEstimator.h"
#include "support/TestSupport.h"

using namespace std::chrono_literals;
using testing_support::FakeHttpClient;
using testing_support::FakeResponse;
using testing_support::ManualClock;

namespace {
    const std::string PROBE_URL = "https://probe.example.com/100k.bin";

    EstimatorSettings probeSettings() {
        EstimatorSettings settings;
        settings.probe_url = PROBE_URL;
        settings.probe_bytes = 100 * 1024;
        return settings;
    }

    bool waitForProbe(NetworkQualityEstimator& estimator) {
        for (int i = 0; i < 200 && estimator.isProbeRunning(); ++i) {
            std::this_thread::sleep_for(10ms);
        }
        return !estimator.isProbeRunning();
    }
}

TEST(NetworkQualityEstimatorTest, ClassifiesAgainstAscendingThresholds) {
    EstimatorSettings settings;
    EXPECT_EQ(NetworkQualityEstimator::classify(1200.0, settings), QualityTier::High);
    EXPECT_EQ(NetworkQualityEstimator::classify(1000.0, settings), QualityTier::High);
    EXPECT_EQ(NetworkQualityEstimator::classify(999.9, settings), QualityTier::Medium);
    EXPECT_EQ(NetworkQualityEstimator::classify(500.0, settings), QualityTier::Medium);
    EXPECT_EQ(NetworkQualityEstimator::classify(250.0, settings), QualityTier::Low);
    EXPECT_EQ(NetworkQualityEstimator::classify(99.0, settings), QualityTier::VeryLow);
    EXPECT_EQ(NetworkQualityEstimator::classify(0.0, settings), QualityTier::VeryLow);
}

TEST(NetworkQualityEstimatorTest, ChunkAndBufferSizesShrinkWithTier) {
    const std::vector<QualityTier> tiers = {QualityTier::High, QualityTier::Medium, QualityTier::Low,
                                            QualityTier::VeryLow};
    for (std::size_t i = 1; i < tiers.size(); ++i) {
        EXPECT_GT(NetworkQualityEstimator::chunkSizeFor(tiers[i - 1]), NetworkQualityEstimator::chunkSizeFor(tiers[i]));
        EXPECT_GT(NetworkQualityEstimator::initialBufferFor(tiers[i - 1]),
                  NetworkQualityEstimator::initialBufferFor(tiers[i]));
    }
    EXPECT_EQ(NetworkQualityEstimator::chunkSizeFor(QualityTier::High), 128u * 1024u);
    EXPECT_EQ(NetworkQualityEstimator::initialBufferFor(QualityTier::VeryLow), 256u * 1024u);
}

TEST(NetworkQualityEstimatorTest, StartsAtMediumBeforeAnyProbe) {
    ManualClock clock;
    FakeHttpClient http(&clock);
    NetworkQualityEstimator estimator(http, probeSettings(), clock.steadyNow());
    EXPECT_EQ(estimator.currentTier(), QualityTier::Medium);
    EXPECT_FALSE(estimator.isSlowNetwork());
}

TEST(NetworkQualityEstimatorTest, FastProbeClassifiesHighThenFailureClassifiesVeryLow) {
    ManualClock clock;
    FakeHttpClient http(&clock);
    // 100 KiB in 80 ms is 1250 KiB/s.
    http.respond(PROBE_URL, FakeResponse{.status = 200, .body = std::string(100 * 1024, 'x'), .elapsed = 80ms});
    NetworkQualityEstimator estimator(http, probeSettings(), clock.steadyNow());

    EXPECT_EQ(estimator.measure(), QualityTier::High);
    EXPECT_EQ(estimator.currentTier(), QualityTier::High);
    EXPECT_NEAR(estimator.lastSpeedKbps(), 1250.0, 0.5);

    http.respond(PROBE_URL, FakeResponse{.status = 503});
    EXPECT_EQ(estimator.measure(), QualityTier::VeryLow);
    EXPECT_TRUE(estimator.isSlowNetwork());
    EXPECT_EQ(estimator.lastSpeedKbps(), 0.0);
}

TEST(NetworkQualityEstimatorTest, ProbeStopsReadingAfterProbeBytes) {
    ManualClock clock;
    FakeHttpClient http(&clock, 1024);
    http.respond(PROBE_URL, FakeResponse{.status = 200, .body = std::string(400 * 1024, 'x'), .elapsed = 1000ms});
    NetworkQualityEstimator estimator(http, probeSettings(), clock.steadyNow());

    // Only the first 100 KiB count, so the rate is 100 KiB/s.
    EXPECT_EQ(estimator.measure(), QualityTier::Low);
    EXPECT_NEAR(estimator.lastSpeedKbps(), 100.0, 0.5);
}

TEST(NetworkQualityEstimatorTest, ThrownTransportErrorClassifiesVeryLow) {
    ManualClock clock;
    FakeHttpClient http(&clock);
    http.respond(PROBE_URL, FakeResponse{.failure = MediaErrorKind::Timeout});
    NetworkQualityEstimator estimator(http, probeSettings(), clock.steadyNow());
    EXPECT_EQ(estimator.measure(), QualityTier::VeryLow);
}

TEST(NetworkQualityEstimatorTest, MeasurementIsCappedAsAWhole) {
    ManualClock clock;
    FakeHttpClient http(&clock, 4096);
    // Each fragment arrives well inside the timeout but 25 of them take 2.5 s.
    http.respond(PROBE_URL, FakeResponse{.status = 200, .body = std::string(100 * 1024, 'x'), .per_fragment = 100ms});
    auto settings = probeSettings();
    settings.probe_timeout = 1s;
    NetworkQualityEstimator estimator(http, settings, clock.steadyNow());

    EXPECT_EQ(estimator.measure(), QualityTier::VeryLow);
    EXPECT_EQ(estimator.lastSpeedKbps(), 0.0);
}

TEST(NetworkQualityEstimatorTest, NoProbeUrlDisablesProbing) {
    FakeHttpClient http;
    NetworkQualityEstimator estimator(http, EstimatorSettings{});

    EXPECT_EQ(estimator.measure(), QualityTier::Medium);
    estimator.update();
    EXPECT_FALSE(estimator.isProbeRunning());
    EXPECT_EQ(http.requestCount(), 0u);
}

TEST(NetworkQualityEstimatorTest, ConnectivityLossForcesVeryLowAndRegainRestoresDefault) {
    FakeHttpClient http;
    NetworkQualityEstimator estimator(http, EstimatorSettings{});
    std::vector<QualityTier> seen;
    auto subscription = estimator.subscribe([&](QualityTier tier) { seen.push_back(tier); });

    estimator.onConnectivityChanged({.connected = false, .link_type = LinkType::None});
    EXPECT_EQ(estimator.currentTier(), QualityTier::VeryLow);

    estimator.onConnectivityChanged({.connected = true, .link_type = LinkType::Wifi});
    EXPECT_EQ(estimator.currentTier(), QualityTier::Medium);

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], QualityTier::VeryLow);
    EXPECT_EQ(seen[1], QualityTier::Medium);
}

TEST(NetworkQualityEstimatorTest, ObserversOnlyHearChangesWhileSubscribed) {
    FakeHttpClient http;
    NetworkQualityEstimator estimator(http, EstimatorSettings{});
    int calls = 0;
    auto subscription = estimator.subscribe([&](QualityTier) { ++calls; });

    estimator.onConnectivityChanged({.connected = false});
    estimator.onConnectivityChanged({.connected = false});
    EXPECT_EQ(calls, 1);

    subscription.reset();
    estimator.onConnectivityChanged({.connected = true});
    EXPECT_EQ(calls, 1);
}

TEST(NetworkQualityEstimatorTest, UpdateProbesInBackgroundOncePerInterval) {
    ManualClock clock;
    FakeHttpClient http(&clock);
    http.respond(PROBE_URL, FakeResponse{.status = 200, .body = std::string(100 * 1024, 'x'), .elapsed = 80ms});
    NetworkQualityEstimator estimator(http, probeSettings(), clock.steadyNow());

    estimator.update();
    ASSERT_TRUE(waitForProbe(estimator));
    EXPECT_EQ(estimator.currentTier(), QualityTier::High);
    EXPECT_EQ(http.requestCount(), 1u);

    estimator.update();
    ASSERT_TRUE(waitForProbe(estimator));
    EXPECT_EQ(http.requestCount(), 1u);

    clock.advance(30s);
    estimator.update();
    ASSERT_TRUE(waitForProbe(estimator));
    EXPECT_EQ(http.requestCount(), 2u);
}
