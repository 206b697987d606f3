#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "oas/foundation/service_metrics.hpp"

using namespace oas::foundation;

TEST(ServiceMetricsTest, CountersStartAtZeroAndAccumulate) {
    ServiceMetrics metrics;
    EXPECT_EQ(metrics.counterValue("oas_auth_success_total"), 0u);

    metrics.incrementCounter("oas_auth_success_total");
    metrics.incrementCounter("oas_auth_success_total", 4);
    EXPECT_EQ(metrics.counterValue("oas_auth_success_total"), 5u);
}

TEST(ServiceMetricsTest, GaugesOverwrite) {
    ServiceMetrics metrics;
    metrics.setGauge("oas_live_tokens", 12.0);
    metrics.setGauge("oas_live_tokens", 3.0);
    EXPECT_DOUBLE_EQ(metrics.gaugeValue("oas_live_tokens"), 3.0);
    EXPECT_DOUBLE_EQ(metrics.gaugeValue("missing"), 0.0);
}

TEST(ServiceMetricsTest, HistogramRequiresRegistration) {
    ServiceMetrics metrics;
    metrics.recordHistogram("latency_ms", 3.0);
    EXPECT_EQ(metrics.histogramCount("latency_ms"), 0u);

    metrics.registerHistogram("latency_ms", HistogramBuckets::defaultLatency());
    metrics.recordHistogram("latency_ms", 3.0);
    metrics.recordHistogram("latency_ms", 2000.0);
    EXPECT_EQ(metrics.histogramCount("latency_ms"), 2u);
}

TEST(ServiceMetricsTest, ScrapeUsesPrometheusTextFormat) {
    ServiceMetrics metrics;
    metrics.incrementCounter("b_total", 2);
    metrics.incrementCounter("a_total");
    metrics.registerHistogram("verify_ms", HistogramBuckets{{1, 10}});
    metrics.recordHistogram("verify_ms", 5.0);

    auto text = metrics.scrape();
    EXPECT_NE(text.find("# TYPE a_total counter\na_total 1\n"), std::string::npos);
    EXPECT_LT(text.find("a_total"), text.find("b_total"));
    EXPECT_NE(text.find("verify_ms_bucket{le=\"1\"} 0\n"), std::string::npos);
    EXPECT_NE(text.find("verify_ms_bucket{le=\"10\"} 1\n"), std::string::npos);
    EXPECT_NE(text.find("verify_ms_bucket{le=\"+Inf\"} 1\n"), std::string::npos);
    EXPECT_NE(text.find("verify_ms_count 1\n"), std::string::npos);
}

TEST(ServiceMetricsTest, ResetClearsEverything) {
    ServiceMetrics metrics;
    metrics.incrementCounter("c");
    metrics.setGauge("g", 1.0);
    metrics.registerHistogram("h", HistogramBuckets::defaultLatency());
    metrics.reset();

    EXPECT_EQ(metrics.counterValue("c"), 0u);
    EXPECT_TRUE(metrics.scrape().empty());
}

TEST(ServiceMetricsTest, ConcurrentIncrementsAreNotLost) {
    ServiceMetrics metrics;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&metrics] {
            for (int i = 0; i < kPerThread; ++i) {
                metrics.incrementCounter("hits");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(metrics.counterValue("hits"), static_cast<uint64_t>(kThreads * kPerThread));
}

TEST(ScopedLatencyTest, RecordsOneObservation) {
    ServiceMetrics metrics;
    metrics.registerHistogram("op_ms", HistogramBuckets::defaultLatency());
    {
        ScopedLatency timer(metrics, "op_ms");
    }
    EXPECT_EQ(metrics.histogramCount("op_ms"), 1u);
}

TEST(ServiceMetricsSingletonTest, InstanceReturnsSameObject) {
    EXPECT_EQ(&ServiceMetrics::instance(), &ServiceMetrics::instance());
}
