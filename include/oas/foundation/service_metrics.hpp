#pragma once

/// @file service_metrics.hpp
/// @brief In-process counters, gauges and histograms with Prometheus
///        text-format export.

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace oas::foundation {

/// Bucket boundaries for histogram metrics (upper bounds, "le").
struct HistogramBuckets {
    /// Default latency buckets in milliseconds: {1,5,10,25,50,100,250,500,1000}.
    static HistogramBuckets defaultLatency();

    std::vector<double> boundaries;
};

/// Central metrics registry of the service.
///
/// Thread-safe behind a single reader/writer lock. Scrapes list each family
/// sorted by name.
///
/// Example:
/// @code
///   auto& metrics = ServiceMetrics::instance();
///   metrics.incrementCounter("oas_auth_success_total");
///   metrics.registerHistogram("oas_credential_verify_ms",
///                             HistogramBuckets::defaultLatency());
///   std::string prom = metrics.scrape();
/// @endcode
class ServiceMetrics {
public:
    ServiceMetrics();
    ~ServiceMetrics();

    ServiceMetrics(const ServiceMetrics&) = delete;
    ServiceMetrics& operator=(const ServiceMetrics&) = delete;
    ServiceMetrics(ServiceMetrics&&) noexcept;
    ServiceMetrics& operator=(ServiceMetrics&&) noexcept;

    /// Increment a counter, creating it on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Current counter value, 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    void setGauge(std::string_view name, double value);

    [[nodiscard]] double gaugeValue(std::string_view name) const;

    /// Register a histogram. Re-registering an existing name is a no-op.
    void registerHistogram(std::string_view name, HistogramBuckets buckets);

    /// Record an observation. No-op for unregistered histograms.
    void recordHistogram(std::string_view name, double value);

    /// Number of observations recorded in a histogram.
    [[nodiscard]] uint64_t histogramCount(std::string_view name) const;

    /// Serialize all metrics in Prometheus text exposition format.
    [[nodiscard]] std::string scrape() const;

    /// Clear every metric. Intended for tests.
    void reset();

    static ServiceMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Records the elapsed wall time in milliseconds into a histogram when it
/// goes out of scope.
class ScopedLatency {
public:
    ScopedLatency(ServiceMetrics& metrics, std::string_view histogram)
        : metrics_(metrics), histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

    ~ScopedLatency() {
        auto elapsed = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start_);
        metrics_.recordHistogram(histogram_, elapsed.count());
    }

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    ServiceMetrics& metrics_;
    std::string_view histogram_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace oas::foundation
