/// @file service_metrics.cpp
/// @brief In-memory implementation of ServiceMetrics.

#include "oas/foundation/service_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <sstream>

namespace oas::foundation {

HistogramBuckets HistogramBuckets::defaultLatency() {
    return HistogramBuckets{{1, 5, 10, 25, 50, 100, 250, 500, 1000}};
}

namespace {

/// Observations land in the first bucket whose upper bound holds them;
/// the cumulative view is built at scrape time.
struct Histogram {
    std::vector<double> upperBounds;
    std::vector<uint64_t> hits;  // upperBounds.size() + 1, last is overflow
    uint64_t count = 0;
    double sum = 0.0;

    void observe(double value) {
        auto slot = std::lower_bound(upperBounds.begin(), upperBounds.end(), value);
        ++hits[static_cast<std::size_t>(slot - upperBounds.begin())];
        ++count;
        sum += value;
    }
};

void writeNumber(std::ostream& out, double value) {
    if (std::isnan(value)) {
        out << "NaN";
    } else if (std::isinf(value)) {
        out << (value < 0 ? "-Inf" : "+Inf");
    } else {
        out << value;
    }
}

void writeType(std::ostream& out, const std::string& name, const char* type) {
    out << "# TYPE " << name << ' ' << type << '\n';
}

}  // namespace

struct ServiceMetrics::Impl {
    mutable std::shared_mutex mutex;
    std::map<std::string, uint64_t, std::less<>> counters;
    std::map<std::string, double, std::less<>> gauges;
    std::map<std::string, Histogram, std::less<>> histograms;
};

ServiceMetrics::ServiceMetrics() : impl_(std::make_unique<Impl>()) {}

ServiceMetrics::~ServiceMetrics() = default;

ServiceMetrics::ServiceMetrics(ServiceMetrics&&) noexcept = default;

ServiceMetrics& ServiceMetrics::operator=(ServiceMetrics&&) noexcept = default;

void ServiceMetrics::incrementCounter(std::string_view name, uint64_t value) {
    std::unique_lock lock(impl_->mutex);
    auto it = impl_->counters.find(name);
    if (it == impl_->counters.end()) {
        impl_->counters.emplace(std::string(name), value);
    } else {
        it->second += value;
    }
}

uint64_t ServiceMetrics::counterValue(std::string_view name) const {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->counters.find(name);
    return it == impl_->counters.end() ? 0 : it->second;
}

void ServiceMetrics::setGauge(std::string_view name, double value) {
    std::unique_lock lock(impl_->mutex);
    impl_->gauges.insert_or_assign(std::string(name), value);
}

double ServiceMetrics::gaugeValue(std::string_view name) const {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->gauges.find(name);
    return it == impl_->gauges.end() ? 0.0 : it->second;
}

void ServiceMetrics::registerHistogram(std::string_view name, HistogramBuckets buckets) {
    std::unique_lock lock(impl_->mutex);
    if (impl_->histograms.count(name) != 0) {
        return;
    }
    auto& bounds = buckets.boundaries;
    std::sort(bounds.begin(), bounds.end());
    bounds.erase(std::unique(bounds.begin(), bounds.end()), bounds.end());

    Histogram histogram;
    histogram.hits.assign(bounds.size() + 1, 0);
    histogram.upperBounds = std::move(bounds);
    impl_->histograms.emplace(std::string(name), std::move(histogram));
}

void ServiceMetrics::recordHistogram(std::string_view name, double value) {
    std::unique_lock lock(impl_->mutex);
    if (auto it = impl_->histograms.find(name); it != impl_->histograms.end()) {
        it->second.observe(value);
    }
}

uint64_t ServiceMetrics::histogramCount(std::string_view name) const {
    std::shared_lock lock(impl_->mutex);
    auto it = impl_->histograms.find(name);
    return it == impl_->histograms.end() ? 0 : it->second.count;
}

std::string ServiceMetrics::scrape() const {
    std::shared_lock lock(impl_->mutex);
    std::ostringstream out;

    for (const auto& [name, value] : impl_->counters) {
        writeType(out, name, "counter");
        out << name << ' ' << value << '\n';
    }
    for (const auto& [name, value] : impl_->gauges) {
        writeType(out, name, "gauge");
        out << name << ' ';
        writeNumber(out, value);
        out << '\n';
    }
    for (const auto& [name, h] : impl_->histograms) {
        writeType(out, name, "histogram");
        uint64_t cumulative = 0;
        for (std::size_t i = 0; i < h.upperBounds.size(); ++i) {
            cumulative += h.hits[i];
            out << name << "_bucket{le=\"";
            writeNumber(out, h.upperBounds[i]);
            out << "\"} " << cumulative << '\n';
        }
        out << name << "_bucket{le=\"+Inf\"} " << h.count << '\n';
        out << name << "_sum ";
        writeNumber(out, h.sum);
        out << '\n' << name << "_count " << h.count << '\n';
    }
    return out.str();
}

void ServiceMetrics::reset() {
    std::unique_lock lock(impl_->mutex);
    impl_->counters.clear();
    impl_->gauges.clear();
    impl_->histograms.clear();
}

ServiceMetrics& ServiceMetrics::instance() {
    static ServiceMetrics metrics;
    return metrics;
}

}  // namespace oas::foundation
