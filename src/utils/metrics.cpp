#include "utils/metrics.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <numeric>

namespace tarb {

LatencyHistogram::LatencyHistogram(const std::string& name, size_t capacity)
    : name_(name)
    , capacity_(capacity == 0 ? 1 : capacity)
{
    ring_ns_.reserve(capacity_);
}

void LatencyHistogram::record(Duration d) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.size() < capacity_) {
        ring_ns_.push_back(d.count());
    } else {
        ring_ns_[next_] = d.count();
    }
    next_ = (next_ + 1) % capacity_;
    count_++;
}

Duration LatencyHistogram::percentile(double p) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();

    std::vector<int64_t> sorted = ring_ns_;
    std::sort(sorted.begin(), sorted.end());

    p = std::clamp(p, 0.0, 100.0);
    size_t idx = static_cast<size_t>((p / 100.0) * static_cast<double>(sorted.size() - 1));
    return Duration(sorted[idx]);
}

Duration LatencyHistogram::max() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();
    return Duration(*std::max_element(ring_ns_.begin(), ring_ns_.end()));
}

Duration LatencyHistogram::mean() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ring_ns_.empty()) return Duration::zero();
    int64_t sum = std::accumulate(ring_ns_.begin(), ring_ns_.end(), int64_t{0});
    return Duration(sum / static_cast<int64_t>(ring_ns_.size()));
}

void LatencyHistogram::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ring_ns_.clear();
    next_ = 0;
    count_ = 0;
}

MetricsRegistry& MetricsRegistry::instance() {
    static MetricsRegistry registry;
    return registry;
}

Counter& MetricsRegistry::counter(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = counters_[name];
    if (!slot) slot = std::make_unique<Counter>(name);
    return *slot;
}

Gauge& MetricsRegistry::gauge(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = gauges_[name];
    if (!slot) slot = std::make_unique<Gauge>(name);
    return *slot;
}

LatencyHistogram& MetricsRegistry::histogram(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = histograms_[name];
    if (!slot) slot = std::make_unique<LatencyHistogram>(name);
    return *slot;
}

std::string MetricsRegistry::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto to_us = [](Duration d) {
        return std::chrono::duration_cast<std::chrono::microseconds>(d).count();
    };

    nlohmann::json j;
    j["counters"] = nlohmann::json::object();
    j["gauges"] = nlohmann::json::object();
    j["histograms"] = nlohmann::json::object();

    for (const auto& [name, counter] : counters_) {
        j["counters"][name] = counter->value();
    }
    for (const auto& [name, gauge] : gauges_) {
        j["gauges"][name] = gauge->value();
    }
    for (const auto& [name, hist] : histograms_) {
        j["histograms"][name] = {
            {"count", hist->count()},
            {"mean_us", to_us(hist->mean())},
            {"p50_us", to_us(hist->percentile(50.0))},
            {"p99_us", to_us(hist->percentile(99.0))},
            {"max_us", to_us(hist->max())}
        };
    }

    return j.dump(2);
}

void MetricsRegistry::reset_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, counter] : counters_) counter->reset();
    for (auto& [name, gauge] : gauges_) gauge->set(0.0);
    for (auto& [name, hist] : histograms_) hist->reset();
}

ScopedLatency::ScopedLatency(LatencyHistogram& histogram)
    : histogram_(histogram)
    , start_(now())
{
}

ScopedLatency::~ScopedLatency() {
    histogram_.record(now() - start_);
}

} // namespace tarb
