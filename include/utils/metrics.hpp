#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <atomic>
#include "common/types.hpp"

namespace tarb {

/**
 * Latency samples kept in a fixed-size ring. Percentiles are computed
 * over the retained window only; count() is the lifetime total.
 */
class LatencyHistogram {
public:
    explicit LatencyHistogram(const std::string& name, size_t capacity = 4096);

    void record(Duration d);

    Duration percentile(double p) const;
    Duration max() const;
    Duration mean() const;

    int64_t count() const { return count_.load(); }
    void reset();

    const std::string& name() const { return name_; }

private:
    std::string name_;
    size_t capacity_;
    std::atomic<int64_t> count_{0};

    mutable std::mutex mutex_;
    std::vector<int64_t> ring_ns_;
    size_t next_{0};
};

class Counter {
public:
    explicit Counter(const std::string& name) : name_(name) {}

    void increment(int64_t delta = 1) { value_ += delta; }
    int64_t value() const { return value_.load(); }
    void reset() { value_ = 0; }

private:
    std::string name_;
    std::atomic<int64_t> value_{0};
};

class Gauge {
public:
    explicit Gauge(const std::string& name) : name_(name) {}

    void set(double value) { value_ = value; }
    double value() const { return value_.load(); }

private:
    std::string name_;
    std::atomic<double> value_{0.0};
};

/**
 * Process-wide metrics. Entries are created on first use and live for the
 * life of the process, so returned references stay valid.
 */
class MetricsRegistry {
public:
    static MetricsRegistry& instance();

    Counter& counter(const std::string& name);
    Gauge& gauge(const std::string& name);
    LatencyHistogram& histogram(const std::string& name);

    // Pretty JSON of every counter, gauge and histogram
    std::string to_json() const;

    void reset_all();

private:
    MetricsRegistry() = default;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Counter>> counters_;
    std::map<std::string, std::unique_ptr<Gauge>> gauges_;
    std::map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;
};

#define TARB_METRIC_COUNTER(name) ::tarb::MetricsRegistry::instance().counter(name)
#define TARB_METRIC_GAUGE(name) ::tarb::MetricsRegistry::instance().gauge(name)
#define TARB_METRIC_HISTOGRAM(name) ::tarb::MetricsRegistry::instance().histogram(name)

/**
 * Records the elapsed time into a histogram when it goes out of scope.
 */
class ScopedLatency {
public:
    explicit ScopedLatency(LatencyHistogram& histogram);
    ~ScopedLatency();

    ScopedLatency(const ScopedLatency&) = delete;
    ScopedLatency& operator=(const ScopedLatency&) = delete;

private:
    LatencyHistogram& histogram_;
    Timestamp start_;
};

} // namespace tarb
