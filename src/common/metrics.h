#pragma once

/// @file metrics.h
/// @brief In-process metrics for detection runs with a Prometheus text export
///
/// Metrics are grouped in families keyed by name. A family holds one series
/// per label set, so a per-feature counter is a single family:
///
/// @code
///   SENTINEL_COUNTER("sentinel_detections_total").Increment();
///   MetricsRegistry::Instance()
///       .GetCounter("sentinel_feature_drift_total", {{"feature", "AGE"}})
///       .Increment();
/// @endcode

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sentinel {

/// @brief Label names to values for one series
using MetricLabels = std::map<std::string, std::string>;

/// @brief Monotonic event count
class Counter {
public:
    void Increment() { Add(1); }

    /// @brief Add a non-negative amount; negative deltas are ignored
    void Add(int64_t delta);

    int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<int64_t> value_{0};
};

/// @brief Last observed value
class Gauge {
public:
    void Set(double value) { value_.store(value, std::memory_order_relaxed); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

/// @brief Distribution of observations over fixed upper bounds
class Histogram {
public:
    /// @brief Latency buckets in seconds, from 1 ms to 10 s
    static const std::vector<double>& DefaultBuckets();

    explicit Histogram(std::vector<double> bounds = DefaultBuckets());

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative counts per upper bound, ending with +Inf
    std::vector<std::pair<double, int64_t>> Buckets() const;

private:
    std::vector<double> bounds_;
    std::vector<int64_t> counts_;  // one per bound plus the +Inf overflow
    int64_t count_ = 0;
    double sum_ = 0.0;
    mutable std::mutex mutex_;
};

/// @brief Observes the seconds between construction and destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// @brief Process-wide registry of metric families
///
/// Returned references stay valid until Reset().
class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    MetricsRegistry(const MetricsRegistry&) = delete;
    MetricsRegistry& operator=(const MetricsRegistry&) = delete;

    /// @brief Get or create the series of a counter family
    Counter& GetCounter(std::string_view name, const MetricLabels& labels = {});

    /// @brief Like GetCounter, but a family holding max_series series gets no
    ///        new ones; unseen label sets share the overflow_labels series
    ///
    /// Keeps label values taken from user data (feature names) from growing
    /// the registry without bound. The overflow series itself may be the
    /// (max_series + 1)-th.
    Counter& GetBoundedCounter(std::string_view name, const MetricLabels& labels,
                               size_t max_series, const MetricLabels& overflow_labels);

    /// @brief Number of series in a counter family, 0 if it does not exist
    size_t CounterSeriesCount(std::string_view name) const;

    /// @brief Get or create the series of a gauge family
    Gauge& GetGauge(std::string_view name, const MetricLabels& labels = {});

    /// @brief Get or create a histogram with the default buckets
    Histogram& GetHistogram(std::string_view name);

    /// @brief Attach the HELP text exported for a family
    void Describe(std::string_view name, std::string_view help);

    /// @brief Prometheus text exposition, families sorted by name
    std::string ExportText() const;

    /// @brief Drop every family and description
    void Reset();

private:
    MetricsRegistry() = default;

    template <typename Metric>
    using Family = std::map<std::string, std::unique_ptr<Metric>>;  // keyed by label text

    mutable std::mutex mutex_;
    std::map<std::string, Family<Counter>, std::less<>> counters_;
    std::map<std::string, Family<Gauge>, std::less<>> gauges_;
    std::map<std::string, std::unique_ptr<Histogram>, std::less<>> histograms_;
    std::map<std::string, std::string, std::less<>> help_;
};

/// @brief Render labels as {name="value",...} with Prometheus escaping
std::string FormatLabels(const MetricLabels& labels);

#define SENTINEL_COUNTER(name) \
    ::sentinel::MetricsRegistry::Instance().GetCounter(name)

#define SENTINEL_GAUGE(name) \
    ::sentinel::MetricsRegistry::Instance().GetGauge(name)

#define SENTINEL_HISTOGRAM(name) \
    ::sentinel::MetricsRegistry::Instance().GetHistogram(name)

#define SENTINEL_METRICS_CONCAT_IMPL(a, b) a##b
#define SENTINEL_METRICS_CONCAT(a, b) SENTINEL_METRICS_CONCAT_IMPL(a, b)

#define SENTINEL_TIMER(histogram) \
    ::sentinel::ScopedTimer SENTINEL_METRICS_CONCAT(_timer_, __LINE__)(histogram)

}  // namespace sentinel
