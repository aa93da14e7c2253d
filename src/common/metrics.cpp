/// @file metrics.cpp
/// @brief Metric families and the Prometheus text export

#include "metrics.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace sentinel {

namespace {

std::string EscapeLabelValue(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    return out;
}

void WriteHeader(std::ostringstream& oss, const std::string& name, std::string_view type,
                 const std::map<std::string, std::string, std::less<>>& help) {
    if (auto it = help.find(name); it != help.end()) {
        oss << "# HELP " << name << " " << it->second << "\n";
    }
    oss << "# TYPE " << name << " " << type << "\n";
}

template <typename Metric>
Metric& GetOrCreate(std::map<std::string, std::map<std::string, std::unique_ptr<Metric>>,
                             std::less<>>& families,
                    std::string_view name, const MetricLabels& labels) {
    auto family = families.find(name);
    if (family == families.end()) {
        family = families.emplace(std::string(name),
                                  std::map<std::string, std::unique_ptr<Metric>>{}).first;
    }
    auto& series = family->second[FormatLabels(labels)];
    if (!series) {
        series = std::make_unique<Metric>();
    }
    return *series;
}

}  // namespace

std::string FormatLabels(const MetricLabels& labels) {
    if (labels.empty()) {
        return "";
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [name, value] : labels) {
        if (!first) {
            out += ",";
        }
        first = false;
        out += name;
        out += "=\"";
        out += EscapeLabelValue(value);
        out += "\"";
    }
    out += "}";
    return out;
}

// =============================================================================
// Counter / Histogram
// =============================================================================

void Counter::Add(int64_t delta) {
    if (delta > 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

const std::vector<double>& Histogram::DefaultBuckets() {
    static const std::vector<double> buckets = {
        0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0};
    return buckets;
}

Histogram::Histogram(std::vector<double> bounds)
    : bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    bounds_.erase(std::unique(bounds_.begin(), bounds_.end()), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);
}

void Histogram::Observe(double value) {
    // A value equal to a bound belongs to that bound's bucket (le semantics)
    const auto it = std::lower_bound(bounds_.begin(), bounds_.end(), value);
    const size_t bucket = static_cast<size_t>(std::distance(bounds_.begin(), it));

    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[bucket];
    ++count_;
    sum_ += value;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(counts_.size());

    int64_t cumulative = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i];
        const double bound = i < bounds_.size() ? bounds_[i]
                                                : std::numeric_limits<double>::infinity();
        result.emplace_back(bound, cumulative);
    }
    return result;
}

ScopedTimer::ScopedTimer(Histogram& histogram)
    : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}

ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

// =============================================================================
// MetricsRegistry
// =============================================================================

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

Counter& MetricsRegistry::GetCounter(std::string_view name, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreate(counters_, name, labels);
}

Counter& MetricsRegistry::GetBoundedCounter(std::string_view name, const MetricLabels& labels,
                                            size_t max_series,
                                            const MetricLabels& overflow_labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto family = counters_.find(name);
    if (family != counters_.end() && family->second.size() >= max_series &&
        family->second.count(FormatLabels(labels)) == 0) {
        return GetOrCreate(counters_, name, overflow_labels);
    }
    return GetOrCreate(counters_, name, labels);
}

size_t MetricsRegistry::CounterSeriesCount(std::string_view name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto family = counters_.find(name);
    return family == counters_.end() ? 0 : family->second.size();
}

Gauge& MetricsRegistry::GetGauge(std::string_view name, const MetricLabels& labels) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetOrCreate(gauges_, name, labels);
}

Histogram& MetricsRegistry::GetHistogram(std::string_view name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    if (it == histograms_.end()) {
        it = histograms_.emplace(std::string(name), std::make_unique<Histogram>()).first;
    }
    return *it->second;
}

void MetricsRegistry::Describe(std::string_view name, std::string_view help) {
    std::lock_guard<std::mutex> lock(mutex_);
    help_.insert_or_assign(std::string(name), std::string(help));
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    for (const auto& [name, family] : counters_) {
        WriteHeader(oss, name, "counter", help_);
        for (const auto& [labels, counter] : family) {
            oss << name << labels << " " << counter->Value() << "\n";
        }
    }

    for (const auto& [name, family] : gauges_) {
        WriteHeader(oss, name, "gauge", help_);
        for (const auto& [labels, gauge] : family) {
            oss << name << labels << " " << gauge->Value() << "\n";
        }
    }

    for (const auto& [name, histogram] : histograms_) {
        WriteHeader(oss, name, "histogram", help_);
        for (const auto& [bound, count] : histogram->Buckets()) {
            oss << name << "_bucket{le=\"";
            if (std::isinf(bound)) {
                oss << "+Inf";
            } else {
                oss << bound;
            }
            oss << "\"} " << count << "\n";
        }
        oss << name << "_sum " << histogram->Sum() << "\n";
        oss << name << "_count " << histogram->Count() << "\n";
    }

    return oss.str();
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
    help_.clear();
}

}  // namespace sentinel
