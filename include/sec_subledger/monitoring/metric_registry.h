#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#if SEC_SUBLEDGER_WITH_METRICS
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#endif

namespace sec_subledger {

using MetricLabels = std::map<std::string, std::string>;

// Handles returned by MetricRegistry. A handle without a sink does nothing,
// which is all a build without SEC_SUBLEDGER_WITH_METRICS ever hands out.
class MetricCounter {
public:
    explicit MetricCounter(std::function<void(double)> sink = nullptr);
    void Increment(double value = 1.0) const;

private:
    std::function<void(double)> sink_;
};

class MetricGauge {
public:
    explicit MetricGauge(std::function<void(double)> sink = nullptr);
    void Set(double value) const;

private:
    std::function<void(double)> sink_;
};

class MetricHistogram {
public:
    explicit MetricHistogram(std::function<void(double)> sink = nullptr);
    void Observe(double value) const;

private:
    std::function<void(double)> sink_;
};

// Process-wide Prometheus registry. Batch runs publish it through
// WriteTextFile in the text exposition format, for a node exporter
// textfile collector to pick up.
class MetricRegistry {
public:
    static MetricRegistry& Instance();
    static bool Enabled();

    // The same (name, labels) pair always resolves to the same series.
    std::shared_ptr<MetricCounter> Counter(const std::string& name,
                                           const std::string& help,
                                           const MetricLabels& labels = {});
    std::shared_ptr<MetricGauge> Gauge(const std::string& name,
                                       const std::string& help,
                                       const MetricLabels& labels = {});
    std::shared_ptr<MetricHistogram> Histogram(const std::string& name,
                                               const std::string& help,
                                               const std::vector<double>& buckets,
                                               const MetricLabels& labels = {});

    bool RenderText(std::string* out, std::string* error) const;
    bool WriteTextFile(const std::string& path, std::string* error) const;

private:
    MetricRegistry();

    static std::string SeriesKey(const std::string& name, const MetricLabels& labels);

    mutable std::mutex mutex_;

#if SEC_SUBLEDGER_WITH_METRICS
    std::shared_ptr<prometheus::Registry> registry_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Counter>*> counter_families_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Gauge>*> gauge_families_;
    std::unordered_map<std::string, prometheus::Family<prometheus::Histogram>*>
        histogram_families_;
    std::unordered_map<std::string, prometheus::Counter*> counters_;
    std::unordered_map<std::string, prometheus::Gauge*> gauges_;
    std::unordered_map<std::string, prometheus::Histogram*> histograms_;
#endif
};

}  // namespace sec_subledger
