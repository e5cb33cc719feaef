#include "sec_subledger/monitoring/metric_registry.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <utility>

#if SEC_SUBLEDGER_WITH_METRICS
#include <prometheus/text_serializer.h>
#endif

namespace sec_subledger {
namespace {

void SetError(std::string* error, const std::string& message) {
    if (error != nullptr) {
        *error = message;
    }
}

#if SEC_SUBLEDGER_WITH_METRICS
// Families are keyed by metric name, series by name plus labels.
template <typename Metric, typename RegisterFamily, typename... AddArgs>
Metric* FindOrAddSeries(std::unordered_map<std::string, prometheus::Family<Metric>*>* families,
                        std::unordered_map<std::string, Metric*>* series,
                        const std::string& name,
                        const std::string& series_key,
                        const MetricLabels& labels,
                        RegisterFamily register_family,
                        AddArgs&&... add_args) {
    const auto series_it = series->find(series_key);
    if (series_it != series->end()) {
        return series_it->second;
    }
    auto family_it = families->find(name);
    if (family_it == families->end()) {
        family_it = families->emplace(name, &register_family()).first;
    }
    Metric* metric = &family_it->second->Add(labels, std::forward<AddArgs>(add_args)...);
    series->emplace(series_key, metric);
    return metric;
}
#endif

}  // namespace

MetricCounter::MetricCounter(std::function<void(double)> sink) : sink_(std::move(sink)) {}

void MetricCounter::Increment(double value) const {
    if (sink_) {
        sink_(value);
    }
}

MetricGauge::MetricGauge(std::function<void(double)> sink) : sink_(std::move(sink)) {}

void MetricGauge::Set(double value) const {
    if (sink_) {
        sink_(value);
    }
}

MetricHistogram::MetricHistogram(std::function<void(double)> sink) : sink_(std::move(sink)) {}

void MetricHistogram::Observe(double value) const {
    if (sink_) {
        sink_(value);
    }
}

MetricRegistry& MetricRegistry::Instance() {
    static MetricRegistry instance;
    return instance;
}

bool MetricRegistry::Enabled() {
    return SEC_SUBLEDGER_WITH_METRICS != 0;
}

MetricRegistry::MetricRegistry() {
#if SEC_SUBLEDGER_WITH_METRICS
    registry_ = std::make_shared<prometheus::Registry>();
#endif
}

std::string MetricRegistry::SeriesKey(const std::string& name, const MetricLabels& labels) {
    std::string key = name;
    for (const auto& [label, value] : labels) {
        key += "|" + label + "=" + value;
    }
    return key;
}

std::shared_ptr<MetricCounter> MetricRegistry::Counter(const std::string& name,
                                                       const std::string& help,
                                                       const MetricLabels& labels) {
#if !SEC_SUBLEDGER_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MetricCounter>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddSeries(&counter_families_, &counters_, name, SeriesKey(name, labels),
                                   labels, [&]() -> prometheus::Family<prometheus::Counter>& {
                                       return prometheus::BuildCounter()
                                           .Name(name)
                                           .Help(help)
                                           .Register(*registry_);
                                   });
    return std::make_shared<MetricCounter>([metric](double value) { metric->Increment(value); });
#endif
}

std::shared_ptr<MetricGauge> MetricRegistry::Gauge(const std::string& name,
                                                   const std::string& help,
                                                   const MetricLabels& labels) {
#if !SEC_SUBLEDGER_WITH_METRICS
    (void)name;
    (void)help;
    (void)labels;
    return std::make_shared<MetricGauge>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddSeries(&gauge_families_, &gauges_, name, SeriesKey(name, labels),
                                   labels, [&]() -> prometheus::Family<prometheus::Gauge>& {
                                       return prometheus::BuildGauge()
                                           .Name(name)
                                           .Help(help)
                                           .Register(*registry_);
                                   });
    return std::make_shared<MetricGauge>([metric](double value) { metric->Set(value); });
#endif
}

std::shared_ptr<MetricHistogram> MetricRegistry::Histogram(const std::string& name,
                                                           const std::string& help,
                                                           const std::vector<double>& buckets,
                                                           const MetricLabels& labels) {
#if !SEC_SUBLEDGER_WITH_METRICS
    (void)name;
    (void)help;
    (void)buckets;
    (void)labels;
    return std::make_shared<MetricHistogram>();
#else
    std::lock_guard<std::mutex> lock(mutex_);
    auto* metric = FindOrAddSeries(
        &histogram_families_, &histograms_, name, SeriesKey(name, labels), labels,
        [&]() -> prometheus::Family<prometheus::Histogram>& {
            return prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
        },
        prometheus::Histogram::BucketBoundaries(buckets.begin(), buckets.end()));
    return std::make_shared<MetricHistogram>([metric](double value) { metric->Observe(value); });
#endif
}

bool MetricRegistry::RenderText(std::string* out, std::string* error) const {
#if !SEC_SUBLEDGER_WITH_METRICS
    (void)out;
    SetError(error, "metrics support not enabled at build time (SEC_SUBLEDGER_WITH_METRICS)");
    return false;
#else
    if (out == nullptr) {
        SetError(error, "metrics output pointer is null");
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    prometheus::TextSerializer serializer;
    *out = serializer.Serialize(registry_->Collect());
    return true;
#endif
}

bool MetricRegistry::WriteTextFile(const std::string& path, std::string* error) const {
    if (path.empty()) {
        SetError(error, "metrics file path is empty");
        return false;
    }
    std::string text;
    if (!RenderText(&text, error)) {
        return false;
    }
    try {
        const std::filesystem::path file_path(path);
        if (!file_path.parent_path().empty()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        // Renamed into place; a collector never reads a partial file.
        const std::filesystem::path tmp_path = file_path.string() + ".tmp";
        {
            std::ofstream out(tmp_path, std::ios::out | std::ios::trunc);
            if (!out.is_open()) {
                SetError(error, "unable to open metrics file: " + tmp_path.string());
                return false;
            }
            out << text;
            if (!out) {
                SetError(error, "failed writing metrics file: " + tmp_path.string());
                return false;
            }
        }
        std::filesystem::rename(tmp_path, file_path);
    } catch (const std::exception& ex) {
        SetError(error, ex.what());
        return false;
    }
    return true;
}

}  // namespace sec_subledger
