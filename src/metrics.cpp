#include "rtvoice/metrics.hpp"

#include <iomanip>
#include <sstream>

namespace rtvoice {

Metrics& Metrics::instance() {
    static Metrics metrics;
    return metrics;
}

Metrics::Metrics() {
    histogram_bounds_ = {0.05, 0.1, 0.25, 0.5, 0.75, 1.0, 1.5, 2.0, 3.0, 5.0, 10.0};
}

void Metrics::increment(const std::string& counter, uint64_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counter] += amount;
}

uint64_t Metrics::counter(const std::string& counter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counter);
    return it == counters_.end() ? 0 : it->second;
}

void Metrics::observe_latency(const std::string& stage, double seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& series = latencies_[stage];
    if (series.buckets.empty()) {
        series.buckets.assign(histogram_bounds_.size() + 1, 0);
    }
    series.count += 1;
    series.sum += seconds;
    for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
        if (seconds <= histogram_bounds_[i]) {
            series.buckets[i] += 1;
        }
    }
    series.buckets.back() += 1;
}

std::string Metrics::render_prometheus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out << std::setprecision(6);

    out << "# HELP rtvoice_events_total Conversation events by kind\n";
    out << "# TYPE rtvoice_events_total counter\n";
    for (const auto& [name, value] : counters_) {
        out << "rtvoice_events_total{kind=\"" << name << "\"} " << value << "\n";
    }

    out << "# HELP rtvoice_latency_seconds Conversation stage latency in seconds\n";
    out << "# TYPE rtvoice_latency_seconds histogram\n";
    for (const auto& [stage, series] : latencies_) {
        for (size_t i = 0; i < histogram_bounds_.size(); ++i) {
            out << "rtvoice_latency_seconds_bucket{stage=\"" << stage
                << "\",le=\"" << histogram_bounds_[i] << "\"} "
                << series.buckets[i] << "\n";
        }
        out << "rtvoice_latency_seconds_bucket{stage=\"" << stage
            << "\",le=\"+Inf\"} " << series.buckets.back() << "\n";
        out << "rtvoice_latency_seconds_count{stage=\"" << stage << "\"} "
            << series.count << "\n";
        out << "rtvoice_latency_seconds_sum{stage=\"" << stage << "\"} "
            << series.sum << "\n";
    }

    return out.str();
}

void Metrics::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    latencies_.clear();
}

}
