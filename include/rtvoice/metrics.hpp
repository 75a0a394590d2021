#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rtvoice {

class Metrics {
public:
    static Metrics& instance();

    void increment(const std::string& counter, uint64_t amount = 1);
    uint64_t counter(const std::string& counter) const;
    void observe_latency(const std::string& stage, double seconds);
    std::string render_prometheus() const;
    void reset();

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    std::map<std::string, HistogramSeries> latencies_;
    std::vector<double> histogram_bounds_;
};

}
