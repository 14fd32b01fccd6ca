#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "wsp/model.hpp"

namespace wsp {

struct Aggregation {
    double min{};
    double avg{};
    double max{};
    std::vector<std::pair<int,double>> percentiles; // (p, value)
};

struct TraceSummary {
    std::size_t connected{};
    std::size_t rejected{};
    std::size_t transport_errors{};
    std::size_t timed_out{};
    std::size_t redirects_followed{};
    std::size_t attempts{};
    std::size_t cancelled{};
    std::size_t not_attempted{};
    Aggregation timing;                 // over recorded attempts' ms
};

// times と要求パーセンタイル pctl (0..100) から統計量を算出
Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl);

TraceSummary summarize_trace(const ProbeTrace& trace, const std::vector<int>& pctl);

} // namespace wsp
