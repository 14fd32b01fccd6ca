#include "wsp/aggregate.hpp"

#include <algorithm>
#include <numeric>
#include <type_traits>
#include <variant>

namespace wsp {

Aggregation aggregate_times(const std::vector<double>& times, const std::vector<int>& pctl)
{
    Aggregation ag{};
    if (times.empty()) return ag;

    auto [min_it, max_it] = std::minmax_element(times.begin(), times.end());
    ag.min = *min_it;
    ag.max = *max_it;
    ag.avg = std::accumulate(times.begin(), times.end(), 0.0) /
             static_cast<double>(times.size());

    std::vector<double> sorted = times;
    std::ranges::sort(sorted);
    auto pct_value = [&](int p) -> double
    {
        size_t n  = sorted.size();
        int    pc = std::clamp(p, 0, 100);
        size_t rank = (static_cast<size_t>(pc) * n + 100 - 1) / 100; // ceil
        rank = std::clamp<size_t>(rank, 1, n);
        return sorted[rank - 1];
    };

    ag.percentiles.reserve(pctl.size());
    for (int p : pctl) ag.percentiles.emplace_back(p, pct_value(p));
    return ag;
}

TraceSummary summarize_trace(const ProbeTrace& trace, const std::vector<int>& pctl)
{
    TraceSummary s{};
    std::vector<double> times;
    times.reserve(trace.attempts.size());
    for (const auto& a : trace.attempts)
    {
        times.push_back(a.ms);
        if (a.redirected_from) ++s.redirects_followed;
        std::visit([&](const auto& o)
        {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Connected>) ++s.connected;
            else if constexpr (std::is_same_v<T, Rejected>) ++s.rejected;
            else if constexpr (std::is_same_v<T, TransportError>) ++s.transport_errors;
            else ++s.timed_out;
        }, a.outcome);
    }
    s.attempts = trace.attempts.size();
    s.cancelled = trace.cancelled.size();
    s.not_attempted = trace.not_attempted;
    s.timing = aggregate_times(times, pctl);
    return s;
}

} // namespace wsp
