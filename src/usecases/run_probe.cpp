#include "wsp/runner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "wsp/candidates.hpp"
#include "wsp/concurrency.hpp"
#include "wsp/errors.hpp"

namespace wsp
{
namespace
{
using Clock = std::chrono::steady_clock;

// how often a waiting attempt re-checks run-level cancellation
constexpr auto kCancelPollSlice = std::chrono::milliseconds(20);

struct Settled
{
    std::optional<Outcome> outcome; // nullopt: cancelled before an outcome
    double ms{};
};

// Races the handshake against its deadline (and the run-level cancel flag).
// Whatever settles first is the outcome; the worker is always joined.
Settled attempt_with_deadline(const HandshakeFn &handshake,
                              const EndpointCandidate &candidate,
                              const HandshakeOptions &opts,
                              const std::atomic<bool> *run_cancel)
{
    SettleOnce<std::optional<Outcome> > slot;
    std::atomic<bool> abort{false};

    const auto t0 = Clock::now();
    const auto deadline = t0 + std::chrono::milliseconds(opts.timeout_ms);

    std::thread worker([&]
    {
        std::optional<Outcome> o;
        try
        {
            o = handshake(candidate, opts, abort);
        }
        catch (const std::exception &e)
        {
            o = Outcome{TransportError{e.what()}};
        }
        slot.offer(std::move(o));
    });

    for (;;)
    {
        const auto now = Clock::now();
        if (now >= deadline)
        {
            slot.offer(Outcome{TimedOut{}});
            break;
        }
        if (run_cancel && run_cancel->load(std::memory_order_relaxed))
        {
            slot.offer(std::nullopt);
            break;
        }
        if (slot.wait_until(std::min(deadline, now + kCancelPollSlice))) break;
    }
    const auto t1 = Clock::now();

    abort.store(true, std::memory_order_relaxed);
    worker.join();

    Settled s;
    s.outcome = slot.take();
    s.ms = std::chrono::duration<double, std::milli>(t1 - t0).count();
    return s;
}

class TraceRecorder
{
public:
    explicit TraceRecorder(const AttemptCallback &on_attempt)
        : on_attempt_(on_attempt)
    {}

    int next_attempt_number() { return ++attempts_started_; }

    // Returns the entry index and whether it became the winner.
    std::pair<std::size_t, bool> append(AttemptResult r)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const std::size_t idx = trace_.attempts.size();
        const bool wins = !trace_.winner && is_connected(r.outcome);
        trace_.attempts.push_back(std::move(r));
        if (wins) trace_.winner = idx;
        if (on_attempt_) on_attempt_(trace_.attempts.back());
        return {idx, wins};
    }

    void cancelled(const EndpointCandidate &c)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        trace_.cancelled.push_back(c);
    }

    void not_attempted(std::size_t n)
    {
        std::lock_guard<std::mutex> lk(mtx_);
        trace_.not_attempted += n;
    }

    bool has_winner() const
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return trace_.winner.has_value();
    }

    ProbeTrace release()
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return std::move(trace_);
    }

private:
    const AttemptCallback &on_attempt_;
    mutable std::mutex mtx_;
    ProbeTrace trace_;
    std::atomic<int> attempts_started_{0};
};

// One candidate's lifecycle, including at most one redirect hop.
void run_candidate(const EndpointCandidate &candidate,
                   const ProbeSettings &settings,
                   const HandshakeFn &handshake,
                   TraceRecorder &rec,
                   const std::atomic<bool> *run_cancel,
                   const std::function<void()> &on_winner)
{
    const int n = rec.next_attempt_number();
    Settled s = attempt_with_deadline(handshake, candidate, settings.handshake, run_cancel);
    if (!s.outcome)
    {
        rec.cancelled(candidate);
        return;
    }

    const Outcome outcome = *s.outcome;
    auto [idx, wins] = rec.append(AttemptResult{n, s.ms, candidate, outcome, std::nullopt});
    if (wins)
    {
        if (on_winner) on_winner();
        return;
    }

    const auto *rej = std::get_if<Rejected>(&outcome);
    if (settings.max_redirect_hops < 1 || !rej || !rej->location ||
        !is_redirect_status(rej->status))
        return;
    if (run_cancel && run_cancel->load(std::memory_order_relaxed)) return;

    EndpointCandidate target;
    target.url = resolve_redirect_url(candidate.url, *rej->location);
    if (target.url.empty()) return;
    target.protocols = candidate.protocols;

    // the followed target is never redirect-followed itself
    const int n2 = rec.next_attempt_number();
    Settled s2 = attempt_with_deadline(handshake, target, settings.handshake, run_cancel);
    if (!s2.outcome)
    {
        rec.cancelled(target);
        return;
    }
    const bool followed_wins =
        rec.append(AttemptResult{n2, s2.ms, std::move(target), std::move(*s2.outcome), idx}).second;
    if (followed_wins && on_winner) on_winner();
}
} // namespace

bool is_redirect_status(int status)
{
    switch (status)
    {
        case 301:
        case 302:
        case 303:
        case 307:
        case 308: return true;
        default: return false;
    }
}

ProbeTrace run_probe(const std::vector<EndpointCandidate> &candidates,
                     const ProbeSettings &settings,
                     const HandshakeFn &handshake,
                     const AttemptCallback &on_attempt)
{
    if (candidates.empty()) throw ConfigurationError("candidate set is empty");
    if (settings.handshake.headers.empty())
        throw ConfigurationError("no credential headers supplied");
    if (settings.handshake.timeout_ms <= 0)
        throw ConfigurationError("per-attempt timeout must be positive");
    if (settings.max_redirect_hops < 0)
        throw ConfigurationError("redirect hop budget must not be negative");
    if (!handshake) throw ConfigurationError("no handshake transport");

    TraceRecorder rec(on_attempt);

    if (settings.concurrency <= 1)
    {
        for (std::size_t i = 0; i < candidates.size(); ++i)
        {
            if (rec.has_winner())
            {
                rec.not_attempted(candidates.size() - i);
                break;
            }
            run_candidate(candidates[i], settings, handshake, rec, nullptr, {});
        }
        return rec.release();
    }

    ThreadPool pool(std::min<int>(settings.concurrency, static_cast<int>(candidates.size())));
    const std::function<void()> on_winner = [&] { rec.not_attempted(pool.cancel()); };
    for (const auto &candidate : candidates)
    {
        const bool queued = pool.submit_cancelable([&, &c = candidate](const std::atomic<bool> &cancel)
        {
            if (cancel.load(std::memory_order_relaxed))
            {
                rec.not_attempted(1);
                return;
            }
            run_candidate(c, settings, handshake, rec, &cancel, on_winner);
        });
        if (!queued) rec.not_attempted(1);
    }
    pool.wait_idle();

    if (auto ep = pool.first_exception()) std::rethrow_exception(ep);
    return rec.release();
}
} // namespace wsp
