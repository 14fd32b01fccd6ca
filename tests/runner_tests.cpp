#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include "wsp/candidates.hpp"
#include "wsp/errors.hpp"
#include "wsp/runner.hpp"

using namespace wsp;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void assert_eq_int(long a, long b, std::string_view msg)
{
    if (a != b)
    {
        std::cerr << "ASSERT FAILED: " << msg << " | expected=" << b <<
                " actual=" << a << std::endl;
        std::exit(1);
    }
}

// Scripted remote: per-URL behaviour, default answer for anything else.
class FakeRemote
{
public:
    enum class Kind { Connect, Reject, Error, HangUntilAbort, SleepIgnoringAbort, Throw };

    struct Behaviour
    {
        Kind kind = Kind::Reject;
        int status = 404;
        std::optional<std::string> location;
        int sleep_ms = 0;
    };

    void set(const std::string &url, Behaviour b) { script_[url] = std::move(b); }
    void set_default(Behaviour b) { default_ = std::move(b); }

    HandshakeFn fn()
    {
        return [this](const EndpointCandidate &c, const HandshakeOptions &opts,
                      const std::atomic<bool> &abort) -> Outcome
        {
            {
                std::lock_guard<std::mutex> lk(mtx_);
                calls_.push_back(c.url);
                last_headers_ = opts.headers;
            }
            ++in_flight_;
            struct Leave { std::atomic<int> &n; ~Leave() { --n; } } leave{in_flight_};

            auto it = script_.find(c.url);
            const Behaviour &b = it == script_.end() ? default_ : it->second;
            switch (b.kind)
            {
                case Kind::Connect: return Connected{};
                case Kind::Reject: return Rejected{b.status, b.location};
                case Kind::Error: return TransportError{"connection refused"};
                case Kind::Throw: throw std::runtime_error("boom");
                case Kind::SleepIgnoringAbort:
                    std::this_thread::sleep_for(std::chrono::milliseconds(b.sleep_ms));
                    return Connected{};
                case Kind::HangUntilAbort:
                    while (!abort.load())
                        std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    return TransportError{"aborted"};
            }
            return TransportError{"unreachable"};
        };
    }

    std::vector<std::string> calls()
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return calls_;
    }

    HeaderList last_headers()
    {
        std::lock_guard<std::mutex> lk(mtx_);
        return last_headers_;
    }

    int in_flight() const { return in_flight_.load(); }

private:
    std::map<std::string, Behaviour> script_;
    Behaviour default_;
    std::mutex mtx_;
    std::vector<std::string> calls_;
    HeaderList last_headers_;
    std::atomic<int> in_flight_{0};
};

static std::vector<EndpointCandidate> make_candidates(int n)
{
    std::vector<EndpointCandidate> out;
    for (int i = 0; i < n; ++i)
    {
        EndpointCandidate c;
        c.url = "wss://h.example/c" + std::to_string(i);
        c.protocols = {"realtime"};
        out.push_back(c);
    }
    return out;
}

static ProbeSettings base_settings(int timeout_ms = 2000)
{
    ProbeSettings s;
    s.handshake.headers = {{"Authorization", "Bearer k"}, {"OpenAI-Beta", "realtime=v1"}};
    s.handshake.timeout_ms = timeout_ms;
    return s;
}

static FakeRemote::Behaviour connect() { return {FakeRemote::Kind::Connect}; }
static FakeRemote::Behaviour reject(int status, std::optional<std::string> loc = std::nullopt)
{
    return {FakeRemote::Kind::Reject, status, std::move(loc)};
}

static void test_single_candidate_connects()
{
    CandidateSpace s;
    s.versions = {"v1"};
    s.paths = {"realtime"};
    s.param_names = {"deployment"};
    s.subprotocol_sets = {{"realtime"}};
    auto cands = generate_candidates("https://h.example", s, "dep");

    FakeRemote remote;
    remote.set(cands[0].url, connect());
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
    assert_eq_int(t.attempts.size(), 1, "single: trace length");
    assert_true(t.winner && *t.winner == 0, "single: winner is entry 0");
    assert_true(t.winning() == &t.attempts[0], "single: winning() points at entry");
    assert_true(is_connected(t.attempts[0].outcome), "single: connected");
    assert_eq_int(t.attempts[0].attempt, 1, "single: attempt number");
    auto headers = remote.last_headers();
    assert_true(headers.size() == 2 && headers[0].first == "Authorization",
                "credential headers forwarded");
}

static void test_all_rejected_404()
{
    auto cands = make_candidates(6);
    FakeRemote remote;
    remote.set_default(reject(404));
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
    assert_eq_int(t.attempts.size(), 6, "404: trace length = candidate count");
    assert_true(!t.winner && t.winning() == nullptr, "404: no winner");
    for (size_t i = 0; i < t.attempts.size(); ++i)
    {
        const auto *r = std::get_if<Rejected>(&t.attempts[i].outcome);
        assert_true(r && r->status == 404 && !r->location, "404: Rejected(404, none)");
        assert_true(t.attempts[i].candidate.url == cands[i].url, "404: generator order kept");
        assert_true(!t.attempts[i].outcome.valueless_by_exception(), "exactly one outcome");
    }
    assert_eq_int(t.not_attempted, 0, "404: nothing skipped");
}

static void test_timeout_then_connect()
{
    auto cands = make_candidates(2);
    FakeRemote remote;
    remote.set(cands[0].url, {FakeRemote::Kind::HangUntilAbort});
    remote.set(cands[1].url, connect());

    auto t0 = std::chrono::steady_clock::now();
    ProbeTrace t = run_probe(cands, base_settings(100), remote.fn());
    auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);

    assert_eq_int(t.attempts.size(), 2, "timeout: trace length");
    assert_true(std::holds_alternative<TimedOut>(t.attempts[0].outcome), "timeout: first TimedOut");
    assert_true(t.winner && *t.winner == 1, "timeout: winner is second");
    assert_true(t.attempts[0].ms >= 90.0, "timeout: first waited ~timeout");
    assert_true(dt.count() < 2000, "timeout: run did not hang");
    assert_eq_int(remote.in_flight(), 0, "timeout: no attempt outlives the run");
}

static void test_timeout_when_transport_ignores_abort()
{
    auto cands = make_candidates(1);
    FakeRemote remote;
    remote.set(cands[0].url, {FakeRemote::Kind::SleepIgnoringAbort, 0, std::nullopt, 300});
    ProbeTrace t = run_probe(cands, base_settings(50), remote.fn());
    assert_eq_int(t.attempts.size(), 1, "late connect: one entry");
    assert_true(std::holds_alternative<TimedOut>(t.attempts[0].outcome),
                "late connect after deadline is still TimedOut");
    assert_true(!t.winner, "late connect: no winner");
    assert_true(t.attempts[0].ms < 250.0, "outcome determined at the deadline");
    assert_eq_int(remote.in_flight(), 0, "late connect: worker joined before return");
}

static void test_sequential_stops_at_first_success()
{
    auto cands = make_candidates(5);
    FakeRemote remote;
    remote.set_default(reject(401));
    remote.set(cands[2].url, connect());
    remote.set(cands[3].url, connect());
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
    assert_eq_int(t.attempts.size(), 3, "early exit: three entries");
    assert_eq_int(remote.calls().size(), 3, "early exit: no attempt after winner");
    assert_true(t.winner && *t.winner == 2, "early exit: winner index");
    assert_eq_int(t.not_attempted, 2, "early exit: remaining counted");
}

static void test_redirect_followed_once()
{
    auto cands = make_candidates(1);
    FakeRemote remote;
    remote.set(cands[0].url, reject(302, "https://other.example/r1"));
    remote.set("wss://other.example/r1", reject(302, "https://third.example/r2"));
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());

    assert_eq_int(t.attempts.size(), 2, "redirect: exactly two entries");
    const auto *first = std::get_if<Rejected>(&t.attempts[0].outcome);
    assert_true(first && first->status == 302 && first->location == "https://other.example/r1",
                "redirect: original Rejected(302, loc)");
    assert_true(!t.attempts[0].redirected_from, "redirect: original has no back-reference");
    assert_true(t.attempts[1].redirected_from && *t.attempts[1].redirected_from == 0,
                "redirect: follow-up links to original");
    assert_true(t.attempts[1].candidate.url == "wss://other.example/r1",
                "redirect: scheme rewritten");
    assert_true(t.attempts[1].candidate.protocols == cands[0].protocols,
                "redirect: same protocol tokens");
    const auto *second = std::get_if<Rejected>(&t.attempts[1].outcome);
    assert_true(second && second->status == 302, "redirect: follow-up outcome recorded");
    assert_eq_int(remote.calls().size(), 2, "redirect: no third attempt");
}

static void test_redirect_target_connects()
{
    auto cands = make_candidates(3);
    FakeRemote remote;
    remote.set_default(reject(404));
    remote.set(cands[0].url, reject(301, "/moved"));
    remote.set("wss://h.example/moved", connect());
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
    assert_eq_int(t.attempts.size(), 2, "redirect win: two entries");
    assert_true(t.winner && *t.winner == 1, "redirect win: winner is follow-up");
    assert_eq_int(t.not_attempted, 2, "redirect win: rest skipped");
}

static void test_redirect_disabled_and_non_redirect_status()
{
    auto cands = make_candidates(1);
    {
        FakeRemote remote;
        remote.set(cands[0].url, reject(302, "https://other.example/"));
        ProbeSettings s = base_settings();
        s.max_redirect_hops = 0;
        ProbeTrace t = run_probe(cands, s, remote.fn());
        assert_eq_int(t.attempts.size(), 1, "hops=0: not followed");
    }
    {
        FakeRemote remote;
        remote.set(cands[0].url, reject(404, "https://other.example/"));
        ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
        assert_eq_int(t.attempts.size(), 1, "404 with Location: not followed");
        const auto *r = std::get_if<Rejected>(&t.attempts[0].outcome);
        assert_true(r && r->location, "404 with Location: location still recorded");
    }
}

static void test_transport_error_and_throw_are_data()
{
    auto cands = make_candidates(2);
    FakeRemote remote;
    remote.set(cands[0].url, {FakeRemote::Kind::Error});
    remote.set(cands[1].url, {FakeRemote::Kind::Throw});
    ProbeTrace t = run_probe(cands, base_settings(), remote.fn());
    assert_eq_int(t.attempts.size(), 2, "errors: both recorded");
    const auto *e0 = std::get_if<TransportError>(&t.attempts[0].outcome);
    const auto *e1 = std::get_if<TransportError>(&t.attempts[1].outcome);
    assert_true(e0 && e0->message == "connection refused", "errors: transport message");
    assert_true(e1 && e1->message == "boom", "errors: thrown exception captured");
}

static void test_configuration_errors_before_network()
{
    FakeRemote remote;
    auto expect_config_error = [&](const std::vector<EndpointCandidate> &c,
                                   const ProbeSettings &s, std::string_view msg)
    {
        bool thrown = false;
        try
        {
            (void) run_probe(c, s, remote.fn());
        }
        catch (const ConfigurationError &)
        {
            thrown = true;
        }
        assert_true(thrown, msg);
    };
    expect_config_error({}, base_settings(), "empty candidate set");
    ProbeSettings no_headers = base_settings();
    no_headers.handshake.headers.clear();
    expect_config_error(make_candidates(1), no_headers, "no credential headers");
    expect_config_error(make_candidates(1), base_settings(0), "zero timeout");
    ProbeSettings neg = base_settings();
    neg.max_redirect_hops = -1;
    expect_config_error(make_candidates(1), neg, "negative hops");
    assert_eq_int(remote.calls().size(), 0, "no attempt made on configuration error");
}

static void test_on_attempt_sees_trace_order_and_exception_propagates()
{
    auto cands = make_candidates(3);
    FakeRemote remote;
    remote.set_default(reject(403));
    std::vector<int> seq;
    bool thrown = false;
    try
    {
        (void) run_probe(cands, base_settings(), remote.fn(), [&](const AttemptResult &a)
        {
            seq.push_back(a.attempt);
            if (a.attempt == 2) throw std::runtime_error("observer failed");
        });
    }
    catch (const std::runtime_error &)
    {
        thrown = true;
    }
    assert_true(thrown, "observer exception propagates");
    assert_true(seq.size() == 2 && seq[0] == 1 && seq[1] == 2, "observer called in order");
    assert_eq_int(remote.calls().size(), 2, "no attempt after observer failure");
}

static void test_parallel_cancels_in_flight_on_success()
{
    auto cands = make_candidates(8);
    FakeRemote remote;
    remote.set_default({FakeRemote::Kind::HangUntilAbort});
    remote.set(cands[1].url, connect());

    ProbeSettings s = base_settings(5000);
    s.concurrency = 4;
    auto t0 = std::chrono::steady_clock::now();
    ProbeTrace t = run_probe(cands, s, remote.fn());
    auto dt = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0);

    assert_true(t.winner.has_value(), "parallel: winner found");
    assert_true(t.winning()->candidate.url == cands[1].url, "parallel: winning candidate");
    assert_eq_int(t.attempts.size(), 1, "parallel: hanging attempts never resolved");
    assert_eq_int(t.attempts.size() + t.cancelled.size() + t.not_attempted, 8,
                  "parallel: every candidate accounted for once");

    std::set<std::string> seen;
    for (const auto &a : t.attempts) assert_true(seen.insert(a.candidate.url).second, "no duplicate entry");
    for (const auto &c : t.cancelled) assert_true(seen.insert(c.url).second, "no duplicate cancel");

    assert_true(dt.count() < 2000, "parallel: cancellation is prompt");
    assert_eq_int(remote.in_flight(), 0, "parallel: nothing leaks past the run");
}

static void test_parallel_all_rejected()
{
    auto cands = make_candidates(9);
    FakeRemote remote;
    remote.set_default(reject(404));
    ProbeSettings s = base_settings();
    s.concurrency = 3;
    ProbeTrace t = run_probe(cands, s, remote.fn());
    assert_eq_int(t.attempts.size(), 9, "parallel 404: all recorded");
    assert_true(!t.winner, "parallel 404: no winner");
    std::set<std::string> urls;
    std::set<int> numbers;
    for (const auto &a : t.attempts)
    {
        urls.insert(a.candidate.url);
        numbers.insert(a.attempt);
    }
    assert_eq_int(urls.size(), 9, "parallel 404: each candidate once");
    assert_eq_int(numbers.size(), 9, "parallel 404: attempt numbers unique");
    assert_true(t.cancelled.empty() && t.not_attempted == 0, "parallel 404: nothing skipped");
}

int main()
{
    test_single_candidate_connects();
    test_all_rejected_404();
    test_timeout_then_connect();
    test_timeout_when_transport_ignores_abort();
    test_sequential_stops_at_first_success();
    test_redirect_followed_once();
    test_redirect_target_connects();
    test_redirect_disabled_and_non_redirect_status();
    test_transport_error_and_throw_are_data();
    test_configuration_errors_before_network();
    test_on_attempt_sees_trace_order_and_exception_propagates();
    test_parallel_cancels_in_flight_on_success();
    test_parallel_all_rejected();

    std::cout << "runner tests: OK" << std::endl;
    return 0;
}
