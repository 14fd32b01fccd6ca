#pragma once

#include <functional>
#include <vector>

#include "wsp/handshake.hpp"
#include "wsp/model.hpp"

namespace wsp {

struct ProbeSettings {
    HandshakeOptions handshake;       // headers, per-attempt timeout, TLS policy
    int max_redirect_hops = 1;        // a followed target never redirects again
    int concurrency = 1;              // > 1: bounded pool, trace in resolution order
};

// Invoked once per recorded entry, in trace order, while the trace is locked.
using AttemptCallback = std::function<void(const AttemptResult&)>;

// Tries candidates in order and stops at the first Connected outcome.
// Per-attempt failures are data in the trace; only ConfigurationError
// (empty candidate list, no headers, bad timeout/hops) is thrown, plus
// whatever `on_attempt` throws. No attempt outlives the call.
ProbeTrace run_probe(const std::vector<EndpointCandidate>& candidates,
                     const ProbeSettings& settings,
                     const HandshakeFn& handshake,
                     const AttemptCallback& on_attempt = {});

bool is_redirect_status(int status);

} // namespace wsp
