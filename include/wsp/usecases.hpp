#pragma once

#include <vector>

#include "wsp/model.hpp"
#include "wsp/options.hpp"
#include "wsp/runner.hpp"

namespace wsp {

// 全組み合わせ (version x path x param x subprotocol set)
std::vector<EndpointCandidate> discovery_candidates(const Options& opt);

// `once`: exactly the combination named on the command line; the path is
// taken relative to /openai/
std::vector<EndpointCandidate> once_candidates(const Options& opt);

// Validates, builds the command's candidate list and runs the prober.
// ConfigurationError propagates before any network activity.
ProbeTrace run_command(const Options& opt,
                       const HandshakeFn& handshake,
                       const AttemptCallback& on_attempt = {});

} // namespace wsp
