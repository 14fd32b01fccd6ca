#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wsp {

// One concrete guess at the endpoint shape: streaming URL + offered sub-protocols.
struct EndpointCandidate {
    std::string              url;
    std::vector<std::string> protocols;
    // generation coordinates (diagnostics only; empty for redirect targets)
    std::string              version;
    std::string              path;
    std::string              param;
};

struct Connected {};

struct Rejected {
    int                        status{};
    std::optional<std::string> location;
};

struct TransportError {
    std::string message;
};

struct TimedOut {};

using Outcome = std::variant<Connected, Rejected, TransportError, TimedOut>;

struct AttemptResult {
    int                        attempt{};        // 1-based, order of initiation
    double                     ms{};
    EndpointCandidate          candidate;
    Outcome                    outcome;
    std::optional<std::size_t> redirected_from; // index into ProbeTrace::attempts
};

struct ProbeTrace {
    std::vector<AttemptResult>     attempts;      // order of outcome determination
    std::optional<std::size_t>     winner;        // index of first Connected entry
    std::vector<EndpointCandidate> cancelled;     // in flight when the winner was found
    std::size_t                    not_attempted{};

    const AttemptResult* winning() const
    {
        return winner ? &attempts[*winner] : nullptr;
    }
};

inline bool is_connected(const Outcome& o) { return std::holds_alternative<Connected>(o); }

const char* outcome_kind_str(const Outcome& o);

// "realtime,oai-realtime"
std::string join_protocols(const std::vector<std::string>& protocols);

} // namespace wsp
