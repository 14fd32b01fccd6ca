#pragma once

#include <functional>
#include <string>
#include <vector>

#include "wsp/candidates.hpp"
#include "wsp/handshake.hpp"
#include "wsp/options.hpp"
#include "wsp/runner.hpp"

namespace wsp {

// getenv-shaped lookup; returns nullptr when unset
using EnvLookup = std::function<const char*(const char*)>;

// Fills fields the command line left empty from AZURE_OPENAI_* variables.
void apply_environment(Options& opt, const EnvLookup& lookup);

// --deployment / AZURE_OPENAI_REALTIME_DEPLOYMENT, else "gpt-realtime"
std::string effective_deployment(const Options& opt);

// Built-in lists with the declared version first; empty and repeated entries dropped.
CandidateSpace candidate_space(const Options& opt);

// Authorization (bearer or api-key), the beta negotiation header, then --header entries.
HeaderList credential_headers(const Options& opt);

ProbeSettings probe_settings(const Options& opt);

// Missing endpoint or credential material, or out-of-range numbers.
// Throws ConfigurationError.
void validate_options(const Options& opt);

// "a,b,,c" -> {"a","b","c"}
std::vector<std::string> split_list(const std::string& s, char sep = ',');

// "realtime;oai-realtime,x" -> {{"realtime"},{"oai-realtime","x"}}
std::vector<std::vector<std::string>> split_protocol_sets(const std::string& s);

} // namespace wsp
