#pragma once

#include <string>
#include <vector>

#include "wsp/handshake.hpp"

namespace wsp
{
enum class Command { Probe, Once, EnvCheck };

enum class AuthStyle { Bearer, ApiKey };

// Built once at startup (command line + environment), then passed by const&.
struct Options
{
    Command command = Command::Probe;
    bool help = false;
    // endpoint contract
    std::string base_endpoint;             // http(s)://host[:port][/prefix]
    std::string deployment;                // deployment id (default: gpt-realtime)
    std::string declared_version;          // tried before the built-in versions
    std::vector<std::string> versions;     // empty = built-in list
    std::vector<std::string> paths;        // empty = built-in list
    std::vector<std::string> param_names;  // empty = built-in list
    std::vector<std::vector<std::string>> subprotocol_sets; // empty = built-in list
    std::string version_param = "api-version";
    // credentials / negotiation headers
    std::string api_key;
    AuthStyle auth_style = AuthStyle::Bearer;
    bool beta_header = true;               // OpenAI-Beta: realtime=v1
    HeaderList extra_headers;              // --header "Name: value"
    // attempt control
    int timeout_ms = 7000;                 // per-attempt wall clock
    int max_redirect_hops = 1;             // 0 disables redirect following
    int concurrency = 1;                   // 1 = strictly sequential
    bool verify_tls = true;
    // `once` command
    std::string once_version = "2024-10-01-preview";
    std::string once_param = "deployment";
    std::string once_path = "realtime";    // under /openai/
    std::vector<std::string> once_protocols{"realtime"};
    // presentation
    bool json = false;                     // final JSON object
    bool ndjson = false;                   // one JSON line per attempt
    bool verbose = false;                  // progress on stderr
    std::vector<int> pctl;                 // requested percentiles (0..100)
};
} // namespace wsp
