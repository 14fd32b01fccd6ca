#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>

#include "wsp/model.hpp"

namespace wsp {

// "Name", "value" pairs sent verbatim with every upgrade request.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HandshakeOptions {
    HeaderList  headers;             // credential + fixed negotiation headers (opaque)
    int         timeout_ms = 7000;
    bool        verify_tls = true;
    std::string user_agent = "wsprobe/1.0";
};

// One upgrade attempt. Implementations must return promptly once `abort`
// becomes true and must release every transport resource before returning.
using HandshakeFn = std::function<Outcome(const EndpointCandidate&,
                                          const HandshakeOptions&,
                                          const std::atomic<bool>& /*abort*/)>;

// libcurl implementation (ws:// / wss:// with CURLOPT_CONNECT_ONLY = 2).
// The connection is closed as soon as the upgrade is accepted.
Outcome curl_handshake_once(const EndpointCandidate& candidate,
                            const HandshakeOptions& opts,
                            const std::atomic<bool>& abort);

// Maps a finished curl_easy_perform to an outcome. `status` is the last
// response code seen (0 if none), `error_text` the curl error buffer.
Outcome classify_handshake(CURLcode rc,
                           long status,
                           std::optional<std::string> location,
                           const std::string& error_text);

// false when the linked libcurl was built without WebSocket support
bool curl_supports_websockets();

} // namespace wsp
