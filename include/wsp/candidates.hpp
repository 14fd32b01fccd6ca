#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "wsp/model.hpp"

namespace wsp {

// Ordered value lists the generator crosses. Put the most likely value first
// in each list: the runner stops at the first success.
struct CandidateSpace {
    std::vector<std::string>              versions;
    std::vector<std::string>              paths;
    std::vector<std::string>              param_names;
    std::vector<std::vector<std::string>> subprotocol_sets;
    std::string                           version_param = "api-version";
};

// Validates an http(s) base URL and strips trailing slashes.
// Throws ConfigurationError when malformed.
std::string normalize_base_endpoint(std::string_view base);

// http -> ws, https -> wss (ws/wss pass through). Host, port and path are kept.
std::string stream_url_from_http(std::string_view url);

// Resolves a redirect Location against the URL that produced it and rewrites
// the scheme to its streaming form. Returns an empty string when unusable.
std::string resolve_redirect_url(std::string_view from_url, std::string_view location);

// Percent-encodes a query component (RFC 3986 unreserved set kept as-is).
std::string encode_query_component(std::string_view s);

EndpointCandidate make_candidate(const std::string& stream_base,
                                 const std::string& version_param,
                                 const std::string& version,
                                 const std::string& path,
                                 const std::string& param,
                                 const std::string& deployment_id,
                                 const std::vector<std::string>& protocols);

// version x path x param x subprotocol-set, outer to inner, first occurrence
// of each (url, protocols) pair kept. Pure and deterministic.
std::vector<EndpointCandidate> generate_candidates(const std::string& base_endpoint,
                                                   const CandidateSpace& space,
                                                   const std::string& deployment_id);

} // namespace wsp
