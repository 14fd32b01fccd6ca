#include "wsp/usecases.hpp"

#include "wsp/candidates.hpp"
#include "wsp/config.hpp"
#include "wsp/errors.hpp"

namespace wsp {

std::vector<EndpointCandidate> discovery_candidates(const Options& opt)
{
    return generate_candidates(opt.base_endpoint, candidate_space(opt), effective_deployment(opt));
}

std::vector<EndpointCandidate> once_candidates(const Options& opt)
{
    if (opt.once_version.empty()) throw ConfigurationError("--ver must not be empty");
    if (opt.once_protocols.empty()) throw ConfigurationError("--proto needs at least one token");

    std::string path = opt.once_path;
    while (!path.empty() && path.front() == '/') path.erase(0, 1);

    const std::string base = stream_url_from_http(normalize_base_endpoint(opt.base_endpoint));
    return {make_candidate(base,
                           opt.version_param,
                           opt.once_version,
                           "openai/" + path,
                           opt.once_param,
                           effective_deployment(opt),
                           opt.once_protocols)};
}

ProbeTrace run_command(const Options& opt,
                       const HandshakeFn& handshake,
                       const AttemptCallback& on_attempt)
{
    validate_options(opt);
    const auto candidates = opt.command == Command::Once ? once_candidates(opt)
                                                         : discovery_candidates(opt);
    return run_probe(candidates, probe_settings(opt), handshake, on_attempt);
}

} // namespace wsp
