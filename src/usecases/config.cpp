#include "wsp/config.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>

#include "wsp/errors.hpp"

namespace wsp
{
namespace
{
const std::vector<std::string> kDefaultVersions{"2024-10-01-preview", "2025-08-28"};
const std::vector<std::string> kDefaultPaths{"openai/realtime", "openai/realtime/audio"};
const std::vector<std::string> kDefaultParams{"deployment", "deploymentId"};
const std::vector<std::vector<std::string> > kDefaultProtocolSets{{"realtime"}, {"oai-realtime"}};
constexpr const char *kDefaultDeployment = "gpt-realtime";

std::vector<std::string> unique_non_empty(const std::vector<std::string> &in)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto &s : in)
    {
        if (s.empty() || !seen.insert(s).second) continue;
        out.push_back(s);
    }
    return out;
}

std::string trim(const std::string &s)
{
    const auto b = s.find_first_not_of(" \t");
    if (b == std::string::npos) return {};
    const auto e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

bool iequals(const std::string &a, const std::string &b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y)
           {
               return std::tolower(x) == std::tolower(y);
           });
}
} // namespace

std::vector<std::string> split_list(const std::string &s, char sep)
{
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s)
    {
        if (ch == sep)
        {
            if (auto t = trim(cur); !t.empty()) out.push_back(std::move(t));
            cur.clear();
        }
        else
        {
            cur.push_back(ch);
        }
    }
    if (auto t = trim(cur); !t.empty()) out.push_back(std::move(t));
    return out;
}

std::vector<std::vector<std::string> > split_protocol_sets(const std::string &s)
{
    std::vector<std::vector<std::string> > out;
    for (const auto &set : split_list(s, ';'))
    {
        auto tokens = split_list(set, ',');
        if (!tokens.empty()) out.push_back(std::move(tokens));
    }
    return out;
}

void apply_environment(Options &opt, const EnvLookup &lookup)
{
    if (!lookup) return;
    auto fill = [&](std::string &field, const char *name)
    {
        if (!field.empty()) return;
        if (const char *v = lookup(name)) field = v;
    };
    fill(opt.base_endpoint, "AZURE_OPENAI_ENDPOINT");
    fill(opt.api_key, "AZURE_OPENAI_API_KEY");
    fill(opt.deployment, "AZURE_OPENAI_REALTIME_DEPLOYMENT");
    fill(opt.declared_version, "AZURE_OPENAI_API_VERSION");
}

std::string effective_deployment(const Options &opt)
{
    return opt.deployment.empty() ? std::string(kDefaultDeployment) : opt.deployment;
}

CandidateSpace candidate_space(const Options &opt)
{
    CandidateSpace space;

    std::vector<std::string> versions;
    versions.push_back(opt.declared_version);
    const auto &listed = opt.versions.empty() ? kDefaultVersions : opt.versions;
    versions.insert(versions.end(), listed.begin(), listed.end());
    space.versions = unique_non_empty(versions);

    space.paths = unique_non_empty(opt.paths.empty() ? kDefaultPaths : opt.paths);
    space.param_names = unique_non_empty(opt.param_names.empty() ? kDefaultParams : opt.param_names);
    space.subprotocol_sets = opt.subprotocol_sets.empty() ? kDefaultProtocolSets : opt.subprotocol_sets;
    space.version_param = opt.version_param;
    return space;
}

HeaderList credential_headers(const Options &opt)
{
    HeaderList headers;
    if (!opt.api_key.empty())
    {
        if (opt.auth_style == AuthStyle::ApiKey)
            headers.emplace_back("api-key", opt.api_key);
        else
            headers.emplace_back("Authorization", "Bearer " + opt.api_key);
    }
    if (opt.beta_header) headers.emplace_back("OpenAI-Beta", "realtime=v1");
    headers.insert(headers.end(), opt.extra_headers.begin(), opt.extra_headers.end());
    return headers;
}

ProbeSettings probe_settings(const Options &opt)
{
    ProbeSettings s;
    s.handshake.headers = credential_headers(opt);
    s.handshake.timeout_ms = opt.timeout_ms;
    s.handshake.verify_tls = opt.verify_tls;
    s.max_redirect_hops = opt.max_redirect_hops;
    s.concurrency = std::max(1, opt.concurrency);
    return s;
}

void validate_options(const Options &opt)
{
    if (opt.base_endpoint.empty())
        throw ConfigurationError("missing endpoint (--endpoint or AZURE_OPENAI_ENDPOINT)");

    bool has_credential = !opt.api_key.empty();
    for (const auto &[name, value] : opt.extra_headers)
    {
        if ((iequals(name, "Authorization") || iequals(name, "api-key")) && !value.empty())
            has_credential = true;
    }
    if (!has_credential)
        throw ConfigurationError(
            "missing credential (--api-key, AZURE_OPENAI_API_KEY or an Authorization/api-key header)");

    if (opt.timeout_ms <= 0) throw ConfigurationError("--timeout must be positive");
    if (opt.max_redirect_hops < 0) throw ConfigurationError("--max-redirects must not be negative");

    // malformed base URL surfaces here rather than at the first attempt
    normalize_base_endpoint(opt.base_endpoint);
}
} // namespace wsp
