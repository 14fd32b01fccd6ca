#include "wsp/cli.hpp"

#include <algorithm>
#include <cstdio>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "wsp/config.hpp"

using namespace std::string_view_literals;

namespace wsp {

void print_usage(const char *prog)
{
    std::println("WebSocket endpoint discovery prober");
    std::println("Usage: {} [probe|once|env-check] [options]", prog);
    std::println("Endpoint / credentials (fall back to AZURE_OPENAI_* environment variables):");
    std::println("  --endpoint URL        http(s) base endpoint (AZURE_OPENAI_ENDPOINT)");
    std::println("  --api-key KEY         credential (AZURE_OPENAI_API_KEY)");
    std::println("  --auth S              bearer|api-key header style (default: bearer)");
    std::println("  --header 'N: V'       extra handshake header (repeatable)");
    std::println("  --no-beta-header      Do not send OpenAI-Beta: realtime=v1");
    std::println(
        "  --deployment ID       deployment id (AZURE_OPENAI_REALTIME_DEPLOYMENT, default: gpt-realtime)");
    std::println("  --api-version V       version tried first (AZURE_OPENAI_API_VERSION)");
    std::println("Candidate space (comma-separated lists, tried in the given order):");
    std::println("  --versions LIST       default: 2024-10-01-preview,2025-08-28");
    std::println("  --paths LIST          default: openai/realtime,openai/realtime/audio");
    std::println("  --params LIST         default: deployment,deploymentId");
    std::println("  --protocols SETS      ';'-separated sets (default: realtime;oai-realtime)");
    std::println("  --version-param NAME  query parameter carrying the version (default: api-version)");
    std::println("Attempt control:");
    std::println("  --timeout MS          per-attempt timeout in milliseconds (default: 7000)");
    std::println("  --max-redirects N     redirect hops per candidate, 0 or 1 (default: 1)");
    std::println("  --concurrency K       parallel attempts (default: 1, sequential)");
    std::println("  --parallel K          Alias of --concurrency");
    std::println("  --insecure            Skip TLS peer verification");
    std::println("once (a single combination):");
    std::println("  --ver V               API version (default: 2024-10-01-preview)");
    std::println("  --param P             deployment parameter name (default: deployment)");
    std::println("  --path P              path under /openai/ (default: realtime)");
    std::println("  --proto a,b           offered sub-protocols (default: realtime)");
    std::println("Output:");
    std::println("  --json                Output the final trace as JSON");
    std::println("  --ndjson              Output each attempt as a single JSON line (NDJSON)");
    std::println("  --pctl LIST           Comma-separated latency percentiles (e.g., 50,90,99)");
    std::println("  -v, --verbose         Progress on stderr");
    std::println("  -h, --help            Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} --endpoint https://myres.openai.azure.com --api-key $KEY", prog);
    std::println("  {} once --ver 2025-08-28 --param deploymentId --proto oai-realtime", prog);
    std::println("  {} probe --concurrency 4 --json --pctl 50,90", prog);
}

// Accepts "--name V" and "--name=V". Returns false for neither form.
static bool take_value(std::string_view a, std::string_view name, int &i, int argc,
                       char **argv, std::string &val)
{
    if (a == name && i + 1 < argc)
    {
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() + 1 && a.starts_with(name) && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    return false;
}

static bool parse_int(const std::string &val, std::string_view what, int &out)
{
    try
    {
        size_t used = 0;
        out = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument("trailing characters");
    }
    catch (const std::exception &)
    {
        std::println(stderr, "invalid {}: {}", what, val);
        return false;
    }
    return true;
}

static bool matches(std::string_view a, std::string_view name)
{
    return a == name || (a.starts_with(name) && a.size() > name.size() && a[name.size()] == '=');
}

bool parse_args(int argc, char **argv, Options &opt)
{
    bool command_seen = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a{argv[i]};
        std::string val;

        auto need = [&](std::string_view name) -> bool
        {
            if (take_value(a, name, i, argc, argv, val)) return true;
            std::println(stderr, "invalid {} usage", name);
            return false;
        };

        if (a == "-h"sv || a == "--help"sv)
        {
            opt.help = true;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.verbose = true;
        }
        else if (matches(a, "--endpoint"))
        {
            if (!need("--endpoint")) return false;
            opt.base_endpoint = val;
        }
        else if (matches(a, "--api-key"))
        {
            if (!need("--api-key")) return false;
            opt.api_key = val;
        }
        else if (matches(a, "--auth"))
        {
            if (!need("--auth")) return false;
            if (val == "bearer") opt.auth_style = AuthStyle::Bearer;
            else if (val == "api-key") opt.auth_style = AuthStyle::ApiKey;
            else
            {
                std::println(stderr, "unknown auth style: {}", val);
                return false;
            }
        }
        else if (matches(a, "--header"))
        {
            if (!need("--header")) return false;
            const auto colon = val.find(':');
            if (colon == std::string::npos || colon == 0)
            {
                std::println(stderr, "invalid header (expected 'Name: value'): {}", val);
                return false;
            }
            std::string name = val.substr(0, colon);
            std::string value = val.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            opt.extra_headers.emplace_back(std::move(name), std::move(value));
        }
        else if (a == "--no-beta-header"sv)
        {
            opt.beta_header = false;
        }
        else if (matches(a, "--deployment"))
        {
            if (!need("--deployment")) return false;
            opt.deployment = val;
        }
        else if (matches(a, "--api-version"))
        {
            if (!need("--api-version")) return false;
            opt.declared_version = val;
        }
        else if (matches(a, "--versions"))
        {
            if (!need("--versions")) return false;
            opt.versions = split_list(val);
        }
        else if (matches(a, "--paths"))
        {
            if (!need("--paths")) return false;
            opt.paths = split_list(val);
        }
        else if (matches(a, "--params"))
        {
            if (!need("--params")) return false;
            opt.param_names = split_list(val);
        }
        else if (matches(a, "--protocols"))
        {
            if (!need("--protocols")) return false;
            opt.subprotocol_sets = split_protocol_sets(val);
            if (opt.subprotocol_sets.empty())
            {
                std::println(stderr, "--protocols needs at least one token");
                return false;
            }
        }
        else if (matches(a, "--version-param"))
        {
            if (!need("--version-param")) return false;
            opt.version_param = val;
        }
        else if (matches(a, "--timeout"))
        {
            if (!need("--timeout")) return false;
            if (!parse_int(val, "--timeout value", opt.timeout_ms)) return false;
            if (opt.timeout_ms <= 0)
            {
                std::println(stderr, "--timeout must be positive");
                return false;
            }
        }
        else if (matches(a, "--max-redirects"))
        {
            if (!need("--max-redirects")) return false;
            if (!parse_int(val, "--max-redirects value", opt.max_redirect_hops)) return false;
            if (opt.max_redirect_hops < 0 || opt.max_redirect_hops > 1)
            {
                std::println(stderr, "--max-redirects must be 0 or 1");
                return false;
            }
        }
        else if (matches(a, "--concurrency") || matches(a, "--parallel"))
        {
            const std::string_view name = matches(a, "--concurrency") ? "--concurrency"sv
                                                                      : "--parallel"sv;
            if (!need(name)) return false;
            if (!parse_int(val, "concurrency", opt.concurrency)) return false;
            if (opt.concurrency <= 0) opt.concurrency = 1;
        }
        else if (a == "--insecure"sv)
        {
            opt.verify_tls = false;
        }
        else if (matches(a, "--ver"))
        {
            if (!need("--ver")) return false;
            opt.once_version = val;
        }
        else if (matches(a, "--param"))
        {
            if (!need("--param")) return false;
            opt.once_param = val;
        }
        else if (matches(a, "--path"))
        {
            if (!need("--path")) return false;
            opt.once_path = val;
        }
        else if (matches(a, "--proto"))
        {
            if (!need("--proto")) return false;
            opt.once_protocols = split_list(val);
        }
        else if (a == "--json"sv)
        {
            opt.json = true;
        }
        else if (a == "--ndjson"sv)
        {
            opt.ndjson = true;
        }
        else if (matches(a, "--pctl"))
        {
            if (!need("--pctl")) return false;
            std::vector<int> out;
            for (const auto &num : split_list(val))
            {
                int p = 0;
                if (!parse_int(num, "percentile", p)) return false;
                if (p < 0 || p > 100)
                {
                    std::println(stderr, "percentile out of range: {}", p);
                    return false;
                }
                out.push_back(p);
            }
            std::ranges::sort(out);
            out.erase(std::ranges::unique(out).begin(), out.end());
            opt.pctl = std::move(out);
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println(stderr, "unknown option: {}", a);
            return false;
        }
        else if (!command_seen)
        {
            command_seen = true;
            if (a == "probe"sv) opt.command = Command::Probe;
            else if (a == "once"sv) opt.command = Command::Once;
            else if (a == "env-check"sv) opt.command = Command::EnvCheck;
            else
            {
                std::println(stderr, "unknown command: {}", a);
                return false;
            }
        }
        else
        {
            std::println(stderr, "unexpected argument: {}", a);
            return false;
        }
    }
    return true;
}

} // namespace wsp
