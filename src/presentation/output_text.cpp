#include "wsp/output.hpp"

#include <iomanip>
#include <sstream>
#include <variant>

#include "wsp/aggregate.hpp"
#include "wsp/config.hpp"
#include "wsp/model.hpp"
#include "wsp/options.hpp"

namespace wsp {

static const char *command_str(Command c)
{
    switch (c)
    {
        case Command::Probe: return "probe";
        case Command::Once: return "once";
        case Command::EnvCheck: return "env-check";
    }
    return "probe";
}

std::string describe_outcome(const AttemptResult &a)
{
    if (std::holds_alternative<Connected>(a.outcome)) return "OK";
    if (const auto *r = std::get_if<Rejected>(&a.outcome))
    {
        std::string s = "HTTP " + std::to_string(r->status);
        if (r->location) s += " -> " + *r->location;
        return s;
    }
    if (const auto *e = std::get_if<TransportError>(&a.outcome)) return e->message;
    return "timeout";
}

std::string format_header_text(const Options &opt, std::size_t candidate_count)
{
    std::ostringstream os;
    os << "Endpoint: " << opt.base_endpoint << '\n';
    os << "Command: " << command_str(opt.command)
       << "  Deployment: " << effective_deployment(opt)
       << "  Candidates: " << candidate_count << '\n';
    os << "Timeout: " << opt.timeout_ms << "ms"
       << "  Redirects: " << opt.max_redirect_hops
       << "  Concurrency: " << opt.concurrency
       << "  TLS verify: " << (opt.verify_tls ? "on" : "off") << '\n';
    os << "Auth: " << (opt.auth_style == AuthStyle::ApiKey ? "api-key" : "bearer")
       << "  Beta header: " << (opt.beta_header ? "on" : "off")
       << "  Extra headers: " << opt.extra_headers.size() << '\n';
    return os.str();
}

std::string format_attempt_line(const AttemptResult &a)
{
    std::ostringstream os;
    os << "- " << a.candidate.url << " [" << join_protocols(a.candidate.protocols) << "] -> "
       << describe_outcome(a);
    if (a.redirected_from) os << " (redirect of #" << (*a.redirected_from + 1) << ")";
    return os.str();
}

std::string format_trace_text(const ProbeTrace &trace)
{
    std::ostringstream os;
    if (const AttemptResult *w = trace.winning())
    {
        os << "SUCCESS\n";
        os << "URL: " << w->candidate.url << '\n';
        os << "Proto: " << join_protocols(w->candidate.protocols) << '\n';
        os << "\nFull trace:\n";
    }
    else
    {
        os << "All attempts failed.\n\nTrace:\n";
    }
    for (const auto &a : trace.attempts) os << format_attempt_line(a) << '\n';
    for (const auto &c : trace.cancelled)
    {
        os << "- " << c.url << " [" << join_protocols(c.protocols) << "] -> cancelled\n";
    }
    return os.str();
}

std::string format_summary_text(const TraceSummary &s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "Summary: attempts=" << s.attempts
       << " connected=" << s.connected
       << " rejected=" << s.rejected
       << " transport_errors=" << s.transport_errors
       << " timed_out=" << s.timed_out
       << " redirects=" << s.redirects_followed << '\n';
    if (s.cancelled || s.not_attempted)
    {
        os << "Skipped: cancelled=" << s.cancelled
           << " not_attempted=" << s.not_attempted << '\n';
    }
    if (s.attempts)
    {
        os << "Latency: min=" << s.timing.min << " ms  avg=" << s.timing.avg
           << " ms  max=" << s.timing.max << " ms\n";
    }
    if (!s.timing.percentiles.empty())
    {
        os << "Percentiles:";
        for (const auto &[p, v] : s.timing.percentiles) os << " p" << p << '=' << v << "ms";
        os << '\n';
    }
    return os.str();
}

std::string format_env_check_text(const Options &opt)
{
    std::ostringstream os;
    os << "AZURE_OPENAI_ENDPOINT: "
       << (opt.base_endpoint.empty() ? "(unset)" : opt.base_endpoint) << '\n';
    os << "AZURE_OPENAI_API_VERSION: "
       << (opt.declared_version.empty() ? "(unset)" : opt.declared_version) << '\n';
    os << "AZURE_OPENAI_REALTIME_DEPLOYMENT: " << effective_deployment(opt) << '\n';
    os << "HAS_API_KEY: " << (opt.api_key.empty() ? "false" : "true") << '\n';
    return os.str();
}

} // namespace wsp
