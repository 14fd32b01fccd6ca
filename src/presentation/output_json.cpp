#include "wsp/output.hpp"

#include <iomanip>
#include <sstream>
#include <variant>

#include "wsp/aggregate.hpp"
#include "wsp/config.hpp"
#include "wsp/json.hpp"
#include "wsp/model.hpp"
#include "wsp/options.hpp"

namespace wsp
{
static void write_protocols(std::ostringstream &os, const std::vector<std::string> &protocols)
{
    os << "[";
    for (size_t i = 0; i < protocols.size(); ++i)
    {
        if (i) os << ",";
        os << json_string(protocols[i]);
    }
    os << "]";
}

static void write_outcome(std::ostringstream &os, const Outcome &o)
{
    os << R"("outcome":)" << json_string(outcome_kind_str(o));
    if (const auto *r = std::get_if<Rejected>(&o))
    {
        os << R"(,"http":)" << r->status;
        if (r->location) os << R"(,"location":)" << json_string(*r->location);
    }
    else if (const auto *e = std::get_if<TransportError>(&o))
    {
        os << R"(,"error":)" << json_string(e->message);
    }
}

static void write_attempt(std::ostringstream &os, const AttemptResult &a)
{
    os << "{";
    os << R"("attempt":)" << a.attempt << R"(,"ms":)" << a.ms;
    os << R"(,"url":)" << json_string(a.candidate.url);
    os << R"(,"protocols":)";
    write_protocols(os, a.candidate.protocols);
    if (!a.candidate.version.empty())
        os << R"(,"version":)" << json_string(a.candidate.version);
    if (!a.candidate.path.empty()) os << R"(,"path":)" << json_string(a.candidate.path);
    if (!a.candidate.param.empty()) os << R"(,"param":)" << json_string(a.candidate.param);
    os << ",";
    write_outcome(os, a.outcome);
    if (a.redirected_from) os << R"(,"redirected_from":)" << *a.redirected_from;
    os << "}";
}

std::string build_ndjson_attempt(const AttemptResult &a)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    write_attempt(os, a);
    return os.str();
}

std::string build_final_json(const Options &opt,
                             const ProbeTrace &trace,
                             const TraceSummary &s)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(3);
    os << "{";
    os << R"("endpoint":)" << json_string(opt.base_endpoint) << ",";
    os << R"("deployment":)" << json_string(effective_deployment(opt)) << ",";
    os << R"("timeout_ms":)" << opt.timeout_ms << ",";
    os << R"("max_redirect_hops":)" << opt.max_redirect_hops << ",";
    os << R"("concurrency":)" << opt.concurrency << ",";
    os << R"("ok":)" << (trace.winner ? "true" : "false") << ",";
    if (const AttemptResult *w = trace.winning())
    {
        os << R"("winner":{"index":)" << *trace.winner
           << R"(,"url":)" << json_string(w->candidate.url) << R"(,"protocols":)";
        write_protocols(os, w->candidate.protocols);
        os << "},";
    }
    else
    {
        os << R"("winner":null,)";
    }
    os << R"("summary":{"attempts":)" << s.attempts
       << R"(,"connected":)" << s.connected
       << R"(,"rejected":)" << s.rejected
       << R"(,"transport_errors":)" << s.transport_errors
       << R"(,"timed_out":)" << s.timed_out
       << R"(,"redirects_followed":)" << s.redirects_followed
       << R"(,"cancelled":)" << s.cancelled
       << R"(,"not_attempted":)" << s.not_attempted
       << R"(,"min_ms":)" << s.timing.min
       << R"(,"avg_ms":)" << s.timing.avg
       << R"(,"max_ms":)" << s.timing.max << "},";
    if (!s.timing.percentiles.empty())
    {
        os << R"("percentiles":{)";
        for (size_t i = 0; i < s.timing.percentiles.size(); ++i)
        {
            if (i) os << ",";
            os << R"("p)" << s.timing.percentiles[i].first << R"(":)"
               << s.timing.percentiles[i].second;
        }
        os << "},";
    }
    os << R"("attempts":[)";
    for (size_t i = 0; i < trace.attempts.size(); ++i)
    {
        if (i) os << ",";
        write_attempt(os, trace.attempts[i]);
    }
    os << "],";
    os << R"("cancelled":[)";
    for (size_t i = 0; i < trace.cancelled.size(); ++i)
    {
        if (i) os << ",";
        os << R"({"url":)" << json_string(trace.cancelled[i].url) << R"(,"protocols":)";
        write_protocols(os, trace.cancelled[i].protocols);
        os << "}";
    }
    os << "]";
    os << "}";
    return os.str();
}

std::string build_env_check_json(const Options &opt)
{
    std::ostringstream os;
    os << "{";
    os << R"("AZURE_OPENAI_ENDPOINT":)" << json_string(opt.base_endpoint) << ",";
    os << R"("AZURE_OPENAI_API_VERSION":)" << json_string(opt.declared_version) << ",";
    os << R"("AZURE_OPENAI_REALTIME_DEPLOYMENT":)" << json_string(effective_deployment(opt)) << ",";
    os << R"("HAS_API_KEY":)" << (opt.api_key.empty() ? "false" : "true");
    os << "}";
    return os.str();
}
} // namespace wsp
