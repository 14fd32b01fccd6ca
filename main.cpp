// WebSocket endpoint discovery prober (C++23)
// Build:
//   cmake -S . -B build && cmake --build build

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <print>
#include <string>

#include "wsp/aggregate.hpp"
#include "wsp/cli.hpp"
#include "wsp/config.hpp"
#include "wsp/errors.hpp"
#include "wsp/handshake.hpp"
#include "wsp/output.hpp"
#include "wsp/usecases.hpp"

using namespace wsp;

static std::mutex g_print_mtx;

int main(int argc, char **argv)
{
    Options opt{};
    if (!parse_args(argc, argv, opt))
    {
        print_usage(argv[0]);
        return 1;
    }
    if (opt.help)
    {
        print_usage(argv[0]);
        return 0;
    }
    apply_environment(opt, [](const char *name) { return std::getenv(name); });

    if (opt.command == Command::EnvCheck)
    {
        if (opt.json) std::println("{}", build_env_check_json(opt));
        else std::print("{}", format_env_check_text(opt));
        return 0;
    }

    try
    {
        validate_options(opt);
        const bool text = !opt.json && !opt.ndjson;

        if (text)
        {
            const auto count = opt.command == Command::Once ? std::size_t{1} : discovery_candidates(opt).size();
            std::println("{}", format_header_text(opt, count));
        }

        auto on_attempt = [&](const AttemptResult &a)
        {
            std::lock_guard<std::mutex> lk(g_print_mtx);
            if (opt.ndjson)
            {
                std::println("{}", build_ndjson_attempt(a));
                std::fflush(stdout);
            }
            if (opt.verbose) std::println(stderr, "[probe] #{} {}", a.attempt, format_attempt_line(a));
        };

        if (!curl_supports_websockets())
        {
            std::println(stderr,
                         "warning: libcurl was built without WebSocket support; "
                         "every attempt will fail as a transport error");
        }

        const ProbeTrace trace = run_command(opt, curl_handshake_once, on_attempt);
        const TraceSummary summary = summarize_trace(trace, opt.pctl);

        if (opt.json)
        {
            std::println("{}", build_final_json(opt, trace, summary));
        }
        else if (text)
        {
            std::println("{}", format_trace_text(trace));
            std::print("{}", format_summary_text(summary));
        }
        std::fflush(stdout);
        return trace.winner ? 0 : 2;
    }
    catch (const ConfigurationError &e)
    {
        std::println(stderr, "configuration error: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        // thread creation failure or an output error; the run is abandoned
        std::println(stderr, "error: {}", e.what());
        return 1;
    }
}
