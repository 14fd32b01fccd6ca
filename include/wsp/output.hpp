#pragma once

#include <cstddef>
#include <string>

namespace wsp
{
// Forward declarations to avoid heavy includes in header
struct Options;
struct AttemptResult;
struct ProbeTrace;
struct TraceSummary;

// "OK", "HTTP 302 -> wss://..", "timeout", or the transport error text
std::string describe_outcome(const AttemptResult &a);

// Text formatting (returns complete text block with trailing newlines when applicable)
std::string format_header_text(const Options &opt, std::size_t candidate_count);

// "- url [proto] -> outcome"
std::string format_attempt_line(const AttemptResult &a);

// Success report (winner + full trace) or failure report (full trace).
std::string format_trace_text(const ProbeTrace &trace);

std::string format_summary_text(const TraceSummary &summary);

std::string format_env_check_text(const Options &opt);

// NDJSON builders (single-line JSON strings without trailing newline)
std::string build_ndjson_attempt(const AttemptResult &a);

// Final JSON (single object string without trailing newline)
std::string build_final_json(const Options &opt,
                             const ProbeTrace &trace,
                             const TraceSummary &summary);

std::string build_env_check_json(const Options &opt);
} // namespace wsp
