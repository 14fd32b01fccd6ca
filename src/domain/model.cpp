#include "wsp/model.hpp"

namespace wsp {

const char* outcome_kind_str(const Outcome& o)
{
    switch (o.index())
    {
        case 0: return "connected";
        case 1: return "rejected";
        case 2: return "transport_error";
        case 3: return "timed_out";
        default: return "unknown";
    }
}

std::string join_protocols(const std::vector<std::string>& protocols)
{
    std::string out;
    for (size_t i = 0; i < protocols.size(); ++i)
    {
        if (i) out += ',';
        out += protocols[i];
    }
    return out;
}

} // namespace wsp
