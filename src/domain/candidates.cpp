#include "wsp/candidates.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_set>
#include <vector>

#include "wsp/errors.hpp"

namespace wsp
{
static std::string lower(std::string_view s)
{
    std::string out(s);
    std::ranges::transform(out, out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

static bool starts_with_nocase(std::string_view s, std::string_view prefix)
{
    return s.size() >= prefix.size() && lower(s.substr(0, prefix.size())) == prefix;
}

static std::string_view trim_slashes(std::string_view s)
{
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

static bool valid_authority(std::string_view auth)
{
    if (auth.empty()) return false;
    std::string_view host = auth;
    if (auto at = host.rfind('@'); at != std::string_view::npos)
        host = host.substr(at + 1);

    std::string_view port;
    if (!host.empty() && host.front() == '[')
    {
        const auto close = host.find(']');
        if (close == std::string_view::npos || close == 1) return false;
        if (close + 1 < host.size())
        {
            if (host[close + 1] != ':') return false;
            port = host.substr(close + 2);
            if (port.empty()) return false;
        }
        host = host.substr(0, close + 1);
    }
    else if (auto colon = host.find(':'); colon != std::string_view::npos)
    {
        port = host.substr(colon + 1);
        host = host.substr(0, colon);
        if (port.empty()) return false;
    }
    if (host.empty()) return false;

    if (!port.empty())
    {
        if (port.size() > 5) return false;
        if (!std::ranges::all_of(port, [](unsigned char c) { return std::isdigit(c) != 0; }))
            return false;
        if (std::stoi(std::string(port)) > 65535) return false;
    }
    return true;
}

std::string normalize_base_endpoint(std::string_view base)
{
    if (base.empty()) throw ConfigurationError("base endpoint is empty");

    std::string_view rest;
    std::string scheme;
    if (starts_with_nocase(base, "https://"))
    {
        scheme = "https";
        rest = base.substr(8);
    }
    else if (starts_with_nocase(base, "http://"))
    {
        scheme = "http";
        rest = base.substr(7);
    }
    else
    {
        throw ConfigurationError("base endpoint must be an http(s) URL: " + std::string(base));
    }

    for (unsigned char c : rest)
    {
        if (std::isspace(c) || c == '?' || c == '#')
            throw ConfigurationError("base endpoint must not contain query, fragment or whitespace: "
                                     + std::string(base));
    }
    while (!rest.empty() && rest.back() == '/') rest.remove_suffix(1);

    const auto slash = rest.find('/');
    if (!valid_authority(rest.substr(0, slash)))
        throw ConfigurationError("base endpoint has no valid host: " + std::string(base));

    return scheme + "://" + std::string(rest);
}

std::string stream_url_from_http(std::string_view url)
{
    if (starts_with_nocase(url, "https://")) return "wss://" + std::string(url.substr(8));
    if (starts_with_nocase(url, "http://")) return "ws://" + std::string(url.substr(7));
    return std::string(url);
}

// RFC 3986 5.2.4; `path` is empty or starts with '/'
static std::string remove_dot_segments(std::string_view path)
{
    if (path.empty()) return {};

    std::vector<std::string_view> segs;
    bool trailing = false;
    std::size_t pos = 1;
    for (;;)
    {
        const auto next = path.find('/', pos);
        const bool last = next == std::string_view::npos;
        const std::string_view seg = path.substr(pos, last ? std::string_view::npos : next - pos);
        if (seg == ".")
        {
            trailing = last;
        }
        else if (seg == "..")
        {
            if (!segs.empty()) segs.pop_back();
            trailing = last;
        }
        else
        {
            segs.push_back(seg);
            trailing = false;
        }
        if (last) break;
        pos = next + 1;
    }

    std::string out;
    for (const auto seg : segs)
    {
        out += '/';
        out += seg;
    }
    if (trailing || out.empty()) out += '/';
    return out;
}

std::string resolve_redirect_url(std::string_view from_url, std::string_view location)
{
    if (location.empty()) return {};

    const auto scheme_end = location.find("://");
    if (scheme_end != std::string_view::npos &&
        location.find_first_of("/?#") > scheme_end)
    {
        if (starts_with_nocase(location, "http://") || starts_with_nocase(location, "https://"))
            return stream_url_from_http(location);
        if (starts_with_nocase(location, "ws://") || starts_with_nocase(location, "wss://"))
            return std::string(location);
        return {};
    }

    const std::string from = stream_url_from_http(from_url);
    const auto from_scheme_end = from.find("://");
    if (from_scheme_end == std::string::npos) return {};

    if (location.starts_with("//"))
        return from.substr(0, from_scheme_end + 1) + std::string(location);

    // base: origin, path and query of the attempted URL (fragment dropped)
    const std::string_view base(from);
    const auto auth_end = std::min(base.find_first_of("/?#", from_scheme_end + 3), base.size());
    const std::string_view origin = base.substr(0, auth_end);
    const auto base_path_end = std::min(base.find_first_of("?#", auth_end), base.size());
    const std::string_view base_path = base.substr(auth_end, base_path_end - auth_end);
    const auto base_query_end = std::min(base.find('#', base_path_end), base.size());
    const std::string_view base_query = base.substr(base_path_end, base_query_end - base_path_end);

    // reference: path and query (a fragment never reaches the server)
    const std::string_view ref = location.substr(0, location.find('#'));
    const auto ref_path_end = std::min(ref.find('?'), ref.size());
    const std::string_view ref_path = ref.substr(0, ref_path_end);
    const std::string_view ref_query = ref.substr(ref_path_end);

    std::string path;
    std::string_view query = ref_query;
    if (ref_path.empty())
    {
        path = std::string(base_path);
        if (ref_query.empty()) query = base_query;
    }
    else if (ref_path.front() == '/')
    {
        path = remove_dot_segments(ref_path);
    }
    else
    {
        std::string merged = base_path.empty()
                                 ? std::string("/")
                                 : std::string(base_path.substr(0, base_path.rfind('/') + 1));
        merged += ref_path;
        path = remove_dot_segments(merged);
    }
    return std::string(origin) + path + std::string(query);
}

std::string encode_query_component(std::string_view s)
{
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~')
        {
            out += static_cast<char>(c);
        }
        else
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

EndpointCandidate make_candidate(const std::string& stream_base,
                                 const std::string& version_param,
                                 const std::string& version,
                                 const std::string& path,
                                 const std::string& param,
                                 const std::string& deployment_id,
                                 const std::vector<std::string>& protocols)
{
    EndpointCandidate c;
    c.url = stream_base;
    if (auto p = trim_slashes(path); !p.empty())
    {
        c.url += '/';
        c.url += p;
    }
    c.url += '?';
    c.url += encode_query_component(version_param) + '=' + encode_query_component(version);
    c.url += '&';
    c.url += encode_query_component(param) + '=' + encode_query_component(deployment_id);
    c.protocols = protocols;
    c.version = version;
    c.path = path;
    c.param = param;
    return c;
}

std::vector<EndpointCandidate> generate_candidates(const std::string& base_endpoint,
                                                   const CandidateSpace& space,
                                                   const std::string& deployment_id)
{
    const std::string stream_base = stream_url_from_http(normalize_base_endpoint(base_endpoint));

    std::vector<EndpointCandidate> out;
    std::unordered_set<std::string> seen; // key: url + '\n' + protocols
    for (const auto& version : space.versions)
    {
        for (const auto& path : space.paths)
        {
            for (const auto& param : space.param_names)
            {
                for (const auto& protocols : space.subprotocol_sets)
                {
                    EndpointCandidate c = make_candidate(stream_base,
                                                         space.version_param,
                                                         version,
                                                         path,
                                                         param,
                                                         deployment_id,
                                                         protocols);
                    std::string key = c.url + '\n';
                    for (const auto& p : protocols)
                    {
                        key += p;
                        key += '\x1f';
                    }
                    if (!seen.insert(std::move(key)).second) continue;
                    out.push_back(std::move(c));
                }
            }
        }
    }
    return out;
}
} // namespace wsp
