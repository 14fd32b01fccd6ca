#include "wsp/handshake.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

#include <curl/curl.h>

namespace wsp
{
namespace
{
struct CurlEasyDeleter {
    void operator()(CURL *c) const { curl_easy_cleanup(c); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};

using CurlPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using SlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct ResponseHead {
    long status{};
    std::optional<std::string> location;
};

bool curl_ready()
{
    static const bool ready = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    return ready;
}

bool iequals_prefix(std::string_view s, std::string_view prefix)
{
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i])))
            return false;
    }
    return true;
}

std::string_view trim(std::string_view s)
{
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

// Called once per header line, status lines included (interim 1xx responses too).
size_t header_cb(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto *head = static_cast<ResponseHead *>(userdata);
    const size_t n = size * nitems;
    std::string_view line = trim(std::string_view(buffer, n));

    if (iequals_prefix(line, "HTTP/"))
    {
        head->location.reset();
        const auto sp = line.find(' ');
        if (sp != std::string_view::npos)
        {
            const std::string code(line.substr(sp + 1, 3));
            head->status = std::strtol(code.c_str(), nullptr, 10);
        }
    }
    else if (iequals_prefix(line, "location:"))
    {
        auto value = trim(line.substr(9));
        if (!value.empty()) head->location = std::string(value);
    }
    return n;
}

int xferinfo_cb(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto *abort = static_cast<const std::atomic<bool> *>(clientp);
    return abort->load(std::memory_order_relaxed) ? 1 : 0;
}

bool append_header(SlistPtr &list, const std::string &line)
{
    curl_slist *next = curl_slist_append(list.get(), line.c_str());
    if (!next) return false;
    (void) list.release(); // same head, now owned through `next`
    list.reset(next);
    return true;
}
} // namespace

bool curl_supports_websockets()
{
    const curl_version_info_data *info = curl_version_info(CURLVERSION_NOW);
    if (!info || !info->protocols) return false;
    for (const char *const *p = info->protocols; *p; ++p)
    {
        if (std::strcmp(*p, "ws") == 0) return true;
    }
    return false;
}

Outcome curl_handshake_once(const EndpointCandidate &candidate,
                            const HandshakeOptions &opts,
                            const std::atomic<bool> &abort)
{
    if (!curl_ready()) return TransportError{"unable to initialize libcurl"};

    CurlPtr curl(curl_easy_init());
    if (!curl) return TransportError{"unable to allocate curl handle"};

    SlistPtr headers;
    for (const auto &[name, value] : opts.headers)
    {
        if (!append_header(headers, name + ": " + value))
            return TransportError{"unable to build request headers"};
    }
    if (!candidate.protocols.empty())
    {
        std::string line = "Sec-WebSocket-Protocol: ";
        for (size_t i = 0; i < candidate.protocols.size(); ++i)
        {
            if (i) line += ", ";
            line += candidate.protocols[i];
        }
        if (!append_header(headers, line))
            return TransportError{"unable to build request headers"};
    }

    ResponseHead head;
    char errbuf[CURL_ERROR_SIZE]{};
    const long timeout_ms = std::max(1, opts.timeout_ms);

    CURL *h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, candidate.url.c_str());
    curl_easy_setopt(h, CURLOPT_CONNECT_ONLY, 2L); // stop after the upgrade
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &head);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, const_cast<std::atomic<bool> *>(&abort));
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, opts.verify_tls ? 1L : 0L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, opts.verify_tls ? 2L : 0L);
    if (!opts.user_agent.empty())
        curl_easy_setopt(h, CURLOPT_USERAGENT, opts.user_agent.c_str());

    const CURLcode rc = curl_easy_perform(h);

    long code = 0;
    if (curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code) != CURLE_OK) code = 0;
    if (code == 0) code = head.status;

    // Returning releases the handle, which closes the socket: no frame is
    // ever exchanged over an accepted upgrade.
    return classify_handshake(rc, code, std::move(head.location), errbuf);
}

Outcome classify_handshake(CURLcode rc,
                           long status,
                           std::optional<std::string> location,
                           const std::string &error_text)
{
    if (rc == CURLE_OK)
    {
        if (status >= 200) return Rejected{static_cast<int>(status), std::move(location)};
        return Connected{};
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) return TimedOut{};
    if (rc == CURLE_ABORTED_BY_CALLBACK) return TransportError{"aborted"};
    // a refused upgrade still carries the HTTP answer
    if (status >= 200) return Rejected{static_cast<int>(status), std::move(location)};

    return TransportError{error_text.empty() ? std::string(curl_easy_strerror(rc)) : error_text};
}
} // namespace wsp
