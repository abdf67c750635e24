#pragma once

#include "config.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <boost/asio/io_context.hpp>

struct SHttpResponse {
    unsigned status = 0;
    std::string body;
};

struct SParsedUrl {
    bool secure = true;
    std::string host;
    std::string port;
    std::string target = "/";
};

std::optional<SParsedUrl> ParseUrl(std::string_view url);

// One-shot requests to secondary price sources whose certificates cannot be
// verified. Certificate and hostname checks are off for https targets, so do
// not reuse this for endpoints that should be verified.
class CInsecureHttpFetcher {
public:
    explicit CInsecureHttpFetcher(const SHttpConfig& cfg);
    virtual ~CInsecureHttpFetcher() = default;

    // method is GET or POST (any case). Throws CTickerError with
    // UnsupportedMethod, TransportError or UnsupportedResponse. Never retries.
    // The whole exchange, resolve included, shares one http.timeout_sec deadline.
    virtual SHttpResponse Fetch(const std::string& url,
                                const std::string& method,
                                const std::optional<std::string>& body = std::nullopt);

    // Thread safe. Fails in-flight and later fetches with TransportError.
    void Abort();

private:
    SHttpConfig m_cfg;

    std::mutex m_mutex;
    std::set<boost::asio::io_context*> m_active;
    std::atomic<bool> m_aborted{false};
};
