#include "http_fetcher.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "errors.hpp"
#include "insecure_tls.hpp"
#include "logger.hpp"

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = net::ip::tcp;

namespace {
constexpr int kHttpVersion = 11;

using Clock = std::chrono::steady_clock;

// Runs one async operation to completion on a private io_context. The stream's
// expiry turns a stalled peer into beast::error::timeout. An aborted fetch
// stops the context and the step reports operation_aborted.
template <typename Initiate>
beast::error_code RunToCompletion(net::io_context& ioc, const std::atomic<bool>& aborted,
                                  Initiate&& initiate) {
    beast::error_code result = net::error::would_block;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    if (aborted.load()) {
        return net::error::operation_aborted;
    }
    ioc.run();
    if (result == net::error::would_block) {
        return net::error::operation_aborted;
    }
    return result;
}

void ThrowTransport(std::string_view step, const std::string& url, beast::error_code ec) {
    throw CTickerError(EErrorCode::TransportError,
                       std::string(step) + " failed for " + url + ": " + ec.message());
}

template <typename Stream>
SHttpResponse Exchange(net::io_context& ioc, const std::atomic<bool>& aborted, Stream& stream,
                       beast::tcp_stream& tcp_layer, http::request<http::string_body>& req,
                       const std::string& url, Clock::time_point deadline) {
    tcp_layer.expires_at(deadline);
    auto ec = RunToCompletion(ioc, aborted, [&](auto handler) { http::async_write(stream, req, handler); });
    if (ec) {
        ThrowTransport("write", url, ec);
    }

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = RunToCompletion(ioc, aborted, [&](auto handler) { http::async_read(stream, buffer, res, handler); });
    if (ec && ec != http::error::end_of_stream &&
        ec.category() == http::make_error_code(http::error::bad_version).category()) {
        throw CTickerError(EErrorCode::UnsupportedResponse,
                           "cannot decode response from " + url + ": " + ec.message());
    }
    if (ec) {
        ThrowTransport("read", url, ec);
    }
    return SHttpResponse{res.result_int(), std::move(res.body())};
}
}

std::optional<SParsedUrl> ParseUrl(std::string_view url) {
    SParsedUrl parsed;
    constexpr std::string_view kHttps = "https://";
    constexpr std::string_view kHttp = "http://";
    if (url.substr(0, kHttps.size()) == kHttps) {
        parsed.secure = true;
        url.remove_prefix(kHttps.size());
    } else if (url.substr(0, kHttp.size()) == kHttp) {
        parsed.secure = false;
        url.remove_prefix(kHttp.size());
    } else {
        return std::nullopt;
    }

    const auto slash = url.find_first_of("/?");
    std::string_view authority = url.substr(0, slash);
    if (slash != std::string_view::npos) {
        parsed.target = std::string(url.substr(slash));
        if (parsed.target.front() == '?') {
            parsed.target.insert(parsed.target.begin(), '/');
        }
    }

    const auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
        parsed.host = std::string(authority.substr(0, colon));
        parsed.port = std::string(authority.substr(colon + 1));
        if (parsed.port.empty() ||
            !std::all_of(parsed.port.begin(), parsed.port.end(), [](unsigned char c) { return std::isdigit(c); })) {
            return std::nullopt;
        }
    } else {
        parsed.host = std::string(authority);
        parsed.port = parsed.secure ? "443" : "80";
    }
    if (parsed.host.empty()) {
        return std::nullopt;
    }
    return parsed;
}

CInsecureHttpFetcher::CInsecureHttpFetcher(const SHttpConfig& cfg)
    : m_cfg(cfg) {}

SHttpResponse CInsecureHttpFetcher::Fetch(const std::string& url,
                                          const std::string& method,
                                          const std::optional<std::string>& body) {
    std::string upper = method;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
    http::verb verb;
    if (upper == "GET") {
        verb = http::verb::get;
    } else if (upper == "POST") {
        verb = http::verb::post;
    } else {
        throw CTickerError(EErrorCode::UnsupportedMethod, "method '" + method + "' is not supported");
    }

    const auto parsed = ParseUrl(url);
    if (!parsed) {
        throw CTickerError(EErrorCode::TransportError, "malformed url '" + url + "'");
    }

    http::request<http::string_body> req{verb, parsed->target, kHttpVersion};
    std::string host_header = parsed->host;
    if (parsed->port != (parsed->secure ? "443" : "80")) {
        host_header += ":" + parsed->port;
    }
    req.set(http::field::host, host_header);
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (verb == http::verb::post && body) {
        req.set(http::field::content_type, "application/json");
        req.body() = *body;
    }
    req.prepare_payload();

    const auto deadline = Clock::now() + std::chrono::seconds(m_cfg.timeout_sec);
    net::io_context ioc;

    struct SActiveGuard {
        SActiveGuard(CInsecureHttpFetcher& fetcher, net::io_context& ioc) : fetcher(fetcher), ioc(ioc) {
            std::lock_guard<std::mutex> lock(fetcher.m_mutex);
            fetcher.m_active.insert(&ioc);
        }
        ~SActiveGuard() {
            std::lock_guard<std::mutex> lock(fetcher.m_mutex);
            fetcher.m_active.erase(&ioc);
        }
        CInsecureHttpFetcher& fetcher;
        net::io_context& ioc;
    } active(*this, ioc);
    if (m_aborted.load()) {
        throw CTickerError(EErrorCode::TransportError, "fetch of " + url + " aborted");
    }

    tcp::resolver resolver(ioc);
    tcp::resolver::results_type results;
    net::steady_timer resolve_deadline(ioc, deadline);
    bool resolve_expired = false;
    resolve_deadline.async_wait([&](beast::error_code wait_ec) {
        if (!wait_ec) {
            resolve_expired = true;
            resolver.cancel();
        }
    });
    auto ec = RunToCompletion(ioc, m_aborted, [&](auto handler) {
        resolver.async_resolve(parsed->host, parsed->port,
                               [&results, &resolve_deadline, handler](beast::error_code resolve_ec,
                                                                      tcp::resolver::results_type r) mutable {
                                   resolve_deadline.cancel();
                                   results = std::move(r);
                                   handler(resolve_ec);
                               });
    });
    if (ec && resolve_expired) {
        ec = beast::error::timeout;
    }
    if (ec) {
        ThrowTransport("resolve", url, ec);
    }

    if (!parsed->secure) {
        beast::tcp_stream stream(ioc);
        stream.expires_at(deadline);
        ec = RunToCompletion(ioc, m_aborted, [&](auto handler) { stream.async_connect(results, handler); });
        if (ec) {
            ThrowTransport("connect", url, ec);
        }
        auto response = Exchange(ioc, m_aborted, stream, stream, req, url, deadline);
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    ssl::context ctx = MakeUnverifiedTlsContext();
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
    if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed->host.c_str())) {
        ThrowTransport("sni", url, beast::error_code{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()});
    }
    auto& tcp_layer = beast::get_lowest_layer(stream);
    tcp_layer.expires_at(deadline);
    ec = RunToCompletion(ioc, m_aborted, [&](auto handler) { tcp_layer.async_connect(results, handler); });
    if (ec) {
        ThrowTransport("connect", url, ec);
    }
    ec = RunToCompletion(ioc, m_aborted, [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); });
    if (ec) {
        ThrowTransport("tls handshake", url, ec);
    }

    auto response = Exchange(ioc, m_aborted, stream, tcp_layer, req, url, deadline);

    // Many servers drop the connection without close_notify; the response is already complete.
    ec = RunToCompletion(ioc, m_aborted, [&](auto handler) { stream.async_shutdown(handler); });
    if (ec && ec != net::ssl::error::stream_truncated && ec != net::error::eof) {
        Log(LogLevel::INFO, "Http", "TLS shutdown for " + url + ": " + ec.message());
    }
    return response;
}

void CInsecureHttpFetcher::Abort() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_aborted.store(true);
    for (auto* ioc : m_active) {
        ioc->stop();
    }
}
