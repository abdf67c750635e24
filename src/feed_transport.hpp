#pragma once

#include "config.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

namespace net = boost::asio;
namespace ssl = net::ssl;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

// Full-duplex frame connection used by CFeedSupervisor. Handlers run on the
// io_context the transport was created with. A close frame from the peer is
// reported to the read handler as websocket::error::closed.
class IFeedTransport {
public:
    using ConnectHandler = std::function<void(beast::error_code)>;
    using WriteHandler = std::function<void(beast::error_code)>;
    using ReadHandler = std::function<void(beast::error_code, std::string)>;

    virtual ~IFeedTransport() = default;

    virtual void AsyncConnect(ConnectHandler handler) = 0;
    virtual void AsyncWrite(std::string text, WriteHandler handler) = 0;
    virtual void AsyncRead(ReadHandler handler) = 0;
    virtual void Close() = 0;
};

class CBeastFeedTransport : public IFeedTransport,
                            public std::enable_shared_from_this<CBeastFeedTransport> {
public:
    CBeastFeedTransport(net::io_context& ioc, const SFeedConfig& cfg);

    void AsyncConnect(ConnectHandler handler) override;
    void AsyncWrite(std::string text, WriteHandler handler) override;
    void AsyncRead(ReadHandler handler) override;
    void Close() override;

private:
    // One connect attempt. Pending operations hold a reference, so a closed
    // stream stays alive until its handlers have drained.
    struct SConnection {
        SConnection(net::io_context& ioc, ssl::context& ctx) : ws(ioc, ctx) {}

        websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws;
        beast::flat_buffer buffer;
        std::string outgoing;
    };
    using ConnectionPtr = std::shared_ptr<SConnection>;

    void OnResolve(ConnectionPtr conn, uint64_t attempt, beast::error_code ec,
                   tcp::resolver::results_type results);
    void OnConnect(ConnectionPtr conn, uint64_t attempt, beast::error_code ec,
                   tcp::resolver::endpoint_type endpoint);
    void OnSslHandshake(ConnectionPtr conn, uint64_t attempt, beast::error_code ec);
    void OnWebsocketHandshake(ConnectionPtr conn, uint64_t attempt, beast::error_code ec);
    void CompleteConnect(beast::error_code ec);

    net::io_context& m_ioc;
    ssl::context m_ssl_ctx;
    tcp::resolver m_resolver;
    ConnectionPtr m_conn;
    // Bumped by Close(); completions of older attempts are dropped.
    uint64_t m_attempt = 0;
    ConnectHandler m_connect_handler;

    SFeedConfig m_cfg;
};
