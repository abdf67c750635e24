#include "feed_transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "insecure_tls.hpp"

CBeastFeedTransport::CBeastFeedTransport(net::io_context& ioc, const SFeedConfig& cfg)
    : m_ioc(ioc),
      m_ssl_ctx(MakeUnverifiedTlsContext()),
      m_resolver(ioc),
      m_cfg(cfg) {}

void CBeastFeedTransport::AsyncConnect(ConnectHandler handler) {
    Close();
    m_connect_handler = std::move(handler);
    m_conn = std::make_shared<SConnection>(m_ioc, m_ssl_ctx);

    m_resolver.async_resolve(m_cfg.host,
                             m_cfg.port,
                             beast::bind_front_handler(&CBeastFeedTransport::OnResolve,
                                                       shared_from_this(), m_conn, m_attempt));
}

void CBeastFeedTransport::OnResolve(ConnectionPtr conn, uint64_t attempt, beast::error_code ec,
                                    tcp::resolver::results_type results) {
    if (attempt != m_attempt) {
        return;
    }
    if (ec) {
        CompleteConnect(ec);
        return;
    }

    auto& tcp_layer = beast::get_lowest_layer(conn->ws);
    tcp_layer.expires_after(std::chrono::seconds(m_cfg.handshake_timeout_sec));
    tcp_layer.async_connect(
        results,
        beast::bind_front_handler(&CBeastFeedTransport::OnConnect, shared_from_this(), conn, attempt));
}

void CBeastFeedTransport::OnConnect(ConnectionPtr conn, uint64_t attempt, beast::error_code ec,
                                    tcp::resolver::endpoint_type /*endpoint*/) {
    if (attempt != m_attempt) {
        return;
    }
    if (ec) {
        CompleteConnect(ec);
        return;
    }

    if (!SSL_set_tlsext_host_name(conn->ws.next_layer().native_handle(), m_cfg.host.c_str())) {
        beast::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        CompleteConnect(sni_ec);
        return;
    }

    beast::get_lowest_layer(conn->ws).expires_after(std::chrono::seconds(m_cfg.handshake_timeout_sec));
    conn->ws.next_layer().async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&CBeastFeedTransport::OnSslHandshake, shared_from_this(), conn, attempt));
}

void CBeastFeedTransport::OnSslHandshake(ConnectionPtr conn, uint64_t attempt, beast::error_code ec) {
    if (attempt != m_attempt) {
        return;
    }
    if (ec) {
        CompleteConnect(ec);
        return;
    }

    // The websocket stream manages its own timeouts from here on.
    beast::get_lowest_layer(conn->ws).expires_never();
    auto opt = websocket::stream_base::timeout::suggested(beast::role_type::client);
    opt.handshake_timeout = std::chrono::seconds(m_cfg.handshake_timeout_sec);
    if (m_cfg.idle_timeout_sec > 0) {
        opt.idle_timeout = std::chrono::seconds(m_cfg.idle_timeout_sec);
        opt.keep_alive_pings = true;
    } else {
        opt.idle_timeout = websocket::stream_base::none();
    }
    conn->ws.set_option(opt);

    std::string host_header = m_cfg.host;
    if (m_cfg.port != "443") {
        host_header += ":" + m_cfg.port;
    }
    conn->ws.async_handshake(
        host_header,
        m_cfg.target,
        beast::bind_front_handler(&CBeastFeedTransport::OnWebsocketHandshake,
                                  shared_from_this(), conn, attempt));
}

void CBeastFeedTransport::OnWebsocketHandshake(ConnectionPtr conn, uint64_t attempt, beast::error_code ec) {
    if (attempt != m_attempt) {
        return;
    }
    if (!ec) {
        conn->ws.text(true);
    }
    CompleteConnect(ec);
}

void CBeastFeedTransport::CompleteConnect(beast::error_code ec) {
    auto handler = std::move(m_connect_handler);
    m_connect_handler = nullptr;
    if (handler) {
        handler(ec);
    }
}

void CBeastFeedTransport::AsyncWrite(std::string text, WriteHandler handler) {
    if (!m_conn) {
        net::post(m_ioc, [handler = std::move(handler)]() {
            handler(net::error::not_connected);
        });
        return;
    }
    auto conn = m_conn;
    conn->outgoing = std::move(text);
    conn->ws.async_write(
        net::buffer(conn->outgoing),
        [self = shared_from_this(), conn, handler = std::move(handler)](beast::error_code ec, std::size_t) {
            handler(ec);
        });
}

void CBeastFeedTransport::AsyncRead(ReadHandler handler) {
    if (!m_conn) {
        net::post(m_ioc, [handler = std::move(handler)]() {
            handler(net::error::not_connected, {});
        });
        return;
    }
    auto conn = m_conn;
    conn->ws.async_read(
        conn->buffer,
        [self = shared_from_this(), conn, handler = std::move(handler)](beast::error_code ec, std::size_t) {
            if (ec) {
                conn->buffer.consume(conn->buffer.size());
                handler(ec, {});
                return;
            }
            std::string frame = beast::buffers_to_string(conn->buffer.data());
            conn->buffer.consume(conn->buffer.size());
            handler(ec, std::move(frame));
        });
}

void CBeastFeedTransport::Close() {
    ++m_attempt;
    m_connect_handler = nullptr;
    m_resolver.cancel();
    if (m_conn) {
        // Outstanding operations complete with operation_aborted and release the stream.
        beast::get_lowest_layer(m_conn->ws).close();
        m_conn.reset();
    }
}
