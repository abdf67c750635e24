#include "insecure_tls.hpp"

boost::asio::ssl::context MakeUnverifiedTlsContext() {
    namespace ssl = boost::asio::ssl;
    ssl::context ctx(ssl::context::tls_client);
    ctx.set_options(ssl::context::default_workarounds |
                    ssl::context::no_sslv2 |
                    ssl::context::no_sslv3);
    ctx.set_verify_mode(ssl::verify_none);
    return ctx;
}
