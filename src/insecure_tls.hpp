#pragma once

#include <boost/asio/ssl.hpp>

// The feed and the secondary price sources present certificates that cannot
// be verified against the system trust store. This is the only factory for a
// TLS client context with certificate and hostname checks switched off; use
// it for those endpoints only.
boost::asio::ssl::context MakeUnverifiedTlsContext();
