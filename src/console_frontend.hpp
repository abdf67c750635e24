#pragma once

#include "command_gateway.hpp"
#include "event_broadcaster.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

// Line-oriented stand-in for the ticker window: prints broadcast topics and
// turns stdin lines into gateway calls. Commands run on a worker pool so a
// slow fetch never stalls event delivery.
class CConsoleFrontend : public std::enable_shared_from_this<CConsoleFrontend> {
public:
    CConsoleFrontend(net::io_context& ui_ioc,
                     std::shared_ptr<CCommandGateway> gateway,
                     std::shared_ptr<CEventBroadcaster> broadcaster,
                     std::ostream& out);

    void AttachListeners();
    // Returns false when stdin cannot be watched (e.g. redirected from a regular file).
    bool StartInput();
    void Stop();

    std::string Execute(const std::string& line);

private:
    void ReadLine();
    void OnLine(const boost::system::error_code& ec, std::size_t bytes);
    void Print(const std::string& text);

    net::io_context& m_ui_ioc;
    std::shared_ptr<CCommandGateway> m_gateway;
    std::shared_ptr<CEventBroadcaster> m_broadcaster;
    std::ostream& m_out;

    std::optional<net::posix::stream_descriptor> m_input;
    net::streambuf m_input_buffer;
    net::thread_pool m_workers{2};
    std::vector<CEventBroadcaster::ListenerId> m_listeners;
};
