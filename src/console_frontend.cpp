#include "console_frontend.hpp"

#include <istream>
#include <sstream>
#include <unistd.h>

#include "errors.hpp"
#include "logger.hpp"

namespace {
constexpr const char* kHelp =
    "commands: get | save <json> | toggle <xau|ms|gh|zs> | color <value> | "
    "menu <item> | fetch <GET|POST> <url> [body] | quit";
}

CConsoleFrontend::CConsoleFrontend(net::io_context& ui_ioc,
                                   std::shared_ptr<CCommandGateway> gateway,
                                   std::shared_ptr<CEventBroadcaster> broadcaster,
                                   std::ostream& out)
    : m_ui_ioc(ui_ioc),
      m_gateway(std::move(gateway)),
      m_broadcaster(std::move(broadcaster)),
      m_out(out) {}

void CConsoleFrontend::AttachListeners() {
    for (const char* topic : {kFeedEventTopic, kSettingsUpdatedTopic, kWindowToggleTopic}) {
        const std::string name = topic;
        m_listeners.push_back(m_broadcaster->Subscribe(name, [this, name](const std::string& payload) {
            Print(name + " " + payload);
        }));
    }
}

bool CConsoleFrontend::StartInput() {
    const int fd = ::dup(STDIN_FILENO);
    if (fd < 0) {
        Log(LogLevel::ERROR, "Console", "stdin not available for commands.");
        return false;
    }
    try {
        m_input.emplace(m_ui_ioc, fd);
    } catch (const boost::system::system_error& e) {
        Log(LogLevel::ERROR, "Console", std::string("stdin not available for commands: ") + e.what());
        m_input.reset();
        ::close(fd);
        return false;
    }
    Print(kHelp);
    ReadLine();
    return true;
}

void CConsoleFrontend::Stop() {
    for (auto id : m_listeners) {
        m_broadcaster->Unsubscribe(id);
    }
    m_listeners.clear();
    if (m_input) {
        boost::system::error_code ec;
        m_input->cancel(ec);
        m_input->close(ec);
        m_input.reset();
    }
    m_workers.stop();
    m_workers.join();
}

void CConsoleFrontend::ReadLine() {
    if (!m_input) {
        return;
    }
    net::async_read_until(*m_input, m_input_buffer, '\n',
                          [self = shared_from_this()](const boost::system::error_code& ec, std::size_t bytes) {
                              self->OnLine(ec, bytes);
                          });
}

void CConsoleFrontend::OnLine(const boost::system::error_code& ec, std::size_t /*bytes*/) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        if (ec != net::error::eof) {
            Log(LogLevel::ERROR, "Console", "stdin read failed: " + ec.message());
        }
        return;
    }

    std::istream is(&m_input_buffer);
    std::string line;
    std::getline(is, line);
    if (!line.empty()) {
        net::post(m_workers, [self = shared_from_this(), line]() {
            self->Print(self->Execute(line));
        });
    }
    ReadLine();
}

void CConsoleFrontend::Print(const std::string& text) {
    net::post(m_ui_ioc, [this, text]() {
        m_out << text << std::endl;
    });
}

std::string CConsoleFrontend::Execute(const std::string& line) {
    std::istringstream iss(line);
    std::string command;
    iss >> command;
    std::string argument;
    std::getline(iss >> std::ws, argument);

    try {
        if (command == "get") {
            return "settings " + m_gateway->GetSettings().ToJson().dump();
        }
        if (command == "save") {
            auto settings = SSettings::FromJson(nlohmann::json::parse(argument));
            return "settings " + m_gateway->SaveSettings(settings).ToJson().dump();
        }
        if (command == "toggle") {
            return "settings " + m_gateway->TogglePlatform(argument).ToJson().dump();
        }
        if (command == "color") {
            return "settings " + m_gateway->SetBackgroundColor(argument).ToJson().dump();
        }
        if (command == "menu") {
            return m_gateway->HandleMenuCommand(argument) ? "ok" : "error: unknown menu item " + argument;
        }
        if (command == "fetch") {
            std::istringstream args(argument);
            std::string method;
            std::string url;
            args >> method >> url;
            std::string body;
            std::getline(args >> std::ws, body);
            auto response = m_gateway->Fetch(url, method,
                                             body.empty() ? std::nullopt : std::optional<std::string>(body));
            return "http " + std::to_string(response.status) + " " + response.body;
        }
        if (command == "quit") {
            m_gateway->Quit();
            return "bye";
        }
    } catch (const CTickerError& e) {
        return std::string("error: ") + e.what();
    } catch (const nlohmann::json::exception& e) {
        return std::string("error: invalid settings document: ") + e.what();
    }
    return kHelp;
}
