#pragma once

#include "command_gateway.hpp"
#include "config.hpp"
#include "console_frontend.hpp"
#include "event_broadcaster.hpp"
#include "feed_supervisor.hpp"
#include "feed_transport.hpp"
#include "http_fetcher.hpp"
#include "settings_store.hpp"
#include "logger.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>

// Wires the core together. The UI io_context runs on the thread calling Run()
// and carries broadcasts and signals; the feed supervisor gets its own network
// thread.
class CAppRunner {
public:
    using TransportFactory = std::function<std::shared_ptr<IFeedTransport>(net::io_context&, const SFeedConfig&)>;

    CAppRunner(int argc, char** argv);
    virtual ~CAppRunner() = default;

    int Run();
    // Thread safe. Stops the UI loop; outstanding feed work and fetches are abandoned.
    void RequestExit(int exit_code);
    bool IsRunning() const { return m_running.load(); }

protected:
    virtual bool LoadAndValidateConfig();
    void SetupSignalHandler();
    std::shared_ptr<ISettingsStorage> OpenStorage();
    void StartNetwork();
    void StopNetwork();
    void HandleExceptionBackoff();

    int m_argc = 0;
    char** m_argv = nullptr;

    SAppConfig m_cfg;

    net::io_context m_ui_ioc;
    net::io_context m_net_ioc;
    std::unique_ptr<net::signal_set> m_signals;

    std::shared_ptr<CEventBroadcaster> m_broadcaster;
    std::shared_ptr<CSettingsStore> m_store;
    std::shared_ptr<CInsecureHttpFetcher> m_fetcher;
    std::shared_ptr<CCommandGateway> m_gateway;
    std::shared_ptr<CFeedSupervisor> m_supervisor;
    std::shared_ptr<CConsoleFrontend> m_frontend;

    std::atomic<bool> m_running{false};
    std::atomic<bool> m_net_stop{false};
    std::atomic<int> m_exit_code{0};

    TransportFactory m_transport_factory;

    std::thread m_net_thread;
};
