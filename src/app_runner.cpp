#include "app_runner.hpp"

#include <chrono>
#include <csignal>
#include <iostream>

#include "errors.hpp"

CAppRunner::CAppRunner(int argc, char** argv)
    : m_argc(argc), m_argv(argv),
      m_transport_factory([](net::io_context& ioc, const SFeedConfig& cfg) {
          return std::make_shared<CBeastFeedTransport>(ioc, cfg);
      }) {}

int CAppRunner::Run() {
    if (!LoadAndValidateConfig()) {
        return 1;
    }
    InitLogFile(m_cfg.log.filename, m_cfg.log.max_file_mb * 1024ull * 1024ull, m_cfg.log.max_files);
    Log(LogLevel::INFO, "Main", "Starting, log file " + m_cfg.log.filename);

    //We handle such case so there is no need to terminate
    std::signal(SIGPIPE, SIG_IGN);
    m_signals = std::make_unique<net::signal_set>(m_ui_ioc, SIGINT, SIGTERM);
    SetupSignalHandler();
    auto ui_work = net::make_work_guard(m_ui_ioc);

    m_broadcaster = std::make_shared<CEventBroadcaster>(m_ui_ioc);
    m_store = std::make_shared<CSettingsStore>(OpenStorage(), m_broadcaster, m_cfg.storage.key);
    m_store->Load();
    m_fetcher = std::make_shared<CInsecureHttpFetcher>(m_cfg.http);
    m_gateway = std::make_shared<CCommandGateway>(
        m_store,
        m_fetcher,
        m_broadcaster,
        [this](int exit_code) { RequestExit(exit_code); });

    if (m_cfg.ui.console_commands) {
        m_frontend = std::make_shared<CConsoleFrontend>(m_ui_ioc, m_gateway, m_broadcaster, std::cout);
        m_frontend->AttachListeners();
        m_frontend->StartInput();
    }

    StartNetwork();

    Log(LogLevel::INFO, "Main", "Entering ui loop...");
    m_running.store(true);
    m_ui_ioc.run();
    m_running.store(false);

    m_fetcher->Abort();
    StopNetwork();
    if (m_frontend) {
        m_frontend->Stop();
    }
    m_signals.reset();

    Log(LogLevel::INFO, "Main", "Ticker stopped.");
    CloseLogFile();
    return m_exit_code.load();
}

void CAppRunner::RequestExit(int exit_code) {
    m_exit_code.store(exit_code);
    m_ui_ioc.stop();
}

void CAppRunner::SetupSignalHandler() {
    m_signals->async_wait([this](const boost::system::error_code& ec, int /*signo*/) {
        if (ec) return;
        Log(LogLevel::INFO, "Main", "Shutdown signal received.");
        RequestExit(0);
    });
}

bool CAppRunner::LoadAndValidateConfig() {
    try {
        m_cfg = LoadConfig(m_argc, m_argv);
    } catch (const std::exception& e) {
        Log(LogLevel::ERROR, "Config", "Failed to load config: " + std::string(e.what()));
        return false;
    }
    if (!ValidateConfig(m_cfg)) {
        Log(LogLevel::ERROR, "Config", "Validation failed.");
        return false;
    }
    return true;
}

std::shared_ptr<ISettingsStorage> CAppRunner::OpenStorage() {
    try {
        return CJsonFileStorage::Open(m_cfg.storage.path);
    } catch (const CTickerError& e) {
        Log(LogLevel::ERROR, "Main", std::string("Open store failed: ") + e.what());
        return nullptr;
    }
}

void CAppRunner::StartNetwork() {
    auto transport = m_transport_factory(m_net_ioc, m_cfg.feed);
    m_supervisor = std::make_shared<CFeedSupervisor>(m_net_ioc, transport, m_broadcaster, m_cfg);
    net::post(m_net_ioc, [supervisor = m_supervisor]() { supervisor->Start(); });

    m_net_stop.store(false);
    m_net_thread = std::thread([this]() {
        auto work = net::make_work_guard(m_net_ioc);
        while (!m_net_stop.load()) {
            try {
                m_net_ioc.run();
                break;
            } catch (const std::exception& e) {
                Log(LogLevel::ERROR, "Feed", "Exception in network loop: " + std::string(e.what()));
                HandleExceptionBackoff();
            }
        }
        Log(LogLevel::INFO, "Feed", "Network thread finished.");
    });
}

void CAppRunner::StopNetwork() {
    m_net_stop.store(true);
    m_net_ioc.stop();
    if (m_net_thread.joinable()) {
        m_net_thread.join();
    }
    // The loop is no longer running, so the supervisor can be touched from here.
    if (m_supervisor) {
        m_supervisor->Stop();
    }
}

void CAppRunner::HandleExceptionBackoff() {
    if (m_net_stop.load()) {
        return;
    }
    const auto delay = std::chrono::milliseconds(m_cfg.retry.backoff_ms);
    Log(LogLevel::INFO, "Feed", "Restart after exception in " + std::to_string(delay.count()) + "ms...");
    std::this_thread::sleep_for(delay);
    m_net_ioc.restart();
    net::post(m_net_ioc, [supervisor = m_supervisor]() { supervisor->Restart(); });
}
