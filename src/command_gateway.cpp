#include "command_gateway.hpp"

#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace {
constexpr std::pair<std::string_view, std::string_view> kMenuToggles[] = {
    {"toggle_xau", "xau"},
    {"toggle_ms", "ms"},
    {"toggle_gh", "gh"},
    {"toggle_zs", "zs"},
};

constexpr std::pair<std::string_view, std::string_view> kMenuColors[] = {
    {"color_dark", "#2c3e50"},
    {"color_blue", "#1e3a5f"},
    {"color_black", "#000000"},
};
}

CCommandGateway::CCommandGateway(std::shared_ptr<CSettingsStore> store,
                                 std::shared_ptr<CInsecureHttpFetcher> fetcher,
                                 std::shared_ptr<CEventBroadcaster> broadcaster,
                                 QuitHandler quit)
    : m_store(std::move(store)),
      m_fetcher(std::move(fetcher)),
      m_broadcaster(std::move(broadcaster)),
      m_quit(std::move(quit)) {}

SSettings CCommandGateway::GetSettings() const {
    return m_store->Get();
}

SSettings CCommandGateway::SaveSettings(const SSettings& settings) {
    m_store->Replace(settings);
    return settings;
}

SSettings CCommandGateway::TogglePlatform(std::string_view platform) {
    return m_store->Toggle(platform);
}

SSettings CCommandGateway::SetBackgroundColor(const std::string& color) {
    return m_store->SetBackground(color);
}

void CCommandGateway::Quit() {
    Log(LogLevel::INFO, "Gateway", "Quit requested.");
    if (m_quit) {
        m_quit(0);
    }
}

SHttpResponse CCommandGateway::Fetch(const std::string& url,
                                     const std::string& method,
                                     const std::optional<std::string>& body) {
    return m_fetcher->Fetch(url, method, body);
}

bool CCommandGateway::HandleMenuCommand(std::string_view item_id) {
    try {
        for (const auto& entry : kMenuToggles) {
            if (entry.first == item_id) {
                TogglePlatform(entry.second);
                return true;
            }
        }
        for (const auto& entry : kMenuColors) {
            if (entry.first == item_id) {
                SetBackgroundColor(std::string(entry.second));
                return true;
            }
        }
    } catch (const CTickerError& e) {
        Log(LogLevel::ERROR, "Gateway", "Menu '" + std::string(item_id) + "' failed: " + e.what());
        return true;
    }

    if (item_id == "show") {
        m_broadcaster->Publish(kWindowToggleTopic, "{}");
        return true;
    }
    if (item_id == "quit") {
        Quit();
        return true;
    }
    Log(LogLevel::ERROR, "Gateway", "Unknown menu item: " + std::string(item_id));
    return false;
}
