#pragma once

#include "event_broadcaster.hpp"
#include "http_fetcher.hpp"
#include "settings_store.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

// Operations the UI and the tray menu may invoke. Mutators return the
// resulting settings; failures are thrown as CTickerError.
class CCommandGateway {
public:
    using QuitHandler = std::function<void(int exit_code)>;

    CCommandGateway(std::shared_ptr<CSettingsStore> store,
                    std::shared_ptr<CInsecureHttpFetcher> fetcher,
                    std::shared_ptr<CEventBroadcaster> broadcaster,
                    QuitHandler quit);

    SSettings GetSettings() const;
    SSettings SaveSettings(const SSettings& settings);
    SSettings TogglePlatform(std::string_view platform);
    SSettings SetBackgroundColor(const std::string& color);
    void Quit();

    SHttpResponse Fetch(const std::string& url,
                        const std::string& method,
                        const std::optional<std::string>& body = std::nullopt);

    // Tray menu item ids. Returns false for an unknown id. Errors are logged,
    // there is nobody to report them to.
    bool HandleMenuCommand(std::string_view item_id);

private:
    std::shared_ptr<CSettingsStore> m_store;
    std::shared_ptr<CInsecureHttpFetcher> m_fetcher;
    std::shared_ptr<CEventBroadcaster> m_broadcaster;
    QuitHandler m_quit;
};
