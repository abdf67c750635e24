#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "command_gateway.hpp"
#include "fake_settings_storage.hpp"

#include <thread>
#include <vector>

namespace {
class MockHttpFetcher : public CInsecureHttpFetcher {
public:
    MockHttpFetcher() : CInsecureHttpFetcher(SHttpConfig{}) {}
    MOCK_METHOD(SHttpResponse, Fetch, (const std::string&, const std::string&, const std::optional<std::string>&), (override));
};

struct SGatewayFixture {
    boost::asio::io_context ioc;
    std::shared_ptr<CFakeSettingsStorage> storage = std::make_shared<CFakeSettingsStorage>();
    std::shared_ptr<CEventBroadcaster> broadcaster = std::make_shared<CEventBroadcaster>(ioc);
    std::shared_ptr<CSettingsStore> store = std::make_shared<CSettingsStore>(storage, broadcaster);
    std::shared_ptr<MockHttpFetcher> fetcher = std::make_shared<MockHttpFetcher>();
    std::vector<int> quit_codes;
    CCommandGateway gateway{store, fetcher, broadcaster, [this](int code) { quit_codes.push_back(code); }};

    SGatewayFixture() { store->Load(); }
};
}

TEST(CommandGatewayTest, MutatorsReturnResultingSettings) {
    SGatewayFixture f;
    EXPECT_EQ(f.gateway.GetSettings(), DefaultSettings());

    SSettings toggled = f.gateway.TogglePlatform("zs");
    EXPECT_FALSE(toggled.show_zs);
    EXPECT_EQ(f.gateway.GetSettings(), toggled);

    SSettings colored = f.gateway.SetBackgroundColor("#1e3a5f");
    EXPECT_FALSE(colored.show_zs);
    EXPECT_EQ(colored.bg_color, "#1e3a5f");

    SSettings replacement;
    replacement.show_ms = false;
    EXPECT_EQ(f.gateway.SaveSettings(replacement), replacement);
    EXPECT_EQ(f.gateway.GetSettings(), replacement);
}

TEST(CommandGatewayTest, ErrorsReachCaller) {
    SGatewayFixture f;
    EXPECT_THROW(f.gateway.TogglePlatform("unknown"), CTickerError);
    f.storage->fail_save = true;
    EXPECT_THROW(f.gateway.SetBackgroundColor("#000000"), CTickerError);
    EXPECT_EQ(f.gateway.GetSettings(), DefaultSettings());
}

TEST(CommandGatewayTest, QuitInvokesHandler) {
    SGatewayFixture f;
    f.gateway.Quit();
    EXPECT_EQ(f.quit_codes, std::vector<int>{0});
}

TEST(CommandGatewayTest, FetchDelegates) {
    SGatewayFixture f;
    EXPECT_CALL(*f.fetcher, Fetch("https://src.example/q", "POST", std::optional<std::string>("{}")))
        .WillOnce(::testing::Return(SHttpResponse{200, "body"}));
    auto res = f.gateway.Fetch("https://src.example/q", "POST", std::string("{}"));
    EXPECT_EQ(res.status, 200u);
    EXPECT_EQ(res.body, "body");
}

TEST(CommandGatewayTest, MenuTogglesAndColors) {
    SGatewayFixture f;
    EXPECT_TRUE(f.gateway.HandleMenuCommand("toggle_xau"));
    EXPECT_TRUE(f.gateway.HandleMenuCommand("toggle_ms"));
    EXPECT_TRUE(f.gateway.HandleMenuCommand("toggle_gh"));
    EXPECT_TRUE(f.gateway.HandleMenuCommand("toggle_zs"));
    SSettings s = f.gateway.GetSettings();
    EXPECT_FALSE(s.show_xau);
    EXPECT_FALSE(s.show_ms);
    EXPECT_FALSE(s.show_gh);
    EXPECT_FALSE(s.show_zs);

    EXPECT_TRUE(f.gateway.HandleMenuCommand("color_blue"));
    EXPECT_EQ(f.gateway.GetSettings().bg_color, "#1e3a5f");
    EXPECT_TRUE(f.gateway.HandleMenuCommand("color_black"));
    EXPECT_EQ(f.gateway.GetSettings().bg_color, "#000000");
    EXPECT_TRUE(f.gateway.HandleMenuCommand("color_dark"));
    EXPECT_EQ(f.gateway.GetSettings().bg_color, "#2c3e50");
}

TEST(CommandGatewayTest, MenuShowAndQuit) {
    SGatewayFixture f;
    int toggles = 0;
    f.broadcaster->Subscribe(kWindowToggleTopic, [&](const std::string&) { ++toggles; });
    EXPECT_TRUE(f.gateway.HandleMenuCommand("show"));
    f.ioc.run();
    EXPECT_EQ(toggles, 1);

    EXPECT_TRUE(f.gateway.HandleMenuCommand("quit"));
    EXPECT_EQ(f.quit_codes, std::vector<int>{0});
}

TEST(CommandGatewayTest, MenuFailureIsAbsorbed) {
    SGatewayFixture f;
    f.storage->fail_save = true;
    EXPECT_TRUE(f.gateway.HandleMenuCommand("toggle_xau"));
    EXPECT_TRUE(f.gateway.GetSettings().show_xau);
    EXPECT_FALSE(f.gateway.HandleMenuCommand("toggle_btc"));
}

TEST(CommandGatewayTest, ConcurrentMenuAndUiCalls) {
    SGatewayFixture f;
    std::thread tray([&]() {
        for (int i = 0; i < 20; ++i) {
            f.gateway.HandleMenuCommand("toggle_gh");
        }
    });
    std::thread ui([&]() {
        for (int i = 0; i < 21; ++i) {
            f.gateway.SetBackgroundColor("#" + std::to_string(100000 + i));
        }
    });
    tray.join();
    ui.join();
    SSettings s = f.gateway.GetSettings();
    EXPECT_TRUE(s.show_gh);
    EXPECT_EQ(s.bg_color, "#100020");
}
