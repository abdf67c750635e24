#include <gtest/gtest.h>
#include "event_broadcaster.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

TEST(EventBroadcasterTest, DropsWithoutListener) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    EXPECT_EQ(broadcaster.Publish(kFeedEventTopic, "tick"), 0u);
    EXPECT_EQ(ioc.poll(), 0u);
}

TEST(EventBroadcasterTest, DeliversOnlyMatchingTopic) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    std::vector<std::string> feed;
    std::vector<std::string> settings;
    broadcaster.Subscribe(kFeedEventTopic, [&](const std::string& p) { feed.push_back(p); });
    broadcaster.Subscribe(kSettingsUpdatedTopic, [&](const std::string& p) { settings.push_back(p); });

    EXPECT_EQ(broadcaster.Publish(kFeedEventTopic, "a"), 1u);
    EXPECT_EQ(broadcaster.Publish(kSettingsUpdatedTopic, "{}"), 1u);
    ioc.run();

    EXPECT_EQ(feed, std::vector<std::string>{"a"});
    EXPECT_EQ(settings, std::vector<std::string>{"{}"});
}

TEST(EventBroadcasterTest, PreservesPublishOrder) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    std::vector<std::string> received;
    broadcaster.Subscribe(kFeedEventTopic, [&](const std::string& p) { received.push_back(p); });

    std::vector<std::string> expected;
    for (int i = 0; i < 100; ++i) {
        expected.push_back(std::to_string(i));
        broadcaster.Publish(kFeedEventTopic, expected.back());
    }
    ioc.run();
    EXPECT_EQ(received, expected);
}

TEST(EventBroadcasterTest, PublishDoesNotWaitForListener) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    std::promise<void> release;
    auto released = release.get_future().share();
    std::atomic<int> delivered{0};
    broadcaster.Subscribe(kFeedEventTopic, [&, released](const std::string&) {
        released.wait();
        ++delivered;
    });

    std::thread ui([&]() {
        auto work = boost::asio::make_work_guard(ioc);
        ioc.run_for(std::chrono::seconds(5));
    });

    broadcaster.Publish(kFeedEventTopic, "first");
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    // The listener is now blocked on the ui thread; publishing must still return at once.
    const auto started = std::chrono::steady_clock::now();
    broadcaster.Publish(kFeedEventTopic, "second");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(100));

    release.set_value();
    while (delivered.load() < 2) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ioc.stop();
    ui.join();
    EXPECT_EQ(delivered.load(), 2);
}

TEST(EventBroadcasterTest, UnsubscribeStopsDelivery) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    int calls = 0;
    auto id = broadcaster.Subscribe(kFeedEventTopic, [&](const std::string&) { ++calls; });
    broadcaster.Publish(kFeedEventTopic, "x");
    ioc.run();
    broadcaster.Unsubscribe(id);
    EXPECT_EQ(broadcaster.Publish(kFeedEventTopic, "y"), 0u);
    ioc.restart();
    ioc.run();
    EXPECT_EQ(calls, 1);
}

TEST(EventBroadcasterTest, ThrowingListenerDoesNotStopOthers) {
    boost::asio::io_context ioc;
    CEventBroadcaster broadcaster(ioc);
    int calls = 0;
    broadcaster.Subscribe(kFeedEventTopic, [](const std::string&) { throw std::runtime_error("boom"); });
    broadcaster.Subscribe(kFeedEventTopic, [&](const std::string&) { ++calls; });
    EXPECT_EQ(broadcaster.Publish(kFeedEventTopic, "x"), 2u);
    EXPECT_NO_THROW(ioc.run());
    EXPECT_EQ(calls, 1);
}
