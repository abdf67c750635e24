#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <boost/asio.hpp>

namespace net = boost::asio;

inline constexpr const char* kFeedEventTopic = "feed-event";
inline constexpr const char* kSettingsUpdatedTopic = "settings-updated";
inline constexpr const char* kWindowToggleTopic = "window-toggle";

// Fans events out to UI listeners. Deliveries are posted onto one strand of the
// UI io_context, so the publisher never runs listener code and each topic keeps
// publish order. Events without a listener are dropped.
class CEventBroadcaster {
public:
    using Listener = std::function<void(const std::string& payload)>;
    using ListenerId = uint64_t;

    explicit CEventBroadcaster(net::io_context& ui_ioc);

    ListenerId Subscribe(const std::string& topic, Listener listener);
    void Unsubscribe(ListenerId id);

    // Returns the number of deliveries scheduled, 0 when the event was dropped.
    std::size_t Publish(const std::string& topic, const std::string& payload);

private:
    struct SSubscription {
        std::string topic;
        std::shared_ptr<Listener> listener;
    };

    net::strand<net::io_context::executor_type> m_strand;
    std::mutex m_mutex;
    std::map<ListenerId, SSubscription> m_subscriptions;
    ListenerId m_next_id{1};
};
