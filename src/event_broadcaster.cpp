#include "event_broadcaster.hpp"

#include <vector>

#include "logger.hpp"

CEventBroadcaster::CEventBroadcaster(net::io_context& ui_ioc)
    : m_strand(net::make_strand(ui_ioc)) {}

CEventBroadcaster::ListenerId CEventBroadcaster::Subscribe(const std::string& topic, Listener listener) {
    std::lock_guard<std::mutex> lock(m_mutex);
    const ListenerId id = m_next_id++;
    m_subscriptions.emplace(id, SSubscription{topic, std::make_shared<Listener>(std::move(listener))});
    return id;
}

void CEventBroadcaster::Unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscriptions.erase(id);
}

std::size_t CEventBroadcaster::Publish(const std::string& topic, const std::string& payload) {
    std::vector<std::shared_ptr<Listener>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& entry : m_subscriptions) {
            if (entry.second.topic == topic) {
                targets.push_back(entry.second.listener);
            }
        }
    }

    for (auto& listener : targets) {
        net::post(m_strand, [listener, topic, payload]() {
            try {
                (*listener)(payload);
            } catch (const std::exception& e) {
                Log(LogLevel::ERROR, "Broadcast", "Listener for '" + topic + "' threw: " + e.what());
            }
        });
    }
    return targets.size();
}
