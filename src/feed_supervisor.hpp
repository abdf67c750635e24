#pragma once

#include "config.hpp"
#include "event_broadcaster.hpp"
#include "feed_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

enum class EConnectionState { Disconnected, Connecting, Subscribed, Receiving, Closing };

std::string_view ToString(EConnectionState state);

// Keeps one subscription to the price feed alive for the life of the process:
// connect, subscribe, forward every frame, and on any failure tear down, wait
// a fixed backoff and start over. Retries never stop until Stop().
// All methods except State() and the counters must run on the io_context thread.
class CFeedSupervisor : public std::enable_shared_from_this<CFeedSupervisor> {
public:
    CFeedSupervisor(net::io_context& ioc,
                    std::shared_ptr<IFeedTransport> transport,
                    std::shared_ptr<CEventBroadcaster> broadcaster,
                    const SAppConfig& cfg);

    void Start();
    void Stop();
    // Drops the current connection attempt and connects again without waiting.
    void Restart();

    EConnectionState State() const { return m_state.load(); }
    uint64_t BackoffCount() const { return m_backoff_count.load(); }
    uint64_t FramesReceived() const { return m_frames_received.load(); }

private:
    void StartConnect();
    void OnConnect(uint64_t generation, beast::error_code ec);
    void OnSubscribed(uint64_t generation, beast::error_code ec);
    void ReadNext(uint64_t generation);
    void OnRead(uint64_t generation, beast::error_code ec, std::string frame);
    void ScheduleReconnect(std::string_view reason, beast::error_code ec);
    void OnBackoffTimer(beast::error_code timer_ec);
    bool IsCurrent(uint64_t generation) const;
    void Transition(EConnectionState next);

    net::steady_timer m_backoff_timer;
    std::shared_ptr<IFeedTransport> m_transport;
    std::shared_ptr<CEventBroadcaster> m_broadcaster;

    std::chrono::milliseconds m_backoff;
    std::string m_subscription;

    // Bumped on every teardown so completions from an abandoned connection are ignored.
    uint64_t m_generation{0};
    bool m_stopped{false};
    std::atomic<EConnectionState> m_state{EConnectionState::Disconnected};
    std::atomic<uint64_t> m_backoff_count{0};
    std::atomic<uint64_t> m_frames_received{0};
};
