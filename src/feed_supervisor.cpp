#include "feed_supervisor.hpp"

#include "logger.hpp"

std::string_view ToString(EConnectionState state) {
    switch (state) {
    case EConnectionState::Disconnected:
        return "Disconnected";
    case EConnectionState::Connecting:
        return "Connecting";
    case EConnectionState::Subscribed:
        return "Subscribed";
    case EConnectionState::Receiving:
        return "Receiving";
    case EConnectionState::Closing:
        return "Closing";
    }
    return "Unknown";
}

CFeedSupervisor::CFeedSupervisor(net::io_context& ioc,
                                 std::shared_ptr<IFeedTransport> transport,
                                 std::shared_ptr<CEventBroadcaster> broadcaster,
                                 const SAppConfig& cfg)
    : m_backoff_timer(ioc),
      m_transport(std::move(transport)),
      m_broadcaster(std::move(broadcaster)),
      m_backoff(cfg.retry.backoff_ms),
      m_subscription(BuildSubscriptionMessage(cfg.feed.instruments)) {}

void CFeedSupervisor::Start() {
    if (m_stopped || m_state.load() != EConnectionState::Disconnected) {
        return;
    }
    StartConnect();
}

void CFeedSupervisor::Stop() {
    if (m_stopped) {
        return;
    }
    m_stopped = true;
    ++m_generation;
    Transition(EConnectionState::Closing);
    m_backoff_timer.cancel();
    m_transport->Close();
}

void CFeedSupervisor::Restart() {
    if (m_stopped) {
        return;
    }
    ++m_generation;
    m_backoff_timer.cancel();
    m_transport->Close();
    Transition(EConnectionState::Disconnected);
    StartConnect();
}

void CFeedSupervisor::StartConnect() {
    if (m_stopped) {
        return;
    }
    Transition(EConnectionState::Connecting);
    const uint64_t generation = m_generation;
    m_transport->AsyncConnect([self = shared_from_this(), generation](beast::error_code ec) {
        self->OnConnect(generation, ec);
    });
}

void CFeedSupervisor::OnConnect(uint64_t generation, beast::error_code ec) {
    if (!IsCurrent(generation)) {
        return;
    }
    if (ec) {
        ScheduleReconnect("handshake", ec);
        return;
    }

    m_transport->AsyncWrite(m_subscription, [self = shared_from_this(), generation](beast::error_code write_ec) {
        self->OnSubscribed(generation, write_ec);
    });
}

void CFeedSupervisor::OnSubscribed(uint64_t generation, beast::error_code ec) {
    if (!IsCurrent(generation)) {
        return;
    }
    if (ec) {
        ScheduleReconnect("subscribe", ec);
        return;
    }
    Transition(EConnectionState::Subscribed);
    Transition(EConnectionState::Receiving);
    ReadNext(generation);
}

void CFeedSupervisor::ReadNext(uint64_t generation) {
    m_transport->AsyncRead([self = shared_from_this(), generation](beast::error_code ec, std::string frame) {
        self->OnRead(generation, ec, std::move(frame));
    });
}

void CFeedSupervisor::OnRead(uint64_t generation, beast::error_code ec, std::string frame) {
    if (!IsCurrent(generation)) {
        return;
    }
    if (ec == websocket::error::closed) {
        ScheduleReconnect("closed by peer", ec);
        return;
    }
    if (ec) {
        ScheduleReconnect("read", ec);
        return;
    }

    ++m_frames_received;
    m_broadcaster->Publish(kFeedEventTopic, frame);
    ReadNext(generation);
}

void CFeedSupervisor::ScheduleReconnect(std::string_view reason, beast::error_code ec) {
    Log(LogLevel::ERROR, "Feed", "Connection error (" + std::string(reason) + "): " + (ec ? ec.message() : "unknown"));

    ++m_generation;
    m_transport->Close();
    Transition(EConnectionState::Disconnected);
    if (m_stopped) {
        return;
    }

    ++m_backoff_count;
    Log(LogLevel::INFO, "Feed", "Reconnecting in " + std::to_string(m_backoff.count()) + "ms...");
    m_backoff_timer.expires_after(m_backoff);
    m_backoff_timer.async_wait(
        beast::bind_front_handler(&CFeedSupervisor::OnBackoffTimer, shared_from_this()));
}

void CFeedSupervisor::OnBackoffTimer(beast::error_code timer_ec) {
    if (timer_ec || m_stopped) {
        return;
    }
    StartConnect();
}

bool CFeedSupervisor::IsCurrent(uint64_t generation) const {
    return !m_stopped && generation == m_generation;
}

void CFeedSupervisor::Transition(EConnectionState next) {
    const auto previous = m_state.exchange(next);
    if (previous != next) {
        Log(LogLevel::INFO, "Feed", std::string(ToString(previous)) + " -> " + std::string(ToString(next)));
    }
}
