#include "connection_manager.hpp"

#include <algorithm>

namespace ancs {

ConnectionManager::ConnectionManager(SerialContext& context,
                                     GattTransport& transport,
                                     Scheduler& scheduler,
                                     const EngineConfig& config)
    : context_(context),
      transport_(transport),
      scheduler_(scheduler),
      config_(config)
{
    stats_.last_error = Error::Ok;
    transport_.set_listener(this);
}

ConnectionManager::~ConnectionManager()
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    cancel_timer(connect_timer_);
    cancel_timer(reconnect_timer_);
    if (!shut_down_) {
        transport_.set_listener(nullptr);
    }
}

void ConnectionManager::set_observer(ConnectionObserver* observer)
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    observer_ = observer;
}

uint32_t ConnectionManager::backoff_delay_ms(const EngineConfig& config, uint32_t attempt)
{
    const uint32_t shift = std::min<uint32_t>(attempt, 31);
    const uint64_t delay = static_cast<uint64_t>(config.reconnect_base_delay_ms) << shift;
    return static_cast<uint32_t>(std::min<uint64_t>(delay, config.reconnect_max_delay_ms));
}

// =============================================================================
// Caller entry points
// =============================================================================

Error ConnectionManager::connect(const DeviceHandle& device)
{
    Error result = Error::Ok;

    context_.run([&] {
        if (shut_down_) {
            result = Error::InvalidState;
            return;
        }
        if (state_ == ConnectionState::Connecting) {
            result = Error::AlreadyInProgress;
            return;
        }
        if (state_ == ConnectionState::Connected && device_ && device_->same_device(device)) {
            return;
        }

        cancel_timer(reconnect_timer_);
        ++reconnect_token_;
        if (state_ == ConnectionState::Connected) {
            close_session();
            set_state(ConnectionState::Disconnected, Error::Ok);
        }

        device_ = device;
        auto_reconnect_ = config_.auto_reconnect;
        reconnect_attempts_ = 0;
        result = start_attempt();
    });

    return result;
}

void ConnectionManager::disconnect()
{
    context_.run([&] {
        auto_reconnect_ = false;
        reconnect_attempts_ = 0;
        cancel_timer(reconnect_timer_);
        ++reconnect_token_;

        if (state_ == ConnectionState::Disconnected) {
            return;
        }

        close_session();
        set_state(ConnectionState::Disconnected, Error::Ok);
    });
}

void ConnectionManager::shutdown()
{
    context_.run([&] {
        if (shut_down_) {
            return;
        }
        disconnect();
        transport_.set_listener(nullptr);
        shut_down_ = true;
    });
}

ConnectionState ConnectionManager::state() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return state_;
}

std::optional<DeviceHandle> ConnectionManager::device() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return device_;
}

uint32_t ConnectionManager::reconnect_attempts() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return reconnect_attempts_;
}

bool ConnectionManager::reconnect_pending() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return reconnect_timer_ != Scheduler::kInvalidTimer;
}

ConnectionManager::Stats ConnectionManager::get_stats() const
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());
    return stats_;
}

Error ConnectionManager::write_control_point(std::span<const uint8_t> command,
                                             GattTransport::Completion on_written)
{
    std::lock_guard<std::recursive_mutex> lock(context_.mutex());

    // Notification Source may fire as soon as its CCCD is written
    if (stage_ != Stage::SubscribingNotificationSource && stage_ != Stage::Ready) {
        return Error::NotConnected;
    }

    const uint64_t session = session_;
    return transport_.write_characteristic(CharacteristicId::ControlPoint, command,
        [this, session, done = std::move(on_written)](Error result) {
            context_.run([&] {
                if (session == session_ && done) {
                    done(result);
                }
            });
        });
}

// =============================================================================
// Attempt pipeline (context held)
// =============================================================================

Error ConnectionManager::start_attempt()
{
    ++stats_.connect_attempts;
    ++session_;
    const uint64_t session = session_;

    stage_ = Stage::Linking;
    set_state(ConnectionState::Connecting, Error::Ok);

    cancel_timer(connect_timer_);
    connect_timer_ = scheduler_.schedule_after(config_.connect_timeout_ms, [this, session]() {
        context_.run([&] { on_connect_timeout(session); });
    });

    const Error err = transport_.connect(*device_, [this, session](Error result) {
        context_.run([&] { on_link_result(session, result); });
    });

    if (err != Error::Ok) {
        fail_attempt(err);
    }
    return err;
}

void ConnectionManager::on_link_result(uint64_t session, Error result)
{
    if (session != session_ || stage_ != Stage::Linking) {
        return;
    }
    if (result != Error::Ok) {
        fail_attempt(Error::ConnectFailure);
        return;
    }

    stage_ = Stage::Discovering;
    const Error err = transport_.discover_services([this, session](Error discovered) {
        context_.run([&] { on_discovery_result(session, discovered); });
    });
    if (err != Error::Ok) {
        fail_attempt(Error::DiscoveryFailure);
    }
}

void ConnectionManager::on_discovery_result(uint64_t session, Error result)
{
    if (session != session_ || stage_ != Stage::Discovering) {
        return;
    }
    if (result != Error::Ok) {
        fail_attempt(Error::DiscoveryFailure);
        return;
    }

    stage_ = Stage::SubscribingDataSource;
    const Error err = transport_.subscribe(CharacteristicId::DataSource,
        [this, session](Error subscribed) {
            context_.run([&] {
                on_subscribe_result(session, CharacteristicId::DataSource, subscribed);
            });
        });
    if (err != Error::Ok) {
        fail_attempt(Error::SubscribeFailure);
    }
}

void ConnectionManager::on_subscribe_result(uint64_t session,
                                            CharacteristicId characteristic,
                                            Error result)
{
    if (session != session_) {
        return;
    }

    const bool data_source_step = characteristic == CharacteristicId::DataSource &&
                                  stage_ == Stage::SubscribingDataSource;
    const bool notification_source_step = characteristic == CharacteristicId::NotificationSource &&
                                          stage_ == Stage::SubscribingNotificationSource;
    if (!data_source_step && !notification_source_step) {
        return;
    }

    if (result != Error::Ok) {
        fail_attempt(Error::SubscribeFailure);
        return;
    }

    if (data_source_step) {
        stage_ = Stage::SubscribingNotificationSource;
        const Error err = transport_.subscribe(CharacteristicId::NotificationSource,
            [this, session](Error subscribed) {
                context_.run([&] {
                    on_subscribe_result(session, CharacteristicId::NotificationSource, subscribed);
                });
            });
        if (err != Error::Ok) {
            fail_attempt(Error::SubscribeFailure);
        }
        return;
    }

    stage_ = Stage::Ready;
    cancel_timer(connect_timer_);
    reconnect_attempts_ = 0;
    ++stats_.connections;
    set_state(ConnectionState::Connected, Error::Ok);
}

void ConnectionManager::on_connect_timeout(uint64_t session)
{
    if (session != session_ || state_ != ConnectionState::Connecting) {
        return;
    }
    connect_timer_ = Scheduler::kInvalidTimer;
    fail_attempt(Error::ConnectTimeout);
}

void ConnectionManager::fail_attempt(Error reason)
{
    ++stats_.connect_failures;
    stats_.last_error = reason;

    close_session();
    set_state(ConnectionState::Disconnected, reason);

    if (auto_reconnect_ && !shut_down_) {
        schedule_reconnect();
    }
}

// =============================================================================
// Reconnect policy
// =============================================================================

void ConnectionManager::schedule_reconnect()
{
    if (!device_) {
        return;
    }

    if (reconnect_attempts_ >= config_.max_reconnect_attempts) {
        auto_reconnect_ = false;
        stats_.last_error = Error::MaxReconnectAttemptsExceeded;
        if (observer_ != nullptr) {
            observer_->on_reconnect_exhausted(*device_, reconnect_attempts_);
        }
        return;
    }

    const uint32_t delay = backoff_delay_ms(config_, reconnect_attempts_);
    ++reconnect_attempts_;
    ++stats_.reconnects_scheduled;

    cancel_timer(reconnect_timer_);
    const uint64_t token = ++reconnect_token_;
    reconnect_timer_ = scheduler_.schedule_after(delay, [this, token]() {
        context_.run([&] { on_reconnect_timer(token); });
    });

    if (observer_ != nullptr) {
        observer_->on_reconnect_scheduled(delay, reconnect_attempts_);
    }
}

void ConnectionManager::on_reconnect_timer(uint64_t token)
{
    if (token != reconnect_token_) {
        return;
    }
    reconnect_timer_ = Scheduler::kInvalidTimer;

    if (!auto_reconnect_ || shut_down_ || state_ != ConnectionState::Disconnected || !device_) {
        return;
    }
    start_attempt();
}

// =============================================================================
// Helpers
// =============================================================================

void ConnectionManager::cancel_timer(Scheduler::TimerId& timer)
{
    if (timer != Scheduler::kInvalidTimer) {
        scheduler_.cancel(timer);
        timer = Scheduler::kInvalidTimer;
    }
}

void ConnectionManager::close_session()
{
    cancel_timer(connect_timer_);
    ++session_;
    stage_ = Stage::Idle;
    transport_.cancel_connection();
}

void ConnectionManager::set_state(ConnectionState state, Error reason)
{
    if (state == state_) {
        return;
    }
    state_ = state;
    if (observer_ != nullptr && device_) {
        observer_->on_connection_state_changed(state, *device_, reason);
    }
}

// =============================================================================
// Transport events
// =============================================================================

void ConnectionManager::on_disconnected(int reason)
{
    (void)reason;

    context_.run([&] {
        if (state_ == ConnectionState::Connecting) {
            fail_attempt(Error::ConnectFailure);
            return;
        }
        if (state_ != ConnectionState::Connected) {
            return;
        }

        ++stats_.drops;
        stats_.last_error = Error::ConnectionLost;
        ++session_;
        stage_ = Stage::Idle;
        set_state(ConnectionState::Disconnected, Error::ConnectionLost);

        if (auto_reconnect_ && !shut_down_) {
            schedule_reconnect();
        }
    });
}

void ConnectionManager::on_characteristic_notified(CharacteristicId characteristic,
                                                   std::span<const uint8_t> bytes)
{
    context_.run([&] {
        if (stage_ != Stage::SubscribingNotificationSource && stage_ != Stage::Ready) {
            return;
        }
        if (observer_ != nullptr) {
            observer_->on_characteristic_notified(characteristic, bytes);
        }
    });
}

} // namespace ancs
