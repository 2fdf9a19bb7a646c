#include <string>
#include <utility>
#include <vector>

#include "connection_manager.hpp"
#include "support/ancs_fixtures.hpp"
#include "support/fake_gatt_transport.hpp"
#include "support/manual_scheduler.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace ancs;

namespace {

const DeviceHandle kPhone{"AA:BB:CC:DD:EE:FF", 1, "iPhone"};
const DeviceHandle kOtherPhone{"11:22:33:44:55:66", 1, "iPad"};

class RecordingObserver : public ConnectionObserver {
public:
    struct Transition {
        ConnectionState state;
        Error reason;
    };

    void on_connection_state_changed(ConnectionState state, const DeviceHandle&, Error reason) override
    {
        transitions.push_back({state, reason});
    }

    void on_characteristic_notified(CharacteristicId characteristic, std::span<const uint8_t> bytes) override
    {
        notified.emplace_back(characteristic, ByteBuffer(bytes.begin(), bytes.end()));
    }

    void on_reconnect_scheduled(uint32_t delay_ms, uint32_t) override { delays.push_back(delay_ms); }

    void on_reconnect_exhausted(const DeviceHandle& device, uint32_t attempts) override
    {
        exhausted_device = device.address;
        exhausted_attempts = attempts;
    }

    std::vector<Transition> transitions;
    std::vector<std::pair<CharacteristicId, ByteBuffer>> notified;
    std::vector<uint32_t> delays;
    std::string exhausted_device;
    uint32_t exhausted_attempts{0};
};

struct ManagerFixture {
    explicit ManagerFixture(EngineConfig cfg = {})
        : config(cfg),
          manager(context, transport, scheduler, config)
    {
        manager.set_observer(&observer);
    }

    ~ManagerFixture() { manager.set_observer(nullptr); }

    void connect_and_handshake(const DeviceHandle& device = kPhone)
    {
        REQUIRE(manager.connect(device) == Error::Ok);
        transport.complete_handshake();
        REQUIRE(manager.state() == ConnectionState::Connected);
    }

    EngineConfig config;
    SerialContext context;
    ancs_test::FakeGattTransport transport;
    ancs_test::ManualScheduler scheduler;
    RecordingObserver observer;
    ConnectionManager manager;
};

}  // namespace

TEST_CASE("handshake subscribes Data Source before Notification Source")
{
    ManagerFixture f;

    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    CHECK(f.manager.state() == ConnectionState::Connecting);
    CHECK(f.transport.connect_calls() == 1);

    f.transport.complete_connect();
    f.transport.complete_discovery();
    REQUIRE(f.transport.subscriptions().size() == 1);
    CHECK(f.transport.subscriptions()[0] == CharacteristicId::DataSource);
    CHECK(f.manager.state() == ConnectionState::Connecting);

    f.transport.complete_subscribe();
    REQUIRE(f.transport.subscriptions().size() == 2);
    CHECK(f.transport.subscriptions()[1] == CharacteristicId::NotificationSource);

    f.transport.complete_subscribe();
    CHECK(f.manager.state() == ConnectionState::Connected);

    REQUIRE(f.observer.transitions.size() == 2);
    CHECK(f.observer.transitions[0].state == ConnectionState::Connecting);
    CHECK(f.observer.transitions[1].state == ConnectionState::Connected);
    CHECK(f.observer.transitions[1].reason == Error::Ok);
    CHECK(f.scheduler.pending() == 0);
}

TEST_CASE("a second connect while connecting is rejected")
{
    ManagerFixture f;

    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    CHECK(f.manager.connect(kPhone) == Error::AlreadyInProgress);
    CHECK(f.manager.connect(kOtherPhone) == Error::AlreadyInProgress);
    CHECK(f.transport.connect_calls() == 1);
}

TEST_CASE("connecting to the device already connected is a no-op")
{
    ManagerFixture f;
    f.connect_and_handshake();

    CHECK(f.manager.connect(kPhone) == Error::Ok);
    CHECK(f.transport.connect_calls() == 1);
    CHECK(f.manager.state() == ConnectionState::Connected);
}

TEST_CASE("connecting to another device closes the current link first")
{
    ManagerFixture f;
    f.connect_and_handshake();

    REQUIRE(f.manager.connect(kOtherPhone) == Error::Ok);
    CHECK(f.transport.connect_calls() == 2);
    CHECK(f.transport.cancellations() >= 1);
    REQUIRE(f.manager.device().has_value());
    CHECK(f.manager.device()->address == kOtherPhone.address);

    REQUIRE(f.observer.transitions.size() == 4);
    CHECK(f.observer.transitions[2].state == ConnectionState::Disconnected);
    CHECK(f.observer.transitions[3].state == ConnectionState::Connecting);
}

TEST_CASE("the connect timeout covers the whole attempt")
{
    ManagerFixture f;
    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    f.transport.complete_connect();
    f.transport.complete_discovery();

    f.scheduler.advance(f.config.connect_timeout_ms);

    CHECK(f.manager.state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(f.observer.transitions.empty());
    CHECK(f.observer.transitions.back().reason == Error::ConnectTimeout);
    CHECK(f.transport.cancellations() >= 1);
    CHECK(f.manager.reconnect_pending());
    CHECK(f.manager.get_stats().last_error == Error::ConnectTimeout);

    // the abandoned subscription never completes the attempt
    f.transport.complete_subscribe();
    CHECK(f.manager.state() == ConnectionState::Disconnected);
}

TEST_CASE("a discovery failure ends the attempt")
{
    ManagerFixture f;
    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    f.transport.complete_connect();
    f.transport.complete_discovery(Error::DiscoveryFailure);

    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK(f.observer.transitions.back().reason == Error::DiscoveryFailure);
    CHECK(f.transport.subscriptions().empty());
}

TEST_CASE("a subscription failure ends the attempt")
{
    ManagerFixture f;
    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    f.transport.complete_connect();
    f.transport.complete_discovery();
    f.transport.complete_subscribe(Error::SubscribeFailure);

    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK(f.observer.transitions.back().reason == Error::SubscribeFailure);
}

TEST_CASE("reconnect delays grow up to the cap and then give up")
{
    ManagerFixture f;
    f.transport.connect_result = Error::ConnectFailure;

    CHECK(f.manager.connect(kPhone) == Error::ConnectFailure);
    CHECK(f.manager.state() == ConnectionState::Disconnected);

    for (int i = 0; i < 12; ++i) {
        f.scheduler.advance(f.config.reconnect_max_delay_ms);
    }

    REQUIRE(f.observer.delays.size() == f.config.max_reconnect_attempts);
    CHECK(f.observer.delays.front() == f.config.reconnect_base_delay_ms);
    for (size_t i = 1; i < f.observer.delays.size(); ++i) {
        CHECK(f.observer.delays[i] <= f.config.reconnect_max_delay_ms);
        if (f.observer.delays[i - 1] < f.config.reconnect_max_delay_ms) {
            CHECK(f.observer.delays[i] > f.observer.delays[i - 1]);
        } else {
            CHECK(f.observer.delays[i] == f.config.reconnect_max_delay_ms);
        }
    }

    CHECK(f.transport.connect_calls() == f.config.max_reconnect_attempts + 1);
    CHECK(f.observer.exhausted_device == kPhone.address);
    CHECK(f.observer.exhausted_attempts == f.config.max_reconnect_attempts);
    CHECK_FALSE(f.manager.reconnect_pending());
    CHECK(f.manager.get_stats().last_error == Error::MaxReconnectAttemptsExceeded);
}

TEST_CASE("a manual connect after giving up starts a fresh backoff sequence")
{
    ManagerFixture f;
    f.transport.connect_result = Error::ConnectFailure;

    CHECK(f.manager.connect(kPhone) == Error::ConnectFailure);
    for (int i = 0; i < 12; ++i) {
        f.scheduler.advance(f.config.reconnect_max_delay_ms);
    }
    REQUIRE(f.observer.delays.size() == f.config.max_reconnect_attempts);
    REQUIRE(f.observer.exhausted_attempts == f.config.max_reconnect_attempts);

    f.observer.delays.clear();
    f.observer.exhausted_attempts = 0;

    CHECK(f.manager.connect(kPhone) == Error::ConnectFailure);
    CHECK(f.manager.reconnect_pending());
    CHECK(f.manager.reconnect_attempts() == 1);
    REQUIRE(f.observer.delays.size() == 1);
    CHECK(f.observer.delays.front() == f.config.reconnect_base_delay_ms);
    CHECK(f.observer.exhausted_attempts == 0);
}

TEST_CASE("a dropped link reconnects and the attempt counter resets once connected")
{
    ManagerFixture f;
    f.connect_and_handshake();

    f.transport.drop();
    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK(f.observer.transitions.back().reason == Error::ConnectionLost);
    CHECK(f.manager.reconnect_pending());
    CHECK(f.manager.reconnect_attempts() == 1);

    f.scheduler.advance(f.config.reconnect_base_delay_ms);
    CHECK(f.transport.connect_calls() == 2);
    f.transport.complete_handshake();
    CHECK(f.manager.state() == ConnectionState::Connected);
    CHECK(f.manager.reconnect_attempts() == 0);

    f.transport.drop();
    REQUIRE(f.observer.delays.size() == 2);
    CHECK(f.observer.delays[1] == f.config.reconnect_base_delay_ms);
    CHECK(f.manager.get_stats().drops == 2);
}

TEST_CASE("disconnect cancels a pending reconnect")
{
    ManagerFixture f;
    f.connect_and_handshake();
    f.transport.drop();
    REQUIRE(f.manager.reconnect_pending());

    f.manager.disconnect();
    CHECK_FALSE(f.manager.reconnect_pending());

    f.scheduler.advance(10 * f.config.reconnect_max_delay_ms);
    CHECK(f.transport.connect_calls() == 1);
    CHECK(f.manager.state() == ConnectionState::Disconnected);
}

TEST_CASE("a requested disconnect does not reconnect")
{
    ManagerFixture f;
    f.connect_and_handshake();

    f.manager.disconnect();
    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK(f.observer.transitions.back().reason == Error::Ok);
    CHECK(f.transport.cancellations() >= 1);
    CHECK_FALSE(f.manager.reconnect_pending());
    CHECK(f.scheduler.pending() == 0);
}

TEST_CASE("auto reconnect can be turned off")
{
    EngineConfig cfg;
    cfg.auto_reconnect = false;
    ManagerFixture f(cfg);
    f.connect_and_handshake();

    f.transport.drop();
    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK_FALSE(f.manager.reconnect_pending());
}

TEST_CASE("control point writes need a subscribed link")
{
    ManagerFixture f;
    const ByteBuffer command = encode_get_notification_attributes(1, default_attribute_specs(8, 8, 8));

    CHECK(f.manager.write_control_point(command, nullptr) == Error::NotConnected);

    REQUIRE(f.manager.connect(kPhone) == Error::Ok);
    f.transport.complete_connect();
    CHECK(f.manager.write_control_point(command, nullptr) == Error::NotConnected);

    f.transport.complete_discovery();
    f.transport.complete_subscribe();
    f.transport.complete_subscribe();

    Error written = Error::InvalidState;
    CHECK(f.manager.write_control_point(command, [&](Error e) { written = e; }) == Error::Ok);
    f.transport.complete_write(Error::Ok);
    CHECK(written == Error::Ok);

    const auto writes = f.transport.writes();
    REQUIRE(writes.size() == 1);
    CHECK(writes[0].characteristic == CharacteristicId::ControlPoint);
    CHECK(writes[0].bytes == command);
}

TEST_CASE("notifications are forwarded only once subscriptions are in place")
{
    ManagerFixture f;
    const auto packet = ancs_test::notification_source(0, 0, 6, 42);

    f.transport.notify(CharacteristicId::NotificationSource, packet);
    CHECK(f.observer.notified.empty());

    f.connect_and_handshake();
    f.transport.notify(CharacteristicId::NotificationSource, packet);
    REQUIRE(f.observer.notified.size() == 1);
    CHECK(f.observer.notified[0].first == CharacteristicId::NotificationSource);
    CHECK(f.observer.notified[0].second == packet);
}

TEST_CASE("shutdown detaches from the transport and refuses new connections")
{
    ManagerFixture f;
    f.connect_and_handshake();

    f.manager.shutdown();
    CHECK(f.manager.state() == ConnectionState::Disconnected);
    CHECK_FALSE(f.transport.has_listener());
    CHECK(f.manager.connect(kPhone) == Error::InvalidState);
}

TEST_CASE("backoff delay doubles from the base and saturates at the cap")
{
    EngineConfig cfg;
    cfg.reconnect_base_delay_ms = 5000;
    cfg.reconnect_max_delay_ms = 60000;

    CHECK(ConnectionManager::backoff_delay_ms(cfg, 0) == 5000);
    CHECK(ConnectionManager::backoff_delay_ms(cfg, 1) == 10000);
    CHECK(ConnectionManager::backoff_delay_ms(cfg, 2) == 20000);
    CHECK(ConnectionManager::backoff_delay_ms(cfg, 3) == 40000);
    CHECK(ConnectionManager::backoff_delay_ms(cfg, 4) == 60000);
    CHECK(ConnectionManager::backoff_delay_ms(cfg, 40) == 60000);
}
