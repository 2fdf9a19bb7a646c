#include <string>
#include <vector>

#include "notification_engine.hpp"
#include "support/ancs_fixtures.hpp"
#include "support/fake_gatt_transport.hpp"
#include "support/manual_scheduler.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using namespace ancs;

namespace {

const DeviceHandle kPhone{"AA:BB:CC:DD:EE:FF", 1, "iPhone"};

struct EngineFixture {
    explicit EngineFixture(EngineConfig cfg = {})
        : engine(transport, scheduler, cfg)
    {
        engine.events().subscribe([this](const EngineEvent& event) { events.push_back(event); });
    }

    void connect()
    {
        REQUIRE(engine.connect(kPhone) == Error::Ok);
        transport.complete_handshake();
        REQUIRE(engine.connection_state() == ConnectionState::Connected);
    }

    void notify_source(const std::vector<uint8_t>& bytes)
    {
        transport.notify(CharacteristicId::NotificationSource, bytes);
    }

    void notify_data(const std::vector<uint8_t>& bytes)
    {
        transport.notify(CharacteristicId::DataSource, bytes);
    }

    std::vector<EngineEvent> of(EngineEventKind kind) const
    {
        std::vector<EngineEvent> out;
        for (const auto& event : events) {
            if (event.kind == kind) {
                out.push_back(event);
            }
        }
        return out;
    }

    bool has_debug(DebugKind kind) const
    {
        for (const auto& event : of(EngineEventKind::Debug)) {
            if (event.debug_kind == kind) {
                return true;
            }
        }
        return false;
    }

    size_t writes_for(uint32_t uid) const
    {
        size_t count = 0;
        for (const auto& write : transport.writes()) {
            CommandHeader header{};
            if (write.characteristic == CharacteristicId::ControlPoint &&
                decode_command_header(write.bytes, header) == Error::Ok &&
                header.notification_uid == uid) {
                ++count;
            }
        }
        return count;
    }

    ancs_test::FakeGattTransport transport;
    ancs_test::ManualScheduler scheduler;
    std::vector<EngineEvent> events;
    NotificationEngine engine;
};

}  // namespace

TEST_CASE("an added notification is enriched and delivered once")
{
    EngineFixture f;
    f.connect();

    const auto connection = f.of(EngineEventKind::ConnectionChanged);
    REQUIRE(connection.size() == 2);
    CHECK(connection[0].state == ConnectionState::Connecting);
    CHECK(connection[1].state == ConnectionState::Connected);
    CHECK(connection[1].device_name == std::optional<std::string>("iPhone"));

    f.notify_source(ancs_test::notification_source(0, 0, 6, 42));
    CHECK(f.writes_for(42) == 1);
    CHECK(f.of(EngineEventKind::NotificationReceived).empty());

    f.notify_data(ancs_test::default_response(42));

    const auto received = f.of(EngineEventKind::NotificationReceived);
    REQUIRE(received.size() == 1);
    const NotificationRecord& record = received[0].record;
    CHECK(received[0].error == Error::Ok);
    CHECK(record.notification_uid == 42);
    CHECK(record.event_id == EventId::Added);
    CHECK(record.category_name == "Email");
    CHECK(record.enrichment == EnrichmentStatus::Enriched);
    CHECK(record.app_identifier == std::optional<std::string>("com.apple.MobileSMS"));
    CHECK(record.app_display_name == std::optional<std::string>("Messages"));
    CHECK(record.title == std::optional<std::string>("Alice"));
    CHECK(record.subtitle == std::optional<std::string>(""));
    CHECK(record.message == std::optional<std::string>("See you at 8"));
    CHECK(record.date == std::optional<std::string>("20240101T120000"));

    CHECK(f.has_debug(DebugKind::NotificationSourceRaw));
    CHECK(f.has_debug(DebugKind::ControlPointCommand));
    CHECK(f.has_debug(DebugKind::DataSourceRaw));
    CHECK(f.has_debug(DebugKind::ParsedAttributes));

    const auto stats = f.engine.get_stats();
    CHECK(stats.connected);
    CHECK(stats.notification_count == 1);
    CHECK(stats.queue.enriched == 1);
}

TEST_CASE("raw Notification Source bytes are published as a hex dump")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(0, 0, 6, 42));

    bool found = false;
    for (const auto& event : f.of(EngineEventKind::Debug)) {
        if (event.debug_kind == DebugKind::NotificationSourceRaw) {
            CHECK(event.text == "00 00 06 01 2A 00 00 00");
            found = true;
        }
    }
    CHECK(found);
}

TEST_CASE("a removed notification is reported without fetching attributes")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(2, 0, 6, 42));

    const auto removed = f.of(EngineEventKind::NotificationRemoved);
    REQUIRE(removed.size() == 1);
    CHECK(removed[0].record.notification_uid == 42);
    CHECK(removed[0].record.event_id == EventId::Removed);
    CHECK(removed[0].record.enrichment == EnrichmentStatus::NotRequested);
    CHECK(f.transport.write_count() == 0);
    CHECK(f.engine.get_stats().removed_count == 1);
}

TEST_CASE("a modified notification is fetched like an added one")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(1, 0, 4, 9));
    CHECK(f.writes_for(9) == 1);
}

TEST_CASE("a short Notification Source packet is dropped and reported")
{
    EngineFixture f;
    f.connect();

    f.notify_source({0x00, 0x00, 0x06, 0x01, 0x2A});

    CHECK(f.transport.write_count() == 0);
    CHECK(f.of(EngineEventKind::NotificationReceived).empty());
    CHECK(f.has_debug(DebugKind::Error));

    const auto stats = f.engine.get_stats();
    CHECK(stats.malformed_packets == 1);
    CHECK(stats.last_error == Error::MalformedPacket);

    // the engine keeps working
    f.notify_source(ancs_test::notification_source(0, 0, 6, 43));
    CHECK(f.writes_for(43) == 1);
}

TEST_CASE("reserved event ids are ignored")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(3, 0, 6, 42));

    CHECK(f.transport.write_count() == 0);
    CHECK(f.of(EngineEventKind::NotificationReceived).empty());
    CHECK(f.of(EngineEventKind::NotificationRemoved).empty());
}

TEST_CASE("a drop mid fetch resolves pending records and the next session starts clean")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(0, 0, 6, 1));
    f.notify_source(ancs_test::notification_source(0, 0, 6, 2));
    REQUIRE(f.writes_for(1) == 1);
    f.events.clear();

    f.transport.drop();

    REQUIRE(f.events.size() >= 3);
    CHECK(f.events[0].kind == EngineEventKind::ConnectionChanged);
    CHECK(f.events[0].state == ConnectionState::Disconnected);
    CHECK(f.events[0].error == Error::ConnectionLost);

    const auto received = f.of(EngineEventKind::NotificationReceived);
    REQUIRE(received.size() == 2);
    CHECK(received[0].record.notification_uid == 1);
    CHECK(received[1].record.notification_uid == 2);
    for (const auto& event : received) {
        CHECK(event.error == Error::ConnectionLost);
        CHECK(event.record.enrichment == EnrichmentStatus::Unavailable);
    }
    CHECK(f.writes_for(2) == 0);

    // late data from the dead session is ignored
    f.notify_data(ancs_test::default_response(1));
    CHECK(f.of(EngineEventKind::NotificationReceived).size() == 2);

    f.scheduler.advance(f.engine.config().reconnect_base_delay_ms);
    CHECK(f.transport.connect_calls() == 2);
    f.transport.complete_handshake();
    REQUIRE(f.engine.connection_state() == ConnectionState::Connected);

    f.events.clear();
    f.notify_source(ancs_test::notification_source(0, 0, 6, 3));
    for (int i = 0; i < 3; ++i) {
        f.scheduler.advance(f.engine.config().attribute_timeout_ms);
    }

    CHECK(f.writes_for(3) == 3);
    const auto degraded = f.of(EngineEventKind::NotificationReceived);
    REQUIRE(degraded.size() == 1);
    CHECK(degraded[0].error == Error::MaxRetriesExceeded);
    CHECK(display_text(degraded[0].record) == std::string(kContentUnavailable));
}

TEST_CASE("the discard policy drops pending records on disconnect")
{
    EngineConfig cfg;
    cfg.drain_policy = DrainPolicy::Discard;
    EngineFixture f(cfg);
    f.connect();

    f.notify_source(ancs_test::notification_source(0, 0, 6, 1));
    f.notify_source(ancs_test::notification_source(0, 0, 6, 2));
    f.engine.disconnect();

    CHECK(f.of(EngineEventKind::NotificationReceived).empty());
    CHECK(f.engine.get_stats().queue.drained == 2);
}

TEST_CASE("pre-existing and silent notifications can be filtered out")
{
    EngineConfig cfg;
    cfg.ignore_pre_existing = true;
    cfg.ignore_silent = true;
    EngineFixture f(cfg);
    f.connect();

    f.notify_source(ancs_test::notification_source(0, event_flags::kPreExisting, 6, 1));
    f.notify_source(ancs_test::notification_source(0, event_flags::kSilent, 6, 2));
    f.notify_source(ancs_test::notification_source(0, event_flags::kImportant, 6, 3));

    CHECK(f.writes_for(1) == 0);
    CHECK(f.writes_for(2) == 0);
    CHECK(f.writes_for(3) == 1);
    CHECK(f.engine.get_stats().filtered_count == 2);
}

TEST_CASE("handlers may call back into the engine")
{
    EngineFixture f;
    f.engine.events().subscribe([&f](const EngineEvent& event) {
        if (event.kind == EngineEventKind::NotificationReceived) {
            (void)f.engine.get_stats();
            f.engine.disconnect();
        }
    }, event_mask::kNotifications);
    f.connect();

    f.notify_source(ancs_test::notification_source(0, 0, 6, 42));
    f.events.clear();
    f.notify_data(ancs_test::default_response(42));

    REQUIRE(f.events.size() >= 2);
    size_t received_at = f.events.size();
    size_t disconnected_at = f.events.size();
    for (size_t i = 0; i < f.events.size(); ++i) {
        if (f.events[i].kind == EngineEventKind::NotificationReceived && received_at == f.events.size()) {
            received_at = i;
        }
        if (f.events[i].kind == EngineEventKind::ConnectionChanged &&
            f.events[i].state == ConnectionState::Disconnected) {
            disconnected_at = i;
        }
    }
    CHECK(received_at < disconnected_at);
    CHECK(disconnected_at < f.events.size());
    CHECK(f.engine.connection_state() == ConnectionState::Disconnected);
}

TEST_CASE("every subscriber receives the events of its mask")
{
    EngineFixture f;
    int first = 0;
    int second = 0;
    int connection_only = 0;

    f.engine.events().subscribe([&](const EngineEvent&) { ++first; }, event_mask::kNotifications);
    const auto id = f.engine.events().subscribe([&](const EngineEvent&) { ++second; },
                                                event_mask::kNotifications);
    f.engine.events().subscribe([&](const EngineEvent& event) {
        CHECK(event.kind == EngineEventKind::ConnectionChanged);
        ++connection_only;
    }, event_mask::bit(EngineEventKind::ConnectionChanged));

    f.connect();
    f.notify_source(ancs_test::notification_source(2, 0, 6, 1));
    CHECK(first == 1);
    CHECK(second == 1);
    CHECK(connection_only == 2);

    CHECK(f.engine.events().unsubscribe(id));
    f.notify_source(ancs_test::notification_source(2, 0, 6, 2));
    CHECK(first == 2);
    CHECK(second == 1);
}

TEST_CASE("exhausted reconnects are reported once")
{
    EngineConfig cfg;
    cfg.max_reconnect_attempts = 2;
    EngineFixture f(cfg);
    f.transport.connect_result = Error::ConnectFailure;

    CHECK(f.engine.connect(kPhone) == Error::ConnectFailure);
    for (int i = 0; i < 5; ++i) {
        f.scheduler.advance(cfg.reconnect_max_delay_ms);
    }

    const auto exhausted = f.of(EngineEventKind::ReconnectExhausted);
    REQUIRE(exhausted.size() == 1);
    CHECK(exhausted[0].attempts == 2);
    CHECK(exhausted[0].device_name == std::optional<std::string>("iPhone"));
    CHECK(exhausted[0].error == Error::MaxReconnectAttemptsExceeded);
    CHECK(f.transport.connect_calls() == 3);
    CHECK(f.engine.get_stats().last_error == Error::MaxReconnectAttemptsExceeded);
}

TEST_CASE("connect validates its input and shutdown is final")
{
    EngineFixture f;
    CHECK(f.engine.connect(DeviceHandle{}) == Error::InvalidArgument);

    f.connect();
    f.notify_source(ancs_test::notification_source(0, 0, 6, 1));
    f.engine.shutdown();

    CHECK(f.engine.connection_state() == ConnectionState::Disconnected);
    CHECK_FALSE(f.transport.has_listener());
    CHECK(f.scheduler.pending() == 0);

    const auto received = f.of(EngineEventKind::NotificationReceived);
    REQUIRE(received.size() == 1);
    CHECK(received[0].error == Error::ConnectionLost);

    CHECK(f.engine.connect(kPhone) == Error::InvalidState);
}

TEST_CASE("unknown bundle identifiers keep no display name")
{
    EngineFixture f;
    f.connect();

    f.notify_source(ancs_test::notification_source(0, 0, 0, 5));
    f.notify_data(ancs_test::default_response(5, "org.example.unknown"));

    const auto received = f.of(EngineEventKind::NotificationReceived);
    REQUIRE(received.size() == 1);
    CHECK_FALSE(received[0].record.app_display_name.has_value());

    f.engine.app_names().put("org.example.unknown", "Example");
    f.notify_source(ancs_test::notification_source(0, 0, 0, 6));
    f.notify_data(ancs_test::default_response(6, "org.example.unknown"));
    CHECK(f.of(EngineEventKind::NotificationReceived).back().record.app_display_name ==
          std::optional<std::string>("Example"));
}
