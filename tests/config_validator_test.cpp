#include "config_validator.hpp"

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest/doctest.h"

using ancs::EngineConfig;
using ancs::Validator;

TEST_CASE("default engine configuration is valid")
{
    const EngineConfig cfg;
    const auto result = Validator::validate(cfg);

    CHECK(result.valid);
    CHECK(result.error_message.empty());
    CHECK(cfg.attribute_timeout_ms == 5000);
    CHECK(cfg.attribute_retries == 2);
    CHECK(cfg.title_max_length == 128);
    CHECK(cfg.message_max_length == 1024);
}

TEST_CASE("out of range timeouts are rejected")
{
    EngineConfig cfg;
    cfg.attribute_timeout_ms = 10;
    CHECK_FALSE(Validator::validate(cfg));

    cfg = EngineConfig{};
    cfg.connect_timeout_ms = 500000;
    const auto result = Validator::validate(cfg);
    CHECK_FALSE(result.valid);
    CHECK(result.error_message == "connect_timeout_ms out of range");
}

TEST_CASE("reconnect base delay may not exceed the cap")
{
    EngineConfig cfg;
    cfg.reconnect_base_delay_ms = 30000;
    cfg.reconnect_max_delay_ms = 10000;
    CHECK_FALSE(Validator::validate(cfg));

    cfg.reconnect_max_delay_ms = 30000;
    CHECK(Validator::validate(cfg));
}

TEST_CASE("attribute lengths and backlog must be non-zero and bounded")
{
    EngineConfig cfg;
    cfg.message_max_length = 0;
    CHECK_FALSE(Validator::validate(cfg));

    cfg = EngineConfig{};
    cfg.title_max_length = 4096;
    CHECK_FALSE(Validator::validate(cfg));

    cfg = EngineConfig{};
    cfg.backlog_capacity = 0;
    CHECK_FALSE(Validator::validate(cfg));

    cfg = EngineConfig{};
    cfg.attribute_retries = 6;
    CHECK_FALSE(Validator::validate(cfg));
}

TEST_CASE("device addresses are six colon separated octets")
{
    CHECK(Validator::is_valid_device_address(""));
    CHECK(Validator::is_valid_device_address("AA:BB:CC:DD:EE:FF"));
    CHECK(Validator::is_valid_device_address("a1:b2:c3:d4:e5:f6"));
    CHECK_FALSE(Validator::is_valid_device_address("AA:BB:CC:DD:EE"));
    CHECK_FALSE(Validator::is_valid_device_address("AA-BB-CC-DD-EE-FF"));
    CHECK_FALSE(Validator::is_valid_device_address("GG:BB:CC:DD:EE:FF"));
}
