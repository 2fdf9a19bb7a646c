/**
 * @file nimble_gatt_transport.hpp
 * @brief GattTransport over the ESP-IDF NimBLE host (GATT central)
 *
 * Connect opens the link and waits for encryption: ANCS only answers on
 * a bonded, encrypted link. Discovery looks up the ANCS service, its
 * three characteristics and the CCCDs of Notification Source and Data
 * Source. Completions run on the NimBLE host task.
 *
 * NimBLE delivers host events through plain C callbacks, so a single
 * transport may be initialized per firmware.
 */

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "gatt_transport.hpp"

extern "C" {
#include "esp_err.h"
#include "host/ble_gap.h"
#include "host/ble_gatt.h"
#include "host/ble_hs.h"
}

namespace ancs {

namespace nimble_config {
constexpr uint16_t kPreferredMtu = 185;
} // namespace nimble_config

class NimbleGattTransport : public GattTransport {
public:
    NimbleGattTransport() = default;
    ~NimbleGattTransport() override;

    NimbleGattTransport(const NimbleGattTransport&) = delete;
    NimbleGattTransport& operator=(const NimbleGattTransport&) = delete;

    /**
     * @brief Start the NimBLE host (port, bond store, host task)
     */
    esp_err_t init();

    /**
     * @brief Host and controller synchronized; connect() fails before that
     */
    bool is_synced() const { return synced_.load(std::memory_order_acquire); }

    // GattTransport
    void set_listener(GattTransportListener* listener) override;
    Error connect(const DeviceHandle& device, Completion on_connected) override;
    Error discover_services(Completion on_discovered) override;
    Error subscribe(CharacteristicId characteristic, Completion on_subscribed) override;
    Error write_characteristic(CharacteristicId characteristic,
                               std::span<const uint8_t> bytes,
                               Completion on_written) override;
    void cancel_connection() override;

    /**
     * @brief "AA:BB:CC:DD:EE:FF" to a NimBLE address (value stored LSB first)
     */
    static bool parse_address(const std::string& text, uint8_t type, ble_addr_t& out);

    struct Stats {
        uint32_t links_opened;
        uint32_t encryption_failures;
        uint32_t notifications_rx;
        uint32_t host_resets;
    };

    Stats get_stats() const;

private:
    enum class LinkStage : uint8_t {
        Idle,
        Connecting,
        Encrypting,
        Up,
    };

    struct Handles {
        uint16_t service_start{0};
        uint16_t service_end{0};
        std::array<uint16_t, 3> def{};   // characteristic declarations
        std::array<uint16_t, 3> value{}; // characteristic values
        std::vector<uint16_t> all_defs;  // every declaration in the service
        uint16_t cccd_notification_source{0};
        uint16_t cccd_data_source{0};
    };

    // NimBLE C callbacks
    static void on_host_sync();
    static void on_host_reset(int reason);
    static void host_task(void* param);
    static int gap_event(ble_gap_event* event, void* arg);
    static int on_service(uint16_t conn_handle, const ble_gatt_error* error,
                          const ble_gatt_svc* service, void* arg);
    static int on_characteristic(uint16_t conn_handle, const ble_gatt_error* error,
                                 const ble_gatt_chr* chr, void* arg);
    static int on_descriptor(uint16_t conn_handle, const ble_gatt_error* error,
                             uint16_t chr_val_handle, const ble_gatt_dsc* dsc, void* arg);
    static int on_write(uint16_t conn_handle, const ble_gatt_error* error,
                        ble_gatt_attr* attr, void* arg);

    void handle_gap_event(ble_gap_event& event);
    void handle_link_up(uint16_t conn_handle);
    void handle_encrypted(uint16_t conn_handle, int status);
    void handle_link_down(uint16_t conn_handle, int reason);
    void handle_host_reset(int reason);
    void handle_notify(uint16_t conn_handle, uint16_t attr_handle, os_mbuf* om);

    void start_descriptor_discovery(uint32_t generation, CharacteristicId characteristic);
    void finish_discovery(uint32_t generation, Error result);
    void finish_connect(Error result);
    static void terminate_link(uint16_t conn_handle);

    Error start_write(CharacteristicId characteristic, bool to_cccd,
                      std::span<const uint8_t> bytes, Completion done, Error failure);
    uint16_t characteristic_end(CharacteristicId characteristic) const;

    static void* to_arg(uint32_t value);
    static uint32_t from_arg(void* arg);

    mutable std::mutex mutex_;
    GattTransportListener* listener_{nullptr};

    LinkStage stage_{LinkStage::Idle};
    uint16_t conn_handle_{BLE_HS_CONN_HANDLE_NONE};
    uint32_t generation_{0};
    Handles handles_;
    std::optional<CharacteristicId> dsc_target_;

    Completion pending_connect_;
    Completion pending_discovery_;
    struct PendingWrite {
        Completion done;
        Error failure{Error::TransportWriteFailure};
    };
    std::unordered_map<uint32_t, PendingWrite> pending_writes_;
    uint32_t next_write_id_{1};

    std::atomic<bool> synced_{false};
    bool initialized_{false};

    std::atomic<uint32_t> links_opened_{0};
    std::atomic<uint32_t> encryption_failures_{0};
    std::atomic<uint32_t> notifications_rx_{0};
    std::atomic<uint32_t> host_resets_{0};
};

} // namespace ancs
