/**
 * @file nimble_gatt_transport.cpp
 * @brief NimBLE central: link, encryption, ANCS discovery and GATT writes
 */

#include "nimble_gatt_transport.hpp"

#include <cstdio>
#include <utility>

extern "C" {
#include "esp_log.h"
#include "host/util/util.h"
#include "nimble/nimble_port.h"
#include "nimble/nimble_port_freertos.h"
#include "services/gap/ble_svc_gap.h"

// Provided by the NimBLE store/config package; no public header declares it
void ble_store_config_init(void);
}

static const char* TAG = "ancs_nimble";

namespace ancs {

namespace {

NimbleGattTransport* s_active = nullptr;

// 128-bit UUIDs, least significant byte first
const ble_uuid128_t kServiceUuid =
    BLE_UUID128_INIT(0xD0, 0x00, 0x2D, 0x12, 0x1E, 0x4B, 0x0F, 0xA4,
                     0x99, 0x4E, 0xCE, 0xB5, 0x31, 0xF4, 0x05, 0x79);

const ble_uuid128_t kNotificationSourceUuid =
    BLE_UUID128_INIT(0xBD, 0x1D, 0xA2, 0x99, 0xE6, 0x25, 0x58, 0x8C,
                     0xD9, 0x42, 0x01, 0x63, 0x0D, 0x12, 0xBF, 0x9F);

const ble_uuid128_t kControlPointUuid =
    BLE_UUID128_INIT(0xD9, 0xD9, 0xAA, 0xFD, 0xBD, 0x9B, 0x21, 0x98,
                     0xA8, 0x49, 0xE1, 0x45, 0xF3, 0xD8, 0xD1, 0x69);

const ble_uuid128_t kDataSourceUuid =
    BLE_UUID128_INIT(0xFB, 0x7B, 0x7C, 0xCE, 0x6A, 0xB3, 0x44, 0xBE,
                     0xB5, 0x4B, 0xD6, 0x24, 0xE9, 0xC6, 0xEA, 0x22);

const ble_uuid16_t kCccdUuid = BLE_UUID16_INIT(uuid::kClientCharacteristicConfig);

constexpr uint8_t kEnableNotifications[] = {0x01, 0x00};

size_t index_of(CharacteristicId id)
{
    return static_cast<size_t>(id);
}

std::optional<CharacteristicId> match_characteristic(const ble_uuid_t* uuid)
{
    if (ble_uuid_cmp(uuid, &kNotificationSourceUuid.u) == 0) {
        return CharacteristicId::NotificationSource;
    }
    if (ble_uuid_cmp(uuid, &kControlPointUuid.u) == 0) {
        return CharacteristicId::ControlPoint;
    }
    if (ble_uuid_cmp(uuid, &kDataSourceUuid.u) == 0) {
        return CharacteristicId::DataSource;
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Host lifecycle
// =============================================================================

NimbleGattTransport::~NimbleGattTransport()
{
    if (initialized_) {
        nimble_port_stop();
        nimble_port_deinit();
    }
    if (s_active == this) {
        s_active = nullptr;
    }
}

esp_err_t NimbleGattTransport::init()
{
    if (initialized_) {
        ESP_LOGW(TAG, "NimBLE transport already initialized");
        return ESP_OK;
    }
    if (s_active != nullptr) {
        ESP_LOGE(TAG, "Another NimBLE transport is active");
        return ESP_ERR_INVALID_STATE;
    }

    s_active = this;

    esp_err_t err = nimble_port_init();
    if (err != ESP_OK) {
        ESP_LOGE(TAG, "nimble_port_init failed: %s", esp_err_to_name(err));
        s_active = nullptr;
        return err;
    }

    ble_hs_cfg.sync_cb = on_host_sync;
    ble_hs_cfg.reset_cb = on_host_reset;
    ble_hs_cfg.store_status_cb = ble_store_util_status_rr;

    // ANCS needs a bonded link; Just Works pairing with secure connections
    ble_hs_cfg.sm_io_cap = BLE_SM_IO_CAP_NO_IO;
    ble_hs_cfg.sm_bonding = 1;
    ble_hs_cfg.sm_mitm = 0;
    ble_hs_cfg.sm_sc = 1;
    ble_hs_cfg.sm_our_key_dist = BLE_SM_PAIR_KEY_DIST_ENC | BLE_SM_PAIR_KEY_DIST_ID;
    ble_hs_cfg.sm_their_key_dist = BLE_SM_PAIR_KEY_DIST_ENC | BLE_SM_PAIR_KEY_DIST_ID;

    ble_svc_gap_init();

    int rc = ble_att_set_preferred_mtu(nimble_config::kPreferredMtu);
    if (rc != 0) {
        ESP_LOGW(TAG, "Failed to set preferred MTU: %d", rc);
    }

    ble_store_config_init();
    nimble_port_freertos_init(host_task);

    initialized_ = true;
    ESP_LOGI(TAG, "NimBLE host started (central)");
    return ESP_OK;
}

void NimbleGattTransport::host_task(void* param)
{
    (void)param;
    ESP_LOGI(TAG, "NimBLE host task started");
    nimble_port_run();
    nimble_port_freertos_deinit();
}

void NimbleGattTransport::on_host_sync()
{
    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
        ESP_LOGE(TAG, "No usable identity address: %d", rc);
        return;
    }
    if (s_active != nullptr) {
        s_active->synced_.store(true, std::memory_order_release);
    }
    ESP_LOGI(TAG, "BLE host synced");
}

void NimbleGattTransport::on_host_reset(int reason)
{
    ESP_LOGW(TAG, "BLE host reset, reason: %d", reason);
    if (s_active != nullptr) {
        s_active->handle_host_reset(reason);
    }
}

void NimbleGattTransport::set_listener(GattTransportListener* listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = listener;
}

NimbleGattTransport::Stats NimbleGattTransport::get_stats() const
{
    return {
        .links_opened = links_opened_.load(std::memory_order_relaxed),
        .encryption_failures = encryption_failures_.load(std::memory_order_relaxed),
        .notifications_rx = notifications_rx_.load(std::memory_order_relaxed),
        .host_resets = host_resets_.load(std::memory_order_relaxed),
    };
}

bool NimbleGattTransport::parse_address(const std::string& text, uint8_t type, ble_addr_t& out)
{
    unsigned int octets[6];
    int consumed = 0;
    const int fields = std::sscanf(text.c_str(), "%2x:%2x:%2x:%2x:%2x:%2x%n",
                                   &octets[0], &octets[1], &octets[2],
                                   &octets[3], &octets[4], &octets[5], &consumed);
    if (fields != 6 || consumed != 17 || text.size() != 17) {
        return false;
    }

    out.type = type;
    for (size_t i = 0; i < 6; ++i) {
        out.val[5 - i] = static_cast<uint8_t>(octets[i]);
    }
    return true;
}

void* NimbleGattTransport::to_arg(uint32_t value)
{
    return reinterpret_cast<void*>(static_cast<uintptr_t>(value));
}

uint32_t NimbleGattTransport::from_arg(void* arg)
{
    return static_cast<uint32_t>(reinterpret_cast<uintptr_t>(arg));
}

// =============================================================================
// Connection
// =============================================================================

Error NimbleGattTransport::connect(const DeviceHandle& device, Completion on_connected)
{
    if (!synced_.load(std::memory_order_acquire)) {
        return Error::TransportUnavailable;
    }

    ble_addr_t peer{};
    if (!parse_address(device.address, device.address_type, peer)) {
        ESP_LOGE(TAG, "Invalid peer address '%s'", device.address.c_str());
        return Error::InvalidArgument;
    }

    uint8_t own_addr_type = 0;
    int rc = ble_hs_id_infer_auto(0, &own_addr_type);
    if (rc != 0) {
        ESP_LOGE(TAG, "Error determining address type: %d", rc);
        return Error::TransportUnavailable;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ != LinkStage::Idle) {
            return Error::AlreadyInProgress;
        }
        stage_ = LinkStage::Connecting;
        pending_connect_ = std::move(on_connected);
        handles_ = Handles{};
        ++generation_;
    }

    // The engine bounds the attempt with its own timer
    rc = ble_gap_connect(own_addr_type, &peer, BLE_HS_FOREVER, nullptr, gap_event, this);
    if (rc != 0) {
        ESP_LOGE(TAG, "ble_gap_connect failed: %d", rc);
        std::lock_guard<std::mutex> lock(mutex_);
        stage_ = LinkStage::Idle;
        pending_connect_ = nullptr;
        return Error::ConnectFailure;
    }

    ESP_LOGI(TAG, "Connecting to %s (type %u)", device.address.c_str(),
             static_cast<unsigned>(device.address_type));
    return Error::Ok;
}

void NimbleGattTransport::cancel_connection()
{
    LinkStage previous;
    uint16_t conn_handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = stage_;
        conn_handle = conn_handle_;

        ++generation_;
        stage_ = LinkStage::Idle;
        conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
        dsc_target_.reset();
        pending_connect_ = nullptr;
        pending_discovery_ = nullptr;
        pending_writes_.clear();
    }

    if (previous == LinkStage::Connecting) {
        int rc = ble_gap_conn_cancel();
        if (rc != 0 && rc != BLE_HS_EALREADY) {
            ESP_LOGW(TAG, "ble_gap_conn_cancel failed: %d", rc);
        }
    } else if (conn_handle != BLE_HS_CONN_HANDLE_NONE) {
        terminate_link(conn_handle);
    }
}

void NimbleGattTransport::terminate_link(uint16_t conn_handle)
{
    int rc = ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
    if (rc != 0 && rc != BLE_HS_ENOTCONN) {
        ESP_LOGW(TAG, "ble_gap_terminate failed: %d", rc);
    }
}

int NimbleGattTransport::gap_event(ble_gap_event* event, void* arg)
{
    auto* self = static_cast<NimbleGattTransport*>(arg);
    if (self == nullptr || event == nullptr) {
        return 0;
    }

    if (event->type == BLE_GAP_EVENT_REPEAT_PAIRING) {
        // The phone dropped its bond: forget ours and pair again
        ble_gap_conn_desc desc;
        if (ble_gap_conn_find(event->repeat_pairing.conn_handle, &desc) == 0) {
            int rc = ble_store_util_delete_peer(&desc.peer_id_addr);
            if (rc != 0) {
                ESP_LOGW(TAG, "Failed to delete old bond: %d", rc);
            }
        }
        ESP_LOGW(TAG, "Repeat pairing, retrying with a fresh bond");
        return BLE_GAP_REPEAT_PAIRING_RETRY;
    }

    self->handle_gap_event(*event);
    return 0;
}

void NimbleGattTransport::handle_gap_event(ble_gap_event& event)
{
    switch (event.type) {
        case BLE_GAP_EVENT_CONNECT:
            if (event.connect.status == 0) {
                handle_link_up(event.connect.conn_handle);
            } else {
                ESP_LOGW(TAG, "Connection failed: %d", event.connect.status);
                finish_connect(Error::ConnectFailure);
            }
            break;

        case BLE_GAP_EVENT_DISCONNECT:
            handle_link_down(event.disconnect.conn.conn_handle, event.disconnect.reason);
            break;

        case BLE_GAP_EVENT_ENC_CHANGE:
            handle_encrypted(event.enc_change.conn_handle, event.enc_change.status);
            break;

        case BLE_GAP_EVENT_NOTIFY_RX:
            handle_notify(event.notify_rx.conn_handle, event.notify_rx.attr_handle,
                          event.notify_rx.om);
            break;

        case BLE_GAP_EVENT_MTU:
            ESP_LOGI(TAG, "MTU updated: %u", static_cast<unsigned>(event.mtu.value));
            break;

        default:
            break;
    }
}

void NimbleGattTransport::handle_link_up(uint16_t conn_handle)
{
    bool wanted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        wanted = stage_ == LinkStage::Connecting;
        if (wanted) {
            conn_handle_ = conn_handle;
            stage_ = LinkStage::Encrypting;
        }
    }

    if (!wanted) {
        // Attempt cancelled while the link was coming up
        terminate_link(conn_handle);
        return;
    }

    const uint16_t link = conn_handle;
    links_opened_.fetch_add(1, std::memory_order_relaxed);
    ESP_LOGI(TAG, "Link up (handle %u), securing", static_cast<unsigned>(link));

    int rc = ble_gap_security_initiate(link);
    if (rc == 0) {
        return; // BLE_GAP_EVENT_ENC_CHANGE follows
    }

    if (rc == BLE_HS_EALREADY) {
        ble_gap_conn_desc desc;
        if (ble_gap_conn_find(link, &desc) == 0 && desc.sec_state.encrypted) {
            handle_encrypted(link, 0);
        }
        return; // otherwise a procedure is running and ENC_CHANGE follows
    }

    ESP_LOGE(TAG, "ble_gap_security_initiate failed: %d", rc);
    handle_encrypted(link, rc);
}

void NimbleGattTransport::handle_encrypted(uint16_t conn_handle, int status)
{
    Completion done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn_handle != conn_handle_ || stage_ != LinkStage::Encrypting) {
            return;
        }
        done = std::move(pending_connect_);
        pending_connect_ = nullptr;

        if (status == 0) {
            stage_ = LinkStage::Up;
        } else {
            ++generation_;
            stage_ = LinkStage::Idle;
            conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
        }
    }

    if (status != 0) {
        encryption_failures_.fetch_add(1, std::memory_order_relaxed);
        ESP_LOGE(TAG, "Link encryption failed: %d", status);
        terminate_link(conn_handle);
        if (done) {
            done(Error::ConnectFailure);
        }
        return;
    }

    ESP_LOGI(TAG, "Link encrypted");
    int rc = ble_gattc_exchange_mtu(conn_handle, nullptr, nullptr);
    if (rc != 0) {
        ESP_LOGW(TAG, "MTU exchange not started: %d", rc);
    }

    if (done) {
        done(Error::Ok);
    }
}

void NimbleGattTransport::finish_connect(Error result)
{
    Completion done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ != LinkStage::Connecting) {
            return;
        }
        stage_ = LinkStage::Idle;
        done = std::move(pending_connect_);
        pending_connect_ = nullptr;
    }

    if (done) {
        done(result);
    }
}

void NimbleGattTransport::handle_link_down(uint16_t conn_handle, int reason)
{
    Completion connect_done;
    GattTransportListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn_handle_ == BLE_HS_CONN_HANDLE_NONE || conn_handle != conn_handle_) {
            return; // closed through cancel_connection()
        }

        connect_done = std::move(pending_connect_);
        pending_connect_ = nullptr;
        pending_discovery_ = nullptr;
        pending_writes_.clear();
        dsc_target_.reset();

        ++generation_;
        stage_ = LinkStage::Idle;
        conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
        listener = listener_;
    }

    ESP_LOGW(TAG, "Link down (handle %u), reason 0x%x",
             static_cast<unsigned>(conn_handle), reason);

    if (connect_done) {
        connect_done(Error::ConnectFailure);
    } else if (listener != nullptr) {
        listener->on_disconnected(reason);
    }
}

void NimbleGattTransport::handle_host_reset(int reason)
{
    synced_.store(false, std::memory_order_release);
    host_resets_.fetch_add(1, std::memory_order_relaxed);

    Completion connect_done;
    GattTransportListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ == LinkStage::Idle) {
            return;
        }

        connect_done = std::move(pending_connect_);
        pending_connect_ = nullptr;
        pending_discovery_ = nullptr;
        pending_writes_.clear();
        dsc_target_.reset();

        ++generation_;
        stage_ = LinkStage::Idle;
        conn_handle_ = BLE_HS_CONN_HANDLE_NONE;
        listener = listener_;
    }

    // Radio gone: reported like a remote drop
    if (connect_done) {
        connect_done(Error::ConnectFailure);
    } else if (listener != nullptr) {
        listener->on_disconnected(reason);
    }
}

void NimbleGattTransport::handle_notify(uint16_t conn_handle, uint16_t attr_handle, os_mbuf* om)
{
    std::optional<CharacteristicId> source;
    GattTransportListener* listener = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (conn_handle != conn_handle_ || stage_ != LinkStage::Up) {
            return;
        }
        if (attr_handle == handles_.value[index_of(CharacteristicId::NotificationSource)]) {
            source = CharacteristicId::NotificationSource;
        } else if (attr_handle == handles_.value[index_of(CharacteristicId::DataSource)]) {
            source = CharacteristicId::DataSource;
        }
        listener = listener_;
    }

    if (!source || listener == nullptr || om == nullptr) {
        return;
    }

    const uint16_t len = OS_MBUF_PKTLEN(om);
    std::vector<uint8_t> bytes(len);
    if (len > 0 && os_mbuf_copydata(om, 0, len, bytes.data()) != 0) {
        ESP_LOGW(TAG, "Failed to copy notification payload (%u bytes)", static_cast<unsigned>(len));
        return;
    }

    notifications_rx_.fetch_add(1, std::memory_order_relaxed);
    listener->on_characteristic_notified(*source, bytes);
}

// =============================================================================
// Discovery
// =============================================================================

Error NimbleGattTransport::discover_services(Completion on_discovered)
{
    uint16_t conn_handle;
    uint32_t generation;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ != LinkStage::Up) {
            return Error::NotConnected;
        }
        if (pending_discovery_) {
            return Error::AlreadyInProgress;
        }
        pending_discovery_ = std::move(on_discovered);
        handles_ = Handles{};
        conn_handle = conn_handle_;
        generation = generation_;
    }

    int rc = ble_gattc_disc_svc_by_uuid(conn_handle, &kServiceUuid.u, on_service, to_arg(generation));
    if (rc != 0) {
        ESP_LOGE(TAG, "Service discovery not started: %d", rc);
        std::lock_guard<std::mutex> lock(mutex_);
        pending_discovery_ = nullptr;
        return Error::DiscoveryFailure;
    }
    return Error::Ok;
}

int NimbleGattTransport::on_service(uint16_t conn_handle, const ble_gatt_error* error,
                                    const ble_gatt_svc* service, void* arg)
{
    NimbleGattTransport* self = s_active;
    if (self == nullptr) {
        return 0;
    }
    const uint32_t generation = from_arg(arg);

    if (error->status == 0 && service != nullptr) {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (generation == self->generation_) {
            self->handles_.service_start = service->start_handle;
            self->handles_.service_end = service->end_handle;
        }
        return 0;
    }

    if (error->status != BLE_HS_EDONE) {
        ESP_LOGE(TAG, "Service discovery error: %d", error->status);
        self->finish_discovery(generation, Error::DiscoveryFailure);
        return 0;
    }

    uint16_t start;
    uint16_t end;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (generation != self->generation_) {
            return 0;
        }
        start = self->handles_.service_start;
        end = self->handles_.service_end;
    }

    if (start == 0) {
        ESP_LOGW(TAG, "ANCS service not found on the peer");
        self->finish_discovery(generation, Error::DiscoveryFailure);
        return 0;
    }

    int rc = ble_gattc_disc_all_chrs(conn_handle, start, end, on_characteristic, arg);
    if (rc != 0) {
        ESP_LOGE(TAG, "Characteristic discovery not started: %d", rc);
        self->finish_discovery(generation, Error::DiscoveryFailure);
    }
    return 0;
}

int NimbleGattTransport::on_characteristic(uint16_t conn_handle, const ble_gatt_error* error,
                                           const ble_gatt_chr* chr, void* arg)
{
    (void)conn_handle;

    NimbleGattTransport* self = s_active;
    if (self == nullptr) {
        return 0;
    }
    const uint32_t generation = from_arg(arg);

    if (error->status == 0 && chr != nullptr) {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (generation != self->generation_) {
            return 0;
        }
        self->handles_.all_defs.push_back(chr->def_handle);
        if (auto id = match_characteristic(&chr->uuid.u)) {
            self->handles_.def[index_of(*id)] = chr->def_handle;
            self->handles_.value[index_of(*id)] = chr->val_handle;
        }
        return 0;
    }

    if (error->status != BLE_HS_EDONE) {
        ESP_LOGE(TAG, "Characteristic discovery error: %d", error->status);
        self->finish_discovery(generation, Error::DiscoveryFailure);
        return 0;
    }

    bool complete;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        const auto& value = self->handles_.value;
        complete = value[0] != 0 && value[1] != 0 && value[2] != 0;
    }

    if (!complete) {
        ESP_LOGW(TAG, "ANCS characteristics missing");
        self->finish_discovery(generation, Error::DiscoveryFailure);
        return 0;
    }

    self->start_descriptor_discovery(generation, CharacteristicId::DataSource);
    return 0;
}

uint16_t NimbleGattTransport::characteristic_end(CharacteristicId characteristic) const
{
    const uint16_t def = handles_.def[index_of(characteristic)];
    uint16_t end = handles_.service_end;
    for (uint16_t other : handles_.all_defs) {
        if (other > def && other - 1 < end) {
            end = static_cast<uint16_t>(other - 1);
        }
    }
    return end;
}

void NimbleGattTransport::start_descriptor_discovery(uint32_t generation, CharacteristicId characteristic)
{
    uint16_t conn_handle;
    uint16_t value;
    uint16_t end;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return;
        }
        dsc_target_ = characteristic;
        conn_handle = conn_handle_;
        value = handles_.value[index_of(characteristic)];
        end = characteristic_end(characteristic);
    }

    if (end <= value) {
        ESP_LOGW(TAG, "%s has no descriptors", characteristic_name(characteristic));
        finish_discovery(generation, Error::DiscoveryFailure);
        return;
    }

    int rc = ble_gattc_disc_all_dscs(conn_handle, value, end, on_descriptor, to_arg(generation));
    if (rc != 0) {
        ESP_LOGE(TAG, "Descriptor discovery not started: %d", rc);
        finish_discovery(generation, Error::DiscoveryFailure);
    }
}

int NimbleGattTransport::on_descriptor(uint16_t conn_handle, const ble_gatt_error* error,
                                       uint16_t chr_val_handle, const ble_gatt_dsc* dsc, void* arg)
{
    (void)conn_handle;
    (void)chr_val_handle;

    NimbleGattTransport* self = s_active;
    if (self == nullptr) {
        return 0;
    }
    const uint32_t generation = from_arg(arg);

    if (error->status == 0 && dsc != nullptr) {
        if (ble_uuid_cmp(&dsc->uuid.u, &kCccdUuid.u) != 0) {
            return 0;
        }
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (generation != self->generation_ || !self->dsc_target_) {
            return 0;
        }
        if (*self->dsc_target_ == CharacteristicId::DataSource) {
            self->handles_.cccd_data_source = dsc->handle;
        } else {
            self->handles_.cccd_notification_source = dsc->handle;
        }
        return 0;
    }

    if (error->status != BLE_HS_EDONE) {
        ESP_LOGE(TAG, "Descriptor discovery error: %d", error->status);
        self->finish_discovery(generation, Error::DiscoveryFailure);
        return 0;
    }

    std::optional<CharacteristicId> target;
    bool complete;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        if (generation != self->generation_) {
            return 0;
        }
        target = self->dsc_target_;
        complete = self->handles_.cccd_data_source != 0 && self->handles_.cccd_notification_source != 0;
    }

    if (target == CharacteristicId::DataSource) {
        self->start_descriptor_discovery(generation, CharacteristicId::NotificationSource);
        return 0;
    }

    if (!complete) {
        ESP_LOGW(TAG, "ANCS CCCD missing");
    }
    self->finish_discovery(generation, complete ? Error::Ok : Error::DiscoveryFailure);
    return 0;
}

void NimbleGattTransport::finish_discovery(uint32_t generation, Error result)
{
    Completion done;
    std::array<uint16_t, 3> value;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !pending_discovery_) {
            return;
        }
        done = std::move(pending_discovery_);
        pending_discovery_ = nullptr;
        dsc_target_.reset();
        value = handles_.value;
    }

    if (result == Error::Ok) {
        ESP_LOGI(TAG, "ANCS discovered (NS %u, CP %u, DS %u)",
                 static_cast<unsigned>(value[0]),
                 static_cast<unsigned>(value[1]),
                 static_cast<unsigned>(value[2]));
    }
    done(result);
}

// =============================================================================
// Writes
// =============================================================================

Error NimbleGattTransport::subscribe(CharacteristicId characteristic, Completion on_subscribed)
{
    if (characteristic == CharacteristicId::ControlPoint) {
        return Error::InvalidArgument;
    }
    return start_write(characteristic, true, kEnableNotifications, std::move(on_subscribed),
                       Error::SubscribeFailure);
}

Error NimbleGattTransport::write_characteristic(CharacteristicId characteristic,
                                                std::span<const uint8_t> bytes,
                                                Completion on_written)
{
    return start_write(characteristic, false, bytes, std::move(on_written),
                       Error::TransportWriteFailure);
}

Error NimbleGattTransport::start_write(CharacteristicId characteristic, bool to_cccd,
                                       std::span<const uint8_t> bytes, Completion done, Error failure)
{
    uint16_t conn_handle;
    uint16_t attr_handle;
    uint32_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stage_ != LinkStage::Up) {
            return Error::NotConnected;
        }

        if (to_cccd) {
            attr_handle = characteristic == CharacteristicId::DataSource
                ? handles_.cccd_data_source
                : handles_.cccd_notification_source;
        } else {
            attr_handle = handles_.value[index_of(characteristic)];
        }
        if (attr_handle == 0) {
            return failure;
        }

        conn_handle = conn_handle_;
        id = next_write_id_++;
        pending_writes_[id] = PendingWrite{std::move(done), failure};
    }

    int rc = ble_gattc_write_flat(conn_handle, attr_handle, bytes.data(),
                                  static_cast<uint16_t>(bytes.size()), on_write, to_arg(id));
    if (rc != 0) {
        ESP_LOGW(TAG, "Write to handle %u rejected: %d", static_cast<unsigned>(attr_handle), rc);
        std::lock_guard<std::mutex> lock(mutex_);
        pending_writes_.erase(id);
        return failure;
    }
    return Error::Ok;
}

int NimbleGattTransport::on_write(uint16_t conn_handle, const ble_gatt_error* error,
                                  ble_gatt_attr* attr, void* arg)
{
    (void)conn_handle;
    (void)attr;

    NimbleGattTransport* self = s_active;
    if (self == nullptr) {
        return 0;
    }

    PendingWrite pending;
    {
        std::lock_guard<std::mutex> lock(self->mutex_);
        auto it = self->pending_writes_.find(from_arg(arg));
        if (it == self->pending_writes_.end()) {
            return 0; // session closed meanwhile
        }
        pending = std::move(it->second);
        self->pending_writes_.erase(it);
    }

    if (error->status != 0) {
        ESP_LOGW(TAG, "Write failed: %d", error->status);
    }
    if (pending.done) {
        pending.done(error->status == 0 ? Error::Ok : pending.failure);
    }
    return 0;
}

} // namespace ancs
