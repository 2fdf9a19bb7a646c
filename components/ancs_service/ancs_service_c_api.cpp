// ancs_service_c_api.cpp (extern "C")
#include "ancs_service_core.hpp"

#include <new>

extern "C" {
#include "esp_log.h"
}

static const char* TAG = "ancs_service_api";

static ancs_service::AncsService* s_service_instance = nullptr;

extern "C" esp_err_t ancs_service_init(event_bus_t* bus)
{
    if (bus == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }
    if (s_service_instance != nullptr) {
        return ESP_OK;
    }

    auto* service = new (std::nothrow) ancs_service::AncsService(bus);
    if (service == nullptr) {
        ESP_LOGE(TAG, "Out of memory creating the ANCS service");
        return ESP_ERR_NO_MEM;
    }

    esp_err_t err = service->init();
    if (err != ESP_OK) {
        delete service;
        return err;
    }
    s_service_instance = service;
    return ESP_OK;
}

extern "C" esp_err_t ancs_service_start(void)
{
    return s_service_instance ? s_service_instance->start() : ESP_ERR_INVALID_STATE;
}

extern "C" esp_err_t ancs_service_connect(const char* address, uint8_t address_type, const char* name)
{
    if (s_service_instance == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }
    if (address == nullptr) {
        return ESP_ERR_INVALID_ARG;
    }

    ancs::DeviceHandle device;
    device.address = address;
    device.address_type = address_type;
    device.name = name != nullptr ? name : "";
    return s_service_instance->connect(device);
}

extern "C" esp_err_t ancs_service_disconnect(void)
{
    return s_service_instance ? s_service_instance->disconnect() : ESP_ERR_INVALID_STATE;
}

extern "C" esp_err_t ancs_service_shutdown(void)
{
    return s_service_instance ? s_service_instance->shutdown() : ESP_ERR_INVALID_STATE;
}

extern "C" ancs_service_status_t ancs_service_get_status(void)
{
    if (s_service_instance == nullptr) {
        ancs_service_status_t status = {};
        return status;
    }
    return s_service_instance->get_status();
}
