#include "ble_radio.hpp"

#include <cassert>
#include <utility>

#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "host/ble_hs.h"
#include "host/util/util.h"
#include "nimble/nimble_port.h"
#include "services/gap/ble_svc_gap.h"
#include "services/gatt/ble_svc_gatt.h"

namespace {
static const char* kTag = "BleRadio";

constexpr uint32_t kHostTaskStackSize = 4096;
constexpr UBaseType_t kHostTaskPriority = 5;
}  // namespace

namespace ble {

std::unique_ptr<BleRadio> BleRadio::s_instance_ = nullptr;

// --- Singleton Management ---

esp_err_t BleRadio::CreateInstance() {
    if (s_instance_ != nullptr) {
        ESP_LOGW(kTag, "BleRadio instance already exists.");
        return ESP_OK;
    }
    s_instance_ = std::unique_ptr<BleRadio>(new BleRadio());
    if (s_instance_ == nullptr) {
        ESP_LOGE(kTag, "Failed to create BleRadio instance.");
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

BleRadio& BleRadio::GetInstance() {
    assert(s_instance_ != nullptr);
    return *s_instance_;
}

// --- RadioGate ---

bool BleRadio::IsRadioEnabled() const { return synced_.load(); }

esp_err_t BleRadio::RequestRadioEnable(EnableCallback done) {
    if (!done) {
        return ESP_ERR_INVALID_ARG;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // synced_ is set before OnSync() takes the lock to complete waiters.
        if (!synced_.load()) {
            if (!host_started_) {
                esp_err_t err = StartHost();
                if (err != ESP_OK) {
                    return err;
                }
                host_started_ = true;
            }
            waiting_.push_back(std::move(done));
            return ESP_OK;
        }
    }
    done(true);
    return ESP_OK;
}

// --- Private Methods ---

esp_err_t BleRadio::StartHost() {
    ESP_LOGI(kTag, "Bringing up the NimBLE host...");

    esp_err_t ret = nimble_port_init();
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "nimble_port_init failed: %s", esp_err_to_name(ret));
        return ret;
    }

    ble_hs_cfg.reset_cb = BleRadio::OnReset;
    ble_hs_cfg.sync_cb = BleRadio::OnSync;

    ble_svc_gap_init();
    ble_svc_gatt_init();

    if (xTaskCreate(NimbleHostTask, "nimble_host", kHostTaskStackSize, nullptr,
                    kHostTaskPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create NimBLE host task.");
        nimble_port_deinit();
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

void BleRadio::CompleteRequests(bool enabled) {
    std::vector<EnableCallback> waiting;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        waiting.swap(waiting_);
    }
    for (auto& done : waiting) {
        done(enabled);
    }
}

// --- Static Callbacks & Tasks ---

void BleRadio::NimbleHostTask(void* /*param*/) {
    ESP_LOGI(kTag, "NimBLE host task started.");
    nimble_port_run();

    // Reached only when nimble_port_stop() is called.
    nimble_port_deinit();
    vTaskDelete(nullptr);
}

void BleRadio::OnSync() {
    BleRadio& radio = GetInstance();

    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
        ESP_LOGE(kTag, "No usable device address; rc=%d", rc);
        radio.CompleteRequests(false);
        return;
    }

    uint8_t addr_type = 0;
    rc = ble_hs_id_infer_auto(0, &addr_type);
    if (rc != 0) {
        ESP_LOGE(kTag, "Failed to infer own address type; rc=%d", rc);
        radio.CompleteRequests(false);
        return;
    }
    radio.own_addr_type_ = addr_type;
    radio.synced_ = true;

    ESP_LOGI(kTag, "NimBLE host synchronized; address type %u.", addr_type);
    radio.CompleteRequests(true);
}

void BleRadio::OnReset(int reason) {
    ESP_LOGW(kTag, "NimBLE host reset; reason=%d", reason);
    GetInstance().synced_ = false;
}

}  // namespace ble
