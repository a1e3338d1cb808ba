#include "ble_advertiser.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "ble_address.hpp"
#include "esp_log.h"
#include "host/ble_hs_adv.h"
#include "services/gap/ble_svc_gap.h"

namespace {
static const char* kTag = "BleAdvertiser";

// A 31-byte scan response leaves 29 bytes for the name after its header.
constexpr size_t kMaxAdvertisedNameLength = 29;
}  // namespace

namespace ble {

BleAdvertiser::BleAdvertiser(BleRadio& radio) : radio_(radio) {}

esp_err_t BleAdvertiser::StartAdvertising(
    const voicelink::Advertisement& advertisement, StoppedCallback on_stopped) {
    if (!radio_.IsRadioEnabled()) {
        ESP_LOGE(kTag, "Radio is not enabled.");
        return ESP_ERR_INVALID_STATE;
    }

    // --- Advertising data: flags and the marker ---
    ble_uuid128_t marker_uuid = MarkerToUuid(advertisement.marker);
    struct ble_hs_adv_fields fields;
    memset(&fields, 0, sizeof(fields));
    fields.flags = BLE_HS_ADV_F_DISC_GEN | BLE_HS_ADV_F_BREDR_UNSUP;
    fields.uuids128 = &marker_uuid;
    fields.num_uuids128 = 1;
    fields.uuids128_is_complete = 1;

    int rc = ble_gap_adv_set_fields(&fields);
    if (rc != 0) {
        ESP_LOGE(kTag, "Error setting advertisement data; rc=%d", rc);
        return ESP_FAIL;
    }

    // --- Scan response: the device name ---
    const std::string& name = advertisement.name;
    const size_t name_len = std::min(name.size(), kMaxAdvertisedNameLength);
    struct ble_hs_adv_fields rsp_fields;
    memset(&rsp_fields, 0, sizeof(rsp_fields));
    rsp_fields.name = reinterpret_cast<const uint8_t*>(name.data());
    rsp_fields.name_len = static_cast<uint8_t>(name_len);
    rsp_fields.name_is_complete = name_len == name.size() ? 1 : 0;

    rc = ble_gap_adv_rsp_set_fields(&rsp_fields);
    if (rc != 0) {
        ESP_LOGE(kTag, "Error setting scan response data; rc=%d", rc);
        return ESP_FAIL;
    }

    rc = ble_svc_gap_device_name_set(name.c_str());
    if (rc != 0) {
        ESP_LOGW(kTag, "Error setting GAP device name; rc=%d", rc);
    }

    struct ble_gap_adv_params adv_params;
    memset(&adv_params, 0, sizeof(adv_params));
    adv_params.conn_mode = advertisement.connectable ? BLE_GAP_CONN_MODE_UND
                                                     : BLE_GAP_CONN_MODE_NON;
    adv_params.disc_mode = BLE_GAP_DISC_MODE_GEN;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_stopped_ = std::move(on_stopped);
    }

    rc = ble_gap_adv_start(radio_.own_addr_type(), nullptr, BLE_HS_FOREVER,
                           &adv_params, BleAdvertiser::GapEventHandler, this);
    if (rc != 0) {
        ESP_LOGE(kTag, "Error starting advertising; rc=%d", rc);
        std::lock_guard<std::mutex> lock(mutex_);
        on_stopped_ = nullptr;
        return ESP_FAIL;
    }

    ESP_LOGI(kTag, "Advertising started as '%s'.", name.c_str());
    return ESP_OK;
}

esp_err_t BleAdvertiser::StopAdvertising() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_stopped_ = nullptr;
    }
    int rc = ble_gap_adv_stop();
    if (rc != 0 && rc != BLE_HS_EALREADY) {
        ESP_LOGE(kTag, "Error stopping advertising; rc=%d", rc);
        return ESP_FAIL;
    }
    ESP_LOGI(kTag, "Advertising stopped.");
    return ESP_OK;
}

// --- Static Callbacks ---

int BleAdvertiser::GapEventHandler(struct ble_gap_event* event, void* arg) {
    static_cast<BleAdvertiser*>(arg)->HandleGapEvent(event);
    return 0;
}

void BleAdvertiser::HandleGapEvent(struct ble_gap_event* event) {
    switch (event->type) {
        case BLE_GAP_EVENT_CONNECT:
            // A successful connection ends advertising.
            ESP_LOGI(kTag, "Central connected; status=%d, conn_handle=%d",
                     event->connect.status, event->connect.conn_handle);
            break;

        case BLE_GAP_EVENT_ADV_COMPLETE:
            ESP_LOGI(kTag, "Advertising complete; reason=%d",
                     event->adv_complete.reason);
            break;

        case BLE_GAP_EVENT_DISCONNECT:
            ESP_LOGI(kTag, "Central disconnected; reason=%d",
                     event->disconnect.reason);
            return;

        default:
            return;
    }

    // A failed connect leaves advertising running.
    if (event->type == BLE_GAP_EVENT_CONNECT && event->connect.status != 0) {
        return;
    }

    StoppedCallback on_stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_stopped = std::move(on_stopped_);
        on_stopped_ = nullptr;
    }
    if (on_stopped) {
        on_stopped();
    }
}

}  // namespace ble
