#include "ble_scanner.hpp"

#include <cstring>
#include <utility>

#include "ble_address.hpp"
#include "esp_log.h"
#include "host/ble_hs_adv.h"

namespace {
static const char* kTag = "BleScanner";
}  // namespace

namespace ble {

BleScanner::BleScanner(BleRadio& radio) : radio_(radio) {}

esp_err_t BleScanner::StartScan(uint32_t duration_ms, ReportCallback on_report,
                                FinishedCallback on_finished) {
    if (!radio_.IsRadioEnabled()) {
        ESP_LOGE(kTag, "Radio is not enabled.");
        return ESP_ERR_INVALID_STATE;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_report_ = std::move(on_report);
        on_finished_ = std::move(on_finished);
    }

    // Active scanning so that scan responses (the names) are requested.
    // Duplicates are kept: the name and the marker arrive separately.
    struct ble_gap_disc_params disc_params;
    memset(&disc_params, 0, sizeof(disc_params));
    disc_params.passive = 0;
    disc_params.filter_duplicates = 0;

    const int32_t duration =
        duration_ms == 0 ? BLE_HS_FOREVER : static_cast<int32_t>(duration_ms);
    int rc = ble_gap_disc(radio_.own_addr_type(), duration, &disc_params,
                          BleScanner::GapEventHandler, this);
    if (rc != 0) {
        ESP_LOGE(kTag, "Error starting discovery; rc=%d", rc);
        std::lock_guard<std::mutex> lock(mutex_);
        on_report_ = nullptr;
        on_finished_ = nullptr;
        return ESP_FAIL;
    }

    ESP_LOGI(kTag, "Discovery started (%s).",
             duration_ms == 0 ? "until stopped" : "timed");
    return ESP_OK;
}

esp_err_t BleScanner::StopScan() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_report_ = nullptr;
        on_finished_ = nullptr;
    }
    int rc = ble_gap_disc_cancel();
    if (rc != 0 && rc != BLE_HS_EALREADY) {
        ESP_LOGE(kTag, "Error cancelling discovery; rc=%d", rc);
        return ESP_FAIL;
    }
    ESP_LOGI(kTag, "Discovery stopped.");
    return ESP_OK;
}

// --- Static Callbacks ---

int BleScanner::GapEventHandler(struct ble_gap_event* event, void* arg) {
    auto* scanner = static_cast<BleScanner*>(arg);
    switch (event->type) {
        case BLE_GAP_EVENT_DISC:
            scanner->HandleDiscovery(*event);
            break;
        case BLE_GAP_EVENT_DISC_COMPLETE:
            scanner->HandleComplete(event->disc_complete.reason);
            break;
        default:
            break;
    }
    return 0;
}

void BleScanner::HandleDiscovery(const struct ble_gap_event& event) {
    struct ble_hs_adv_fields fields;
    int rc = ble_hs_adv_parse_fields(&fields, event.disc.data,
                                     event.disc.length_data);
    if (rc != 0) {
        ESP_LOGD(kTag, "Unparseable advertisement; rc=%d", rc);
        return;
    }

    voicelink::AdvertisementReport report;
    report.address = FormatAddress(event.disc.addr);
    for (int i = 0; i < fields.num_uuids128; ++i) {
        report.markers.push_back(UuidToMarker(fields.uuids128[i]));
    }
    if (fields.name != nullptr && fields.name_len > 0) {
        report.name.assign(reinterpret_cast<const char*>(fields.name),
                           fields.name_len);
    }

    ReportCallback on_report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_report = on_report_;
    }
    if (on_report) {
        on_report(report);
    }
}

void BleScanner::HandleComplete(int reason) {
    ESP_LOGI(kTag, "Discovery complete; reason=%d", reason);

    FinishedCallback on_finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_finished = std::move(on_finished_);
        on_finished_ = nullptr;
        on_report_ = nullptr;
    }
    if (on_finished) {
        // The window elapsing is reported as reason 0.
        on_finished(reason == BLE_HS_ETIMEOUT ? 0 : reason);
    }
}

}  // namespace ble
