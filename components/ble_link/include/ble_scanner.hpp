#ifndef BLE_SCANNER_HPP_
#define BLE_SCANNER_HPP_

#include <mutex>

#include "ble_radio.hpp"
#include "discovery.hpp"
#include "host/ble_hs.h"

namespace ble {

/**
 * @class BleScanner
 * @brief Active GAP discovery. Every advertisement and scan response is
 * parsed and forwarded as one report; the seeker does the filtering.
 */
class BleScanner : public voicelink::ScanDriver {
   public:
    explicit BleScanner(BleRadio& radio);

    BleScanner(const BleScanner&) = delete;
    BleScanner& operator=(const BleScanner&) = delete;

    esp_err_t StartScan(uint32_t duration_ms, ReportCallback on_report,
                        FinishedCallback on_finished) override;
    esp_err_t StopScan() override;

   private:
    static int GapEventHandler(struct ble_gap_event* event, void* arg);
    void HandleDiscovery(const struct ble_gap_event& event);
    void HandleComplete(int reason);

    BleRadio& radio_;
    std::mutex mutex_;
    ReportCallback on_report_;
    FinishedCallback on_finished_;
};

}  // namespace ble

#endif  // BLE_SCANNER_HPP_
