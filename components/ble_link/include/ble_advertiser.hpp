#ifndef BLE_ADVERTISER_HPP_
#define BLE_ADVERTISER_HPP_

#include <mutex>

#include "ble_radio.hpp"
#include "discovery.hpp"
#include "host/ble_hs.h"

namespace ble {

/**
 * @class BleAdvertiser
 * @brief Puts the marker in the advertising data and the device name in
 * the scan response.
 */
class BleAdvertiser : public voicelink::AdvertiseDriver {
   public:
    explicit BleAdvertiser(BleRadio& radio);

    BleAdvertiser(const BleAdvertiser&) = delete;
    BleAdvertiser& operator=(const BleAdvertiser&) = delete;

    esp_err_t StartAdvertising(const voicelink::Advertisement& advertisement,
                               StoppedCallback on_stopped) override;
    esp_err_t StopAdvertising() override;

   private:
    static int GapEventHandler(struct ble_gap_event* event, void* arg);
    void HandleGapEvent(struct ble_gap_event* event);

    BleRadio& radio_;
    std::mutex mutex_;
    StoppedCallback on_stopped_;
};

}  // namespace ble

#endif  // BLE_ADVERTISER_HPP_
