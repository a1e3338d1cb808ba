#ifndef BLE_RADIO_HPP_
#define BLE_RADIO_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "esp_err.h"
#include "radio_gate.hpp"

namespace ble {

/**
 * @class BleRadio
 * @brief A singleton that owns the NimBLE host.
 *
 * The host is brought up lazily on the first RequestRadioEnable(); the radio
 * counts as enabled once the host has synchronized with the controller.
 */
class BleRadio : public voicelink::RadioGate {
   public:
    /**
     * @brief Creates the unique BleRadio instance. Does not touch the radio.
     * @return esp_err_t ESP_OK on success.
     */
    static esp_err_t CreateInstance();

    /**
     * @brief Gets the singleton instance.
     * @warning CreateInstance() must have been called successfully first.
     */
    static BleRadio& GetInstance();

    ~BleRadio() override = default;

    BleRadio(const BleRadio&) = delete;
    BleRadio& operator=(const BleRadio&) = delete;

    bool IsRadioEnabled() const override;
    esp_err_t RequestRadioEnable(EnableCallback done) override;

    /**
     * @brief The own-address type to advertise, scan and connect with.
     * Valid once the radio is enabled.
     */
    uint8_t own_addr_type() const { return own_addr_type_.load(); }

   private:
    BleRadio() = default;

    esp_err_t StartHost();
    void CompleteRequests(bool enabled);

    static void NimbleHostTask(void* param);
    static void OnSync();
    static void OnReset(int reason);

    static std::unique_ptr<BleRadio> s_instance_;

    std::mutex mutex_;
    bool host_started_ = false;
    std::vector<EnableCallback> waiting_;
    std::atomic<bool> synced_{false};
    std::atomic<uint8_t> own_addr_type_{0};
};

}  // namespace ble

#endif  // BLE_RADIO_HPP_
