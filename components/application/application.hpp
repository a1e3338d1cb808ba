#ifndef APP_APPLICATION_HPP_
#define APP_APPLICATION_HPP_

#include <memory>
#include <string>

#include "connection_manager.hpp"
#include "esp_err.h"
#include "settings_capability_gate.hpp"

namespace audio {
class I2sAudioDevices;
}
namespace ble {
class BleAdvertiser;
class BleScanner;
class L2capTransport;
}  // namespace ble

namespace app {

/**
 * @class Application
 * @brief The main application class that wires the platform components to
 * the connection manager.
 *
 * The radio, transport and audio drivers are created here and handed to a
 * voicelink::ConnectionManager; the serial console and the status LED are its
 * only user-facing surfaces.
 */
class Application {
   public:
    // --- Singleton Management ---
    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /**
     * @brief Creates and initializes the unique Application instance.
     * @return esp_err_t ESP_OK on success, or an ESP-IDF error code on failure.
     */
    static esp_err_t CreateInstance();

    /**
     * @brief Gets the singleton instance of the Application.
     * @warning CreateInstance() must have been called successfully before this.
     * @return A reference to the unique Application instance.
     */
    static Application& GetInstance();

    ~Application();

    /**
     * @brief Starts the manager's event task and the serial console.
     */
    esp_err_t Start();

    voicelink::ConnectionManager& manager() { return *manager_; }

    /**
     * @brief Renames the device and persists the new name.
     */
    esp_err_t Rename(const std::string& name);

   private:
    Application();

    /**
     * @brief Internal initialization method called by CreateInstance.
     * @return esp_err_t ESP_OK on success.
     */
    esp_err_t Initialize();

    void OnStatusChanged(const voicelink::StatusView& view);

    std::unique_ptr<SettingsCapabilityGate> capabilities_;
    std::unique_ptr<ble::BleAdvertiser> advertiser_;
    std::unique_ptr<ble::BleScanner> scanner_;
    std::unique_ptr<ble::L2capTransport> transport_;
    std::unique_ptr<audio::I2sAudioDevices> audio_devices_;

    // Declared last: destroyed before the drivers it uses.
    std::unique_ptr<voicelink::ConnectionManager> manager_;

    voicelink::Phase last_logged_phase_ = voicelink::Phase::kIdle;

    // Static pointer to the single instance of this class.
    static std::unique_ptr<Application> s_instance_;
};

}  // namespace app

#endif  // APP_APPLICATION_HPP_
