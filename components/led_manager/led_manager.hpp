#ifndef LED_LED_MANAGER_HPP_
#define LED_LED_MANAGER_HPP_

#include <memory>

#include "esp_err.h"
#include "led_strip.h"
#include "status_color.hpp"

namespace led {

/**
 * @class LEDManager
 * @brief A singleton owning the on-board addressable status LED.
 */
class LEDManager {
   public:
    struct Config {
        int gpio_pin;
        uint32_t max_leds = 1;
        uint32_t resolution_hz = 10 * 1000 * 1000;  // 10MHz
    };

    // --- Singleton Management ---
    LEDManager(const LEDManager&) = delete;
    LEDManager& operator=(const LEDManager&) = delete;
    ~LEDManager();

    static esp_err_t CreateInstance(const Config& config);
    static LEDManager& GetInstance();

    /**
     * @brief Sets every LED on the strip to `color` and displays it.
     */
    esp_err_t Show(const Color& color);

    /**
     * @brief Shows the color for `status`. Repeated colors are not re-sent.
     */
    esp_err_t ShowStatus(const voicelink::StatusView& status);

    /**
     * @brief Turns off all LEDs immediately.
     * @return esp_err_t ESP_OK on success.
     */
    esp_err_t TurnOff();

   private:
    LEDManager() = default;
    esp_err_t Initialize(const Config& config);

    led_strip_handle_t led_strip_handle_ = nullptr;
    Config config_{};
    Color shown_{};

    static std::unique_ptr<LEDManager> s_instance_;
};

}  // namespace led

#endif  // LED_LED_MANAGER_HPP_
