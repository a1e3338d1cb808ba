#include "led_manager.hpp"

#include <cassert>

#include "esp_log.h"

namespace {
static const char* kTag = "LedManager";
}

namespace led {

std::unique_ptr<LEDManager> LEDManager::s_instance_ = nullptr;

esp_err_t LEDManager::CreateInstance(const LEDManager::Config& config) {
    if (s_instance_ != nullptr) {
        return ESP_OK;
    }
    s_instance_ = std::unique_ptr<LEDManager>(new LEDManager());
    esp_err_t err = s_instance_->Initialize(config);
    if (err != ESP_OK) {
        s_instance_.reset();
    }
    return err;
}

LEDManager& LEDManager::GetInstance() {
    assert(s_instance_ != nullptr);
    return *s_instance_;
}

LEDManager::~LEDManager() {
    if (led_strip_handle_) {
        led_strip_del(led_strip_handle_);
    }
}

esp_err_t LEDManager::Initialize(const LEDManager::Config& config) {
    config_ = config;
    ESP_LOGI(kTag, "Initializing LED Strip on GPIO %d", config_.gpio_pin);

    led_strip_config_t strip_config = {
        .strip_gpio_num = config_.gpio_pin,
        .max_leds = config_.max_leds,
        .led_model = LED_MODEL_WS2812,
        .color_component_format = LED_STRIP_COLOR_COMPONENT_FMT_GRB,
        .flags = {.invert_out = false},
    };

    led_strip_rmt_config_t rmt_config = {
        .clk_src = RMT_CLK_SRC_DEFAULT,
        .resolution_hz = config_.resolution_hz,
        .mem_block_symbols = 0,
        .flags = {.with_dma = true},
    };

    esp_err_t err = led_strip_new_rmt_device(&strip_config, &rmt_config,
                                             &led_strip_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create LED strip: %s", esp_err_to_name(err));
        return err;
    }

    // Turn the LED off on initialization
    return TurnOff();
}

esp_err_t LEDManager::Show(const Color& color) {
    if (!led_strip_handle_) {
        return ESP_ERR_INVALID_STATE;
    }
    for (uint32_t i = 0; i < config_.max_leds; ++i) {
        esp_err_t err = led_strip_set_pixel(led_strip_handle_, i, color.red,
                                            color.green, color.blue);
        if (err != ESP_OK) {
            return err;
        }
    }
    esp_err_t err = led_strip_refresh(led_strip_handle_);
    if (err == ESP_OK) {
        shown_ = color;
    }
    return err;
}

esp_err_t LEDManager::ShowStatus(const voicelink::StatusView& status) {
    const Color color = StatusColor(status);
    if (color == shown_) {
        return ESP_OK;
    }
    return Show(color);
}

esp_err_t LEDManager::TurnOff() {
    if (!led_strip_handle_) {
        return ESP_ERR_INVALID_STATE;
    }
    // led_strip_clear() updates the buffer and refreshes the strip.
    esp_err_t err = led_strip_clear(led_strip_handle_);
    if (err == ESP_OK) {
        shown_ = Color{};
    }
    return err;
}

}  // namespace led
