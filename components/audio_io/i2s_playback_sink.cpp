#include "i2s_playback_sink.hpp"

#include "driver/i2s_common.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"

namespace audio {
namespace {
static const char* kTag = "I2sPlaybackSink";

constexpr i2s_port_t kI2sPort = I2S_NUM_1;
constexpr uint32_t kDmaBufferCount = 8;
constexpr uint32_t kDmaBufferSamples = 256;

// MAX98357A wiring
constexpr gpio_num_t kI2sStdGpioBclk = GPIO_NUM_15;
constexpr gpio_num_t kI2sStdGpioWs = GPIO_NUM_16;
constexpr gpio_num_t kI2sStdGpioDout = GPIO_NUM_7;

constexpr uint32_t kWriteTimeoutMs = 500;
}  // namespace

std::unique_ptr<I2sPlaybackSink> I2sPlaybackSink::Create(
    const voicelink::AudioFormat& format) {
    i2s_chan_config_t chan_cfg =
        I2S_CHANNEL_DEFAULT_CONFIG(kI2sPort, I2S_ROLE_MASTER);
    chan_cfg.dma_desc_num = kDmaBufferCount;
    chan_cfg.dma_frame_num = kDmaBufferSamples;
    chan_cfg.auto_clear = true;  // Play silence on underflow

    i2s_chan_handle_t tx_handle = nullptr;
    esp_err_t err = i2s_new_channel(&chan_cfg, &tx_handle, nullptr);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create I2S channel: %s",
                 esp_err_to_name(err));
        return nullptr;
    }

    i2s_std_config_t std_cfg = {
        .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(format.sample_rate_hz),
        .slot_cfg = I2S_STD_PHILIPS_SLOT_DEFAULT_CONFIG(
            I2S_DATA_BIT_WIDTH_16BIT, I2S_SLOT_MODE_MONO),
        .gpio_cfg =
            {
                .mclk = I2S_GPIO_UNUSED,
                .bclk = kI2sStdGpioBclk,
                .ws = kI2sStdGpioWs,
                .dout = kI2sStdGpioDout,
                .din = I2S_GPIO_UNUSED,
                .invert_flags =
                    {
                        .mclk_inv = false,
                        .bclk_inv = false,
                        .ws_inv = false,
                    },
            },
    };
    std_cfg.slot_cfg.slot_mask = I2S_STD_SLOT_LEFT;

    err = i2s_channel_init_std_mode(tx_handle, &std_cfg);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to initialize I2S channel in std mode: %s",
                 esp_err_to_name(err));
        i2s_del_channel(tx_handle);
        return nullptr;
    }

    return std::unique_ptr<I2sPlaybackSink>(new I2sPlaybackSink(tx_handle));
}

I2sPlaybackSink::I2sPlaybackSink(i2s_chan_handle_t handle)
    : tx_handle_(handle), enabled_(false) {}

I2sPlaybackSink::~I2sPlaybackSink() {
    if (tx_handle_ == nullptr) {
        return;
    }
    if (enabled_) {
        i2s_channel_disable(tx_handle_);
    }
    i2s_del_channel(tx_handle_);
    ESP_LOGI(kTag, "Playback channel released.");
}

esp_err_t I2sPlaybackSink::Start() {
    if (enabled_) {
        return ESP_OK;
    }
    esp_err_t err = i2s_channel_enable(tx_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to enable I2S channel: %s",
                 esp_err_to_name(err));
        return err;
    }
    enabled_ = true;
    return ESP_OK;
}

esp_err_t I2sPlaybackSink::Stop() {
    if (!enabled_) {
        return ESP_OK;
    }
    enabled_ = false;
    esp_err_t err = i2s_channel_disable(tx_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to disable I2S channel: %s",
                 esp_err_to_name(err));
    }
    return err;
}

esp_err_t I2sPlaybackSink::Write(std::span<const uint8_t> src) {
    if (!enabled_) {
        return ESP_ERR_INVALID_STATE;
    }
    size_t bytes_written = 0;
    esp_err_t err = i2s_channel_write(tx_handle_, src.data(), src.size(),
                                      &bytes_written,
                                      pdMS_TO_TICKS(kWriteTimeoutMs));
    if (err != ESP_OK) {
        ESP_LOGW(kTag, "I2S write failed: %s", esp_err_to_name(err));
        return err;
    }
    if (bytes_written < src.size()) {
        ESP_LOGW(kTag, "Short write: %u of %u bytes.",
                 static_cast<unsigned>(bytes_written),
                 static_cast<unsigned>(src.size()));
    }
    return ESP_OK;
}

}  // namespace audio
