#include "i2s_capture_source.hpp"

#include <algorithm>
#include <cstring>

#include "driver/i2s_common.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "hal/i2s_types.h"

namespace audio {
namespace {
static const char* kTag = "I2sCaptureSource";

// I2S peripheral configuration
constexpr i2s_port_t kI2sPort = I2S_NUM_0;
constexpr i2s_data_bit_width_t kI2sBitsPerSample = I2S_DATA_BIT_WIDTH_32BIT;
constexpr uint32_t kDmaBufferCount = 8;
constexpr uint32_t kDmaBufferSamples = 256;

// GPIO pin configuration
constexpr gpio_num_t kI2sStdGpioWs = GPIO_NUM_4;
constexpr gpio_num_t kI2sStdGpioBclk = GPIO_NUM_5;
constexpr gpio_num_t kI2sStdGpioDin = GPIO_NUM_6;

// Conversion constants
constexpr int kAdcToPcmBitShift = 12;

// A read gives up after this long so that Stop() is observed.
constexpr uint32_t kReadTimeoutMs = 100;
}  // namespace

// --- Static Factory Method ---
std::unique_ptr<I2sCaptureSource> I2sCaptureSource::Create(
    const voicelink::AudioFormat& format) {
    ESP_LOGI(kTag, "Creating capture source at %lu Hz...",
             static_cast<unsigned long>(format.sample_rate_hz));

    i2s_chan_config_t chan_cfg =
        I2S_CHANNEL_DEFAULT_CONFIG(kI2sPort, I2S_ROLE_MASTER);
    chan_cfg.dma_desc_num = kDmaBufferCount;
    chan_cfg.dma_frame_num = kDmaBufferSamples;

    i2s_chan_handle_t rx_handle = nullptr;
    esp_err_t err = i2s_new_channel(&chan_cfg, nullptr, &rx_handle);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create I2S channel: %s",
                 esp_err_to_name(err));
        return nullptr;
    }

    i2s_std_config_t std_cfg = {
        .clk_cfg = I2S_STD_CLK_DEFAULT_CONFIG(format.sample_rate_hz),
        .slot_cfg = I2S_STD_MSB_SLOT_DEFAULT_CONFIG(kI2sBitsPerSample,
                                                    I2S_SLOT_MODE_MONO),
        .gpio_cfg =
            {
                .mclk = I2S_GPIO_UNUSED,
                .bclk = kI2sStdGpioBclk,
                .ws = kI2sStdGpioWs,
                .dout = I2S_GPIO_UNUSED,
                .din = kI2sStdGpioDin,
                .invert_flags =
                    {
                        .mclk_inv = false,
                        .bclk_inv = false,
                        .ws_inv = false,
                    },
            },
    };
    std_cfg.slot_cfg.slot_mask = I2S_STD_SLOT_LEFT;  // Use left slot for mono

    err = i2s_channel_init_std_mode(rx_handle, &std_cfg);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to initialize I2S channel in std mode: %s",
                 esp_err_to_name(err));
        i2s_del_channel(rx_handle);
        return nullptr;
    }

    // Constructor is private; std::make_unique cannot access it.
    return std::unique_ptr<I2sCaptureSource>(new I2sCaptureSource(rx_handle));
}

I2sCaptureSource::I2sCaptureSource(i2s_chan_handle_t handle)
    : rx_handle_(handle), enabled_(false), raw_block_{} {}

I2sCaptureSource::~I2sCaptureSource() {
    if (rx_handle_ == nullptr) {
        return;
    }
    if (enabled_) {
        i2s_channel_disable(rx_handle_);
    }
    i2s_del_channel(rx_handle_);
    ESP_LOGI(kTag, "Capture channel released.");
}

esp_err_t I2sCaptureSource::Start() {
    if (enabled_) {
        return ESP_OK;
    }
    esp_err_t err = i2s_channel_enable(rx_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to enable I2S channel: %s",
                 esp_err_to_name(err));
        return err;
    }
    enabled_ = true;
    ESP_LOGI(kTag, "Capture started.");
    return ESP_OK;
}

esp_err_t I2sCaptureSource::Stop() {
    if (!enabled_) {
        return ESP_OK;
    }
    enabled_ = false;
    esp_err_t err = i2s_channel_disable(rx_handle_);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to disable I2S channel: %s",
                 esp_err_to_name(err));
        return err;
    }
    ESP_LOGI(kTag, "Capture stopped.");
    return ESP_OK;
}

esp_err_t I2sCaptureSource::Read(std::span<uint8_t> dest,
                                 size_t& bytes_read) {
    bytes_read = 0;
    const size_t wanted_samples = dest.size() / sizeof(int16_t);

    while (bytes_read / sizeof(int16_t) < wanted_samples) {
        if (!enabled_) {
            return ESP_ERR_INVALID_STATE;
        }
        const size_t block = std::min(
            kBlockSamples, wanted_samples - bytes_read / sizeof(int16_t));

        size_t raw_bytes = 0;
        esp_err_t err = i2s_channel_read(rx_handle_, raw_block_.data(),
                                         block * sizeof(int32_t), &raw_bytes,
                                         pdMS_TO_TICKS(kReadTimeoutMs));
        if (err == ESP_ERR_TIMEOUT) {
            // Hand back what we have; the caller loops.
            return ESP_OK;
        }
        if (err != ESP_OK) {
            ESP_LOGE(kTag, "I2S read failed: %s", esp_err_to_name(err));
            return err;
        }

        const size_t samples = raw_bytes / sizeof(int32_t);
        for (size_t i = 0; i < samples; ++i) {
            const int32_t value = raw_block_[i] >> kAdcToPcmBitShift;
            const int16_t pcm = static_cast<int16_t>(
                std::clamp(value, static_cast<int32_t>(INT16_MIN),
                           static_cast<int32_t>(INT16_MAX)));
            std::memcpy(dest.data() + bytes_read, &pcm, sizeof(pcm));
            bytes_read += sizeof(pcm);
        }
    }
    return ESP_OK;
}

size_t I2sCaptureSource::MinFrameBytes() const {
    return kBlockSamples * sizeof(int16_t);
}

}  // namespace audio
