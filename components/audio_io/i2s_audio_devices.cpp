#include "i2s_audio_devices.hpp"

#include "aec_conditioner.hpp"
#include "esp_log.h"
#include "i2s_capture_source.hpp"
#include "i2s_playback_sink.hpp"

namespace {
static const char* kTag = "I2sAudioDevices";
}  // namespace

namespace audio {

I2sAudioDevices::I2sAudioDevices(bool echo_cancellation)
    : echo_cancellation_(echo_cancellation) {}

esp_err_t I2sAudioDevices::OpenSession(const voicelink::AudioFormat& format,
                                       voicelink::AudioSession& session) {
    if (format.channels != 1 || format.bits_per_sample != 16) {
        ESP_LOGE(kTag, "Unsupported format: %u channel(s), %u bits.",
                 format.channels, format.bits_per_sample);
        return ESP_ERR_NOT_SUPPORTED;
    }

    auto capture = I2sCaptureSource::Create(format);
    if (!capture) {
        return ESP_FAIL;
    }

    auto playback = I2sPlaybackSink::Create(format);
    if (!playback) {
        return ESP_FAIL;
    }
    esp_err_t err = playback->Start();
    if (err != ESP_OK) {
        return err;
    }

    std::unique_ptr<AecConditioner> conditioner;
    if (echo_cancellation_) {
        conditioner = AecConditioner::Create(format);
        if (!conditioner) {
            ESP_LOGW(kTag, "Continuing without echo cancellation.");
        }
    }

    session.capture = std::move(capture);
    session.playback = std::move(playback);
    session.conditioner = std::move(conditioner);
    return ESP_OK;
}

}  // namespace audio
