#ifndef AUDIO_I2S_PLAYBACK_SINK_HPP_
#define AUDIO_I2S_PLAYBACK_SINK_HPP_

#include <memory>
#include <span>

#include "audio_device.hpp"
#include "driver/i2s_std.h"

namespace audio {

/**
 * @class I2sPlaybackSink
 * @brief A class-D I2S amplifier fed 16-bit mono PCM.
 */
class I2sPlaybackSink : public voicelink::PlaybackSink {
   public:
    /**
     * @return The sink on success, or nullptr on failure.
     */
    static std::unique_ptr<I2sPlaybackSink> Create(
        const voicelink::AudioFormat& format);

    ~I2sPlaybackSink() override;

    I2sPlaybackSink(const I2sPlaybackSink&) = delete;
    I2sPlaybackSink& operator=(const I2sPlaybackSink&) = delete;

    esp_err_t Start() override;
    esp_err_t Stop() override;
    esp_err_t Write(std::span<const uint8_t> src) override;

   private:
    explicit I2sPlaybackSink(i2s_chan_handle_t handle);

    i2s_chan_handle_t tx_handle_;
    bool enabled_;
};

}  // namespace audio

#endif  // AUDIO_I2S_PLAYBACK_SINK_HPP_
