#ifndef AUDIO_I2S_AUDIO_DEVICES_HPP_
#define AUDIO_I2S_AUDIO_DEVICES_HPP_

#include <atomic>

#include "audio_device.hpp"

namespace audio {

/**
 * @class I2sAudioDevices
 * @brief Opens the board's microphone and speaker for a streaming session,
 * with echo cancellation when enabled.
 */
class I2sAudioDevices : public voicelink::AudioDeviceFactory {
   public:
    explicit I2sAudioDevices(bool echo_cancellation);

    esp_err_t OpenSession(const voicelink::AudioFormat& format,
                          voicelink::AudioSession& session) override;

    /**
     * @brief Takes effect from the next session.
     */
    void SetEchoCancellation(bool enabled) { echo_cancellation_ = enabled; }

   private:
    std::atomic<bool> echo_cancellation_;
};

}  // namespace audio

#endif  // AUDIO_I2S_AUDIO_DEVICES_HPP_
