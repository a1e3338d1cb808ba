#ifndef AUDIO_I2S_CAPTURE_SOURCE_HPP_
#define AUDIO_I2S_CAPTURE_SOURCE_HPP_

#include <array>
#include <atomic>
#include <cstdint>
#include <memory>
#include <span>

#include "audio_device.hpp"
#include "driver/i2s_std.h"
#include "driver/i2s_types.h"

namespace audio {

/**
 * @class I2sCaptureSource
 * @brief The I2S MEMS microphone, delivering 16-bit mono PCM.
 *
 * The microphone produces 32-bit slots; each sample is shifted down and
 * clamped to int16. The channel is created disabled and only clocks while
 * started.
 */
class I2sCaptureSource : public voicelink::CaptureSource {
   public:
    /**
     * @brief Creates and configures the receive channel.
     *
     * @param format Only the sample rate is taken from it; the output is
     * always 16-bit mono.
     * @return The source on success, or nullptr on failure.
     */
    static std::unique_ptr<I2sCaptureSource> Create(
        const voicelink::AudioFormat& format);

    ~I2sCaptureSource() override;

    // An I2sCaptureSource owns a hardware channel and cannot be copied.
    I2sCaptureSource(const I2sCaptureSource&) = delete;
    I2sCaptureSource& operator=(const I2sCaptureSource&) = delete;

    esp_err_t Start() override;
    esp_err_t Stop() override;

    /**
     * @brief Fills `dest` with whole 16-bit samples.
     *
     * Waits at most one DMA period per block, so a Stop() from another task
     * ends the read promptly.
     */
    esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) override;

    size_t MinFrameBytes() const override;

   private:
    static constexpr size_t kBlockSamples = 256;

    explicit I2sCaptureSource(i2s_chan_handle_t handle);

    /**
     * @brief Handle for the configured I2S receive channel.
     */
    i2s_chan_handle_t rx_handle_;
    std::atomic<bool> enabled_;
    std::array<int32_t, kBlockSamples> raw_block_;
};

}  // namespace audio

#endif  // AUDIO_I2S_CAPTURE_SOURCE_HPP_
