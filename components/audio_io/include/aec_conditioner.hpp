#ifndef AUDIO_AEC_CONDITIONER_HPP_
#define AUDIO_AEC_CONDITIONER_HPP_

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <span>

#include "audio_device.hpp"
#include "esp_aec.h"

namespace audio {

/**
 * @class AecConditioner
 * @brief Acoustic echo cancellation from esp-sr, using the speaker output as
 * the reference signal.
 *
 * Played audio is queued by ObservePlayback() on the inbound pump and
 * consumed chunk by chunk in Process() on the outbound pump. When the
 * reference runs dry the missing samples are treated as silence.
 */
class AecConditioner : public voicelink::CaptureConditioner {
   public:
    /**
     * @return The conditioner, or nullptr if esp-sr refused the format.
     */
    static std::unique_ptr<AecConditioner> Create(
        const voicelink::AudioFormat& format);

    ~AecConditioner() override;

    AecConditioner(const AecConditioner&) = delete;
    AecConditioner& operator=(const AecConditioner&) = delete;

    void Process(std::span<uint8_t> frame) override;
    void ObservePlayback(std::span<const uint8_t> played) override;
    size_t ChunkBytes() const override;

   private:
    AecConditioner(aec_handle_t* handle, size_t chunk_samples,
                   int16_t* mic, int16_t* ref, int16_t* out);

    aec_handle_t* handle_;
    const size_t chunk_samples_;

    // 16-byte aligned scratch buffers of one chunk each.
    int16_t* mic_;
    int16_t* ref_;
    int16_t* out_;

    std::mutex reference_mutex_;
    std::deque<int16_t> reference_;
};

}  // namespace audio

#endif  // AUDIO_AEC_CONDITIONER_HPP_
