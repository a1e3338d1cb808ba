#ifndef VOICELINK_AUDIO_DEVICE_HPP_
#define VOICELINK_AUDIO_DEVICE_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "esp_err.h"

namespace voicelink {

/**
 * @struct AudioFormat
 * @brief The PCM format both peers agree on out of band.
 */
struct AudioFormat {
    uint32_t sample_rate_hz = 16000;
    uint8_t channels = 1;
    uint8_t bits_per_sample = 16;

    size_t BytesPerSampleFrame() const {
        return static_cast<size_t>(channels) * (bits_per_sample / 8);
    }
};

/**
 * @brief The fixed voice format used on every connection.
 */
constexpr AudioFormat kVoiceFormat{};

/**
 * @class CaptureSource
 * @brief A microphone-like device delivering raw PCM bytes.
 */
class CaptureSource {
   public:
    virtual ~CaptureSource() = default;

    virtual esp_err_t Start() = 0;

    /**
     * @brief Stops capturing. A Read() blocked in another task returns
     * promptly, with an error or with zero bytes.
     */
    virtual esp_err_t Stop() = 0;

    /**
     * @brief Blocks for up to one buffer of samples.
     * @param[out] bytes_read May be zero when nothing was captured in time.
     */
    virtual esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) = 0;

    /**
     * @brief The smallest read size the device supports for its format.
     */
    virtual size_t MinFrameBytes() const = 0;
};

/**
 * @class PlaybackSink
 * @brief A speaker-like device consuming raw PCM bytes.
 */
class PlaybackSink {
   public:
    virtual ~PlaybackSink() = default;

    virtual esp_err_t Start() = 0;
    virtual esp_err_t Stop() = 0;

    /**
     * @brief Blocks until `src` has been queued for playback.
     */
    virtual esp_err_t Write(std::span<const uint8_t> src) = 0;
};

/**
 * @class CaptureConditioner
 * @brief Echo cancellation / noise suppression applied to captured frames.
 */
class CaptureConditioner {
   public:
    virtual ~CaptureConditioner() = default;

    /**
     * @brief Conditions `frame` in place. Bytes beyond the last whole chunk
     * are left untouched.
     */
    virtual void Process(std::span<uint8_t> frame) = 0;

    /**
     * @brief Feeds audio that was just sent to the speaker, used as the echo
     * reference. May be called from a different task than Process().
     */
    virtual void ObservePlayback(std::span<const uint8_t> played) = 0;

    /**
     * @brief The number of bytes the conditioner consumes per step.
     */
    virtual size_t ChunkBytes() const = 0;
};

/**
 * @struct AudioSession
 * @brief The audio devices bound to one streaming session.
 *
 * The conditioner belongs to the capture source's lifetime; it may be null
 * when the platform offers none.
 */
struct AudioSession {
    std::unique_ptr<CaptureSource> capture;
    std::unique_ptr<PlaybackSink> playback;
    std::unique_ptr<CaptureConditioner> conditioner;
};

/**
 * @class AudioDeviceFactory
 * @brief Acquires the capture/playback pair for a session.
 */
class AudioDeviceFactory {
   public:
    virtual ~AudioDeviceFactory() = default;

    /**
     * @param[out] session Filled with started playback and a stopped capture
     * source on ESP_OK; left empty on failure.
     */
    virtual esp_err_t OpenSession(const AudioFormat& format,
                                  AudioSession& session) = 0;
};

}  // namespace voicelink

#endif  // VOICELINK_AUDIO_DEVICE_HPP_
