#ifndef VOICELINK_STREAMING_PIPELINE_HPP_
#define VOICELINK_STREAMING_PIPELINE_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>

#include "audio_device.hpp"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "radio_gate.hpp"
#include "transport.hpp"

namespace voicelink {

enum class PumpDirection {
    kOutbound,  // capture -> stream write failed
    kInbound,   // stream read failed or reached end of stream
    kCapture,   // the capture device failed; the connection is unaffected
};

/**
 * @struct StreamFault
 * @brief Reported by a pump that stopped on its own.
 *
 * For kInbound, `error` is ESP_OK when the peer closed the stream.
 */
struct StreamFault {
    PumpDirection direction;
    esp_err_t error;
};

/**
 * @class StreamingPipeline
 * @brief Runs the outbound (capture -> stream) and inbound (stream ->
 * playback) pumps for one connection.
 *
 * The pipeline borrows the stream; it never shuts it down or destroys it.
 * Control methods are called by the connection manager only, which
 * serializes them. Pumps run in their own FreeRTOS tasks and report faults
 * through the fault callback without touching the manager directly.
 */
class StreamingPipeline {
   public:
    using FaultCallback = std::function<void(const StreamFault& fault)>;

    StreamingPipeline(AudioDeviceFactory& devices,
                      const CapabilityGate& capabilities,
                      const AudioFormat& format = kVoiceFormat);
    ~StreamingPipeline();

    StreamingPipeline(const StreamingPipeline&) = delete;
    StreamingPipeline& operator=(const StreamingPipeline&) = delete;

    /**
     * @brief Sets the fault observer. Invoked from pump tasks.
     */
    void SetFaultCallback(FaultCallback callback);

    /**
     * @brief Binds the pipeline to `stream`, starts the inbound pump and
     * opens the audio session.
     *
     * If the audio devices cannot be opened the binding and the inbound
     * pump are kept and the error is returned. Received audio is dropped
     * until SetTransmitting(true) opens the session.
     */
    esp_err_t Start(ByteStream& stream);

    /**
     * @brief Mutes or unmutes. Only the outbound pump and the capture
     * device's running state change.
     * @return ESP_ERR_NOT_ALLOWED if the microphone capability is not
     * granted, ESP_ERR_INVALID_STATE if not bound to a stream, or the device
     * error if the session could not be (re)opened.
     */
    esp_err_t SetTransmitting(bool enabled);

    /**
     * @brief Tells both pumps to stop and unblocks the capture device. The
     * owner must then unblock the stream (Shutdown) and call Join().
     */
    void RequestStop();

    /**
     * @brief Waits for both pumps to exit, releases the audio session and
     * forgets the stream.
     */
    void Join();

    bool IsBound() const;
    bool HasSession() const;
    bool IsTransmitting() const { return outbound_enabled_.load(); }
    size_t frame_bytes() const;

    uint32_t frames_sent() const { return frames_sent_.load(); }
    uint32_t frames_received() const { return frames_received_.load(); }
    uint32_t frames_discarded() const { return frames_discarded_.load(); }

   private:
    static void OutboundPumpTask(void* param);
    static void InboundPumpTask(void* param);
    void RunOutboundPump();
    void RunInboundPump();

    esp_err_t StartInboundLocked();
    esp_err_t EnsureSessionLocked();
    void ReleaseSessionLocked();
    void WaitForPumpExit(EventBits_t bits);
    void ReportFault(const StreamFault& fault);

    AudioDeviceFactory& devices_;
    const CapabilityGate& capabilities_;
    const AudioFormat format_;

    mutable std::mutex mutex_;
    ByteStream* stream_ = nullptr;
    AudioSession session_;
    size_t frame_bytes_ = 0;
    FaultCallback on_fault_;

    // What the inbound pump plays into; follows the session.
    std::mutex playback_mutex_;
    PlaybackSink* playback_ = nullptr;
    CaptureConditioner* reference_ = nullptr;

    std::atomic<bool> inbound_running_{false};
    std::atomic<bool> outbound_enabled_{false};
    std::atomic<uint32_t> frames_sent_{0};
    std::atomic<uint32_t> frames_received_{0};
    std::atomic<uint32_t> frames_discarded_{0};

    EventGroupHandle_t pump_exits_ = nullptr;
};

}  // namespace voicelink

#endif  // VOICELINK_STREAMING_PIPELINE_HPP_
