#include "streaming_pipeline.hpp"

#include <utility>

#include "buffer_policy.hpp"
#include "esp_log.h"
#include "freertos/task.h"

namespace {
static const char* kTag = "StreamingPipeline";

constexpr EventBits_t kOutboundExitedBit = BIT0;
constexpr EventBits_t kInboundExitedBit = BIT1;

// 20 ms of 16 kHz mono PCM per inbound read.
constexpr size_t kInboundFrameBytes = 640;

constexpr uint32_t kPumpStackSize = 4096;
constexpr UBaseType_t kPumpPriority = 6;

// Joining logs a warning every period while a pump is still blocked.
constexpr uint32_t kJoinWarnPeriodMs = 1000;
}  // namespace

namespace voicelink {

StreamingPipeline::StreamingPipeline(AudioDeviceFactory& devices,
                                     const CapabilityGate& capabilities,
                                     const AudioFormat& format)
    : devices_(devices), capabilities_(capabilities), format_(format) {
    pump_exits_ = xEventGroupCreate();
    if (pump_exits_ == nullptr) {
        ESP_LOGE(kTag, "Failed to create pump event group.");
        return;
    }
    // No pump is running yet.
    xEventGroupSetBits(pump_exits_, kOutboundExitedBit | kInboundExitedBit);
}

StreamingPipeline::~StreamingPipeline() {
    RequestStop();
    Join();
    if (pump_exits_ != nullptr) {
        vEventGroupDelete(pump_exits_);
    }
}

void StreamingPipeline::SetFaultCallback(FaultCallback callback) {
    // Must be set before Start(); pumps read it without the lock.
    on_fault_ = std::move(callback);
}

esp_err_t StreamingPipeline::Start(ByteStream& stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pump_exits_ == nullptr) {
        return ESP_ERR_NO_MEM;
    }
    if (stream_ != nullptr) {
        ESP_LOGW(kTag, "Pipeline is already bound to a stream.");
        return ESP_ERR_INVALID_STATE;
    }
    stream_ = &stream;
    frames_sent_ = 0;
    frames_received_ = 0;
    frames_discarded_ = 0;

    // The peer closing must be noticed even without audio devices.
    esp_err_t err = StartInboundLocked();
    if (err != ESP_OK) {
        stream_ = nullptr;
        return err;
    }
    return EnsureSessionLocked();
}

esp_err_t StreamingPipeline::SetTransmitting(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_ == nullptr) {
        return ESP_ERR_INVALID_STATE;
    }

    if (!enabled) {
        if (!outbound_enabled_.exchange(false)) {
            return ESP_OK;
        }
        ESP_LOGI(kTag, "Muting microphone.");
        if (session_.capture) {
            esp_err_t err = session_.capture->Stop();
            if (err != ESP_OK) {
                ESP_LOGW(kTag, "Capture stop reported %s",
                         esp_err_to_name(err));
            }
        }
        WaitForPumpExit(kOutboundExitedBit);
        return ESP_OK;
    }

    if (outbound_enabled_.load()) {
        return ESP_OK;
    }
    if (!capabilities_.IsGranted(Capability::kMicrophone)) {
        ESP_LOGW(kTag, "Microphone capability not granted.");
        return ESP_ERR_NOT_ALLOWED;
    }

    esp_err_t err = EnsureSessionLocked();
    if (err != ESP_OK) {
        return err;
    }

    // A pump that stopped on its own may still be on its way out.
    WaitForPumpExit(kOutboundExitedBit);

    err = session_.capture->Start();
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to start capture: %s", esp_err_to_name(err));
        return err;
    }

    xEventGroupClearBits(pump_exits_, kOutboundExitedBit);
    outbound_enabled_ = true;
    if (xTaskCreate(OutboundPumpTask, "pump_out", kPumpStackSize, this,
                    kPumpPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create outbound pump task.");
        outbound_enabled_ = false;
        xEventGroupSetBits(pump_exits_, kOutboundExitedBit);
        session_.capture->Stop();
        return ESP_ERR_NO_MEM;
    }

    ESP_LOGI(kTag, "Microphone live, %u-byte frames.",
             static_cast<unsigned>(frame_bytes_));
    return ESP_OK;
}

void StreamingPipeline::RequestStop() {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_running_ = false;
    const bool was_transmitting = outbound_enabled_.exchange(false);
    if (was_transmitting && session_.capture) {
        session_.capture->Stop();
    }
}

void StreamingPipeline::Join() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pump_exits_ == nullptr) {
        return;
    }
    WaitForPumpExit(kOutboundExitedBit | kInboundExitedBit);
    ReleaseSessionLocked();
    stream_ = nullptr;
}

bool StreamingPipeline::IsBound() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_ != nullptr;
}

bool StreamingPipeline::HasSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.capture != nullptr;
}

size_t StreamingPipeline::frame_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frame_bytes_;
}

// --- Private Methods ---

esp_err_t StreamingPipeline::EnsureSessionLocked() {
    if (session_.capture) {
        return ESP_OK;
    }

    ESP_LOGI(kTag, "Opening audio session (%u Hz, %u ch, %u bit)...",
             static_cast<unsigned>(format_.sample_rate_hz),
             static_cast<unsigned>(format_.channels),
             static_cast<unsigned>(format_.bits_per_sample));
    AudioSession session;
    esp_err_t err = devices_.OpenSession(format_, session);
    if (err != ESP_OK || !session.capture || !session.playback) {
        ESP_LOGE(kTag, "Failed to open audio session: %s",
                 esp_err_to_name(err != ESP_OK ? err : ESP_FAIL));
        return err != ESP_OK ? err : ESP_FAIL;
    }

    const size_t chunk =
        session.conditioner ? session.conditioner->ChunkBytes() : 0;
    const size_t frame_bytes =
        ComputeFrameBytes(format_, session.capture->MinFrameBytes(), chunk);
    if (frame_bytes == 0) {
        ESP_LOGE(kTag, "Audio devices reported an unusable buffer size.");
        return ESP_ERR_INVALID_SIZE;
    }

    session_ = std::move(session);
    frame_bytes_ = frame_bytes;
    {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_ = session_.playback.get();
        reference_ = session_.conditioner.get();
    }
    ESP_LOGI(kTag, "Audio session open; frame size %u bytes%s.",
             static_cast<unsigned>(frame_bytes_),
             session_.conditioner ? ", echo cancellation on" : "");
    return ESP_OK;
}

esp_err_t StreamingPipeline::StartInboundLocked() {
    xEventGroupClearBits(pump_exits_, kInboundExitedBit);
    inbound_running_ = true;
    if (xTaskCreate(InboundPumpTask, "pump_in", kPumpStackSize, this,
                    kPumpPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create inbound pump task.");
        inbound_running_ = false;
        xEventGroupSetBits(pump_exits_, kInboundExitedBit);
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

void StreamingPipeline::ReleaseSessionLocked() {
    {
        std::lock_guard<std::mutex> lock(playback_mutex_);
        playback_ = nullptr;
        reference_ = nullptr;
    }
    if (!session_.capture && !session_.playback) {
        return;
    }
    // The conditioner lives exactly as long as the capture source.
    session_.conditioner.reset();
    session_.capture.reset();
    if (session_.playback) {
        session_.playback->Stop();
        session_.playback.reset();
    }
    frame_bytes_ = 0;
    ESP_LOGI(kTag, "Audio session released.");
}

void StreamingPipeline::WaitForPumpExit(EventBits_t bits) {
    while (true) {
        EventBits_t set =
            xEventGroupWaitBits(pump_exits_, bits, pdFALSE, pdTRUE,
                                pdMS_TO_TICKS(kJoinWarnPeriodMs));
        if ((set & bits) == bits) {
            return;
        }
        ESP_LOGW(kTag, "Still waiting for pump exit (bits 0x%x).",
                 static_cast<unsigned>(bits & ~set));
    }
}

void StreamingPipeline::ReportFault(const StreamFault& fault) {
    if (on_fault_) {
        on_fault_(fault);
    }
}

void StreamingPipeline::OutboundPumpTask(void* param) {
    static_cast<StreamingPipeline*>(param)->RunOutboundPump();
    vTaskDelete(nullptr);
}

void StreamingPipeline::InboundPumpTask(void* param) {
    static_cast<StreamingPipeline*>(param)->RunInboundPump();
    vTaskDelete(nullptr);
}

void StreamingPipeline::RunOutboundPump() {
    ESP_LOGI(kTag, "Outbound pump started.");
    AudioFrame frame(frame_bytes_);

    while (outbound_enabled_.load()) {
        size_t bytes_read = 0;
        esp_err_t err = session_.capture->Read(frame.writable(), bytes_read);
        if (!outbound_enabled_.load()) {
            break;
        }
        if (err != ESP_OK) {
            ESP_LOGE(kTag, "Capture read failed: %s", esp_err_to_name(err));
            if (outbound_enabled_.exchange(false)) {
                ReportFault(StreamFault{PumpDirection::kCapture, err});
            }
            break;
        }
        if (bytes_read == 0) {
            continue;
        }

        frame.set_size(bytes_read);
        if (session_.conditioner) {
            session_.conditioner->Process(frame.data());
        }

        err = stream_->Write(frame.data());
        if (err != ESP_OK) {
            ESP_LOGE(kTag, "Stream write failed: %s", esp_err_to_name(err));
            if (outbound_enabled_.exchange(false)) {
                ReportFault(StreamFault{PumpDirection::kOutbound, err});
            }
            break;
        }
        frames_sent_++;
    }

    ESP_LOGI(kTag, "Outbound pump stopped after %u frames.",
             static_cast<unsigned>(frames_sent_.load()));
    // Nothing may touch `this` after the bit is set.
    xEventGroupSetBits(pump_exits_, kOutboundExitedBit);
}

void StreamingPipeline::RunInboundPump() {
    ESP_LOGI(kTag, "Inbound pump started.");
    AudioFrame frame(ComputeFrameBytes(format_, kInboundFrameBytes, 0));

    while (inbound_running_.load()) {
        size_t bytes_read = 0;
        esp_err_t err = stream_->Read(frame.writable(), bytes_read);
        if (!inbound_running_.load()) {
            break;
        }
        if (err != ESP_OK || bytes_read == 0) {
            if (err != ESP_OK) {
                ESP_LOGE(kTag, "Stream read failed: %s", esp_err_to_name(err));
            } else {
                ESP_LOGW(kTag, "Peer closed the stream.");
            }
            inbound_running_ = false;
            // Sending into a dead connection is pointless.
            if (outbound_enabled_.exchange(false)) {
                session_.capture->Stop();
            }
            ReportFault(StreamFault{PumpDirection::kInbound, err});
            break;
        }

        frame.set_size(bytes_read);
        std::lock_guard<std::mutex> lock(playback_mutex_);
        if (playback_ == nullptr) {
            // No audio session yet; keep draining the stream.
            frames_discarded_++;
            continue;
        }
        err = playback_->Write(frame.data());
        if (err != ESP_OK) {
            ESP_LOGW(kTag, "Playback write failed: %s", esp_err_to_name(err));
            continue;
        }
        if (reference_ != nullptr) {
            reference_->ObservePlayback(frame.data());
        }
        frames_received_++;
    }

    ESP_LOGI(kTag, "Inbound pump stopped after %u frames.",
             static_cast<unsigned>(frames_received_.load()));
    xEventGroupSetBits(pump_exits_, kInboundExitedBit);
}

}  // namespace voicelink
