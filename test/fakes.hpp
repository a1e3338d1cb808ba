#ifndef TEST_FAKES_HPP_
#define TEST_FAKES_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "audio_device.hpp"
#include "connection_state.hpp"
#include "discovery.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/stream_buffer.h"
#include "radio_gate.hpp"
#include "transport.hpp"

namespace voicelink_test {

/**
 * @brief Polls `condition` until it holds or `timeout_ms` elapses.
 */
bool WaitUntil(const std::function<bool()>& condition,
               uint32_t timeout_ms = 2000);

// --- Radio and capabilities ---

class FakeRadio : public voicelink::RadioGate {
   public:
    bool IsRadioEnabled() const override { return enabled.load(); }
    esp_err_t RequestRadioEnable(EnableCallback done) override;

    /**
     * @brief Answers the outstanding enable request.
     */
    void Complete(bool enabled_now);

    std::atomic<bool> enabled{true};
    std::atomic<int> requests{0};
    esp_err_t request_error = ESP_OK;

   private:
    std::mutex mutex_;
    EnableCallback pending_;
};

class FakeCapabilities : public voicelink::CapabilityGate {
   public:
    bool IsGranted(voicelink::Capability capability) const override {
        return capability == voicelink::Capability::kRadio ? radio.load()
                                                      : microphone.load();
    }

    std::atomic<bool> radio{true};
    std::atomic<bool> microphone{true};
};

// --- Discovery drivers ---

class FakeAdvertiser : public voicelink::AdvertiseDriver {
   public:
    esp_err_t StartAdvertising(const voicelink::Advertisement& advertisement,
                               StoppedCallback on_stopped) override;
    esp_err_t StopAdvertising() override;

    /**
     * @brief Simulates the radio ending advertising on its own.
     */
    void EndByRadio();

    voicelink::Advertisement last() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_;
    }

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    esp_err_t start_error = ESP_OK;

   private:
    std::mutex mutex_;
    voicelink::Advertisement last_;
    StoppedCallback on_stopped_;
};

class FakeScanner : public voicelink::ScanDriver {
   public:
    esp_err_t StartScan(uint32_t duration_ms, ReportCallback on_report,
                        FinishedCallback on_finished) override;
    esp_err_t StopScan() override;

    /**
     * @brief Delivers one advertisement report, if a scan is running.
     */
    void Report(const std::string& address, bool with_marker,
                const std::string& name);

    /**
     * @brief Ends the scan as the radio would.
     */
    void Finish(int status);

    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<uint32_t> last_duration{0};
    esp_err_t start_error = ESP_OK;

   private:
    std::mutex mutex_;
    ReportCallback on_report_;
    FinishedCallback on_finished_;
};

// --- Streams ---

struct PipeShared;

/**
 * @class PipeStream
 * @brief One end of an in-memory duplex pipe built on FreeRTOS stream
 * buffers. Shutting one end down makes the other end read end-of-stream.
 */
class PipeStream : public voicelink::ByteStream {
   public:
    PipeStream(std::shared_ptr<PipeShared> shared, bool side_a,
               voicelink::PeerId remote);

    esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) override;
    esp_err_t Write(std::span<const uint8_t> src) override;
    void Shutdown() override;
    voicelink::PeerId RemotePeer() const override { return remote_; }

    std::atomic<bool> fail_writes{false};
    std::atomic<int> shutdowns{0};

   private:
    std::shared_ptr<PipeShared> shared_;
    const bool side_a_;
    const voicelink::PeerId remote_;
};

/**
 * @brief Creates a connected pair. `first` reports `first_sees` as its
 * remote peer, `second` reports `second_sees`.
 */
std::pair<std::unique_ptr<PipeStream>, std::unique_ptr<PipeStream>> MakePipe(
    const voicelink::PeerId& first_sees, const voicelink::PeerId& second_sees);

class FakeAcceptor : public voicelink::StreamAcceptor {
   public:
    FakeAcceptor();
    ~FakeAcceptor() override;

    esp_err_t Listen(const voicelink::ServiceId& service) override;
    esp_err_t Accept(std::unique_ptr<voicelink::ByteStream>& stream) override;
    void Close() override;

    /**
     * @brief Hands an incoming stream to a pending or future Accept().
     * @return false if the acceptor is not armed.
     */
    bool Offer(std::unique_ptr<voicelink::ByteStream> stream);

    bool IsArmed();
    voicelink::ServiceId last_service();

    std::atomic<int> listens{0};
    std::atomic<int> closes{0};
    esp_err_t listen_error = ESP_OK;

   private:
    std::mutex mutex_;
    SemaphoreHandle_t signal_;
    bool armed_ = false;
    voicelink::ServiceId service_;
    std::unique_ptr<voicelink::ByteStream> pending_;
};

class FakeConnector : public voicelink::StreamConnector {
   public:
    FakeConnector();
    ~FakeConnector() override;

    esp_err_t Connect(uint32_t attempt, const voicelink::PeerId& peer,
                      const voicelink::ServiceId& service, uint32_t timeout_ms,
                      std::unique_ptr<voicelink::ByteStream>& stream) override;
    void Cancel(uint32_t attempt) override;

    /**
     * @brief Completes a blocked Connect() made without a remote acceptor.
     */
    void Resolve(esp_err_t error, std::unique_ptr<voicelink::ByteStream> stream);

    bool InFlight() const { return in_flight_.load(); }

    // When set, Connect() pairs with this acceptor at once.
    FakeAcceptor* remote = nullptr;
    // How the remote side sees this device.
    voicelink::PeerId local_identity{"02:00:00:00:00:02", std::nullopt};

    // Delay before Connect() looks at its attempt, as a slow worker start.
    std::atomic<uint32_t> enter_delay_ms{0};

    std::atomic<int> connects{0};
    std::atomic<int> cancels{0};
    // Connect() calls refused because their attempt was already cancelled.
    std::atomic<int> refused{0};
    // The local end of the most recent paired stream; owned by the caller.
    std::atomic<PipeStream*> last_stream{nullptr};

   private:
    std::mutex mutex_;
    SemaphoreHandle_t signal_;
    std::atomic<bool> in_flight_{false};
    uint32_t attempt_ = 0;
    uint32_t cancelled_through_ = 0;
    bool cancelled_ = false;
    std::optional<esp_err_t> result_;
    std::unique_ptr<voicelink::ByteStream> stream_;
};

// --- Audio ---

struct AudioStats {
    std::atomic<int> opens{0};
    std::atomic<int> capture_starts{0};
    std::atomic<int> capture_stops{0};
    std::atomic<bool> capture_fails{false};
    std::atomic<size_t> playback_bytes{0};
    std::atomic<int> conditioners_alive{0};
    std::atomic<int> conditioners_destroyed{0};
    std::atomic<int> conditioned_frames{0};
    std::atomic<int> observed_frames{0};
};

class FakeAudioFactory : public voicelink::AudioDeviceFactory {
   public:
    static constexpr size_t kMinFrameBytes = 320;
    static constexpr size_t kChunkBytes = 64;

    esp_err_t OpenSession(const voicelink::AudioFormat& format,
                          voicelink::AudioSession& session) override;

    std::shared_ptr<AudioStats> stats = std::make_shared<AudioStats>();
    std::atomic<esp_err_t> open_error{ESP_OK};
    bool with_conditioner = true;
};

// --- Observers ---

/**
 * @class StatusRecorder
 * @brief Keeps every StatusView a manager publishes.
 */
class StatusRecorder {
   public:
    void Record(const voicelink::StatusView& view);

    bool Saw(voicelink::Phase phase);
    std::vector<voicelink::StatusView> views();
    void Clear();

   private:
    std::mutex mutex_;
    std::vector<voicelink::StatusView> views_;
};

}  // namespace voicelink_test

#endif  // TEST_FAKES_HPP_
