#include "fakes.hpp"

#include <algorithm>

#include "freertos/task.h"
#include "peer.hpp"

namespace voicelink_test {
namespace {
constexpr size_t kPipeCapacity = 4096;
constexpr uint32_t kPipePollMs = 10;
constexpr uint32_t kPollMs = 10;

TickType_t Ticks(uint32_t ms) {
    return std::max<TickType_t>(1, pdMS_TO_TICKS(ms));
}

class FakeCapture : public voicelink::CaptureSource {
   public:
    explicit FakeCapture(std::shared_ptr<AudioStats> stats)
        : stats_(std::move(stats)) {}

    esp_err_t Start() override {
        running_ = true;
        stats_->capture_starts++;
        return ESP_OK;
    }

    esp_err_t Stop() override {
        running_ = false;
        stats_->capture_stops++;
        return ESP_OK;
    }

    esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) override {
        bytes_read = 0;
        vTaskDelay(Ticks(5));
        if (!running_.load()) {
            return ESP_ERR_INVALID_STATE;
        }
        if (stats_->capture_fails.load()) {
            return ESP_FAIL;
        }
        std::fill(dest.begin(), dest.end(), 0x11);
        bytes_read = dest.size();
        return ESP_OK;
    }

    size_t MinFrameBytes() const override {
        return FakeAudioFactory::kMinFrameBytes;
    }

   private:
    std::shared_ptr<AudioStats> stats_;
    std::atomic<bool> running_{false};
};

class FakePlayback : public voicelink::PlaybackSink {
   public:
    explicit FakePlayback(std::shared_ptr<AudioStats> stats)
        : stats_(std::move(stats)) {}

    esp_err_t Start() override { return ESP_OK; }
    esp_err_t Stop() override { return ESP_OK; }

    esp_err_t Write(std::span<const uint8_t> src) override {
        stats_->playback_bytes += src.size();
        return ESP_OK;
    }

   private:
    std::shared_ptr<AudioStats> stats_;
};

class FakeConditioner : public voicelink::CaptureConditioner {
   public:
    explicit FakeConditioner(std::shared_ptr<AudioStats> stats)
        : stats_(std::move(stats)) {
        stats_->conditioners_alive++;
    }

    ~FakeConditioner() override {
        stats_->conditioners_alive--;
        stats_->conditioners_destroyed++;
    }

    void Process(std::span<uint8_t> frame) override {
        stats_->conditioned_frames++;
    }

    void ObservePlayback(std::span<const uint8_t> played) override {
        stats_->observed_frames++;
    }

    size_t ChunkBytes() const override {
        return FakeAudioFactory::kChunkBytes;
    }

   private:
    std::shared_ptr<AudioStats> stats_;
};
}  // namespace

bool WaitUntil(const std::function<bool()>& condition, uint32_t timeout_ms) {
    const TickType_t deadline = xTaskGetTickCount() + pdMS_TO_TICKS(timeout_ms);
    while (!condition()) {
        if (xTaskGetTickCount() >= deadline) {
            return condition();
        }
        vTaskDelay(Ticks(kPollMs));
    }
    return true;
}

// --- FakeRadio ---

esp_err_t FakeRadio::RequestRadioEnable(EnableCallback done) {
    requests++;
    if (request_error != ESP_OK) {
        return request_error;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    pending_ = std::move(done);
    return ESP_OK;
}

void FakeRadio::Complete(bool enabled_now) {
    EnableCallback done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        done = std::move(pending_);
        pending_ = nullptr;
    }
    enabled = enabled_now;
    if (done) {
        done(enabled_now);
    }
}

// --- FakeAdvertiser ---

esp_err_t FakeAdvertiser::StartAdvertising(
    const voicelink::Advertisement& advertisement, StoppedCallback on_stopped) {
    if (start_error != ESP_OK) {
        return start_error;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    starts++;
    last_ = advertisement;
    on_stopped_ = std::move(on_stopped);
    return ESP_OK;
}

esp_err_t FakeAdvertiser::StopAdvertising() {
    std::lock_guard<std::mutex> lock(mutex_);
    stops++;
    on_stopped_ = nullptr;
    return ESP_OK;
}

void FakeAdvertiser::EndByRadio() {
    StoppedCallback on_stopped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_stopped = std::move(on_stopped_);
        on_stopped_ = nullptr;
    }
    if (on_stopped) {
        on_stopped();
    }
}

// --- FakeScanner ---

esp_err_t FakeScanner::StartScan(uint32_t duration_ms, ReportCallback on_report,
                                 FinishedCallback on_finished) {
    if (start_error != ESP_OK) {
        return start_error;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    starts++;
    last_duration = duration_ms;
    on_report_ = std::move(on_report);
    on_finished_ = std::move(on_finished);
    return ESP_OK;
}

esp_err_t FakeScanner::StopScan() {
    std::lock_guard<std::mutex> lock(mutex_);
    stops++;
    on_report_ = nullptr;
    on_finished_ = nullptr;
    return ESP_OK;
}

void FakeScanner::Report(const std::string& address, bool with_marker,
                         const std::string& name) {
    ReportCallback on_report;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_report = on_report_;
    }
    if (!on_report) {
        return;
    }
    voicelink::AdvertisementReport report;
    report.address = address;
    if (with_marker) {
        report.markers.push_back(voicelink::VoiceLinkMarker());
    }
    report.name = name;
    on_report(report);
}

void FakeScanner::Finish(int status) {
    FinishedCallback on_finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_finished = std::move(on_finished_);
        on_finished_ = nullptr;
        on_report_ = nullptr;
    }
    if (on_finished) {
        on_finished(status);
    }
}

// --- PipeStream ---

struct PipeShared {
    PipeShared()
        : to_a(xStreamBufferCreate(kPipeCapacity, 1)),
          to_b(xStreamBufferCreate(kPipeCapacity, 1)) {}
    ~PipeShared() {
        vStreamBufferDelete(to_a);
        vStreamBufferDelete(to_b);
    }

    StreamBufferHandle_t to_a;
    StreamBufferHandle_t to_b;
    std::atomic<bool> a_closed{false};
    std::atomic<bool> b_closed{false};
};

PipeStream::PipeStream(std::shared_ptr<PipeShared> shared, bool side_a,
                       voicelink::PeerId remote)
    : shared_(std::move(shared)), side_a_(side_a), remote_(std::move(remote)) {}

esp_err_t PipeStream::Read(std::span<uint8_t> dest, size_t& bytes_read) {
    StreamBufferHandle_t rx = side_a_ ? shared_->to_a : shared_->to_b;
    const std::atomic<bool>& self_closed =
        side_a_ ? shared_->a_closed : shared_->b_closed;
    const std::atomic<bool>& peer_closed =
        side_a_ ? shared_->b_closed : shared_->a_closed;

    bytes_read = 0;
    while (true) {
        if (self_closed.load()) {
            return ESP_ERR_INVALID_STATE;
        }
        size_t n = xStreamBufferReceive(rx, dest.data(), dest.size(),
                                        Ticks(kPipePollMs));
        if (n > 0) {
            bytes_read = n;
            return ESP_OK;
        }
        if (peer_closed.load()) {
            return ESP_OK;
        }
    }
}

esp_err_t PipeStream::Write(std::span<const uint8_t> src) {
    StreamBufferHandle_t tx = side_a_ ? shared_->to_b : shared_->to_a;
    const std::atomic<bool>& self_closed =
        side_a_ ? shared_->a_closed : shared_->b_closed;
    const std::atomic<bool>& peer_closed =
        side_a_ ? shared_->b_closed : shared_->a_closed;

    size_t offset = 0;
    while (offset < src.size()) {
        if (fail_writes.load() || self_closed.load() || peer_closed.load()) {
            return ESP_FAIL;
        }
        offset += xStreamBufferSend(tx, src.data() + offset,
                                    src.size() - offset, Ticks(kPipePollMs));
    }
    return ESP_OK;
}

void PipeStream::Shutdown() {
    shutdowns++;
    (side_a_ ? shared_->a_closed : shared_->b_closed) = true;
}

std::pair<std::unique_ptr<PipeStream>, std::unique_ptr<PipeStream>> MakePipe(
    const voicelink::PeerId& first_sees, const voicelink::PeerId& second_sees) {
    auto shared = std::make_shared<PipeShared>();
    return {std::make_unique<PipeStream>(shared, true, first_sees),
            std::make_unique<PipeStream>(shared, false, second_sees)};
}

// --- FakeAcceptor ---

FakeAcceptor::FakeAcceptor() : signal_(xSemaphoreCreateBinary()) {}

FakeAcceptor::~FakeAcceptor() { vSemaphoreDelete(signal_); }

esp_err_t FakeAcceptor::Listen(const voicelink::ServiceId& service) {
    listens++;
    if (listen_error != ESP_OK) {
        return listen_error;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    // A stale wake-up from the previous Close() must not end the next wait.
    xSemaphoreTake(signal_, 0);
    armed_ = true;
    service_ = service;
    pending_.reset();
    return ESP_OK;
}

esp_err_t FakeAcceptor::Accept(std::unique_ptr<voicelink::ByteStream>& stream) {
    xSemaphoreTake(signal_, portMAX_DELAY);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_) {
        return ESP_ERR_INVALID_STATE;
    }
    stream = std::move(pending_);
    return ESP_OK;
}

void FakeAcceptor::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closes++;
    armed_ = false;
    xSemaphoreGive(signal_);
}

bool FakeAcceptor::Offer(std::unique_ptr<voicelink::ByteStream> stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_) {
        return false;
    }
    armed_ = false;
    pending_ = std::move(stream);
    xSemaphoreGive(signal_);
    return true;
}

bool FakeAcceptor::IsArmed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

voicelink::ServiceId FakeAcceptor::last_service() {
    std::lock_guard<std::mutex> lock(mutex_);
    return service_;
}

// --- FakeConnector ---

FakeConnector::FakeConnector() : signal_(xSemaphoreCreateBinary()) {}

FakeConnector::~FakeConnector() { vSemaphoreDelete(signal_); }

esp_err_t FakeConnector::Connect(uint32_t attempt, const voicelink::PeerId& peer,
                                 const voicelink::ServiceId& service,
                                 uint32_t timeout_ms,
                                 std::unique_ptr<voicelink::ByteStream>& stream) {
    if (enter_delay_ms.load() > 0) {
        vTaskDelay(pdMS_TO_TICKS(enter_delay_ms.load()));
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (attempt <= cancelled_through_) {
            refused++;
            return ESP_ERR_INVALID_STATE;
        }
    }
    connects++;

    if (remote != nullptr) {
        auto [mine, theirs] = MakePipe(peer, local_identity);
        PipeStream* local_end = mine.get();
        if (!remote->Offer(std::move(theirs))) {
            return ESP_FAIL;
        }
        last_stream = local_end;
        stream = std::move(mine);
        return ESP_OK;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        xSemaphoreTake(signal_, 0);
        attempt_ = attempt;
        cancelled_ = false;
        result_.reset();
        stream_.reset();
        in_flight_ = true;
    }

    const bool signalled =
        xSemaphoreTake(signal_, pdMS_TO_TICKS(timeout_ms)) == pdTRUE;

    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_ = false;
    if (!signalled) {
        return ESP_ERR_TIMEOUT;
    }
    if (cancelled_) {
        return ESP_ERR_INVALID_STATE;
    }
    if (result_.value_or(ESP_FAIL) != ESP_OK) {
        return result_.value_or(ESP_FAIL);
    }
    stream = std::move(stream_);
    return ESP_OK;
}

void FakeConnector::Cancel(uint32_t attempt) {
    std::lock_guard<std::mutex> lock(mutex_);
    cancels++;
    cancelled_through_ = std::max(cancelled_through_, attempt);
    if (in_flight_ && attempt_ <= attempt) {
        cancelled_ = true;
        xSemaphoreGive(signal_);
    }
}

void FakeConnector::Resolve(esp_err_t error,
                            std::unique_ptr<voicelink::ByteStream> stream) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_ = error;
    stream_ = std::move(stream);
    xSemaphoreGive(signal_);
}

// --- FakeAudioFactory ---

esp_err_t FakeAudioFactory::OpenSession(const voicelink::AudioFormat& format,
                                        voicelink::AudioSession& session) {
    stats->opens++;
    if (open_error.load() != ESP_OK) {
        return open_error.load();
    }
    session.capture = std::make_unique<FakeCapture>(stats);
    session.playback = std::make_unique<FakePlayback>(stats);
    if (with_conditioner) {
        session.conditioner = std::make_unique<FakeConditioner>(stats);
    }
    return ESP_OK;
}

// --- StatusRecorder ---

void StatusRecorder::Record(const voicelink::StatusView& view) {
    std::lock_guard<std::mutex> lock(mutex_);
    views_.push_back(view);
}

bool StatusRecorder::Saw(voicelink::Phase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(
        views_.begin(), views_.end(),
        [phase](const voicelink::StatusView& view) { return view.phase == phase; });
}

std::vector<voicelink::StatusView> StatusRecorder::views() {
    std::lock_guard<std::mutex> lock(mutex_);
    return views_;
}

void StatusRecorder::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    views_.clear();
}

}  // namespace voicelink_test
