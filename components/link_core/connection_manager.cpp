#include "connection_manager.hpp"

#include <utility>

#include "esp_log.h"
#include "link_event.hpp"

namespace {
static const char* kTag = "ConnectionManager";

constexpr EventBits_t kAcceptIdleBit = BIT0;
constexpr EventBits_t kConnectIdleBit = BIT1;
constexpr EventBits_t kEventTaskExitedBit = BIT2;

// Bounded: at most one refresh, one radio result, one attempt result and two
// pump faults are ever outstanding.
constexpr UBaseType_t kEventQueueLength = 16;

constexpr uint32_t kEventTaskStackSize = 4096;
constexpr UBaseType_t kEventTaskPriority = 5;
constexpr uint32_t kWorkerStackSize = 4096;
constexpr UBaseType_t kWorkerPriority = 5;

// Pumps must never block forever on a full queue while the manager joins them.
constexpr uint32_t kFaultPostWaitMs = 100;

// Closed or cancelled workers return promptly. One still busy after this
// long makes the new attempt be rejected instead of stalling the lock.
constexpr uint32_t kWorkerIdleWaitMs = 1000;

struct AcceptArgs {
    voicelink::ConnectionManager* manager;
    uint32_t attempt;
};

struct ConnectArgs {
    voicelink::ConnectionManager* manager;
    uint32_t attempt;
    voicelink::PeerId peer;
    uint32_t timeout_ms;
};
}  // namespace

namespace voicelink {

ConnectionManager::ConnectionManager(const Dependencies& deps,
                                     const Settings& settings)
    : deps_(deps),
      announcer_(deps.advertiser),
      seeker_(deps.scanner),
      pipeline_(deps.audio, deps.capabilities),
      idle_state_(*this),
      listening_state_(*this),
      scanning_state_(*this),
      connecting_state_(*this),
      connected_state_(*this),
      closing_state_(*this),
      current_state_(&idle_state_),
      settings_(settings) {
    announcer_.SetOnAnnouncingChanged([this](bool) { PostRefresh(); });
    pipeline_.SetFaultCallback([this](const StreamFault& fault) {
        auto event = std::make_unique<LinkEvent>(EventType::kStreamFault);
        event->attempt = connection_serial_.load();
        event->fault = fault;
        event->error = fault.error;
        PostEvent(std::move(event), pdMS_TO_TICKS(kFaultPostWaitMs));
    });
}

ConnectionManager::~ConnectionManager() {
    Shutdown();
    if (event_queue_ != nullptr) {
        // Callbacks may still have posted after the event task ended.
        DrainQueue();
        vQueueDelete(event_queue_);
        event_queue_ = nullptr;
    }
    if (task_exits_ != nullptr) {
        vEventGroupDelete(task_exits_);
    }
}

esp_err_t ConnectionManager::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        ESP_LOGW(kTag, "Connection manager already started.");
        return ESP_OK;
    }

    task_exits_ = xEventGroupCreate();
    event_queue_ = xQueueCreate(kEventQueueLength, sizeof(LinkEvent*));
    if (task_exits_ == nullptr || event_queue_ == nullptr) {
        ESP_LOGE(kTag, "Failed to create event queue or event group.");
        return ESP_ERR_NO_MEM;
    }
    xEventGroupSetBits(task_exits_, kAcceptIdleBit | kConnectIdleBit);

    if (xTaskCreate(EventTask, "link_events", kEventTaskStackSize, this,
                    kEventTaskPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create event task.");
        return ESP_ERR_NO_MEM;
    }

    started_ = true;
    ESP_LOGI(kTag, "Connection manager started as '%s'.",
             settings_.device_name.c_str());
    PublishLocked();
    return ESP_OK;
}

void ConnectionManager::Shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!started_ || shutting_down_) {
            return;
        }
        ESP_LOGI(kTag, "Shutting down from [%s]...",
                 PhaseName(current_state_->GetPhase()));
        shutting_down_ = true;
        pending_role_ = PendingRole::kNone;

        const Phase phase = current_state_->GetPhase();
        if (phase == Phase::kConnecting || phase == Phase::kConnected) {
            SetState(Phase::kClosing);
        } else {
            SetState(Phase::kIdle);
        }
    }

    // Close() and Cancel() above make the workers return promptly.
    xEventGroupWaitBits(task_exits_, kAcceptIdleBit | kConnectIdleBit,
                        pdFALSE, pdTRUE, portMAX_DELAY);

    if (PostEvent(std::make_unique<LinkEvent>(EventType::kShutdown),
                  portMAX_DELAY)) {
        xEventGroupWaitBits(task_exits_, kEventTaskExitedBit, pdFALSE, pdTRUE,
                            portMAX_DELAY);
    }
    DrainQueue();
    ESP_LOGI(kTag, "Connection manager stopped.");
}

void ConnectionManager::AddObserver(StatusObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.push_back(std::move(observer));
}

// --- Commands ---

esp_err_t ConnectionManager::RequestHost() {
    return RunCommand("RequestHost",
                      [this]() { return current_state_->RequestHost(); });
}

esp_err_t ConnectionManager::RequestScan() {
    return RunCommand("RequestScan",
                      [this]() { return current_state_->RequestScan(); });
}

esp_err_t ConnectionManager::RequestConnect(const PeerId& peer) {
    return RunCommand("RequestConnect", [this, &peer]() {
        return current_state_->RequestConnect(peer);
    });
}

esp_err_t ConnectionManager::StopDiscovery() {
    return RunCommand("StopDiscovery",
                      [this]() { return current_state_->StopDiscovery(); });
}

esp_err_t ConnectionManager::Disconnect() {
    return RunCommand("Disconnect",
                      [this]() { return current_state_->Disconnect(); });
}

esp_err_t ConnectionManager::ToggleTransmit() {
    return RunCommand("ToggleTransmit",
                      [this]() { return current_state_->ToggleTransmit(); });
}

StatusView ConnectionManager::GetStatus() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return BuildViewLocked(current_state_->GetPhase());
}

void ConnectionManager::SetDeviceName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.device_name = name;
    ESP_LOGI(kTag, "Device name set to '%s'.", name.c_str());
}

// --- Transitions ---

bool ConnectionManager::SetState(Phase new_phase) {
    StateBase* new_state = StateFor(new_phase);
    if (current_state_ == new_state) {
        return false;
    }

    ESP_LOGI(kTag, "Transitioning from [%s] to [%s]",
             PhaseName(current_state_->GetPhase()), PhaseName(new_phase));

    StateBase* old_state = current_state_;
    old_state->OnExit();
    current_state_ = new_state;
    PublishLocked();
    new_state->OnEnter();
    return true;
}

void ConnectionManager::Fail(const Failure& failure) {
    ESP_LOGE(kTag, "Failure in [%s]: %s (code %d)",
             PhaseName(current_state_->GetPhase()),
             LinkErrorName(failure.error), failure.code);
    last_failure_ = failure;
    PublishLocked(Phase::kFailed);
    if (!SetState(Phase::kIdle)) {
        PublishLocked();
    }
}

void ConnectionManager::PublishLocked(std::optional<Phase> phase_override) {
    if (observers_.empty()) {
        return;
    }
    const StatusView view =
        BuildViewLocked(phase_override.value_or(current_state_->GetPhase()));
    for (const auto& observer : observers_) {
        observer(view);
    }
}

StatusView ConnectionManager::BuildViewLocked(Phase phase) const {
    StatusView view;
    view.phase = phase;
    view.announcing = announcer_.IsAnnouncing();
    view.discovering = seeker_.IsScanning();
    view.transmitting =
        phase == Phase::kConnected && pipeline_.IsTransmitting();
    if (phase == Phase::kConnecting || phase == Phase::kConnected) {
        view.peer = target_peer_;
    }
    view.last_failure = last_failure_;
    view.status_text = DescribeStatus(phase, view.peer, last_failure_);
    view.candidates = seeker_.Candidates();
    return view;
}

StateBase* ConnectionManager::StateFor(Phase phase) {
    switch (phase) {
        case Phase::kIdle:
            return &idle_state_;
        case Phase::kListening:
            return &listening_state_;
        case Phase::kScanning:
            return &scanning_state_;
        case Phase::kConnecting:
            return &connecting_state_;
        case Phase::kConnected:
            return &connected_state_;
        case Phase::kClosing:
            return &closing_state_;
        case Phase::kFailed:
            break;
    }
    // Failed is only ever published, never entered.
    ESP_LOGE(kTag, "No state object for [%s]; using Idle.", PhaseName(phase));
    return &idle_state_;
}

// --- Role Helpers ---

esp_err_t ConnectionManager::CheckRadio(PendingRole role, const PeerId* peer) {
    if (!deps_.capabilities.IsGranted(Capability::kRadio)) {
        Fail(Failure{LinkError::kPermissionDenied, ESP_ERR_NOT_ALLOWED});
        return ESP_ERR_NOT_ALLOWED;
    }
    if (deps_.radio.IsRadioEnabled()) {
        pending_role_ = PendingRole::kNone;
        return ESP_OK;
    }

    // The latest request wins; one enable request serves them all.
    pending_role_ = role;
    if (peer != nullptr) {
        pending_peer_ = *peer;
    }
    if (radio_request_outstanding_) {
        return ESP_ERR_NOT_FINISHED;
    }

    const uint32_t request = ++radio_request_id_;
    esp_err_t err = deps_.radio.RequestRadioEnable([this, request](bool on) {
        auto event = std::make_unique<LinkEvent>(EventType::kRadioResult);
        event->attempt = request;
        event->enabled = on;
        PostEvent(std::move(event), portMAX_DELAY);
    });
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Radio enable request failed: %s",
                 esp_err_to_name(err));
        pending_role_ = PendingRole::kNone;
        Fail(Failure{LinkError::kRadioDisabled, err});
        return err;
    }

    radio_request_outstanding_ = true;
    ESP_LOGI(kTag, "Radio is off; waiting for it to be enabled.");
    return ESP_ERR_NOT_FINISHED;
}

esp_err_t ConnectionManager::BeginHosting() {
    // A previous accept wait has been closed; let it finish reporting.
    if (!WaitForWorkerIdle(kAcceptIdleBit)) {
        ESP_LOGW(kTag, "Previous accept wait has not finished.");
        return ESP_ERR_INVALID_STATE;
    }
    last_failure_.reset();

    const ServiceId& service = VoiceLinkService();
    esp_err_t err = deps_.acceptor.Listen(service);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to listen on '%s': %s", service.name.c_str(),
                 esp_err_to_name(err));
        Fail(Failure{LinkError::kTransportError, err});
        return err;
    }

    const uint32_t attempt = ++attempt_id_;
    xEventGroupClearBits(task_exits_, kAcceptIdleBit);
    auto args = std::make_unique<AcceptArgs>(AcceptArgs{this, attempt});
    if (xTaskCreate(AcceptTask, "link_accept", kWorkerStackSize, args.get(),
                    kWorkerPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create accept task.");
        xEventGroupSetBits(task_exits_, kAcceptIdleBit);
        deps_.acceptor.Close();
        Fail(Failure{LinkError::kTransportError, ESP_ERR_NO_MEM});
        return ESP_ERR_NO_MEM;
    }
    // The accept task owns its arguments now.
    args.release();

    err = announcer_.Start(VoiceLinkMarker(), settings_.device_name, true);
    if (err != ESP_OK) {
        ++attempt_id_;
        deps_.acceptor.Close();
        Fail(Failure{LinkError::kDiscoveryFailed, err});
        return err;
    }

    SetState(Phase::kListening);
    return ESP_OK;
}

esp_err_t ConnectionManager::BeginScanning() {
    last_failure_.reset();
    const uint32_t attempt = ++attempt_id_;

    Seeker::Callbacks callbacks;
    callbacks.on_candidates_changed = [this]() { PostRefresh(); };
    callbacks.on_finished = [this, attempt](int status) {
        auto event = std::make_unique<LinkEvent>(EventType::kScanFinished);
        event->attempt = attempt;
        event->code = status;
        PostEvent(std::move(event), portMAX_DELAY);
    };

    esp_err_t err = seeker_.Start(VoiceLinkMarker(),
                                  settings_.scan_duration_ms, callbacks);
    if (err != ESP_OK) {
        Fail(Failure{LinkError::kDiscoveryFailed, err});
        return err;
    }

    SetState(Phase::kScanning);
    return ESP_OK;
}

esp_err_t ConnectionManager::BeginConnecting(const PeerId& peer) {
    // The previous attempt was cancelled when it ended; let it report.
    if (!WaitForWorkerIdle(kConnectIdleBit)) {
        ESP_LOGW(kTag, "Previous connect attempt has not finished.");
        return ESP_ERR_INVALID_STATE;
    }
    last_failure_.reset();

    // Leaving Scanning stops the scan before the radio starts connecting.
    target_peer_ = peer;
    SetState(Phase::kConnecting);

    const uint32_t attempt = ++attempt_id_;
    connect_attempt_ = attempt;
    connect_in_flight_ = true;
    xEventGroupClearBits(task_exits_, kConnectIdleBit);
    auto args = std::make_unique<ConnectArgs>(
        ConnectArgs{this, attempt, peer, settings_.connect_timeout_ms});
    if (xTaskCreate(ConnectTask, "link_connect", kWorkerStackSize, args.get(),
                    kWorkerPriority, nullptr) != pdPASS) {
        ESP_LOGE(kTag, "Failed to create connect task.");
        connect_in_flight_ = false;
        xEventGroupSetBits(task_exits_, kConnectIdleBit);
        Fail(Failure{LinkError::kConnectionRefused, ESP_ERR_NO_MEM});
        return ESP_ERR_NO_MEM;
    }
    args.release();

    ESP_LOGI(kTag, "Connecting to %s (%s)...", peer.DisplayName().c_str(),
             peer.address.c_str());
    return ESP_OK;
}

void ConnectionManager::EndHosting() {
    ++attempt_id_;
    deps_.acceptor.Close();
    announcer_.Stop();
}

void ConnectionManager::EndScanning() {
    ++attempt_id_;
    seeker_.Stop();
}

void ConnectionManager::CancelConnecting() {
    ++attempt_id_;
    if (connect_in_flight_) {
        connect_in_flight_ = false;
        // Also covers a worker that has not reached Connect() yet.
        deps_.connector.Cancel(connect_attempt_);
    }
}

void ConnectionManager::AdoptConnection(std::unique_ptr<ByteStream> stream) {
    target_peer_ = stream->RemotePeer();
    connection_ = std::move(stream);
    connection_serial_++;
}

void ConnectionManager::TearDownConnection() {
    if (!connection_) {
        target_peer_.reset();
        return;
    }

    ESP_LOGI(kTag, "Tearing down connection to %s...",
             connection_->RemotePeer().DisplayName().c_str());
    // Order matters: the pumps must be gone before the stream is destroyed.
    pipeline_.RequestStop();
    connection_->Shutdown();
    pipeline_.Join();
    connection_serial_++;
    connection_.reset();
    target_peer_.reset();
}

// --- Event Plumbing ---

esp_err_t ConnectionManager::RunCommand(
    const char* name, const std::function<esp_err_t()>& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || shutting_down_) {
        ESP_LOGW(kTag, "%s rejected: manager not running.", name);
        return ESP_ERR_INVALID_STATE;
    }

    ESP_LOGI(kTag, "Command %s in [%s].", name,
             PhaseName(current_state_->GetPhase()));
    esp_err_t err = command();
    if (err == ESP_ERR_INVALID_STATE) {
        ESP_LOGW(kTag, "%s is not valid in [%s].", name,
                 PhaseName(current_state_->GetPhase()));
    }
    return err;
}

bool ConnectionManager::PostEvent(std::unique_ptr<LinkEvent> event,
                                  TickType_t wait) {
    LinkEvent* raw = event.get();
    if (event_queue_ == nullptr ||
        xQueueSend(event_queue_, &raw, wait) != pdTRUE) {
        ESP_LOGW(kTag, "Event queue unavailable; dropping event %d.",
                 static_cast<int>(event->type));
        if (event->stream) {
            event->stream->Shutdown();
        }
        return false;
    }
    // The queue owns the event until the event task takes it back.
    event.release();
    return true;
}

bool ConnectionManager::WaitForWorkerIdle(EventBits_t bit) {
    const EventBits_t bits = xEventGroupWaitBits(
        task_exits_, bit, pdFALSE, pdTRUE, pdMS_TO_TICKS(kWorkerIdleWaitMs));
    return (bits & bit) == bit;
}

void ConnectionManager::PostRefresh() {
    if (refresh_pending_.exchange(true)) {
        return;
    }
    if (!PostEvent(std::make_unique<LinkEvent>(EventType::kRefresh), 0)) {
        refresh_pending_ = false;
    }
}

void ConnectionManager::HandleEventLocked(LinkEvent& event) {
    switch (event.type) {
        case EventType::kRefresh:
            refresh_pending_ = false;
            PublishLocked();
            break;
        case EventType::kRadioResult:
            HandleRadioResultLocked(event);
            break;
        default:
            if (!shutting_down_) {
                current_state_->HandleEvent(event);
            }
            break;
    }

    if (event.stream) {
        ESP_LOGW(kTag, "Releasing stream from a superseded attempt (%s).",
                 event.stream->RemotePeer().DisplayName().c_str());
        event.stream->Shutdown();
        event.stream.reset();
    }
}

void ConnectionManager::HandleRadioResultLocked(const LinkEvent& event) {
    if (event.attempt != radio_request_id_) {
        return;
    }
    radio_request_outstanding_ = false;

    const PendingRole role = pending_role_;
    pending_role_ = PendingRole::kNone;
    if (role == PendingRole::kNone || shutting_down_ ||
        current_state_->GetPhase() != Phase::kIdle) {
        return;
    }

    if (!event.enabled) {
        Fail(Failure{LinkError::kRadioDisabled, 0});
        return;
    }

    ESP_LOGI(kTag, "Radio enabled; starting the queued role.");
    switch (role) {
        case PendingRole::kHost:
            BeginHosting();
            break;
        case PendingRole::kScan:
            BeginScanning();
            break;
        case PendingRole::kConnect:
            BeginConnecting(pending_peer_);
            break;
        case PendingRole::kNone:
            break;
    }
}

void ConnectionManager::DrainQueue() {
    if (event_queue_ == nullptr) {
        return;
    }
    LinkEvent* raw = nullptr;
    while (xQueueReceive(event_queue_, &raw, 0) == pdTRUE) {
        std::unique_ptr<LinkEvent> event(raw);
        if (event->stream) {
            event->stream->Shutdown();
        }
    }
}

void ConnectionManager::EventTask(void* param) {
    static_cast<ConnectionManager*>(param)->RunEventTask();
    vTaskDelete(nullptr);
}

void ConnectionManager::RunEventTask() {
    ESP_LOGI(kTag, "Event task started.");
    while (true) {
        LinkEvent* raw = nullptr;
        if (xQueueReceive(event_queue_, &raw, portMAX_DELAY) != pdTRUE) {
            continue;
        }
        std::unique_ptr<LinkEvent> event(raw);
        if (event->type == EventType::kShutdown) {
            break;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        HandleEventLocked(*event);
    }
    ESP_LOGI(kTag, "Event task stopped.");
    xEventGroupSetBits(task_exits_, kEventTaskExitedBit);
}

void ConnectionManager::AcceptTask(void* param) {
    std::unique_ptr<AcceptArgs> args(static_cast<AcceptArgs*>(param));
    ConnectionManager* manager = args->manager;
    const uint32_t attempt = args->attempt;
    args.reset();
    manager->RunAccept(attempt);
    vTaskDelete(nullptr);
}

void ConnectionManager::RunAccept(uint32_t attempt) {
    std::unique_ptr<ByteStream> stream;
    esp_err_t err = deps_.acceptor.Accept(stream);
    ESP_LOGD(kTag, "Accept attempt %u returned %s.",
             static_cast<unsigned>(attempt), esp_err_to_name(err));

    auto event = std::make_unique<LinkEvent>(EventType::kAcceptResult);
    event->attempt = attempt;
    event->error = err;
    event->stream = std::move(stream);
    PostEvent(std::move(event), portMAX_DELAY);

    // Nothing may touch `this` after the bit is set.
    xEventGroupSetBits(task_exits_, kAcceptIdleBit);
}

void ConnectionManager::ConnectTask(void* param) {
    std::unique_ptr<ConnectArgs> args(static_cast<ConnectArgs*>(param));
    args->manager->RunConnect(args->attempt, args->peer, args->timeout_ms);
    args.reset();
    vTaskDelete(nullptr);
}

void ConnectionManager::RunConnect(uint32_t attempt, const PeerId& peer,
                                   uint32_t timeout_ms) {
    std::unique_ptr<ByteStream> stream;
    esp_err_t err = deps_.connector.Connect(attempt, peer, VoiceLinkService(),
                                            timeout_ms, stream);

    auto event = std::make_unique<LinkEvent>(EventType::kConnectResult);
    event->attempt = attempt;
    event->error = err;
    event->stream = std::move(stream);
    PostEvent(std::move(event), portMAX_DELAY);

    xEventGroupSetBits(task_exits_, kConnectIdleBit);
}

}  // namespace voicelink
