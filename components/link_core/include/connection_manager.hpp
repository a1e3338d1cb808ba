#ifndef VOICELINK_CONNECTION_MANAGER_HPP_
#define VOICELINK_CONNECTION_MANAGER_HPP_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "audio_device.hpp"
#include "connection_state.hpp"
#include "discovery.hpp"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/queue.h"
#include "freertos/task.h"
#include "link_error.hpp"
#include "peer.hpp"
#include "radio_gate.hpp"
#include "states/closing_state.hpp"
#include "states/connected_state.hpp"
#include "states/connecting_state.hpp"
#include "states/idle_state.hpp"
#include "states/listening_state.hpp"
#include "states/scanning_state.hpp"
#include "states/state_base.hpp"
#include "streaming_pipeline.hpp"
#include "transport.hpp"

namespace voicelink {

struct LinkEvent;

/**
 * @class ConnectionManager
 * @brief Owns the connection lifecycle: discovery roles, the single
 * connection, and its streaming pipeline.
 *
 * Commands and background events go through one transition lock, so the
 * state seen by observers changes in exactly one place at a time. Platform
 * callbacks never mutate state directly; they post a LinkEvent that the
 * manager's event task processes under that lock.
 */
class ConnectionManager {
   public:
    /**
     * @struct Dependencies
     * @brief The platform services the manager drives. All must outlive it.
     */
    struct Dependencies {
        RadioGate& radio;
        const CapabilityGate& capabilities;
        AdvertiseDriver& advertiser;
        ScanDriver& scanner;
        StreamAcceptor& acceptor;
        StreamConnector& connector;
        AudioDeviceFactory& audio;
    };

    struct Settings {
        std::string device_name = "VoiceLink";
        uint32_t connect_timeout_ms = 10000;
        // 0 scans until StopDiscovery().
        uint32_t scan_duration_ms = 0;
        bool transmit_on_connect = false;
    };

    using StatusObserver = std::function<void(const StatusView& view)>;

    ConnectionManager(const Dependencies& deps, const Settings& settings);
    ~ConnectionManager();

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    /**
     * @brief Creates the event queue and the event task.
     * @return ESP_OK, or ESP_ERR_NO_MEM if a FreeRTOS object could not be
     * created.
     */
    esp_err_t Start();

    /**
     * @brief Stops discovery, cancels any attempt, tears the connection
     * down and ends the event task. Commands are rejected afterwards.
     */
    void Shutdown();

    /**
     * @brief Registers an observer. Observers run with the transition lock
     * held and must not call back into the manager.
     */
    void AddObserver(StatusObserver observer);

    // --- Commands ---

    /**
     * @brief Idle -> Listening. Arms the acceptor for one connection and
     * announces this device as connectable.
     * @return ESP_OK (also when deferred on radio enablement),
     * ESP_ERR_INVALID_STATE outside Idle, ESP_ERR_NOT_ALLOWED if the radio
     * capability is not granted, or the driver error.
     */
    esp_err_t RequestHost();

    /**
     * @brief Idle -> Scanning with a fresh candidate list.
     */
    esp_err_t RequestScan();

    /**
     * @brief Idle or Scanning -> Connecting. Never touches an existing
     * connection: rejected while Listening, Connecting or Connected.
     */
    esp_err_t RequestConnect(const PeerId& peer);

    /**
     * @brief Listening or Scanning -> Idle.
     */
    esp_err_t StopDiscovery();

    /**
     * @brief Connecting or Connected -> Closing -> Idle.
     */
    esp_err_t Disconnect();

    /**
     * @brief Mutes or unmutes the microphone while Connected.
     * @return ESP_ERR_NOT_ALLOWED if the microphone capability is denied.
     */
    esp_err_t ToggleTransmit();

    StatusView GetStatus() const;

    /**
     * @brief Replaces the name used by the next announcement.
     */
    void SetDeviceName(const std::string& name);

   private:
    friend class IdleState;
    friend class ListeningState;
    friend class ScanningState;
    friend class ConnectingState;
    friend class ConnectedState;
    friend class ClosingState;

    enum class PendingRole { kNone, kHost, kScan, kConnect };

    // --- Transitions (transition lock held) ---
    bool SetState(Phase new_phase);
    void Fail(const Failure& failure);
    void PublishLocked(std::optional<Phase> phase_override = std::nullopt);
    StatusView BuildViewLocked(Phase phase) const;

    // --- Role helpers used by the states (transition lock held) ---
    esp_err_t CheckRadio(PendingRole role, const PeerId* peer);
    esp_err_t BeginHosting();
    esp_err_t BeginScanning();
    esp_err_t BeginConnecting(const PeerId& peer);
    void EndHosting();
    void EndScanning();
    void CancelConnecting();
    void AdoptConnection(std::unique_ptr<ByteStream> stream);
    void TearDownConnection();
    bool IsCurrentAttempt(uint32_t attempt) const {
        return attempt == attempt_id_;
    }
    bool IsCurrentConnection(uint32_t serial) const {
        return serial == connection_serial_.load();
    }

    // --- Event plumbing ---
    esp_err_t RunCommand(const char* name,
                         const std::function<esp_err_t()>& command);
    bool PostEvent(std::unique_ptr<LinkEvent> event, TickType_t wait);
    bool WaitForWorkerIdle(EventBits_t bit);
    void PostRefresh();
    void HandleEventLocked(LinkEvent& event);
    void HandleRadioResultLocked(const LinkEvent& event);
    void DrainQueue();

    static void EventTask(void* param);
    void RunEventTask();
    static void AcceptTask(void* param);
    void RunAccept(uint32_t attempt);
    static void ConnectTask(void* param);
    void RunConnect(uint32_t attempt, const PeerId& peer,
                    uint32_t timeout_ms);

    StateBase* StateFor(Phase phase);

    // --- Dependencies ---
    Dependencies deps_;
    Announcer announcer_;
    Seeker seeker_;
    StreamingPipeline pipeline_;

    // --- State Objects ---
    IdleState idle_state_;
    ListeningState listening_state_;
    ScanningState scanning_state_;
    ConnectingState connecting_state_;
    ConnectedState connected_state_;
    ClosingState closing_state_;

    // --- Guarded by mutex_ ---
    mutable std::mutex mutex_;
    StateBase* current_state_;
    Settings settings_;
    std::vector<StatusObserver> observers_;
    std::optional<Failure> last_failure_;
    std::optional<Failure> closing_failure_;
    std::optional<PeerId> target_peer_;
    std::unique_ptr<ByteStream> connection_;
    uint32_t attempt_id_ = 0;
    uint32_t connect_attempt_ = 0;
    bool connect_in_flight_ = false;
    PendingRole pending_role_ = PendingRole::kNone;
    PeerId pending_peer_;
    bool radio_request_outstanding_ = false;
    uint32_t radio_request_id_ = 0;
    bool shutting_down_ = false;
    bool started_ = false;

    std::atomic<uint32_t> connection_serial_{0};
    std::atomic<bool> refresh_pending_{false};

    QueueHandle_t event_queue_ = nullptr;
    EventGroupHandle_t task_exits_ = nullptr;
};

}  // namespace voicelink

#endif  // VOICELINK_CONNECTION_MANAGER_HPP_
