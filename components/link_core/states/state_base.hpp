#ifndef VOICELINK_STATES_STATE_BASE_HPP_
#define VOICELINK_STATES_STATE_BASE_HPP_

#include "connection_state.hpp"
#include "esp_err.h"
#include "peer.hpp"

namespace voicelink {

class ConnectionManager;
struct LinkEvent;

/**
 * @class StateBase
 * @brief Common interface of the connection manager's states.
 *
 * Every entry point runs with the manager's transition lock held. A command
 * a state does not override is rejected with ESP_ERR_INVALID_STATE; an event
 * it does not override is ignored.
 */
class StateBase {
   public:
    /**
     * @param context The owning manager, used to reach shared resources and
     * to trigger transitions.
     */
    explicit StateBase(ConnectionManager& context) : context_(context) {}

    virtual ~StateBase() = default;

    StateBase(const StateBase&) = delete;
    StateBase& operator=(const StateBase&) = delete;
    StateBase(StateBase&&) = delete;
    StateBase& operator=(StateBase&&) = delete;

    /**
     * @brief Called once when the manager transitions into this state, after
     * the new phase has been published.
     */
    virtual void OnEnter() {}

    /**
     * @brief Called once when the manager leaves this state. Releases
     * whatever the state started.
     */
    virtual void OnExit() {}

    // --- Commands ---
    virtual esp_err_t RequestHost() { return ESP_ERR_INVALID_STATE; }
    virtual esp_err_t RequestScan() { return ESP_ERR_INVALID_STATE; }
    virtual esp_err_t RequestConnect(const PeerId& /*peer*/) {
        return ESP_ERR_INVALID_STATE;
    }
    virtual esp_err_t StopDiscovery() { return ESP_ERR_INVALID_STATE; }
    virtual esp_err_t Disconnect() { return ESP_ERR_INVALID_STATE; }
    virtual esp_err_t ToggleTransmit() { return ESP_ERR_INVALID_STATE; }

    /**
     * @brief Handles a background event. The state may take ownership of
     * the event's stream.
     */
    virtual void HandleEvent(LinkEvent& /*event*/) {}

    virtual Phase GetPhase() const = 0;

   protected:
    ConnectionManager& context_;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_STATE_BASE_HPP_
