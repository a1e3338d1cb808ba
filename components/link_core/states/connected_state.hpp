#ifndef VOICELINK_STATES_CONNECTED_STATE_HPP_
#define VOICELINK_STATES_CONNECTED_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class ConnectedState
 * @brief The connection is up and the streaming pipeline is bound to it.
 */
class ConnectedState : public StateBase {
   public:
    explicit ConnectedState(ConnectionManager& context);

    void OnEnter() override;
    esp_err_t Disconnect() override;
    esp_err_t ToggleTransmit() override;
    void HandleEvent(LinkEvent& event) override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_CONNECTED_STATE_HPP_
