#ifndef VOICELINK_STATES_CONNECTING_STATE_HPP_
#define VOICELINK_STATES_CONNECTING_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class ConnectingState
 * @brief An outbound connect attempt is in flight.
 */
class ConnectingState : public StateBase {
   public:
    explicit ConnectingState(ConnectionManager& context);

    void OnExit() override;
    esp_err_t Disconnect() override;
    void HandleEvent(LinkEvent& event) override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_CONNECTING_STATE_HPP_
