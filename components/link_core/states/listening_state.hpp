#ifndef VOICELINK_STATES_LISTENING_STATE_HPP_
#define VOICELINK_STATES_LISTENING_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class ListeningState
 * @brief Hosting: the acceptor is armed and the device announces itself.
 */
class ListeningState : public StateBase {
   public:
    explicit ListeningState(ConnectionManager& context);

    void OnExit() override;
    esp_err_t StopDiscovery() override;
    void HandleEvent(LinkEvent& event) override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_LISTENING_STATE_HPP_
