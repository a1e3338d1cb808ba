#ifndef VOICELINK_STATES_IDLE_STATE_HPP_
#define VOICELINK_STATES_IDLE_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class IdleState
 * @brief No role is active. Hosting and scanning start only from here.
 *
 * A role requested while the radio is off is remembered and started when
 * the enable request completes.
 */
class IdleState : public StateBase {
   public:
    explicit IdleState(ConnectionManager& context);

    esp_err_t RequestHost() override;
    esp_err_t RequestScan() override;
    esp_err_t RequestConnect(const PeerId& peer) override;
    esp_err_t StopDiscovery() override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_IDLE_STATE_HPP_
