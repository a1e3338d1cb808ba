#ifndef VOICELINK_STATES_SCANNING_STATE_HPP_
#define VOICELINK_STATES_SCANNING_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class ScanningState
 * @brief A discovery pass is collecting candidates.
 */
class ScanningState : public StateBase {
   public:
    explicit ScanningState(ConnectionManager& context);

    void OnExit() override;
    esp_err_t RequestConnect(const PeerId& peer) override;
    esp_err_t StopDiscovery() override;
    void HandleEvent(LinkEvent& event) override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_SCANNING_STATE_HPP_
