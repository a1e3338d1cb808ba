#ifndef VOICELINK_STATES_CLOSING_STATE_HPP_
#define VOICELINK_STATES_CLOSING_STATE_HPP_

#include "states/state_base.hpp"

namespace voicelink {

/**
 * @class ClosingState
 * @brief Transient: tears the connection down, then moves on to Idle.
 */
class ClosingState : public StateBase {
   public:
    explicit ClosingState(ConnectionManager& context);

    void OnEnter() override;
    Phase GetPhase() const override;
};

}  // namespace voicelink

#endif  // VOICELINK_STATES_CLOSING_STATE_HPP_
