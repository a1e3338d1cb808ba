#include "states/closing_state.hpp"

#include "connection_manager.hpp"

namespace voicelink {

ClosingState::ClosingState(ConnectionManager& context) : StateBase(context) {}

void ClosingState::OnEnter() {
    context_.TearDownConnection();

    if (context_.closing_failure_) {
        Failure failure = *context_.closing_failure_;
        context_.closing_failure_.reset();
        context_.Fail(failure);
        return;
    }
    context_.SetState(Phase::kIdle);
}

Phase ClosingState::GetPhase() const { return Phase::kClosing; }

}  // namespace voicelink
