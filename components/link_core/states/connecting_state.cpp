#include "states/connecting_state.hpp"

#include <utility>

#include "connection_manager.hpp"
#include "esp_log.h"
#include "link_event.hpp"

namespace {
static const char* kTag = "ConnectingState";
}  // namespace

namespace voicelink {

ConnectingState::ConnectingState(ConnectionManager& context)
    : StateBase(context) {}

void ConnectingState::OnExit() { context_.CancelConnecting(); }

esp_err_t ConnectingState::Disconnect() {
    context_.SetState(Phase::kClosing);
    return ESP_OK;
}

void ConnectingState::HandleEvent(LinkEvent& event) {
    if (event.type != EventType::kConnectResult ||
        !context_.IsCurrentAttempt(event.attempt)) {
        return;
    }
    context_.connect_in_flight_ = false;

    if (event.error != ESP_OK || !event.stream) {
        ESP_LOGE(kTag, "Connect attempt failed: %s",
                 esp_err_to_name(event.error));
        context_.Fail(Failure{LinkError::kConnectionRefused, event.error});
        return;
    }

    context_.AdoptConnection(std::move(event.stream));
    context_.SetState(Phase::kConnected);
}

Phase ConnectingState::GetPhase() const { return Phase::kConnecting; }

}  // namespace voicelink
