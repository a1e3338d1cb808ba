#include "states/listening_state.hpp"

#include <utility>

#include "connection_manager.hpp"
#include "esp_log.h"
#include "link_event.hpp"

namespace {
static const char* kTag = "ListeningState";
}  // namespace

namespace voicelink {

ListeningState::ListeningState(ConnectionManager& context)
    : StateBase(context) {}

void ListeningState::OnExit() { context_.EndHosting(); }

esp_err_t ListeningState::StopDiscovery() {
    context_.SetState(Phase::kIdle);
    return ESP_OK;
}

void ListeningState::HandleEvent(LinkEvent& event) {
    if (event.type != EventType::kAcceptResult ||
        !context_.IsCurrentAttempt(event.attempt)) {
        return;
    }

    if (event.error != ESP_OK || !event.stream) {
        ESP_LOGE(kTag, "Accept failed: %s", esp_err_to_name(event.error));
        context_.Fail(Failure{LinkError::kTransportError, event.error});
        return;
    }

    ESP_LOGI(kTag, "Accepted connection from %s.",
             event.stream->RemotePeer().DisplayName().c_str());
    context_.AdoptConnection(std::move(event.stream));
    context_.SetState(Phase::kConnected);
}

Phase ListeningState::GetPhase() const { return Phase::kListening; }

}  // namespace voicelink
