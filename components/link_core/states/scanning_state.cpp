#include "states/scanning_state.hpp"

#include "connection_manager.hpp"
#include "esp_log.h"
#include "link_event.hpp"

namespace {
static const char* kTag = "ScanningState";
}  // namespace

namespace voicelink {

ScanningState::ScanningState(ConnectionManager& context)
    : StateBase(context) {}

void ScanningState::OnExit() { context_.EndScanning(); }

esp_err_t ScanningState::RequestConnect(const PeerId& peer) {
    // The scan is stopped by leaving this state.
    return context_.BeginConnecting(peer);
}

esp_err_t ScanningState::StopDiscovery() {
    context_.SetState(Phase::kIdle);
    return ESP_OK;
}

void ScanningState::HandleEvent(LinkEvent& event) {
    if (event.type != EventType::kScanFinished ||
        !context_.IsCurrentAttempt(event.attempt)) {
        return;
    }

    if (event.code != 0) {
        ESP_LOGE(kTag, "Scan aborted by the radio; rc=%d", event.code);
        context_.Fail(Failure{LinkError::kDiscoveryFailed, event.code});
        return;
    }
    ESP_LOGI(kTag, "Scan window elapsed.");
    context_.SetState(Phase::kIdle);
}

Phase ScanningState::GetPhase() const { return Phase::kScanning; }

}  // namespace voicelink
