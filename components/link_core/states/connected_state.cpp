#include "states/connected_state.hpp"

#include "connection_manager.hpp"
#include "esp_log.h"
#include "link_event.hpp"

namespace {
static const char* kTag = "ConnectedState";
}  // namespace

namespace voicelink {

ConnectedState::ConnectedState(ConnectionManager& context)
    : StateBase(context) {}

void ConnectedState::OnEnter() {
    ESP_LOGI(kTag, "Connected to %s.",
             context_.target_peer_ ? context_.target_peer_->DisplayName().c_str()
                                   : "?");

    esp_err_t err = context_.pipeline_.Start(*context_.connection_);
    if (!context_.pipeline_.IsBound()) {
        // Without an inbound reader a dropped peer would go unnoticed.
        ESP_LOGE(kTag, "Stream reader could not start: %s",
                 esp_err_to_name(err));
        context_.closing_failure_ = Failure{LinkError::kTransportError, err};
        context_.SetState(Phase::kClosing);
        return;
    }
    if (err != ESP_OK) {
        // The connection stays up; ToggleTransmit() retries the devices.
        ESP_LOGE(kTag, "Streaming could not start: %s", esp_err_to_name(err));
        context_.last_failure_ =
            Failure{LinkError::kResourceInitFailed, err};
        context_.PublishLocked();
        return;
    }

    if (context_.settings_.transmit_on_connect) {
        ToggleTransmit();
    } else {
        context_.PublishLocked();
    }
}

esp_err_t ConnectedState::Disconnect() {
    context_.SetState(Phase::kClosing);
    return ESP_OK;
}

esp_err_t ConnectedState::ToggleTransmit() {
    const bool enable = !context_.pipeline_.IsTransmitting();
    esp_err_t err = context_.pipeline_.SetTransmitting(enable);

    if (err == ESP_OK) {
        ESP_LOGI(kTag, "Microphone %s.", enable ? "on" : "off");
        context_.last_failure_.reset();
    } else if (err == ESP_ERR_NOT_ALLOWED) {
        context_.last_failure_ = Failure{LinkError::kPermissionDenied, err};
    } else {
        ESP_LOGE(kTag, "Could not unmute: %s", esp_err_to_name(err));
        context_.last_failure_ = Failure{LinkError::kResourceInitFailed, err};
    }
    context_.PublishLocked();
    return err;
}

void ConnectedState::HandleEvent(LinkEvent& event) {
    if (event.type != EventType::kStreamFault ||
        !context_.IsCurrentConnection(event.attempt)) {
        return;
    }

    if (event.fault.direction == PumpDirection::kCapture) {
        ESP_LOGW(kTag, "Microphone failed, muted: %s",
                 esp_err_to_name(event.fault.error));
        context_.last_failure_ =
            Failure{LinkError::kResourceInitFailed, event.fault.error};
        context_.PublishLocked();
        return;
    }

    ESP_LOGW(kTag, "%s pump stopped: %s",
             event.fault.direction == PumpDirection::kOutbound ? "Outbound"
                                                               : "Inbound",
             esp_err_to_name(event.fault.error));
    context_.closing_failure_ =
        Failure{LinkError::kStreamError, event.fault.error};
    context_.SetState(Phase::kClosing);
}

Phase ConnectedState::GetPhase() const { return Phase::kConnected; }

}  // namespace voicelink
