#include "states/idle_state.hpp"

#include "connection_manager.hpp"
#include "esp_log.h"

namespace {
static const char* kTag = "IdleState";
}  // namespace

namespace voicelink {

IdleState::IdleState(ConnectionManager& context) : StateBase(context) {}

esp_err_t IdleState::RequestHost() {
    esp_err_t err =
        context_.CheckRadio(ConnectionManager::PendingRole::kHost, nullptr);
    if (err == ESP_ERR_NOT_FINISHED) {
        return ESP_OK;  // Deferred until the radio is on.
    }
    if (err != ESP_OK) {
        return err;
    }
    return context_.BeginHosting();
}

esp_err_t IdleState::RequestScan() {
    esp_err_t err =
        context_.CheckRadio(ConnectionManager::PendingRole::kScan, nullptr);
    if (err == ESP_ERR_NOT_FINISHED) {
        return ESP_OK;
    }
    if (err != ESP_OK) {
        return err;
    }
    return context_.BeginScanning();
}

esp_err_t IdleState::RequestConnect(const PeerId& peer) {
    esp_err_t err =
        context_.CheckRadio(ConnectionManager::PendingRole::kConnect, &peer);
    if (err == ESP_ERR_NOT_FINISHED) {
        return ESP_OK;
    }
    if (err != ESP_OK) {
        return err;
    }
    return context_.BeginConnecting(peer);
}

esp_err_t IdleState::StopDiscovery() {
    if (context_.pending_role_ == ConnectionManager::PendingRole::kNone) {
        return ESP_ERR_INVALID_STATE;
    }
    ESP_LOGI(kTag, "Dropping the role queued behind radio enablement.");
    context_.pending_role_ = ConnectionManager::PendingRole::kNone;
    return ESP_OK;
}

Phase IdleState::GetPhase() const { return Phase::kIdle; }

}  // namespace voicelink
