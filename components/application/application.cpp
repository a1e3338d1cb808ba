#include "application.hpp"

#include <cassert>  // For assert()

#include "ble_advertiser.hpp"
#include "ble_radio.hpp"
#include "ble_scanner.hpp"
#include "console_commands.hpp"
#include "esp_log.h"
#include "i2s_audio_devices.hpp"
#include "l2cap_transport.hpp"
#include "led_manager.hpp"
#include "storage_manager.hpp"

namespace {
// File-local constants.
static const char* kTag = "Application";

constexpr int kStatusLedGpio = 48;
}  // namespace

namespace app {

// Initialize the instance pointer to nullptr.
std::unique_ptr<Application> Application::s_instance_ = nullptr;

// --- Singleton Management ---

esp_err_t Application::CreateInstance() {
    if (s_instance_ != nullptr) {
        ESP_LOGW(kTag, "Application instance already created.");
        return ESP_OK;
    }
    // Use 'new' as the constructor is private.
    s_instance_ = std::unique_ptr<Application>(new Application());

    // Perform fallible initialization.
    esp_err_t err = s_instance_->Initialize();
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to initialize Application.");
        s_instance_.reset();
        return err;
    }

    ESP_LOGI(kTag, "Application instance created successfully.");
    return ESP_OK;
}

Application& Application::GetInstance() {
    assert(s_instance_ != nullptr);
    return *s_instance_;
}

// --- Lifecycle ---

Application::Application() = default;

Application::~Application() {
    if (manager_) {
        manager_->Shutdown();
    }
}

esp_err_t Application::Initialize() {
    ESP_LOGI(kTag, "Initializing components...");

    // --- Status LED ---
    led::LEDManager::Config led_config = {
        .gpio_pin = kStatusLedGpio, .max_leds = 1,
        .resolution_hz = 10 * 1000 * 1000};
    esp_err_t ret = led::LEDManager::CreateInstance(led_config);
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create LedManager instance.");
        return ret;
    }

    // --- Settings ---
    ret = storage::SettingsStore::CreateInstance();
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create SettingsStore instance.");
        return ret;
    }
    const storage::Settings settings =
        storage::SettingsStore::GetInstance().Get();

    // --- Radio and transport ---
    ret = ble::BleRadio::CreateInstance();
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create BleRadio instance.");
        return ret;
    }
    ble::BleRadio& radio = ble::BleRadio::GetInstance();

    advertiser_ = std::make_unique<ble::BleAdvertiser>(radio);
    scanner_ = std::make_unique<ble::BleScanner>(radio);
    transport_ = std::make_unique<ble::L2capTransport>(radio);
    ret = transport_->Initialize();
    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "Failed to initialize L2CAP transport.");
        return ret;
    }

    // --- Audio and capabilities ---
    audio_devices_ =
        std::make_unique<audio::I2sAudioDevices>(settings.echo_cancellation);
    capabilities_ = std::make_unique<SettingsCapabilityGate>(
        settings.radio_allowed, settings.microphone_allowed);

    // --- Connection manager ---
    voicelink::ConnectionManager::Dependencies deps = {
        .radio = radio,
        .capabilities = *capabilities_,
        .advertiser = *advertiser_,
        .scanner = *scanner_,
        .acceptor = *transport_,
        .connector = *transport_,
        .audio = *audio_devices_,
    };
    voicelink::ConnectionManager::Settings manager_settings;
    manager_settings.device_name = settings.device_name;
    manager_settings.connect_timeout_ms = settings.connect_timeout_ms;
    manager_settings.scan_duration_ms = settings.scan_duration_ms;
    manager_settings.transmit_on_connect = settings.transmit_on_connect;
    manager_ = std::make_unique<voicelink::ConnectionManager>(deps, manager_settings);

    manager_->AddObserver(
        [this](const voicelink::StatusView& view) { OnStatusChanged(view); });

    ESP_LOGI(kTag, "Components initialized.");
    return ESP_OK;
}

esp_err_t Application::Start() {
    ESP_LOGI(kTag, "Starting connection manager...");
    esp_err_t err = manager_->Start();
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to start connection manager: %s",
                 esp_err_to_name(err));
        return err;
    }

    err = StartConsole(*this);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to start console: %s", esp_err_to_name(err));
        return err;
    }
    return ESP_OK;
}

esp_err_t Application::Rename(const std::string& name) {
    storage::SettingsStore& store = storage::SettingsStore::GetInstance();
    storage::Settings settings = store.Get();
    settings.device_name = name;

    manager_->SetDeviceName(name);
    return store.Update(settings);
}

// Runs with the manager's transition lock held.
void Application::OnStatusChanged(const voicelink::StatusView& view) {
    if (view.phase != last_logged_phase_) {
        ESP_LOGI(kTag, "Status: %s", view.status_text.c_str());
        last_logged_phase_ = view.phase;
    }

    esp_err_t err = led::LEDManager::GetInstance().ShowStatus(view);
    if (err != ESP_OK) {
        ESP_LOGW(kTag, "Failed to update status LED: %s",
                 esp_err_to_name(err));
    }
}

}  // namespace app
