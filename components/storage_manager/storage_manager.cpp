#include "storage_manager.hpp"

#include <cassert>
#include <cstdio>
#include <string>

#include "esp_log.h"
#include "esp_spiffs.h"

namespace {
static const char* kTag = "SettingsStore";

// The partition label used for SPIFFS. This MUST match partitions.csv.
static const char* kSpiffsPartitionLabel = "storage";

static const char* kSettingsFilePath = "/spiffs/voicelink.cfg";

constexpr size_t kReadChunk = 128;
}  // namespace

namespace storage {

// Definition and initialization of the static singleton instance.
std::unique_ptr<SettingsStore> SettingsStore::s_instance_ = nullptr;

esp_err_t SettingsStore::CreateInstance() {
    if (s_instance_ != nullptr) {
        ESP_LOGW(kTag, "SettingsStore instance already created.");
        return ESP_OK;
    }
    s_instance_ = std::unique_ptr<SettingsStore>(new SettingsStore());
    esp_err_t err = s_instance_->Initialize();
    if (err != ESP_OK) {
        s_instance_.reset();
    }
    return err;
}

SettingsStore& SettingsStore::GetInstance() {
    assert(s_instance_ != nullptr);
    return *s_instance_;
}

SettingsStore::~SettingsStore() {
    ESP_LOGI(kTag, "Unregistering SPIFFS filesystem.");
    esp_vfs_spiffs_unregister(kSpiffsPartitionLabel);
}

esp_err_t SettingsStore::Initialize() {
    ESP_LOGI(kTag, "Initializing and mounting SPIFFS filesystem...");

    esp_vfs_spiffs_conf_t conf = {.base_path = "/spiffs",
                                  .partition_label = kSpiffsPartitionLabel,
                                  .max_files = 3,
                                  // Format the partition if mounting fails.
                                  .format_if_mount_failed = true};

    esp_err_t ret = esp_vfs_spiffs_register(&conf);
    if (ret != ESP_OK) {
        if (ret == ESP_FAIL) {
            ESP_LOGE(kTag, "Failed to mount or format filesystem.");
        } else if (ret == ESP_ERR_NOT_FOUND) {
            ESP_LOGE(
                kTag,
                "Failed to find SPIFFS partition '%s'. Check partitions.csv.",
                kSpiffsPartitionLabel);
        } else {
            ESP_LOGE(kTag, "Failed to initialize SPIFFS (%s)",
                     esp_err_to_name(ret));
        }
        return ret;
    }

    ret = Load();
    if (ret == ESP_ERR_NOT_FOUND) {
        ESP_LOGI(kTag, "No settings file yet; writing defaults.");
        std::lock_guard<std::mutex> lock(mutex_);
        return SaveLocked();
    }
    return ret;
}

esp_err_t SettingsStore::Load() {
    FILE* file = fopen(kSettingsFilePath, "r");
    if (file == nullptr) {
        return ESP_ERR_NOT_FOUND;
    }

    std::string text;
    char chunk[kReadChunk];
    size_t n = 0;
    while ((n = fread(chunk, 1, sizeof(chunk), file)) > 0) {
        text.append(chunk, n);
    }
    const bool read_error = ferror(file) != 0;
    fclose(file);
    if (read_error) {
        ESP_LOGE(kTag, "Failed to read '%s'.", kSettingsFilePath);
        return ESP_FAIL;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Settings loaded;
    const size_t rejected = ParseSettings(text, loaded);
    if (rejected > 0) {
        ESP_LOGW(kTag, "%u setting(s) ignored; defaults kept for those.",
                 static_cast<unsigned>(rejected));
    }
    settings_ = loaded;
    ESP_LOGI(kTag, "Settings loaded; device name '%s'.",
             settings_.device_name.c_str());
    return ESP_OK;
}

Settings SettingsStore::Get() {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

esp_err_t SettingsStore::Update(const Settings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
    return SaveLocked();
}

esp_err_t SettingsStore::SaveLocked() {
    FILE* file = fopen(kSettingsFilePath, "w");
    if (file == nullptr) {
        ESP_LOGE(kTag, "Failed to open '%s' for writing.", kSettingsFilePath);
        return ESP_FAIL;
    }

    const std::string text = SerializeSettings(settings_);
    const size_t written = fwrite(text.data(), 1, text.size(), file);
    // Close before checking so the data reaches flash either way.
    const int close_result = fclose(file);
    if (written != text.size() || close_result != 0) {
        ESP_LOGE(kTag, "Failed to write '%s'.", kSettingsFilePath);
        return ESP_FAIL;
    }
    return ESP_OK;
}

}  // namespace storage
