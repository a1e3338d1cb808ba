#ifndef STORAGE_STORAGE_MANAGER_HPP_
#define STORAGE_STORAGE_MANAGER_HPP_

#include <memory>
#include <mutex>

#include "esp_err.h"
#include "settings.hpp"

namespace storage {

/**
 * @class SettingsStore
 * @brief Keeps the user settings in a file on the SPIFFS partition.
 */
class SettingsStore {
   public:
    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;
    ~SettingsStore();

    /**
     * @brief Creates the unique SettingsStore instance.
     * This mounts SPIFFS and loads the settings file, if one exists.
     * @return esp_err_t ESP_OK on success.
     */
    static esp_err_t CreateInstance();

    /**
     * @brief Gets the singleton instance of the SettingsStore.
     * @return A reference to the unique SettingsStore instance.
     */
    static SettingsStore& GetInstance();

    /**
     * @return A copy of the current settings.
     */
    Settings Get();

    /**
     * @brief Replaces the settings and writes them to flash.
     * @return ESP_OK once the file has been written. The in-memory copy is
     * updated even if the write fails.
     */
    esp_err_t Update(const Settings& settings);

   private:
    SettingsStore() = default;
    esp_err_t Initialize();
    esp_err_t Load();
    esp_err_t SaveLocked();

    std::mutex mutex_;
    Settings settings_;
    static std::unique_ptr<SettingsStore> s_instance_;
};

}  // namespace storage

#endif  // STORAGE_STORAGE_MANAGER_HPP_
