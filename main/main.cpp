#include "esp_event.h"
#include "esp_log.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#include "nvs_flash.h"

#include "application.hpp"

namespace {
// File-local constants.
static const char* kTag = "app_main";
}  // namespace

// The entry point of the application must have C linkage.
extern "C" void app_main(void) {
    // --- 1. Perform low-level system initialization ---
    // NimBLE keeps its bonding and identity data in NVS.
    ESP_LOGI(kTag, "Initializing NVS flash...");
    esp_err_t ret = nvs_flash_init();
    if (ret == ESP_ERR_NVS_NO_FREE_PAGES ||
        ret == ESP_ERR_NVS_NEW_VERSION_FOUND) {
        // NVS partition contains errors, erase and retry.
        ESP_ERROR_CHECK(nvs_flash_erase());
        ret = nvs_flash_init();
    }
    ESP_ERROR_CHECK(ret);

    ESP_LOGI(kTag, "Initializing default event loop...");
    ESP_ERROR_CHECK(esp_event_loop_create_default());

    // --- 2. Create the Application; it brings up every other component ---
    ESP_LOGI(kTag, "Creating Application instance...");
    ret = app::Application::CreateInstance();
    if (ret == ESP_OK) {
        ret = app::Application::GetInstance().Start();
    }

    if (ret != ESP_OK) {
        ESP_LOGE(kTag, "FATAL: Failed to start VoiceLink. Error: %s (%d)",
                 esp_err_to_name(ret), ret);
        ESP_LOGE(kTag, "System will halt.");
        while (true) {
            vTaskDelay(portMAX_DELAY);
        }
    }

    ESP_LOGI(kTag, "VoiceLink ready. Type 'help' on the console.");
}
