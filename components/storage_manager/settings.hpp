#ifndef STORAGE_SETTINGS_HPP_
#define STORAGE_SETTINGS_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace storage {

/**
 * @struct Settings
 * @brief User settings persisted across reboots.
 */
struct Settings {
    std::string device_name = "VoiceLink";
    bool radio_allowed = true;
    bool microphone_allowed = true;
    bool transmit_on_connect = false;
    bool echo_cancellation = true;
    uint32_t connect_timeout_ms = 10000;
    uint32_t scan_duration_ms = 0;  // 0 scans until stopped
};

/**
 * @brief Applies `key=value` lines from `text` on top of `settings`.
 *
 * Blank lines and lines starting with '#' are skipped. Unknown keys and
 * malformed values are logged and leave the existing value in place.
 *
 * @return The number of lines that were rejected.
 */
size_t ParseSettings(std::string_view text, Settings& settings);

/**
 * @brief Renders every field as one `key=value` line.
 */
std::string SerializeSettings(const Settings& settings);

}  // namespace storage

#endif  // STORAGE_SETTINGS_HPP_
