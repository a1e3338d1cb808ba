#include "settings.hpp"

#include <charconv>

#include "esp_log.h"

namespace {
static const char* kTag = "Settings";

// Longest name that still fits a scan response.
constexpr size_t kMaxDeviceNameLength = 29;

std::string_view Trim(std::string_view text) {
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r");
    return text.substr(first, last - first + 1);
}

bool ParseBool(std::string_view value, bool& out) {
    if (value == "true" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

bool ParseUint(std::string_view value, uint32_t& out) {
    uint32_t parsed = 0;
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    if (ec != std::errc() || ptr != end) {
        return false;
    }
    out = parsed;
    return true;
}

bool ApplyValue(std::string_view key, std::string_view value,
                storage::Settings& settings) {
    if (key == "device_name") {
        if (value.empty() || value.size() > kMaxDeviceNameLength) {
            return false;
        }
        settings.device_name.assign(value);
        return true;
    }
    if (key == "radio_allowed") {
        return ParseBool(value, settings.radio_allowed);
    }
    if (key == "microphone_allowed") {
        return ParseBool(value, settings.microphone_allowed);
    }
    if (key == "transmit_on_connect") {
        return ParseBool(value, settings.transmit_on_connect);
    }
    if (key == "echo_cancellation") {
        return ParseBool(value, settings.echo_cancellation);
    }
    if (key == "connect_timeout_ms") {
        uint32_t timeout = 0;
        if (!ParseUint(value, timeout) || timeout == 0) {
            return false;
        }
        settings.connect_timeout_ms = timeout;
        return true;
    }
    if (key == "scan_duration_ms") {
        return ParseUint(value, settings.scan_duration_ms);
    }
    return false;
}
}  // namespace

namespace storage {

size_t ParseSettings(std::string_view text, Settings& settings) {
    size_t rejected = 0;
    size_t line_number = 0;

    while (!text.empty()) {
        const auto newline = text.find('\n');
        std::string_view line = Trim(text.substr(0, newline));
        text = newline == std::string_view::npos ? std::string_view()
                                                 : text.substr(newline + 1);
        ++line_number;

        if (line.empty() || line.front() == '#') {
            continue;
        }

        const auto equals = line.find('=');
        if (equals == std::string_view::npos) {
            ESP_LOGW(kTag, "Line %u: missing '='.",
                     static_cast<unsigned>(line_number));
            ++rejected;
            continue;
        }

        const std::string_view key = Trim(line.substr(0, equals));
        const std::string_view value = Trim(line.substr(equals + 1));
        if (!ApplyValue(key, value, settings)) {
            ESP_LOGW(kTag, "Line %u: ignoring '%.*s'.",
                     static_cast<unsigned>(line_number),
                     static_cast<int>(line.size()), line.data());
            ++rejected;
        }
    }
    return rejected;
}

std::string SerializeSettings(const Settings& settings) {
    auto flag = [](bool value) { return value ? "true" : "false"; };

    std::string out;
    out += "device_name=" + settings.device_name + "\n";
    out += std::string("radio_allowed=") + flag(settings.radio_allowed) + "\n";
    out += std::string("microphone_allowed=") +
           flag(settings.microphone_allowed) + "\n";
    out += std::string("transmit_on_connect=") +
           flag(settings.transmit_on_connect) + "\n";
    out += std::string("echo_cancellation=") +
           flag(settings.echo_cancellation) + "\n";
    out += "connect_timeout_ms=" +
           std::to_string(settings.connect_timeout_ms) + "\n";
    out += "scan_duration_ms=" + std::to_string(settings.scan_duration_ms) +
           "\n";
    return out;
}

}  // namespace storage
