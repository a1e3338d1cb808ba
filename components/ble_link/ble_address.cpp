#include "ble_address.hpp"

#include <array>
#include <cstdio>

namespace {
// "AA:BB:CC:DD:EE:FF"
constexpr size_t kAddressTextLength = 17;
constexpr std::string_view kRandomSuffix = "/r";

int HexNibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}
}  // namespace

namespace ble {

std::string FormatAddress(const ble_addr_t& addr) {
    // NimBLE keeps the least significant byte first.
    char text[kAddressTextLength + 1];
    snprintf(text, sizeof(text), "%02X:%02X:%02X:%02X:%02X:%02X", addr.val[5],
             addr.val[4], addr.val[3], addr.val[2], addr.val[1], addr.val[0]);
    std::string result(text);
    if (addr.type != BLE_ADDR_PUBLIC) {
        result += kRandomSuffix;
    }
    return result;
}

bool ParseAddress(std::string_view text, ble_addr_t& addr) {
    uint8_t type = BLE_ADDR_PUBLIC;
    if (text.size() == kAddressTextLength + kRandomSuffix.size() &&
        text.substr(kAddressTextLength) == kRandomSuffix) {
        type = BLE_ADDR_RANDOM;
        text = text.substr(0, kAddressTextLength);
    }
    if (text.size() != kAddressTextLength) {
        return false;
    }

    ble_addr_t parsed{};
    parsed.type = type;
    for (size_t i = 0; i < 6; ++i) {
        const size_t pos = i * 3;
        if (i > 0 && text[pos - 1] != ':') {
            return false;
        }
        const int high = HexNibble(text[pos]);
        const int low = HexNibble(text[pos + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        parsed.val[5 - i] = static_cast<uint8_t>((high << 4) | low);
    }
    addr = parsed;
    return true;
}

ble_uuid128_t MarkerToUuid(const voicelink::Marker& marker) {
    ble_uuid128_t uuid{};
    uuid.u.type = BLE_UUID_TYPE_128;
    const auto& bytes = marker.bytes();
    for (size_t i = 0; i < voicelink::Marker::kSize; ++i) {
        uuid.value[i] = bytes[voicelink::Marker::kSize - 1 - i];
    }
    return uuid;
}

voicelink::Marker UuidToMarker(const ble_uuid128_t& uuid) {
    std::array<uint8_t, voicelink::Marker::kSize> bytes{};
    for (size_t i = 0; i < voicelink::Marker::kSize; ++i) {
        bytes[i] = uuid.value[voicelink::Marker::kSize - 1 - i];
    }
    return voicelink::Marker(bytes);
}

}  // namespace ble
