#include "peer.hpp"

#include <cstdio>

namespace {
// Canonical UUID text is 8-4-4-4-12 hex digits.
constexpr size_t kUuidTextLength = 36;

constexpr bool IsHyphenPosition(size_t index) {
    return index == 8 || index == 13 || index == 18 || index == 23;
}

int HexValue(char c) {
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

namespace voicelink {

const std::string& PeerId::DisplayName() const {
    if (label.has_value() && !label->empty()) {
        return *label;
    }
    return address;
}

bool Marker::FromString(std::string_view text, Marker& marker) {
    if (text.size() != kUuidTextLength) {
        return false;
    }

    std::array<uint8_t, kSize> bytes{};
    size_t out = 0;
    for (size_t i = 0; i < text.size();) {
        if (IsHyphenPosition(i)) {
            if (text[i] != '-') {
                return false;
            }
            ++i;
            continue;
        }
        const int high = HexValue(text[i]);
        const int low = HexValue(text[i + 1]);
        if (high < 0 || low < 0 || IsHyphenPosition(i + 1)) {
            return false;
        }
        bytes[out++] = static_cast<uint8_t>((high << 4) | low);
        i += 2;
    }

    marker = Marker(bytes);
    return true;
}

std::string Marker::ToString() const {
    char text[kUuidTextLength + 1];
    snprintf(text, sizeof(text),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
             "%02x%02x%02x%02x%02x%02x",
             bytes_[0], bytes_[1], bytes_[2], bytes_[3], bytes_[4], bytes_[5],
             bytes_[6], bytes_[7], bytes_[8], bytes_[9], bytes_[10],
             bytes_[11], bytes_[12], bytes_[13], bytes_[14], bytes_[15]);
    return std::string(text);
}

const Marker& VoiceLinkMarker() {
    static const Marker marker(std::array<uint8_t, Marker::kSize>{
        0x8c, 0xe2, 0x55, 0xc0, 0x20, 0x0a, 0x11, 0xe0, 0xac, 0x64, 0x08,
        0x00, 0x20, 0x0c, 0x9a, 0x66});
    return marker;
}

const ServiceId& VoiceLinkService() {
    static const ServiceId service{"AudioShareService", 0x00C5};
    return service;
}

}  // namespace voicelink
