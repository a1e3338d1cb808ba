#include "status_color.hpp"

namespace {
// Kept dim; the LED sits right next to the user.
constexpr uint8_t kDim = 16;
constexpr uint8_t kBright = 64;
}  // namespace

namespace led {

Color StatusColor(const voicelink::StatusView& status) {
    if (status.phase == voicelink::Phase::kFailed ||
        (status.phase == voicelink::Phase::kIdle && status.last_failure)) {
        return {kDim, 0, 0};
    }

    switch (status.phase) {
        case voicelink::Phase::kListening:
        case voicelink::Phase::kScanning:
            return {0, 0, kDim};
        case voicelink::Phase::kConnecting:
            return {0, kDim, kDim};
        case voicelink::Phase::kConnected:
            if (status.last_failure) {
                return {kDim, kDim, 0};
            }
            return {0, status.transmitting ? kBright : kDim, 0};
        case voicelink::Phase::kClosing:
        case voicelink::Phase::kIdle:
        case voicelink::Phase::kFailed:
        default:
            return {};
    }
}

}  // namespace led
