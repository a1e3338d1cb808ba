#include "link_error.hpp"

namespace voicelink {

const char* LinkErrorName(LinkError error) {
    switch (error) {
        case LinkError::kRadioDisabled:
            return "RadioDisabled";
        case LinkError::kPermissionDenied:
            return "PermissionDenied";
        case LinkError::kDiscoveryFailed:
            return "DiscoveryFailed";
        case LinkError::kConnectionRefused:
            return "ConnectionRefused";
        case LinkError::kTransportError:
            return "TransportError";
        case LinkError::kStreamError:
            return "StreamError";
        case LinkError::kResourceInitFailed:
            return "ResourceInitFailed";
    }
    return "Unknown";
}

std::string DescribeFailure(const Failure& failure) {
    switch (failure.error) {
        case LinkError::kRadioDisabled:
            return "Bluetooth must be enabled";
        case LinkError::kPermissionDenied:
            return "Permission required";
        case LinkError::kDiscoveryFailed:
            return "Discovery failed (code " + std::to_string(failure.code) +
                   ")";
        case LinkError::kConnectionRefused:
            return "Connection failed";
        case LinkError::kTransportError:
            return "Connection error";
        case LinkError::kStreamError:
            return "Connection lost";
        case LinkError::kResourceInitFailed:
            return "Audio device unavailable";
    }
    return "Unknown failure";
}

}  // namespace voicelink
