#include "connection_state.hpp"

namespace voicelink {

const char* PhaseName(Phase phase) {
    switch (phase) {
        case Phase::kIdle:
            return "Idle";
        case Phase::kListening:
            return "Listening";
        case Phase::kScanning:
            return "Scanning";
        case Phase::kConnecting:
            return "Connecting";
        case Phase::kConnected:
            return "Connected";
        case Phase::kClosing:
            return "Closing";
        case Phase::kFailed:
            return "Failed";
    }
    return "Unknown";
}

std::string DescribeStatus(Phase phase, const std::optional<PeerId>& peer,
                           const std::optional<Failure>& last_failure) {
    const std::string peer_name = peer ? peer->DisplayName() : "peer";
    switch (phase) {
        case Phase::kIdle:
            return last_failure ? DescribeFailure(*last_failure)
                                : "Not connected";
        case Phase::kFailed:
            return last_failure ? DescribeFailure(*last_failure) : "Failed";
        case Phase::kListening:
            return "Server listening...";
        case Phase::kScanning:
            return "Scanning...";
        case Phase::kConnecting:
            return "Connecting to " + peer_name + "...";
        case Phase::kConnected:
            // An audio problem does not end the connection; show both.
            if (last_failure) {
                return "Connected to " + peer_name + " (" +
                       DescribeFailure(*last_failure) + ")";
            }
            return "Connected to " + peer_name;
        case Phase::kClosing:
            return "Disconnecting...";
    }
    return "";
}

}  // namespace voicelink
