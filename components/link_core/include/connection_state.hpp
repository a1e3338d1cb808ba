#ifndef VOICELINK_CONNECTION_STATE_HPP_
#define VOICELINK_CONNECTION_STATE_HPP_

#include <optional>
#include <string>
#include <vector>

#include "link_error.hpp"
#include "peer.hpp"

namespace voicelink {

/**
 * @enum Phase
 * @brief The phases of the connection state machine.
 */
enum class Phase {
    kIdle,
    kListening,
    kScanning,
    kConnecting,
    kConnected,
    kClosing,
    kFailed,
};

const char* PhaseName(Phase phase);

/**
 * @struct StatusView
 * @brief Read-only snapshot handed to observers after every change.
 *
 * `peer` is set while Connecting or Connected. `last_failure` survives the
 * return to Idle so the user can still read what went wrong; it is cleared
 * when the next role starts.
 */
struct StatusView {
    Phase phase = Phase::kIdle;
    bool announcing = false;
    bool discovering = false;
    bool transmitting = false;
    std::optional<PeerId> peer;
    std::optional<Failure> last_failure;
    std::string status_text;
    std::vector<PeerCandidate> candidates;
};

/**
 * @brief Builds the one-line status text for a view.
 */
std::string DescribeStatus(Phase phase, const std::optional<PeerId>& peer,
                           const std::optional<Failure>& last_failure);

}  // namespace voicelink

#endif  // VOICELINK_CONNECTION_STATE_HPP_
