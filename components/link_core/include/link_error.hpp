#ifndef VOICELINK_LINK_ERROR_HPP_
#define VOICELINK_LINK_ERROR_HPP_

#include <string>

#include "esp_err.h"

namespace voicelink {

/**
 * @enum LinkError
 * @brief The named failure conditions a user can be told about.
 */
enum class LinkError {
    kRadioDisabled,       // Radio enablement declined or failed.
    kPermissionDenied,    // A required capability is not granted.
    kDiscoveryFailed,     // Advertising or scanning could not start.
    kConnectionRefused,   // Outbound connect attempt failed.
    kTransportError,      // Acceptor or transport failed outside a session.
    kStreamError,         // Read/write failed on an established connection.
    kResourceInitFailed,  // Audio devices could not be acquired.
};

/**
 * @struct Failure
 * @brief A LinkError plus the driver code that caused it, if any.
 */
struct Failure {
    LinkError error;
    int code = 0;

    bool operator==(const Failure& other) const {
        return error == other.error && code == other.code;
    }
};

/**
 * @brief Short machine-friendly name of an error, e.g. "StreamError".
 */
const char* LinkErrorName(LinkError error);

/**
 * @brief The status line shown to the user for a failure.
 *
 * Each condition gets its own wording so "connection lost" and
 * "connection refused" stay distinguishable.
 */
std::string DescribeFailure(const Failure& failure);

}  // namespace voicelink

#endif  // VOICELINK_LINK_ERROR_HPP_
