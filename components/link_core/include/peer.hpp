#ifndef VOICELINK_PEER_HPP_
#define VOICELINK_PEER_HPP_

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace voicelink {

/**
 * @struct PeerId
 * @brief Identifies a remote device by its radio address.
 *
 * The label is the human-readable name the peer published, if any. Two
 * PeerIds are the same device when their addresses match, whatever their
 * labels say.
 */
struct PeerId {
    std::string address;
    std::optional<std::string> label;

    bool operator==(const PeerId& other) const {
        return address == other.address;
    }

    /**
     * @brief Returns the label when present and non-empty, else the address.
     */
    const std::string& DisplayName() const;
};

/**
 * @struct PeerCandidate
 * @brief A peer seen during the current discovery pass.
 *
 * `last_seen_order` is refreshed on every sighting; the position of the
 * candidate in its list is fixed by the first sighting.
 */
struct PeerCandidate {
    PeerId peer;
    uint32_t last_seen_order = 0;
};

/**
 * @class Marker
 * @brief The 128-bit identifier that tags this application's advertisements.
 *
 * Bytes are held in the order they are written in the canonical
 * `xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx` form.
 */
class Marker {
   public:
    static constexpr size_t kSize = 16;

    Marker() = default;
    explicit Marker(const std::array<uint8_t, kSize>& bytes) : bytes_(bytes) {}

    /**
     * @brief Parses the canonical textual form of a 128-bit UUID.
     * @param text The UUID text, hyphens required at the canonical positions.
     * @param[out] marker Receives the parsed value on success.
     * @return true if `text` was a well-formed UUID.
     */
    static bool FromString(std::string_view text, Marker& marker);

    std::string ToString() const;

    const std::array<uint8_t, kSize>& bytes() const { return bytes_; }

    bool operator==(const Marker& other) const {
        return bytes_ == other.bytes_;
    }

   private:
    std::array<uint8_t, kSize> bytes_{};
};

/**
 * @struct ServiceId
 * @brief The well-known service a host registers its acceptor under.
 *
 * `channel` is the link-layer endpoint number (an L2CAP PSM on BLE).
 */
struct ServiceId {
    std::string name;
    uint16_t channel = 0;
};

/**
 * @brief The marker shared by every VoiceLink device.
 */
const Marker& VoiceLinkMarker();

/**
 * @brief The service every VoiceLink host accepts connections on.
 */
const ServiceId& VoiceLinkService();

}  // namespace voicelink

#endif  // VOICELINK_PEER_HPP_
