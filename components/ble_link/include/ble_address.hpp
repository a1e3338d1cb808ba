#ifndef BLE_ADDRESS_HPP_
#define BLE_ADDRESS_HPP_

#include <string>
#include <string_view>

#include "host/ble_hs.h"
#include "peer.hpp"

namespace ble {

/**
 * @brief Formats a device address as `AA:BB:CC:DD:EE:FF`, with a `/r`
 * suffix for random addresses so the text is enough to connect back.
 */
std::string FormatAddress(const ble_addr_t& addr);

/**
 * @brief Parses text produced by FormatAddress().
 * @return true and fills `addr` if `text` is well formed.
 */
bool ParseAddress(std::string_view text, ble_addr_t& addr);

/**
 * @brief Converts a marker (canonical byte order) to NimBLE's little-endian
 * 128-bit UUID.
 */
ble_uuid128_t MarkerToUuid(const voicelink::Marker& marker);

voicelink::Marker UuidToMarker(const ble_uuid128_t& uuid);

}  // namespace ble

#endif  // BLE_ADDRESS_HPP_
