#ifndef LED_STATUS_COLOR_HPP_
#define LED_STATUS_COLOR_HPP_

#include <cstdint>

#include "connection_state.hpp"

namespace led {

struct Color {
    uint8_t red = 0;
    uint8_t green = 0;
    uint8_t blue = 0;

    bool operator==(const Color&) const = default;
};

/**
 * @brief Maps a status snapshot to the indicator color.
 *
 * Off when idle, blue while listening or scanning, cyan while connecting,
 * green while connected (brighter while transmitting), red whenever a
 * failure is being reported.
 */
Color StatusColor(const voicelink::StatusView& status);

}  // namespace led

#endif  // LED_STATUS_COLOR_HPP_
