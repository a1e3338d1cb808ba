#ifndef VOICELINK_LINK_EVENT_HPP_
#define VOICELINK_LINK_EVENT_HPP_

#include <cstdint>
#include <memory>

#include "esp_err.h"
#include "streaming_pipeline.hpp"
#include "transport.hpp"

namespace voicelink {

/**
 * @enum EventType
 * @brief Background results delivered to the manager's event task.
 */
enum class EventType {
    kAcceptResult,   // attempt, error, stream
    kConnectResult,  // attempt, error, stream
    kRadioResult,    // attempt, enabled
    kScanFinished,   // attempt, code
    kStreamFault,    // attempt (connection serial), fault
    kRefresh,        // announcer or candidate list changed
    kShutdown,       // ends the event task
};

/**
 * @struct LinkEvent
 * @brief One queued event. Heap-allocated by the poster and deleted by the
 * event task; a stream it still owns at that point is shut down with it.
 */
struct LinkEvent {
    EventType type;
    uint32_t attempt = 0;
    esp_err_t error = ESP_OK;
    int code = 0;
    bool enabled = false;
    StreamFault fault{PumpDirection::kInbound, ESP_OK};
    std::unique_ptr<ByteStream> stream;

    explicit LinkEvent(EventType event_type) : type(event_type) {}
};

}  // namespace voicelink

#endif  // VOICELINK_LINK_EVENT_HPP_
