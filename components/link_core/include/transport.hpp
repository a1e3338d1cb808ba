#ifndef VOICELINK_TRANSPORT_HPP_
#define VOICELINK_TRANSPORT_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

#include "esp_err.h"
#include "peer.hpp"

namespace voicelink {

/**
 * @class ByteStream
 * @brief One established duplex byte pipe to a peer.
 *
 * Reads and writes may run concurrently from different tasks (one reader, one
 * writer). Only the owner of the stream may call Shutdown() or destroy it.
 */
class ByteStream {
   public:
    virtual ~ByteStream() = default;

    /**
     * @brief Blocks until at least one byte is available, the peer closes the
     * stream, or the stream fails.
     *
     * @param[out] dest Buffer to fill; at most dest.size() bytes are read.
     * @param[out] bytes_read Number of bytes stored. Zero with ESP_OK means
     * the peer closed the stream.
     * @return ESP_OK, or an error code if the link failed.
     */
    virtual esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) = 0;

    /**
     * @brief Writes all of `src` before returning.
     * @return ESP_OK, or an error code if the link failed. A failed write
     * leaves no safe resumption point.
     */
    virtual esp_err_t Write(std::span<const uint8_t> src) = 0;

    /**
     * @brief Closes the link so that blocked Read()/Write() calls return
     * promptly. The object stays valid until destroyed.
     */
    virtual void Shutdown() = 0;

    /**
     * @brief The peer this stream is bound to.
     */
    virtual PeerId RemotePeer() const = 0;
};

/**
 * @class StreamAcceptor
 * @brief Waits for one inbound connection on a service.
 */
class StreamAcceptor {
   public:
    virtual ~StreamAcceptor() = default;

    /**
     * @brief Registers the acceptor under `service` and arms it for one
     * connection. Calling it again after Close() re-arms it.
     */
    virtual esp_err_t Listen(const ServiceId& service) = 0;

    /**
     * @brief Blocks until a peer connects or Close() is called.
     * @param[out] stream Receives the accepted stream on ESP_OK.
     * @return ESP_OK, ESP_ERR_INVALID_STATE if closed while waiting, or a
     * transport error.
     */
    virtual esp_err_t Accept(std::unique_ptr<ByteStream>& stream) = 0;

    /**
     * @brief Disarms the acceptor and wakes a blocked Accept().
     */
    virtual void Close() = 0;
};

/**
 * @class StreamConnector
 * @brief Opens an outbound connection to a peer's service.
 *
 * Each call is tagged with a caller-chosen attempt id that increases with
 * every attempt. Cancellation is recorded per id, so an attempt cancelled
 * before its Connect() starts never reaches the radio.
 */
class StreamConnector {
   public:
    virtual ~StreamConnector() = default;

    /**
     * @brief Blocks until connected, refused, timed out or cancelled.
     * @param[out] stream Receives the connected stream on ESP_OK.
     * @return ESP_OK, ESP_ERR_TIMEOUT, ESP_ERR_INVALID_STATE if `attempt`
     * was cancelled (before or during the call), or a transport error.
     */
    virtual esp_err_t Connect(uint32_t attempt, const PeerId& peer,
                              const ServiceId& service, uint32_t timeout_ms,
                              std::unique_ptr<ByteStream>& stream) = 0;

    /**
     * @brief Cancels `attempt` and every earlier one. A blocked Connect()
     * for it returns promptly; a later one returns at once.
     */
    virtual void Cancel(uint32_t attempt) = 0;
};

}  // namespace voicelink

#endif  // VOICELINK_TRANSPORT_HPP_
