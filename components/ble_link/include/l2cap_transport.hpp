#ifndef BLE_L2CAP_TRANSPORT_HPP_
#define BLE_L2CAP_TRANSPORT_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

#include "ble_radio.hpp"
#include "esp_err.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/semphr.h"
#include "freertos/stream_buffer.h"
#include "host/ble_hs.h"
#include "transport.hpp"

namespace ble {

class L2capTransport;

/**
 * @class L2capStream
 * @brief One connection-oriented L2CAP channel used as a duplex byte pipe.
 *
 * Received SDUs are copied into a FreeRTOS stream buffer on the host task;
 * Read() drains it. Write() splits its input into SDUs of at most the peer's
 * MTU and waits out stalls.
 */
class L2capStream : public voicelink::ByteStream {
   public:
    ~L2capStream() override;

    L2capStream(const L2capStream&) = delete;
    L2capStream& operator=(const L2capStream&) = delete;

    esp_err_t Read(std::span<uint8_t> dest, size_t& bytes_read) override;
    esp_err_t Write(std::span<const uint8_t> src) override;
    void Shutdown() override;
    voicelink::PeerId RemotePeer() const override { return peer_; }

   private:
    friend class L2capTransport;

    L2capStream(L2capTransport& transport, struct ble_l2cap_chan* chan,
                uint16_t conn_handle, voicelink::PeerId peer, uint16_t peer_mtu);

    esp_err_t Initialize();

    // --- Called by the transport on the host task ---
    void OnDataReceived(struct os_mbuf* sdu);
    void OnTxUnstalled();
    void OnDisconnected();

    L2capTransport& transport_;
    std::mutex mutex_;
    struct ble_l2cap_chan* chan_;
    const uint16_t conn_handle_;
    const voicelink::PeerId peer_;
    const uint16_t peer_mtu_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> shut_down_locally_{false};
    StreamBufferHandle_t rx_buffer_ = nullptr;
    SemaphoreHandle_t tx_ready_ = nullptr;
    std::vector<uint8_t> rx_scratch_;
};

/**
 * @class L2capTransport
 * @brief L2CAP connection-oriented channels over NimBLE, as both the host's
 * acceptor and the client's connector.
 *
 * Only one channel exists at a time. Incoming channels are refused while the
 * acceptor is not armed or a channel is already open.
 */
class L2capTransport : public voicelink::StreamAcceptor,
                       public voicelink::StreamConnector {
   public:
    explicit L2capTransport(BleRadio& radio);
    ~L2capTransport() override;

    L2capTransport(const L2capTransport&) = delete;
    L2capTransport& operator=(const L2capTransport&) = delete;

    /**
     * @brief Sets up the SDU buffer pool and the signalling event group.
     * @return ESP_OK on success.
     */
    esp_err_t Initialize();

    // --- StreamAcceptor ---
    esp_err_t Listen(const voicelink::ServiceId& service) override;
    esp_err_t Accept(std::unique_ptr<voicelink::ByteStream>& stream) override;
    void Close() override;

    // --- StreamConnector ---
    esp_err_t Connect(uint32_t attempt, const voicelink::PeerId& peer,
                      const voicelink::ServiceId& service, uint32_t timeout_ms,
                      std::unique_ptr<voicelink::ByteStream>& stream) override;
    void Cancel(uint32_t attempt) override;

   private:
    friend class L2capStream;

    enum class ConnectPhase { kIdle, kGap, kChannel };

    static int L2capEventHandler(struct ble_l2cap_event* event, void* arg);
    int HandleL2capEvent(struct ble_l2cap_event* event);
    static int GapEventHandler(struct ble_gap_event* event, void* arg);
    void HandleGapEvent(struct ble_gap_event* event);

    std::unique_ptr<L2capStream> CreateStream(struct ble_l2cap_chan* chan,
                                              uint16_t conn_handle,
                                              const voicelink::PeerId& peer);
    void FinishConnect(esp_err_t result);
    struct os_mbuf* AllocateSdu();
    void Detach(L2capStream* stream);

    BleRadio& radio_;

    // Recursive: NimBLE may call back into the handlers from inside an API
    // call made while the lock is held.
    std::recursive_mutex mutex_;
    EventGroupHandle_t events_ = nullptr;

    // --- Acceptor ---
    bool server_registered_ = false;
    uint16_t server_psm_ = 0;
    bool armed_ = false;
    std::unique_ptr<L2capStream> accepted_;

    // --- Connector ---
    ConnectPhase connect_phase_ = ConnectPhase::kIdle;
    uint32_t connect_attempt_ = 0;
    // Attempts up to and including this id are cancelled.
    uint32_t cancelled_through_ = 0;
    bool connect_cancelled_ = false;
    uint16_t connect_handle_ = BLE_HS_CONN_HANDLE_NONE;
    uint16_t connect_psm_ = 0;
    voicelink::PeerId connect_peer_;
    esp_err_t connect_result_ = ESP_OK;
    std::unique_ptr<L2capStream> connected_;

    // The open channel, whichever side created it.
    L2capStream* active_ = nullptr;
};

}  // namespace ble

#endif  // BLE_L2CAP_TRANSPORT_HPP_
