#include "l2cap_transport.hpp"

#include <algorithm>
#include <utility>

#include "ble_address.hpp"
#include "esp_log.h"
#include "host/ble_l2cap.h"
#include "os/os_mbuf.h"
#include "os/os_mempool.h"

namespace {
static const char* kTag = "L2capTransport";

// Local SDU size for both directions.
constexpr uint16_t kCocMtu = 512;
constexpr int kSduBufferCount = 4 * MYNEWT_VAL(BLE_L2CAP_COC_MAX_NUM);

// About a quarter second of 16 kHz mono PCM.
constexpr size_t kRxBufferSize = 8192;

constexpr uint32_t kReadPollMs = 100;
constexpr uint32_t kTxStallTimeoutMs = 2000;
// Extra time granted on top of the caller's timeout for the channel setup.
constexpr uint32_t kChannelSetupMarginMs = 5000;

constexpr EventBits_t kAcceptReadyBit = BIT0;
constexpr EventBits_t kAcceptClosedBit = BIT1;
constexpr EventBits_t kConnectDoneBit = BIT2;

// SDU receive pool, shared by every channel.
os_membuf_t g_sdu_memory[OS_MEMPOOL_SIZE(kSduBufferCount, kCocMtu)];
struct os_mempool g_sdu_mempool;
struct os_mbuf_pool g_sdu_mbuf_pool;
}  // namespace

namespace ble {

// --- L2capStream ---

L2capStream::L2capStream(L2capTransport& transport, struct ble_l2cap_chan* chan,
                         uint16_t conn_handle, voicelink::PeerId peer,
                         uint16_t peer_mtu)
    : transport_(transport),
      chan_(chan),
      conn_handle_(conn_handle),
      peer_(std::move(peer)),
      peer_mtu_(peer_mtu),
      rx_scratch_(kCocMtu) {}

L2capStream::~L2capStream() {
    Shutdown();
    transport_.Detach(this);
    if (rx_buffer_ != nullptr) {
        vStreamBufferDelete(rx_buffer_);
    }
    if (tx_ready_ != nullptr) {
        vSemaphoreDelete(tx_ready_);
    }
}

esp_err_t L2capStream::Initialize() {
    rx_buffer_ = xStreamBufferCreate(kRxBufferSize, 1);
    tx_ready_ = xSemaphoreCreateBinary();
    if (rx_buffer_ == nullptr || tx_ready_ == nullptr) {
        ESP_LOGE(kTag, "Failed to allocate stream buffers.");
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

esp_err_t L2capStream::Read(std::span<uint8_t> dest, size_t& bytes_read) {
    bytes_read = 0;
    if (dest.empty()) {
        return ESP_OK;
    }
    while (true) {
        size_t received = xStreamBufferReceive(rx_buffer_, dest.data(),
                                               dest.size(),
                                               pdMS_TO_TICKS(kReadPollMs));
        if (received > 0) {
            bytes_read = received;
            return ESP_OK;
        }
        if (closed_.load()) {
            // Buffered data has been drained; report end of stream.
            return shut_down_locally_.load() ? ESP_ERR_INVALID_STATE : ESP_OK;
        }
    }
}

esp_err_t L2capStream::Write(std::span<const uint8_t> src) {
    size_t offset = 0;
    while (offset < src.size()) {
        if (closed_.load()) {
            return ESP_ERR_INVALID_STATE;
        }

        const size_t chunk =
            std::min<size_t>(src.size() - offset, peer_mtu_);
        struct os_mbuf* om =
            ble_hs_mbuf_from_flat(src.data() + offset, chunk);
        if (om == nullptr) {
            ESP_LOGE(kTag, "Out of mbufs for a %u-byte SDU.",
                     static_cast<unsigned>(chunk));
            return ESP_ERR_NO_MEM;
        }

        int rc = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (chan_ == nullptr) {
                os_mbuf_free_chain(om);
                return ESP_ERR_INVALID_STATE;
            }
            rc = ble_l2cap_send(chan_, om);
        }

        if (rc == 0) {
            offset += chunk;
            continue;
        }
        if (rc == BLE_HS_ESTALLED) {
            // Queued; the next SDU has to wait for the unstall.
            offset += chunk;
        } else if (rc == BLE_HS_EBUSY) {
            os_mbuf_free_chain(om);
        } else {
            os_mbuf_free_chain(om);
            ESP_LOGE(kTag, "ble_l2cap_send failed; rc=%d", rc);
            return ESP_FAIL;
        }

        if (xSemaphoreTake(tx_ready_, pdMS_TO_TICKS(kTxStallTimeoutMs)) !=
            pdTRUE) {
            ESP_LOGE(kTag, "Channel stalled for too long.");
            return ESP_ERR_TIMEOUT;
        }
    }
    return ESP_OK;
}

void L2capStream::Shutdown() {
    if (closed_.load() && chan_ == nullptr) {
        return;
    }
    shut_down_locally_ = true;
    closed_ = true;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (chan_ != nullptr) {
            int rc = ble_l2cap_disconnect(chan_);
            if (rc != 0) {
                ESP_LOGW(kTag, "ble_l2cap_disconnect failed; rc=%d", rc);
            }
            chan_ = nullptr;
        }
    }

    int rc = ble_gap_terminate(conn_handle_, BLE_ERR_REM_USER_CONN_TERM);
    if (rc != 0 && rc != BLE_HS_ENOTCONN) {
        ESP_LOGW(kTag, "ble_gap_terminate failed; rc=%d", rc);
    }
    xSemaphoreGive(tx_ready_);
    ESP_LOGI(kTag, "Channel to %s shut down.", peer_.address.c_str());
}

void L2capStream::OnDataReceived(struct os_mbuf* sdu) {
    const uint16_t length =
        std::min<uint16_t>(OS_MBUF_PKTLEN(sdu), rx_scratch_.size());
    int rc = os_mbuf_copydata(sdu, 0, length, rx_scratch_.data());
    os_mbuf_free_chain(sdu);
    if (rc != 0) {
        ESP_LOGW(kTag, "Failed to copy received SDU; rc=%d", rc);
    } else {
        size_t sent = xStreamBufferSend(rx_buffer_, rx_scratch_.data(),
                                        length, 0);
        if (sent < length) {
            ESP_LOGW(kTag, "Receive buffer full; dropped %u bytes.",
                     static_cast<unsigned>(length - sent));
        }
    }

    // Each SDU consumes the receive buffer; hand the channel a new one.
    std::lock_guard<std::mutex> lock(mutex_);
    if (chan_ == nullptr) {
        return;
    }
    struct os_mbuf* next = transport_.AllocateSdu();
    if (next == nullptr) {
        ESP_LOGE(kTag, "No SDU buffer to re-arm the channel.");
        return;
    }
    rc = ble_l2cap_recv_ready(chan_, next);
    if (rc != 0) {
        ESP_LOGE(kTag, "ble_l2cap_recv_ready failed; rc=%d", rc);
        os_mbuf_free_chain(next);
    }
}

void L2capStream::OnTxUnstalled() { xSemaphoreGive(tx_ready_); }

void L2capStream::OnDisconnected() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        chan_ = nullptr;
    }
    closed_ = true;
    xSemaphoreGive(tx_ready_);
    ESP_LOGI(kTag, "Channel to %s disconnected.", peer_.address.c_str());
}

// --- L2capTransport ---

L2capTransport::L2capTransport(BleRadio& radio) : radio_(radio) {}

L2capTransport::~L2capTransport() {
    accepted_.reset();
    connected_.reset();
    if (events_ != nullptr) {
        vEventGroupDelete(events_);
    }
}

esp_err_t L2capTransport::Initialize() {
    int rc = os_mempool_init(&g_sdu_mempool, kSduBufferCount, kCocMtu,
                             g_sdu_memory, "voicelink_sdu");
    if (rc != 0) {
        ESP_LOGE(kTag, "os_mempool_init failed; rc=%d", rc);
        return ESP_FAIL;
    }
    rc = os_mbuf_pool_init(&g_sdu_mbuf_pool, &g_sdu_mempool, kCocMtu,
                           kSduBufferCount);
    if (rc != 0) {
        ESP_LOGE(kTag, "os_mbuf_pool_init failed; rc=%d", rc);
        return ESP_FAIL;
    }

    events_ = xEventGroupCreate();
    if (events_ == nullptr) {
        ESP_LOGE(kTag, "Failed to create event group.");
        return ESP_ERR_NO_MEM;
    }
    ESP_LOGI(kTag, "L2CAP transport ready (MTU %u).", kCocMtu);
    return ESP_OK;
}

// --- StreamAcceptor ---

esp_err_t L2capTransport::Listen(const voicelink::ServiceId& service) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!radio_.IsRadioEnabled()) {
        return ESP_ERR_INVALID_STATE;
    }

    // NimBLE cannot unregister a server; it stays registered and is armed
    // or disarmed instead.
    if (!server_registered_) {
        int rc = ble_l2cap_create_server(service.channel, kCocMtu,
                                         L2capTransport::L2capEventHandler,
                                         this);
        if (rc != 0) {
            ESP_LOGE(kTag, "ble_l2cap_create_server(0x%04x) failed; rc=%d",
                     service.channel, rc);
            return ESP_FAIL;
        }
        server_registered_ = true;
        server_psm_ = service.channel;
    } else if (server_psm_ != service.channel) {
        ESP_LOGE(kTag, "Server already registered on PSM 0x%04x.",
                 server_psm_);
        return ESP_ERR_INVALID_ARG;
    }

    accepted_.reset();
    xEventGroupClearBits(events_, kAcceptReadyBit | kAcceptClosedBit);
    armed_ = true;
    ESP_LOGI(kTag, "Listening for '%s' on PSM 0x%04x.", service.name.c_str(),
             service.channel);
    return ESP_OK;
}

esp_err_t L2capTransport::Accept(std::unique_ptr<voicelink::ByteStream>& stream) {
    xEventGroupWaitBits(events_, kAcceptReadyBit | kAcceptClosedBit, pdTRUE,
                        pdFALSE, portMAX_DELAY);

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!accepted_) {
        return ESP_ERR_INVALID_STATE;
    }
    stream = std::move(accepted_);
    return ESP_OK;
}

void L2capTransport::Close() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    armed_ = false;
    xEventGroupSetBits(events_, kAcceptClosedBit);
}

// --- StreamConnector ---

esp_err_t L2capTransport::Connect(uint32_t attempt,
                                  const voicelink::PeerId& peer,
                                  const voicelink::ServiceId& service,
                                  uint32_t timeout_ms,
                                  std::unique_ptr<voicelink::ByteStream>& stream) {
    ble_addr_t addr;
    if (!ParseAddress(peer.address, addr)) {
        ESP_LOGE(kTag, "Malformed peer address '%s'.", peer.address.c_str());
        return ESP_ERR_INVALID_ARG;
    }

    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (attempt <= cancelled_through_) {
            ESP_LOGI(kTag, "Connect attempt %u was cancelled before it started.",
                     static_cast<unsigned>(attempt));
            return ESP_ERR_INVALID_STATE;
        }
        if (!radio_.IsRadioEnabled()) {
            return ESP_ERR_INVALID_STATE;
        }
        if (connect_phase_ != ConnectPhase::kIdle) {
            ESP_LOGE(kTag, "A connect attempt is already in flight.");
            return ESP_ERR_INVALID_STATE;
        }
        connect_phase_ = ConnectPhase::kGap;
        connect_attempt_ = attempt;
        connect_cancelled_ = false;
        connect_handle_ = BLE_HS_CONN_HANDLE_NONE;
        connect_psm_ = service.channel;
        connect_peer_ = peer;
        connect_result_ = ESP_FAIL;
        connected_.reset();
        xEventGroupClearBits(events_, kConnectDoneBit);

        int rc = ble_gap_connect(radio_.own_addr_type(), &addr, timeout_ms,
                                 nullptr, L2capTransport::GapEventHandler,
                                 this);
        if (rc != 0) {
            ESP_LOGE(kTag, "ble_gap_connect failed; rc=%d", rc);
            connect_phase_ = ConnectPhase::kIdle;
            return ESP_FAIL;
        }
    }
    ESP_LOGI(kTag, "Connecting to %s...", peer.address.c_str());

    EventBits_t bits = xEventGroupWaitBits(
        events_, kConnectDoneBit, pdTRUE, pdTRUE,
        pdMS_TO_TICKS(timeout_ms + kChannelSetupMarginMs));

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if ((bits & kConnectDoneBit) == 0) {
        ESP_LOGE(kTag, "Connect attempt timed out.");
        if (connect_phase_ == ConnectPhase::kGap) {
            ble_gap_conn_cancel();
        } else if (connect_handle_ != BLE_HS_CONN_HANDLE_NONE) {
            ble_gap_terminate(connect_handle_, BLE_ERR_REM_USER_CONN_TERM);
        }
        connect_result_ = ESP_ERR_TIMEOUT;
    }
    connect_phase_ = ConnectPhase::kIdle;

    if (connect_result_ != ESP_OK || !connected_) {
        connected_.reset();
        return connect_result_ != ESP_OK ? connect_result_ : ESP_FAIL;
    }
    stream = std::move(connected_);
    return ESP_OK;
}

void L2capTransport::Cancel(uint32_t attempt) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (attempt > cancelled_through_) {
        cancelled_through_ = attempt;
    }
    if (connect_phase_ == ConnectPhase::kIdle || connect_attempt_ > attempt) {
        return;
    }
    ESP_LOGI(kTag, "Cancelling connect attempt.");
    connect_cancelled_ = true;
    if (connect_phase_ == ConnectPhase::kGap) {
        ble_gap_conn_cancel();
    } else if (connect_handle_ != BLE_HS_CONN_HANDLE_NONE) {
        ble_gap_terminate(connect_handle_, BLE_ERR_REM_USER_CONN_TERM);
    }
    FinishConnect(ESP_ERR_INVALID_STATE);
}

// --- Private Methods ---

std::unique_ptr<L2capStream> L2capTransport::CreateStream(
    struct ble_l2cap_chan* chan, uint16_t conn_handle,
    const voicelink::PeerId& peer) {
    struct ble_l2cap_chan_info info;
    uint16_t peer_mtu = kCocMtu;
    if (ble_l2cap_get_chan_info(chan, &info) == 0 && info.peer_coc_mtu > 0) {
        peer_mtu = info.peer_coc_mtu;
    }

    auto stream = std::unique_ptr<L2capStream>(
        new L2capStream(*this, chan, conn_handle, peer, peer_mtu));
    if (stream->Initialize() != ESP_OK) {
        return nullptr;
    }
    active_ = stream.get();
    ESP_LOGI(kTag, "Channel open to %s (peer MTU %u).", peer.address.c_str(),
             peer_mtu);
    return stream;
}

void L2capTransport::FinishConnect(esp_err_t result) {
    connect_result_ = result;
    xEventGroupSetBits(events_, kConnectDoneBit);
}

struct os_mbuf* L2capTransport::AllocateSdu() {
    return os_mbuf_get_pkthdr(&g_sdu_mbuf_pool, 0);
}

void L2capTransport::Detach(L2capStream* stream) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (active_ == stream) {
        active_ = nullptr;
    }
}

// --- Static Callbacks ---

int L2capTransport::L2capEventHandler(struct ble_l2cap_event* event,
                                      void* arg) {
    return static_cast<L2capTransport*>(arg)->HandleL2capEvent(event);
}

int L2capTransport::HandleL2capEvent(struct ble_l2cap_event* event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    switch (event->type) {
        case BLE_L2CAP_EVENT_COC_ACCEPT: {
            if (!armed_ || active_ != nullptr) {
                ESP_LOGW(kTag, "Refusing channel on conn_handle=%d.",
                         event->accept.conn_handle);
                return BLE_HS_ENOMEM;
            }
            struct os_mbuf* sdu_rx = AllocateSdu();
            if (sdu_rx == nullptr) {
                return BLE_HS_ENOMEM;
            }
            int rc = ble_l2cap_recv_ready(event->accept.chan, sdu_rx);
            if (rc != 0) {
                os_mbuf_free_chain(sdu_rx);
                return rc;
            }
            return 0;
        }

        case BLE_L2CAP_EVENT_COC_CONNECTED: {
            const uint16_t conn_handle = event->connect.conn_handle;
            const bool outbound = connect_phase_ == ConnectPhase::kChannel &&
                                  conn_handle == connect_handle_;

            if (event->connect.status != 0) {
                ESP_LOGE(kTag, "Channel setup failed; status=%d",
                         event->connect.status);
                if (outbound) {
                    ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
                    FinishConnect(ESP_FAIL);
                }
                return 0;
            }

            if (outbound) {
                if (connect_cancelled_) {
                    ble_l2cap_disconnect(event->connect.chan);
                    return 0;
                }
                connected_ = CreateStream(event->connect.chan, conn_handle,
                                          connect_peer_);
                FinishConnect(connected_ ? ESP_OK : ESP_ERR_NO_MEM);
                return 0;
            }

            if (!armed_) {
                ble_l2cap_disconnect(event->connect.chan);
                return 0;
            }
            voicelink::PeerId peer;
            struct ble_gap_conn_desc desc;
            if (ble_gap_conn_find(conn_handle, &desc) == 0) {
                peer.address = FormatAddress(desc.peer_id_addr);
            }
            accepted_ = CreateStream(event->connect.chan, conn_handle, peer);
            if (!accepted_) {
                ble_l2cap_disconnect(event->connect.chan);
                return 0;
            }
            armed_ = false;
            xEventGroupSetBits(events_, kAcceptReadyBit);
            return 0;
        }

        case BLE_L2CAP_EVENT_COC_DISCONNECTED:
            if (active_ != nullptr && active_->chan_ == event->disconnect.chan) {
                active_->OnDisconnected();
            }
            return 0;

        case BLE_L2CAP_EVENT_COC_DATA_RECEIVED:
            if (active_ != nullptr) {
                active_->OnDataReceived(event->receive.sdu_rx);
            } else {
                os_mbuf_free_chain(event->receive.sdu_rx);
            }
            return 0;

        case BLE_L2CAP_EVENT_COC_TX_UNSTALLED:
            if (active_ != nullptr) {
                active_->OnTxUnstalled();
            }
            return 0;

        default:
            return 0;
    }
}

int L2capTransport::GapEventHandler(struct ble_gap_event* event, void* arg) {
    static_cast<L2capTransport*>(arg)->HandleGapEvent(event);
    return 0;
}

void L2capTransport::HandleGapEvent(struct ble_gap_event* event) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    switch (event->type) {
        case BLE_GAP_EVENT_CONNECT: {
            if (event->connect.status != 0) {
                ESP_LOGE(kTag, "Link setup failed; status=%d",
                         event->connect.status);
                if (connect_phase_ == ConnectPhase::kGap) {
                    FinishConnect(event->connect.status == BLE_HS_ETIMEOUT
                                      ? ESP_ERR_TIMEOUT
                                      : ESP_FAIL);
                }
                return;
            }

            const uint16_t conn_handle = event->connect.conn_handle;
            if (connect_phase_ != ConnectPhase::kGap || connect_cancelled_) {
                ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
                return;
            }

            connect_handle_ = conn_handle;
            connect_phase_ = ConnectPhase::kChannel;
            struct os_mbuf* sdu_rx = AllocateSdu();
            if (sdu_rx == nullptr) {
                ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
                FinishConnect(ESP_ERR_NO_MEM);
                return;
            }
            int rc = ble_l2cap_connect(conn_handle, connect_psm_, kCocMtu,
                                       sdu_rx,
                                       L2capTransport::L2capEventHandler, this);
            if (rc != 0) {
                ESP_LOGE(kTag, "ble_l2cap_connect failed; rc=%d", rc);
                os_mbuf_free_chain(sdu_rx);
                ble_gap_terminate(conn_handle, BLE_ERR_REM_USER_CONN_TERM);
                FinishConnect(ESP_FAIL);
            }
            return;
        }

        case BLE_GAP_EVENT_DISCONNECT:
            ESP_LOGI(kTag, "Link to peripheral dropped; reason=%d",
                     event->disconnect.reason);
            if (connect_phase_ == ConnectPhase::kChannel &&
                event->disconnect.conn.conn_handle == connect_handle_) {
                FinishConnect(ESP_FAIL);
            }
            return;

        default:
            return;
    }
}

}  // namespace ble
