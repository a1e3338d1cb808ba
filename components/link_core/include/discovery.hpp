#ifndef VOICELINK_DISCOVERY_HPP_
#define VOICELINK_DISCOVERY_HPP_

#include <cstdint>
#include <functional>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "candidate_list.hpp"
#include "esp_err.h"
#include "peer.hpp"

namespace voicelink {

/**
 * @struct Advertisement
 * @brief What an announcing device puts on air.
 */
struct Advertisement {
    Marker marker;
    std::string name;
    bool connectable = false;
};

/**
 * @struct AdvertisementReport
 * @brief One received advertisement or scan response, already parsed.
 *
 * A report may carry the markers, the name, or both; a device typically
 * sends them in separate packets.
 */
struct AdvertisementReport {
    std::string address;
    std::vector<Marker> markers;
    std::string name;
};

/**
 * @class AdvertiseDriver
 * @brief Platform hook that puts an Advertisement on air.
 */
class AdvertiseDriver {
   public:
    using StoppedCallback = std::function<void()>;

    virtual ~AdvertiseDriver() = default;

    /**
     * @brief Starts periodic advertising.
     * @param on_stopped Invoked if the platform ends advertising on its own,
     * for example because a peer connected.
     */
    virtual esp_err_t StartAdvertising(const Advertisement& advertisement,
                                       StoppedCallback on_stopped) = 0;
    virtual esp_err_t StopAdvertising() = 0;
};

/**
 * @class ScanDriver
 * @brief Platform hook that listens for advertisements.
 */
class ScanDriver {
   public:
    using ReportCallback = std::function<void(const AdvertisementReport&)>;
    // status 0: the scan window elapsed; otherwise a platform failure code.
    using FinishedCallback = std::function<void(int status)>;

    virtual ~ScanDriver() = default;

    /**
     * @param duration_ms Scan window; 0 scans until StopScan().
     */
    virtual esp_err_t StartScan(uint32_t duration_ms, ReportCallback on_report,
                                FinishedCallback on_finished) = 0;
    virtual esp_err_t StopScan() = 0;
};

/**
 * @class Announcer
 * @brief The "make me findable" discovery role.
 */
class Announcer {
   public:
    using StateCallback = std::function<void(bool announcing)>;

    explicit Announcer(AdvertiseDriver& driver);

    Announcer(const Announcer&) = delete;
    Announcer& operator=(const Announcer&) = delete;

    /**
     * @brief Begins broadcasting `marker` and `name`. A no-op returning
     * ESP_OK while already announcing.
     * @return ESP_OK, or the driver's error if broadcasting could not start.
     */
    esp_err_t Start(const Marker& marker, const std::string& name,
                    bool connectable);

    /**
     * @brief Stops broadcasting. A no-op if not announcing.
     */
    void Stop();

    bool IsAnnouncing() const;

    /**
     * @brief Sets the observer of the announcing flag. Called outside the
     * announcer's lock, from whichever task caused the change.
     */
    void SetOnAnnouncingChanged(StateCallback callback);

   private:
    void HandleDriverStopped(uint32_t generation);
    void Notify(bool announcing);

    AdvertiseDriver& driver_;
    mutable std::mutex mutex_;
    bool announcing_ = false;
    uint32_t generation_ = 0;
    StateCallback on_changed_;
};

/**
 * @class Seeker
 * @brief The "find peers" discovery role.
 *
 * Keeps the candidate list of the current pass. Reports arrive on the
 * platform's callback task; the list is guarded by an internal mutex.
 */
class Seeker {
   public:
    // Unlisted devices remembered at once while waiting for the marker or
    // the name to arrive in a later report. The oldest is forgotten first.
    static constexpr size_t kMaxPendingSightings = 32;

    struct Callbacks {
        std::function<void()> on_candidates_changed;
        std::function<void(int status)> on_finished;
    };

    explicit Seeker(ScanDriver& driver);

    Seeker(const Seeker&) = delete;
    Seeker& operator=(const Seeker&) = delete;

    /**
     * @brief Clears the candidate list and begins a new discovery pass.
     *
     * Only peers advertising `marker` and a non-empty name are listed. A
     * running pass is stopped first.
     */
    esp_err_t Start(const Marker& marker, uint32_t duration_ms,
                    Callbacks callbacks);

    /**
     * @brief Ends the pass. Candidates stay visible until the next Start().
     */
    void Stop();

    bool IsScanning() const;

    std::vector<PeerCandidate> Candidates() const;

    /**
     * @brief Looks up a listed candidate by address.
     * @return true and fills `peer` if the address is listed.
     */
    bool FindCandidate(const std::string& address, PeerId& peer) const;

    size_t pending_sightings() const;

   private:
    struct Sighting {
        std::string address;
        bool marked = false;
        std::string name;
    };

    Sighting& SightingFor(const std::string& address);

    void HandleReport(uint32_t generation, const AdvertisementReport& report);
    void HandleFinished(uint32_t generation, int status);

    ScanDriver& driver_;
    mutable std::mutex mutex_;
    bool scanning_ = false;
    uint32_t generation_ = 0;
    Marker marker_;
    Callbacks callbacks_;
    CandidateList candidates_;

    // Partial sightings of the current pass, oldest first.
    std::deque<Sighting> pending_;
};

}  // namespace voicelink

#endif  // VOICELINK_DISCOVERY_HPP_
