#include "discovery.hpp"

#include <algorithm>
#include <utility>

#include "esp_log.h"

namespace {
static const char* kTag = "Discovery";
}  // namespace

namespace voicelink {

// --- Announcer ---

Announcer::Announcer(AdvertiseDriver& driver) : driver_(driver) {}

esp_err_t Announcer::Start(const Marker& marker, const std::string& name,
                           bool connectable) {
    uint32_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (announcing_) {
            ESP_LOGD(kTag, "Already announcing, nothing to do.");
            return ESP_OK;
        }
        generation = ++generation_;
    }

    Advertisement advertisement{marker, name, connectable};
    esp_err_t err = driver_.StartAdvertising(
        advertisement,
        [this, generation]() { HandleDriverStopped(generation); });
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to start announcing: %s", esp_err_to_name(err));
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        announcing_ = true;
    }
    ESP_LOGI(kTag, "Announcing as '%s' (%s).", name.c_str(),
             connectable ? "connectable" : "non-connectable");
    Notify(true);
    return ESP_OK;
}

void Announcer::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!announcing_) {
            return;
        }
        announcing_ = false;
        ++generation_;
    }

    esp_err_t err = driver_.StopAdvertising();
    if (err != ESP_OK) {
        ESP_LOGW(kTag, "Stopping advertising reported %s",
                 esp_err_to_name(err));
    }
    ESP_LOGI(kTag, "Announcing stopped.");
    Notify(false);
}

bool Announcer::IsAnnouncing() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return announcing_;
}

void Announcer::SetOnAnnouncingChanged(StateCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_changed_ = std::move(callback);
}

void Announcer::HandleDriverStopped(uint32_t generation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !announcing_) {
            return;
        }
        announcing_ = false;
    }
    ESP_LOGI(kTag, "Advertising ended by the radio.");
    Notify(false);
}

void Announcer::Notify(bool announcing) {
    StateCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = on_changed_;
    }
    if (callback) {
        callback(announcing);
    }
}

// --- Seeker ---

Seeker::Seeker(ScanDriver& driver) : driver_(driver) {}

esp_err_t Seeker::Start(const Marker& marker, uint32_t duration_ms,
                        Callbacks callbacks) {
    if (IsScanning()) {
        Stop();
    }

    uint32_t generation = 0;
    std::function<void()> on_changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        generation = ++generation_;
        marker_ = marker;
        callbacks_ = std::move(callbacks);
        candidates_.Clear();
        pending_.clear();
        scanning_ = true;
        on_changed = callbacks_.on_candidates_changed;
    }
    // Observers see the cleared list before any new sighting.
    if (on_changed) {
        on_changed();
    }

    esp_err_t err = driver_.StartScan(
        duration_ms,
        [this, generation](const AdvertisementReport& report) {
            HandleReport(generation, report);
        },
        [this, generation](int status) { HandleFinished(generation, status); });
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to start scanning: %s", esp_err_to_name(err));
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation_ == generation) {
            scanning_ = false;
        }
        return err;
    }

    ESP_LOGI(kTag, "Scanning for marker %s", marker.ToString().c_str());
    return ESP_OK;
}

void Seeker::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!scanning_) {
            return;
        }
        scanning_ = false;
        ++generation_;
    }

    esp_err_t err = driver_.StopScan();
    if (err != ESP_OK) {
        ESP_LOGW(kTag, "Stopping scan reported %s", esp_err_to_name(err));
    }
    ESP_LOGI(kTag, "Scanning stopped.");
}

bool Seeker::IsScanning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return scanning_;
}

std::vector<PeerCandidate> Seeker::Candidates() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return candidates_.candidates();
}

size_t Seeker::pending_sightings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool Seeker::FindCandidate(const std::string& address, PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const PeerCandidate& candidate : candidates_.candidates()) {
        if (candidate.peer.address == address) {
            peer = candidate.peer;
            return true;
        }
    }
    return false;
}

void Seeker::HandleReport(uint32_t generation,
                          const AdvertisementReport& report) {
    std::function<void()> on_changed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !scanning_) {
            return;
        }

        const PeerId seen{report.address, std::nullopt};
        if (candidates_.Contains(seen)) {
            // Listed already; only the sighting order moves.
            candidates_.Record(seen);
            return;
        }

        const bool carries_marker =
            std::find(report.markers.begin(), report.markers.end(),
                      marker_) != report.markers.end();
        if (!carries_marker && report.name.empty()) {
            return;
        }

        Sighting& sighting = SightingFor(report.address);
        sighting.marked = sighting.marked || carries_marker;
        if (!report.name.empty()) {
            sighting.name = report.name;
        }
        // Nameless announcements cannot be offered for connection.
        if (!sighting.marked || sighting.name.empty()) {
            return;
        }

        const std::string name = sighting.name;
        pending_.erase(std::find_if(
            pending_.begin(), pending_.end(),
            [&report](const Sighting& s) { return s.address == report.address; }));
        candidates_.Record(PeerId{report.address, name});
        ESP_LOGI(kTag, "Found peer '%s' (%s)", name.c_str(),
                 report.address.c_str());
        on_changed = callbacks_.on_candidates_changed;
    }
    if (on_changed) {
        on_changed();
    }
}

Seeker::Sighting& Seeker::SightingFor(const std::string& address) {
    for (Sighting& sighting : pending_) {
        if (sighting.address == address) {
            return sighting;
        }
    }
    if (pending_.size() >= kMaxPendingSightings) {
        pending_.pop_front();
    }
    pending_.push_back(Sighting{address, false, {}});
    return pending_.back();
}

void Seeker::HandleFinished(uint32_t generation, int status) {
    std::function<void(int)> on_finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_ || !scanning_) {
            return;
        }
        scanning_ = false;
        on_finished = callbacks_.on_finished;
    }
    if (status != 0) {
        ESP_LOGE(kTag, "Scan ended with failure; status=%d", status);
    } else {
        ESP_LOGI(kTag, "Scan window elapsed.");
    }
    if (on_finished) {
        on_finished(status);
    }
}

}  // namespace voicelink
