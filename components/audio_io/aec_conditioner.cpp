#include "aec_conditioner.hpp"

#include <algorithm>
#include <cstring>

#include "esp_heap_caps.h"
#include "esp_log.h"

namespace audio {
namespace {
static const char* kTag = "AecConditioner";

constexpr int kFilterLength = 4;
constexpr int kChannelCount = 1;

// Reference older than this many chunks no longer lines up with the echo.
constexpr size_t kMaxReferenceChunks = 8;

int16_t* AllocateChunk(size_t samples) {
    return static_cast<int16_t*>(heap_caps_aligned_alloc(
        16, samples * sizeof(int16_t), MALLOC_CAP_INTERNAL));
}
}  // namespace

std::unique_ptr<AecConditioner> AecConditioner::Create(
    const voicelink::AudioFormat& format) {
    if (format.channels != 1 || format.bits_per_sample != 16) {
        ESP_LOGE(kTag, "Echo cancellation needs 16-bit mono input.");
        return nullptr;
    }

    aec_handle_t* handle =
        aec_create(static_cast<int>(format.sample_rate_hz), kFilterLength,
                   kChannelCount, AEC_MODE_VOIP_HIGH_PERF);
    if (handle == nullptr) {
        ESP_LOGE(kTag, "aec_create failed.");
        return nullptr;
    }

    const int chunk = aec_get_chunksize(handle);
    if (chunk <= 0) {
        ESP_LOGE(kTag, "Invalid AEC chunk size %d.", chunk);
        aec_destroy(handle);
        return nullptr;
    }
    const size_t chunk_samples = static_cast<size_t>(chunk);

    int16_t* mic = AllocateChunk(chunk_samples);
    int16_t* ref = AllocateChunk(chunk_samples);
    int16_t* out = AllocateChunk(chunk_samples);
    if (mic == nullptr || ref == nullptr || out == nullptr) {
        ESP_LOGE(kTag, "Failed to allocate AEC buffers.");
        heap_caps_free(mic);
        heap_caps_free(ref);
        heap_caps_free(out);
        aec_destroy(handle);
        return nullptr;
    }

    ESP_LOGI(kTag, "AEC ready: %u samples per chunk.",
             static_cast<unsigned>(chunk_samples));
    return std::unique_ptr<AecConditioner>(
        new AecConditioner(handle, chunk_samples, mic, ref, out));
}

AecConditioner::AecConditioner(aec_handle_t* handle, size_t chunk_samples,
                               int16_t* mic, int16_t* ref, int16_t* out)
    : handle_(handle),
      chunk_samples_(chunk_samples),
      mic_(mic),
      ref_(ref),
      out_(out) {}

AecConditioner::~AecConditioner() {
    aec_destroy(handle_);
    heap_caps_free(mic_);
    heap_caps_free(ref_);
    heap_caps_free(out_);
    ESP_LOGI(kTag, "AEC released.");
}

void AecConditioner::Process(std::span<uint8_t> frame) {
    const size_t chunk_bytes = ChunkBytes();
    for (size_t offset = 0; offset + chunk_bytes <= frame.size();
         offset += chunk_bytes) {
        std::memcpy(mic_, frame.data() + offset, chunk_bytes);

        {
            std::lock_guard<std::mutex> lock(reference_mutex_);
            const size_t available =
                std::min(reference_.size(), chunk_samples_);
            std::copy_n(reference_.begin(), available, ref_);
            std::fill(ref_ + available, ref_ + chunk_samples_, 0);
            reference_.erase(reference_.begin(),
                             reference_.begin() + available);
        }

        aec_process(handle_, mic_, ref_, out_);
        std::memcpy(frame.data() + offset, out_, chunk_bytes);
    }
}

void AecConditioner::ObservePlayback(std::span<const uint8_t> played) {
    const size_t samples = played.size() / sizeof(int16_t);
    std::lock_guard<std::mutex> lock(reference_mutex_);
    for (size_t i = 0; i < samples; ++i) {
        int16_t sample;
        std::memcpy(&sample, played.data() + i * sizeof(int16_t),
                    sizeof(sample));
        reference_.push_back(sample);
    }
    const size_t limit = kMaxReferenceChunks * chunk_samples_;
    if (reference_.size() > limit) {
        reference_.erase(reference_.begin(),
                         reference_.begin() + (reference_.size() - limit));
    }
}

size_t AecConditioner::ChunkBytes() const {
    return chunk_samples_ * sizeof(int16_t);
}

}  // namespace audio
