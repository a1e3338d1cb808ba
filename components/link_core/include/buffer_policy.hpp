#ifndef VOICELINK_BUFFER_POLICY_HPP_
#define VOICELINK_BUFFER_POLICY_HPP_

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "audio_device.hpp"

namespace voicelink {

/**
 * @brief Computes the per-session frame size.
 *
 * The result is at least `min_frame_bytes`, a whole number of sample frames
 * of `format`, and, when `chunk_bytes` is non-zero, a whole number of
 * conditioner chunks.
 *
 * @return The frame size in bytes, or 0 if the inputs are unusable.
 */
size_t ComputeFrameBytes(const AudioFormat& format, size_t min_frame_bytes,
                         size_t chunk_bytes);

/**
 * @class AudioFrame
 * @brief Fixed-capacity byte buffer reused for every pump iteration.
 */
class AudioFrame {
   public:
    explicit AudioFrame(size_t capacity) : storage_(capacity), size_(0) {}

    AudioFrame(const AudioFrame&) = delete;
    AudioFrame& operator=(const AudioFrame&) = delete;

    size_t capacity() const { return storage_.size(); }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    /**
     * @brief The whole buffer, for a device or stream read to fill.
     */
    std::span<uint8_t> writable() { return std::span<uint8_t>(storage_); }

    /**
     * @brief Marks the first `size` bytes as valid, clamped to capacity.
     */
    void set_size(size_t size) {
        size_ = size < storage_.size() ? size : storage_.size();
    }

    std::span<uint8_t> data() {
        return std::span<uint8_t>(storage_.data(), size_);
    }
    std::span<const uint8_t> data() const {
        return std::span<const uint8_t>(storage_.data(), size_);
    }

   private:
    std::vector<uint8_t> storage_;
    size_t size_;
};

}  // namespace voicelink

#endif  // VOICELINK_BUFFER_POLICY_HPP_
