#include "buffer_policy.hpp"

#include <numeric>

namespace {
size_t RoundUp(size_t value, size_t multiple) {
    if (multiple == 0) {
        return value;
    }
    return ((value + multiple - 1) / multiple) * multiple;
}
}  // namespace

namespace voicelink {

size_t ComputeFrameBytes(const AudioFormat& format, size_t min_frame_bytes,
                         size_t chunk_bytes) {
    const size_t sample_frame = format.BytesPerSampleFrame();
    if (sample_frame == 0 || min_frame_bytes == 0) {
        return 0;
    }

    size_t step = sample_frame;
    if (chunk_bytes != 0) {
        step = std::lcm(sample_frame, chunk_bytes);
    }
    return RoundUp(min_frame_bytes, step);
}

}  // namespace voicelink
