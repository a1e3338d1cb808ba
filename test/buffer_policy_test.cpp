#include "buffer_policy.hpp"
#include "gtest/gtest.h"

namespace {

TEST(ComputeFrameBytesTest, RoundsToWholeSampleFrames) {
    voicelink::AudioFormat stereo{16000, 2, 16};
    EXPECT_EQ(voicelink::ComputeFrameBytes(stereo, 10, 0), 12u);
    EXPECT_EQ(voicelink::ComputeFrameBytes(voicelink::kVoiceFormat, 641, 0), 642u);
}

TEST(ComputeFrameBytesTest, AlignsToConditionerChunks) {
    // 512-sample chunks of 16-bit mono.
    EXPECT_EQ(voicelink::ComputeFrameBytes(voicelink::kVoiceFormat, 512, 1024), 1024u);
    EXPECT_EQ(voicelink::ComputeFrameBytes(voicelink::kVoiceFormat, 1500, 1024), 2048u);

    voicelink::AudioFormat stereo{16000, 2, 16};
    EXPECT_EQ(voicelink::ComputeFrameBytes(stereo, 100, 6), 108u);
}

TEST(ComputeFrameBytesTest, KeepsExactMinimum) {
    EXPECT_EQ(voicelink::ComputeFrameBytes(voicelink::kVoiceFormat, 320, 64), 320u);
}

TEST(ComputeFrameBytesTest, RejectsUnusableInputs) {
    EXPECT_EQ(voicelink::ComputeFrameBytes(voicelink::kVoiceFormat, 0, 64), 0u);
    voicelink::AudioFormat silent{16000, 0, 16};
    EXPECT_EQ(voicelink::ComputeFrameBytes(silent, 320, 0), 0u);
}

TEST(AudioFrameTest, SizeIsClampedToCapacity) {
    voicelink::AudioFrame frame(8);
    EXPECT_TRUE(frame.empty());
    frame.set_size(20);
    EXPECT_EQ(frame.size(), 8u);
    EXPECT_EQ(frame.data().size(), 8u);
    EXPECT_EQ(frame.writable().size(), 8u);
}

}  // namespace
