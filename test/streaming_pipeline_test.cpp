#include <array>
#include <mutex>
#include <vector>

#include "fakes.hpp"
#include "gtest/gtest.h"
#include "streaming_pipeline.hpp"

namespace voicelink_test {
namespace {

const voicelink::PeerId kLocal{"02:00:00:00:00:01", std::string("Local")};
const voicelink::PeerId kRemote{"02:00:00:00:00:02", std::string("Remote")};

class StreamingPipelineTest : public ::testing::Test {
   protected:
    void SetUp() override {
        auto [mine, theirs] = MakePipe(kRemote, kLocal);
        local = std::move(mine);
        remote = std::move(theirs);
        pipeline.SetFaultCallback([this](const voicelink::StreamFault& fault) {
            std::lock_guard<std::mutex> lock(mutex);
            faults.push_back(fault);
        });
    }

    void TearDown() override {
        pipeline.RequestStop();
        local->Shutdown();
        pipeline.Join();
    }

    std::vector<voicelink::StreamFault> Faults() {
        std::lock_guard<std::mutex> lock(mutex);
        return faults;
    }

    bool SawFault(voicelink::PumpDirection direction) {
        for (const auto& fault : Faults()) {
            if (fault.direction == direction) {
                return true;
            }
        }
        return false;
    }

    void SendFromRemote(size_t bytes) {
        std::vector<uint8_t> data(bytes, 0x22);
        ASSERT_EQ(remote->Write(data), ESP_OK);
    }

    FakeAudioFactory audio;
    FakeCapabilities capabilities;
    voicelink::StreamingPipeline pipeline{audio, capabilities};
    std::unique_ptr<PipeStream> local;
    std::unique_ptr<PipeStream> remote;

    std::mutex mutex;
    std::vector<voicelink::StreamFault> faults;
};

TEST_F(StreamingPipelineTest, PlaysInboundAudio) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    EXPECT_TRUE(pipeline.IsBound());
    EXPECT_TRUE(pipeline.HasSession());
    EXPECT_EQ(pipeline.frame_bytes(), FakeAudioFactory::kMinFrameBytes);

    SendFromRemote(1000);
    EXPECT_TRUE(WaitUntil(
        [this]() { return audio.stats->playback_bytes.load() == 1000; }));
    EXPECT_GT(pipeline.frames_received(), 0u);
    // Played audio is handed to the echo canceller as its reference.
    EXPECT_GT(audio.stats->observed_frames.load(), 0);
}

TEST_F(StreamingPipelineTest, StartsMuted) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    EXPECT_FALSE(pipeline.IsTransmitting());
    EXPECT_EQ(audio.stats->capture_starts.load(), 0);
    EXPECT_EQ(pipeline.frames_sent(), 0u);
}

TEST_F(StreamingPipelineTest, UnmuteSendsConditionedFrames) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    EXPECT_TRUE(pipeline.IsTransmitting());

    std::array<uint8_t, 64> received{};
    size_t bytes_read = 0;
    ASSERT_EQ(remote->Read(received, bytes_read), ESP_OK);
    ASSERT_GT(bytes_read, 0u);
    EXPECT_EQ(received[0], 0x11);
    EXPECT_TRUE(WaitUntil([this]() { return pipeline.frames_sent() > 0; }));
    EXPECT_GT(audio.stats->conditioned_frames.load(), 0);
}

TEST_F(StreamingPipelineTest, MuteStopsCaptureWithoutReleasingIt) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(false), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);

    EXPECT_EQ(audio.stats->opens.load(), 1);
    EXPECT_EQ(audio.stats->capture_starts.load(), 2);
    EXPECT_EQ(audio.stats->capture_stops.load(), 1);
    EXPECT_EQ(audio.stats->conditioners_destroyed.load(), 0);
    EXPECT_TRUE(pipeline.HasSession());
    EXPECT_TRUE(Faults().empty());
}

TEST_F(StreamingPipelineTest, WriteFailureReportsOutboundFault) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    local->fail_writes = true;
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);

    EXPECT_TRUE(WaitUntil(
        [this]() { return SawFault(voicelink::PumpDirection::kOutbound); }));
    EXPECT_TRUE(WaitUntil([this]() { return !pipeline.IsTransmitting(); }));
    EXPECT_EQ(Faults().size(), 1u);
}

TEST_F(StreamingPipelineTest, PeerCloseReportsEndOfStreamAndMutes) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    remote->Shutdown();

    ASSERT_TRUE(WaitUntil(
        [this]() { return SawFault(voicelink::PumpDirection::kInbound); }));
    for (const auto& fault : Faults()) {
        if (fault.direction == voicelink::PumpDirection::kInbound) {
            EXPECT_EQ(fault.error, ESP_OK);
        }
    }
    EXPECT_TRUE(WaitUntil([this]() { return !pipeline.IsTransmitting(); }));
}

TEST_F(StreamingPipelineTest, DeniedMicrophoneIsNotAllowed) {
    capabilities.microphone = false;
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    EXPECT_EQ(pipeline.SetTransmitting(true), ESP_ERR_NOT_ALLOWED);
    EXPECT_FALSE(pipeline.IsTransmitting());
    EXPECT_EQ(audio.stats->capture_starts.load(), 0);
}

TEST_F(StreamingPipelineTest, OpenFailureKeepsBindingForRetry) {
    audio.open_error = ESP_ERR_NOT_FOUND;
    EXPECT_EQ(pipeline.Start(*local), ESP_ERR_NOT_FOUND);
    EXPECT_TRUE(pipeline.IsBound());
    EXPECT_FALSE(pipeline.HasSession());

    audio.open_error = ESP_OK;
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    EXPECT_TRUE(pipeline.HasSession());
    EXPECT_TRUE(pipeline.IsTransmitting());
}

TEST_F(StreamingPipelineTest, OpenFailureStillNoticesPeerClose) {
    audio.open_error = ESP_ERR_NOT_FOUND;
    EXPECT_EQ(pipeline.Start(*local), ESP_ERR_NOT_FOUND);

    remote->Shutdown();
    EXPECT_TRUE(WaitUntil(
        [this]() { return SawFault(voicelink::PumpDirection::kInbound); }));
}

TEST_F(StreamingPipelineTest, AudioBeforeTheSessionOpensIsDropped) {
    audio.open_error = ESP_ERR_NOT_FOUND;
    EXPECT_EQ(pipeline.Start(*local), ESP_ERR_NOT_FOUND);

    SendFromRemote(200);
    ASSERT_TRUE(WaitUntil([this]() { return pipeline.frames_discarded() > 0; }));
    EXPECT_EQ(audio.stats->playback_bytes.load(), 0);
    EXPECT_EQ(pipeline.frames_received(), 0u);

    audio.open_error = ESP_OK;
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    SendFromRemote(300);
    EXPECT_TRUE(WaitUntil(
        [this]() { return audio.stats->playback_bytes.load() == 300; }));
    EXPECT_TRUE(Faults().empty());
}

TEST_F(StreamingPipelineTest, TransmitRequiresABoundStream) {
    EXPECT_EQ(pipeline.SetTransmitting(true), ESP_ERR_INVALID_STATE);
}

TEST_F(StreamingPipelineTest, CaptureFailureKeepsInboundRunning) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    audio.stats->capture_fails = true;
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);

    EXPECT_TRUE(WaitUntil(
        [this]() { return SawFault(voicelink::PumpDirection::kCapture); }));
    EXPECT_FALSE(SawFault(voicelink::PumpDirection::kInbound));

    SendFromRemote(100);
    EXPECT_TRUE(WaitUntil(
        [this]() { return audio.stats->playback_bytes.load() == 100; }));
}

TEST_F(StreamingPipelineTest, JoinReleasesConditionerOnce) {
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    EXPECT_EQ(audio.stats->conditioners_alive.load(), 1);

    pipeline.RequestStop();
    local->Shutdown();
    pipeline.Join();

    EXPECT_FALSE(pipeline.IsBound());
    EXPECT_FALSE(pipeline.HasSession());
    EXPECT_EQ(audio.stats->conditioners_alive.load(), 0);
    EXPECT_EQ(audio.stats->conditioners_destroyed.load(), 1);
    // A local stop is not a fault.
    EXPECT_TRUE(Faults().empty());

    pipeline.Join();
    EXPECT_EQ(audio.stats->conditioners_destroyed.load(), 1);
}

TEST_F(StreamingPipelineTest, WorksWithoutConditioner) {
    audio.with_conditioner = false;
    ASSERT_EQ(pipeline.Start(*local), ESP_OK);
    ASSERT_EQ(pipeline.SetTransmitting(true), ESP_OK);
    EXPECT_TRUE(WaitUntil([this]() { return pipeline.frames_sent() > 0; }));
    EXPECT_EQ(audio.stats->conditioned_frames.load(), 0);
}

}  // namespace
}  // namespace voicelink_test
