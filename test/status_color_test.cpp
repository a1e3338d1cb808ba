#include "gtest/gtest.h"
#include "status_color.hpp"

namespace {

voicelink::StatusView View(voicelink::Phase phase) {
    voicelink::StatusView view;
    view.phase = phase;
    return view;
}

TEST(StatusColorTest, IdleIsOff) {
    EXPECT_EQ(led::StatusColor(View(voicelink::Phase::kIdle)), led::Color{});
}

TEST(StatusColorTest, DiscoveryIsBlue) {
    const led::Color listening = led::StatusColor(View(voicelink::Phase::kListening));
    EXPECT_GT(listening.blue, 0);
    EXPECT_EQ(listening.red, 0);
    EXPECT_EQ(listening.green, 0);
    EXPECT_EQ(led::StatusColor(View(voicelink::Phase::kScanning)), listening);
}

TEST(StatusColorTest, TransmittingIsBrighterGreen) {
    voicelink::StatusView view = View(voicelink::Phase::kConnected);
    const led::Color muted = led::StatusColor(view);
    view.transmitting = true;
    const led::Color live = led::StatusColor(view);
    EXPECT_GT(muted.green, 0);
    EXPECT_GT(live.green, muted.green);
    EXPECT_EQ(live.red, 0);
}

TEST(StatusColorTest, FailureIsRed) {
    voicelink::StatusView view = View(voicelink::Phase::kIdle);
    view.last_failure = voicelink::Failure{voicelink::LinkError::kStreamError, 0};
    const led::Color color = led::StatusColor(view);
    EXPECT_GT(color.red, 0);
    EXPECT_EQ(color.green, 0);
    EXPECT_EQ(led::StatusColor(View(voicelink::Phase::kFailed)), color);
}

}  // namespace
