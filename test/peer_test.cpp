#include "gtest/gtest.h"
#include "peer.hpp"

namespace {

TEST(MarkerTest, ParsesCanonicalText) {
    voicelink::Marker marker;
    ASSERT_TRUE(
        voicelink::Marker::FromString("8ce255c0-200a-11e0-ac64-0800200c9a66", marker));
    EXPECT_EQ(marker, voicelink::VoiceLinkMarker());
    EXPECT_EQ(marker.ToString(), "8ce255c0-200a-11e0-ac64-0800200c9a66");
}

TEST(MarkerTest, AcceptsUpperCaseHex) {
    voicelink::Marker marker;
    ASSERT_TRUE(
        voicelink::Marker::FromString("8CE255C0-200A-11E0-AC64-0800200C9A66", marker));
    EXPECT_EQ(marker, voicelink::VoiceLinkMarker());
}

TEST(MarkerTest, RejectsMalformedText) {
    voicelink::Marker marker;
    EXPECT_FALSE(voicelink::Marker::FromString("", marker));
    EXPECT_FALSE(
        voicelink::Marker::FromString("8ce255c0200a11e0ac640800200c9a66", marker));
    EXPECT_FALSE(
        voicelink::Marker::FromString("8ce255c0-200a-11e0-ac64-0800200c9a6g", marker));
    EXPECT_FALSE(
        voicelink::Marker::FromString("8ce255c-0200a-11e0-ac64-0800200c9a66", marker));
}

TEST(PeerIdTest, EqualityIgnoresLabel) {
    voicelink::PeerId a{"AA:BB:CC:DD:EE:FF", std::string("Alice")};
    voicelink::PeerId b{"AA:BB:CC:DD:EE:FF", std::nullopt};
    voicelink::PeerId c{"AA:BB:CC:DD:EE:00", std::string("Alice")};
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(PeerIdTest, DisplayNameFallsBackToAddress) {
    voicelink::PeerId named{"AA:BB:CC:DD:EE:FF", std::string("Alice")};
    voicelink::PeerId unnamed{"AA:BB:CC:DD:EE:FF", std::nullopt};
    voicelink::PeerId empty{"AA:BB:CC:DD:EE:FF", std::string()};
    EXPECT_EQ(named.DisplayName(), "Alice");
    EXPECT_EQ(unnamed.DisplayName(), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(empty.DisplayName(), "AA:BB:CC:DD:EE:FF");
}

TEST(ServiceIdTest, VoiceServiceIsFixed) {
    EXPECT_EQ(voicelink::VoiceLinkService().name, "AudioShareService");
    EXPECT_EQ(voicelink::VoiceLinkService().channel, 0x00C5);
}

}  // namespace
