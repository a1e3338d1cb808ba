#include "gtest/gtest.h"
#include "settings.hpp"

namespace {

TEST(ParseSettingsTest, ReadsEveryKey) {
    storage::Settings settings;
    const size_t rejected = storage::ParseSettings(
        "device_name=Kitchen\n"
        "radio_allowed=false\n"
        "microphone_allowed=0\n"
        "transmit_on_connect=true\n"
        "echo_cancellation=false\n"
        "connect_timeout_ms=2500\n"
        "scan_duration_ms=30000\n",
        settings);

    EXPECT_EQ(rejected, 0u);
    EXPECT_EQ(settings.device_name, "Kitchen");
    EXPECT_FALSE(settings.radio_allowed);
    EXPECT_FALSE(settings.microphone_allowed);
    EXPECT_TRUE(settings.transmit_on_connect);
    EXPECT_FALSE(settings.echo_cancellation);
    EXPECT_EQ(settings.connect_timeout_ms, 2500u);
    EXPECT_EQ(settings.scan_duration_ms, 30000u);
}

TEST(ParseSettingsTest, SkipsCommentsAndWhitespace) {
    storage::Settings settings;
    const size_t rejected = storage::ParseSettings(
        "# saved by the console\r\n"
        "\n"
        "  device_name =  Porch Unit \r\n",
        settings);
    EXPECT_EQ(rejected, 0u);
    EXPECT_EQ(settings.device_name, "Porch Unit");
}

TEST(ParseSettingsTest, KeepsDefaultsForBadLines) {
    storage::Settings settings;
    const size_t rejected = storage::ParseSettings(
        "volume=11\n"
        "radio_allowed=maybe\n"
        "connect_timeout_ms=0\n"
        "scan_duration_ms=-5\n"
        "device_name=\n"
        "no equals sign\n"
        "transmit_on_connect=true",
        settings);

    EXPECT_EQ(rejected, 6u);
    const storage::Settings defaults;
    EXPECT_EQ(settings.device_name, defaults.device_name);
    EXPECT_EQ(settings.radio_allowed, defaults.radio_allowed);
    EXPECT_EQ(settings.connect_timeout_ms, defaults.connect_timeout_ms);
    EXPECT_EQ(settings.scan_duration_ms, defaults.scan_duration_ms);
    EXPECT_TRUE(settings.transmit_on_connect);
}

TEST(ParseSettingsTest, RejectsNamesTooLongToAdvertise) {
    storage::Settings settings;
    EXPECT_EQ(storage::ParseSettings(
                  "device_name=" + std::string(30, 'x') + "\n", settings),
              1u);
    EXPECT_EQ(settings.device_name, "VoiceLink");
}

TEST(SerializeSettingsTest, ParsesBackToTheSameValues) {
    storage::Settings original;
    original.device_name = "Garage";
    original.microphone_allowed = false;
    original.scan_duration_ms = 15000;

    storage::Settings parsed;
    EXPECT_EQ(storage::ParseSettings(storage::SerializeSettings(original),
                                     parsed),
              0u);
    EXPECT_EQ(parsed.device_name, "Garage");
    EXPECT_FALSE(parsed.microphone_allowed);
    EXPECT_EQ(parsed.scan_duration_ms, 15000u);
    EXPECT_EQ(parsed.connect_timeout_ms, original.connect_timeout_ms);
}

}  // namespace
