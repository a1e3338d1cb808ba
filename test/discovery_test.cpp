#include <atomic>
#include <cstdio>
#include <vector>

#include "discovery.hpp"
#include "fakes.hpp"
#include "gtest/gtest.h"

namespace voicelink_test {
namespace {

class SeekerTest : public ::testing::Test {
   protected:
    voicelink::Seeker::Callbacks Callbacks() {
        return {[this]() { changes++; },
                [this](int status) { finished.push_back(status); }};
    }

    FakeScanner scanner;
    voicelink::Seeker seeker{scanner};
    std::atomic<int> changes{0};
    std::vector<int> finished;
};

TEST_F(SeekerTest, ListsMarkedPeersWithNames) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    scanner.Report("00:00:00:00:00:01", true, "Alice");
    scanner.Report("00:00:00:00:00:02", false, "Stranger");

    const auto candidates = seeker.Candidates();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].peer.address, "00:00:00:00:00:01");
    EXPECT_EQ(candidates[0].peer.DisplayName(), "Alice");
}

TEST_F(SeekerTest, CorrelatesMarkerAndNameAcrossReports) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    scanner.Report("00:00:00:00:00:01", true, "");
    EXPECT_TRUE(seeker.Candidates().empty());

    // Scan response carrying only the name.
    scanner.Report("00:00:00:00:00:01", false, "Alice");
    ASSERT_EQ(seeker.Candidates().size(), 1u);

    voicelink::PeerId found;
    EXPECT_TRUE(seeker.FindCandidate("00:00:00:00:00:01", found));
    EXPECT_EQ(found.DisplayName(), "Alice");
}

TEST_F(SeekerTest, NamelessPeersAreNotListed) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    scanner.Report("00:00:00:00:00:01", true, "");
    scanner.Report("00:00:00:00:00:01", true, "");
    EXPECT_TRUE(seeker.Candidates().empty());
}

TEST_F(SeekerTest, CrowdedAirwavesStayBounded) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    char address[18];
    for (int i = 0; i < 500; ++i) {
        snprintf(address, sizeof(address), "10:00:00:00:%02X:%02X",
                 (i >> 8) & 0xFF, i & 0xFF);
        scanner.Report(address, false, "Headphones");
    }
    EXPECT_LE(seeker.pending_sightings(), voicelink::Seeker::kMaxPendingSightings);
    EXPECT_TRUE(seeker.Candidates().empty());

    scanner.Report("00:00:00:00:00:01", true, "Alice");
    ASSERT_EQ(seeker.Candidates().size(), 1u);
    EXPECT_EQ(seeker.Candidates()[0].peer.DisplayName(), "Alice");
}

TEST_F(SeekerTest, ListedPeersLeaveNoPendingSighting) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    scanner.Report("00:00:00:00:00:01", true, "");
    scanner.Report("00:00:00:00:00:02", false, "Speaker");
    scanner.Report("00:00:00:00:00:03", false, "Watch");
    EXPECT_EQ(seeker.pending_sightings(), 3u);

    scanner.Report("00:00:00:00:00:01", false, "Alice");
    ASSERT_EQ(seeker.Candidates().size(), 1u);
    EXPECT_EQ(seeker.Candidates()[0].peer.DisplayName(), "Alice");
    EXPECT_EQ(seeker.pending_sightings(), 2u);

    // Later sightings of a listed peer add nothing.
    scanner.Report("00:00:00:00:00:01", true, "Alice");
    EXPECT_EQ(seeker.pending_sightings(), 2u);
    EXPECT_EQ(seeker.Candidates().size(), 1u);
}

TEST_F(SeekerTest, DuplicateSightingsNotifyOnce) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    const int after_start = changes.load();
    scanner.Report("00:00:00:00:00:01", true, "Alice");
    scanner.Report("00:00:00:00:00:01", true, "Alice");
    scanner.Report("00:00:00:00:00:02", true, "Bob");
    scanner.Report("00:00:00:00:00:01", true, "Alice");

    EXPECT_EQ(changes.load() - after_start, 2);
    const auto candidates = seeker.Candidates();
    ASSERT_EQ(candidates.size(), 2u);
    EXPECT_EQ(candidates[0].peer.address, "00:00:00:00:00:01");
    EXPECT_EQ(candidates[1].peer.address, "00:00:00:00:00:02");
}

TEST_F(SeekerTest, NewPassStartsEmpty) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    scanner.Report("00:00:00:00:00:01", true, "Alice");
    seeker.Stop();
    EXPECT_EQ(seeker.Candidates().size(), 1u);
    EXPECT_FALSE(seeker.IsScanning());

    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()), ESP_OK);
    EXPECT_TRUE(seeker.Candidates().empty());
    EXPECT_EQ(scanner.starts.load(), 2);
}

TEST_F(SeekerTest, ForwardsFinishStatus) {
    ASSERT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 5000, Callbacks()),
              ESP_OK);
    EXPECT_EQ(scanner.last_duration.load(), 5000u);
    scanner.Finish(0);
    EXPECT_FALSE(seeker.IsScanning());
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_EQ(finished[0], 0);
}

TEST_F(SeekerTest, StartFailureIsReported) {
    scanner.start_error = ESP_ERR_INVALID_STATE;
    EXPECT_EQ(seeker.Start(voicelink::VoiceLinkMarker(), 0, Callbacks()),
              ESP_ERR_INVALID_STATE);
    EXPECT_FALSE(seeker.IsScanning());
}

class AnnouncerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        announcer.SetOnAnnouncingChanged(
            [this](bool announcing) { changes.push_back(announcing); });
    }

    FakeAdvertiser advertiser;
    voicelink::Announcer announcer{advertiser};
    std::vector<bool> changes;
};

TEST_F(AnnouncerTest, StartIsIdempotent) {
    ASSERT_EQ(announcer.Start(voicelink::VoiceLinkMarker(), "Alice", true), ESP_OK);
    ASSERT_EQ(announcer.Start(voicelink::VoiceLinkMarker(), "Alice", true), ESP_OK);
    EXPECT_EQ(advertiser.starts.load(), 1);
    EXPECT_TRUE(announcer.IsAnnouncing());
    EXPECT_EQ(advertiser.last().name, "Alice");
    EXPECT_TRUE(advertiser.last().connectable);
    EXPECT_EQ(changes, std::vector<bool>{true});
}

TEST_F(AnnouncerTest, StopWhenIdleDoesNothing) {
    announcer.Stop();
    EXPECT_EQ(advertiser.stops.load(), 0);
    EXPECT_TRUE(changes.empty());
}

TEST_F(AnnouncerTest, RadioEndingAdvertisingIsObserved) {
    ASSERT_EQ(announcer.Start(voicelink::VoiceLinkMarker(), "Alice", true), ESP_OK);
    advertiser.EndByRadio();
    EXPECT_FALSE(announcer.IsAnnouncing());
    EXPECT_EQ((std::vector<bool>{true, false}), changes);

    // Already stopped; the driver is not asked again.
    announcer.Stop();
    EXPECT_EQ(advertiser.stops.load(), 0);
}

TEST_F(AnnouncerTest, DriverErrorLeavesAnnouncerIdle) {
    advertiser.start_error = ESP_FAIL;
    EXPECT_EQ(announcer.Start(voicelink::VoiceLinkMarker(), "Alice", true),
              ESP_FAIL);
    EXPECT_FALSE(announcer.IsAnnouncing());
    EXPECT_TRUE(changes.empty());
}

}  // namespace
}  // namespace voicelink_test
