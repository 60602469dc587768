#include <string>

#include <gtest/gtest.h>

#include "wifitrack/core/Errors.hpp"
#include "wifitrack/data/ReplayScanSource.hpp"

namespace {

std::string dataPath(const std::string& name) {
  return std::string(WIFITRACK_TEST_DATA_DIR) + "/" + name;
}

} // namespace

TEST(ReplayScanSourceTests, ReadsSnapshotsAndSkipsInvalidLines) {
  wifitrack::ReplayScanSource source(dataPath("replay_scans.jsonl"));

  wifitrack::Snapshot_t snapshot;
  ASSERT_TRUE(source.next(snapshot));
  EXPECT_DOUBLE_EQ(snapshot.time, 0.0);
  ASSERT_EQ(snapshot.sightings.size(), 2u);
  EXPECT_EQ(snapshot.sightings[0].deviceId, "f4:bd:9e:00:00:01");
  EXPECT_EQ(snapshot.sightings[0].attributes.channel, 6);
  EXPECT_EQ(snapshot.sightings[1].attributes.ssid, "guest");

  std::size_t count = 1;
  double lastTime = snapshot.time;
  while (source.next(snapshot)) {
    EXPECT_GE(snapshot.time, lastTime);
    lastTime = snapshot.time;
    ++count;
  }
  EXPECT_EQ(count, 4u);
  EXPECT_DOUBLE_EQ(lastTime, 20.0);
  EXPECT_EQ(source.invalidLines(), 1u);
}

TEST(ReplayScanSourceTests, MissingFileIsScanUnavailable) {
  EXPECT_THROW({ wifitrack::ReplayScanSource source(dataPath("does_not_exist.jsonl")); },
               wifitrack::ScanUnavailableError);
}
