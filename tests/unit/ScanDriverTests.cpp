#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "wifitrack/core/Clock.hpp"
#include "wifitrack/core/Errors.hpp"
#include "wifitrack/data/ScanSource.hpp"
#include "wifitrack/pipeline/ScanDriver.hpp"

namespace wifitrack {

// Replays a fixed list of device sets, stamped with the shared clock.
class ScriptedSource final : public IScanSource {
public:
  ScriptedSource(std::shared_ptr<ManualClock> clock, std::vector<std::vector<std::string>> script)
      : clock(std::move(clock)), script(std::move(script)) {}

  bool next(Snapshot_t& out) override {
    if (index >= script.size()) {
      return false;
    }
    if (failAt >= 0 && static_cast<int>(index) == failAt) {
      throw ScanUnavailableError("radio went away");
    }
    out = Snapshot_t{};
    out.time = clock->now();
    for (const std::string& id : script[index]) {
      Sighting_t sighting;
      sighting.deviceId = id;
      out.sightings.push_back(sighting);
    }
    ++index;
    clock->advance(scanCost);
    if (onScan) {
      onScan(index);
    }
    return true;
  }

  double scanCost = 0.0;
  int failAt = -1;
  std::function<void(std::size_t)> onScan;
  std::size_t calls() const { return index; }

private:
  std::shared_ptr<ManualClock> clock;
  std::vector<std::vector<std::string>> script;
  std::size_t index = 0;
};

// Emits snapshots of device "a" at the given times, ignoring the clock.
class TimedSource final : public IScanSource {
public:
  explicit TimedSource(std::vector<double> times) : times(std::move(times)) {}

  bool next(Snapshot_t& out) override {
    if (index >= times.size()) {
      return false;
    }
    out = Snapshot_t{};
    out.time = times[index++];
    Sighting_t sighting;
    sighting.deviceId = "a";
    out.sightings.push_back(sighting);
    return true;
  }

private:
  std::vector<double> times;
  std::size_t index = 0;
};

} // namespace wifitrack

namespace {

wifitrack::DriverOptions_t makeOptions(double interval, double duration) {
  wifitrack::DriverOptions_t options;
  options.threshold = 5.0;
  options.scanInterval = interval;
  options.scanDuration = duration;
  return options;
}

} // namespace

TEST(ScanDriverTests, SamplesOnFixedCadenceUntilDurationElapses) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 20.0));

  const wifitrack::RunResult_t result = driver.run();

  EXPECT_EQ(result.scanCount, 4u);
  EXPECT_FALSE(result.stoppedEarly);
  EXPECT_DOUBLE_EQ(result.origin, 0.0);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_DOUBLE_EQ(result.records[0].interval.start, 0.0);
  EXPECT_DOUBLE_EQ(result.records[0].interval.end, 15.0);
}

TEST(ScanDriverTests, ScanTimeDoesNotShiftTicks) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  source->scanCost = 2.0;
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 20.0));

  const auto result = driver.run();
  EXPECT_EQ(result.scanCount, 4u);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_DOUBLE_EQ(result.records[0].interval.end, 15.0);
}

TEST(ScanDriverTests, OverrunningScanSkipsMissedTicks) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  source->scanCost = 7.0;
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 20.0));

  const auto result = driver.run();
  // Scans start at 0 and 10; the 5 and 15 ticks were lost to overruns.
  EXPECT_EQ(result.scanCount, 2u);
  ASSERT_EQ(result.records.size(), 2u);
  EXPECT_DOUBLE_EQ(result.records[0].interval.end, 0.0);
  EXPECT_DOUBLE_EQ(result.records[1].interval.start, 10.0);
}

TEST(ScanDriverTests, SplitsIntervalsWhenDeviceGoesQuiet) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>{{"a", "b"}, {"a"}, {"a"}, {"a", "b"}});
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 0.0));

  const auto result = driver.run();
  EXPECT_EQ(result.scanCount, 4u);
  const auto b = driver.tracker().intervalsFor("b");
  ASSERT_EQ(b.size(), 2u);
  EXPECT_DOUBLE_EQ(b[0].start, 0.0);
  EXPECT_DOUBLE_EQ(b[0].end, 0.0);
  EXPECT_DOUBLE_EQ(b[1].start, 15.0);
  const auto a = driver.tracker().intervalsFor("a");
  ASSERT_EQ(a.size(), 1u);
  EXPECT_DOUBLE_EQ(a[0].end, 15.0);
}

TEST(ScanDriverTests, HonorsMaxScans) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  auto options = makeOptions(0.0, 0.0);
  options.maxScans = 3;
  wifitrack::ScanDriver driver(source, clock, options);

  const auto result = driver.run();
  EXPECT_EQ(result.scanCount, 3u);
  EXPECT_EQ(source->calls(), 3u);
}

TEST(ScanDriverTests, StopRequestFinalizesOpenSpans) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 0.0));
  source->onScan = [&driver](std::size_t calls) {
    if (calls == 3) {
      driver.requestStop();
    }
  };

  const auto result = driver.run();
  EXPECT_TRUE(result.stoppedEarly);
  EXPECT_EQ(result.scanCount, 3u);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_DOUBLE_EQ(result.records[0].interval.start, 0.0);
  EXPECT_DOUBLE_EQ(result.records[0].interval.end, 10.0);
  EXPECT_TRUE(driver.tracker().isFinalized());
}

TEST(ScanDriverTests, CountdownDelaysFirstScan) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>{{"a"}});
  auto options = makeOptions(5.0, 0.0);
  options.startAfter = 3.0;
  wifitrack::ScanDriver driver(source, clock, options);

  const auto result = driver.run();
  EXPECT_DOUBLE_EQ(result.origin, 3.0);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_DOUBLE_EQ(result.records[0].interval.start, 3.0);
}

TEST(ScanDriverTests, ScanFailureFinalizesAndPropagates) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(10, std::vector<std::string>{"a"}));
  source->failAt = 2;
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 0.0));

  EXPECT_THROW(driver.run(), wifitrack::ScanUnavailableError);
  EXPECT_TRUE(driver.tracker().isFinalized());
  ASSERT_EQ(driver.tracker().closedIntervals().size(), 1u);
  EXPECT_DOUBLE_EQ(driver.tracker().closedIntervals()[0].end, 5.0);
}

TEST(ScanDriverTests, InstantScanReturnsSingleSnapshot) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>{{"a", "b"}});
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 60.0));

  const auto snapshot = driver.runInstant();
  EXPECT_EQ(snapshot.sightings.size(), 2u);
  EXPECT_THROW(driver.runInstant(), wifitrack::ScanUnavailableError);
}

TEST(ScanDriverTests, RejectsInvalidOptions) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(clock, std::vector<std::vector<std::string>>{});
  EXPECT_THROW({ wifitrack::ScanDriver driver(source, clock, makeOptions(-1.0, 10.0)); },
               wifitrack::PreconditionError);
  auto options = makeOptions(5.0, 10.0);
  options.threshold = 0.0;
  EXPECT_THROW({ wifitrack::ScanDriver driver(source, clock, options); }, wifitrack::PreconditionError);
  EXPECT_THROW({ wifitrack::ScanDriver driver(nullptr, clock, makeOptions(5.0, 10.0)); },
               wifitrack::PreconditionError);
}

TEST(ScanDriverTests, StopAppliesToOneRunOnly) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::ScriptedSource>(
      clock, std::vector<std::vector<std::string>>(3, std::vector<std::string>{"a"}));
  wifitrack::ScanDriver driver(source, clock, makeOptions(5.0, 0.0));

  driver.requestStop();
  const auto stopped = driver.run();
  EXPECT_TRUE(stopped.stoppedEarly);
  EXPECT_EQ(stopped.scanCount, 0u);
  EXPECT_FALSE(driver.stopRequested());

  const auto resumed = driver.run();
  EXPECT_FALSE(resumed.stoppedEarly);
  EXPECT_EQ(resumed.scanCount, 3u);
  ASSERT_EQ(resumed.records.size(), 1u);
  EXPECT_DOUBLE_EQ(resumed.records[0].interval.end, 10.0);
}

TEST(ScanDriverTests, SnapshotGoingBackwardsFinalizesAndPropagates) {
  auto clock = std::make_shared<wifitrack::ManualClock>();
  auto source = std::make_shared<wifitrack::TimedSource>(std::vector<double>{0.0, 5.0, 3.0});
  wifitrack::ScanDriver driver(source, clock, makeOptions(0.0, 0.0));

  EXPECT_THROW(driver.run(), wifitrack::PreconditionError);
  EXPECT_TRUE(driver.tracker().isFinalized());
  ASSERT_EQ(driver.tracker().closedIntervals().size(), 1u);
  EXPECT_DOUBLE_EQ(driver.tracker().closedIntervals()[0].start, 0.0);
  EXPECT_DOUBLE_EQ(driver.tracker().closedIntervals()[0].end, 5.0);
}
