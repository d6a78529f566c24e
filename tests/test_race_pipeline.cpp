#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "f1ar/dataset_exporter.hpp"
#include "f1ar/errors.hpp"
#include "f1ar/logger.hpp"
#include "f1ar/race_pipeline.hpp"
#include "MockTelemetrySource.hpp"
#include "TelemetryFixtures.hpp"

namespace f1ar {
namespace {

MockTelemetrySource three_driver_source() {
    MockTelemetrySource source;
    source.session = fixtures::session({fixtures::driver("1"), fixtures::driver("2"), fixtures::driver("3")});
    source.positions["1"] = fixtures::position_series({20.0, 21.0}, {0, 500}, {0, 300}, {10, 12});
    source.positions["2"] = fixtures::position_series({18.0, 19.0}, {50, 60}, {40, 30}, {11, 11});
    source.positions["3"] = fixtures::position_series({16.0, 17.0, 18.0}, {-200, 0, 100}, {10, 20, 30},
                                                      {9, 10, 11});
    source.cars["1"] = fixtures::car_series({20.0, 21.0}, {100, 50}, {0, 1}, {300, 280});
    source.cars["3"] = fixtures::car_series({16.0, 17.0, 18.0}, {10, 20, 30}, {0, 0, 0}, {90, 95, 99});
    return source;
}

} // namespace

TEST(RacePipelineTest, ProcessesEveryUsableDriver) {
    // All three drivers produce telemetry with a shared time zero.
    auto source = three_driver_source();
    RacePipeline pipeline(source, PipelineConfig{});

    const RaceDataset dataset = pipeline.run();
    ASSERT_EQ(dataset.tracks.size(), 3u);
    EXPECT_TRUE(dataset.skipped.empty());
    EXPECT_DOUBLE_EQ(dataset.time_zero, 16.0);
    EXPECT_DOUBLE_EQ(dataset.tracks[0].times.front(), 4.0);
    EXPECT_DOUBLE_EQ(dataset.tracks[2].times.front(), 0.0);
    EXPECT_EQ(dataset.tracks[1].throttle, std::vector<double>(2, 0.0));
}

TEST(RacePipelineTest, SkipsDriverMissingZChannel) {
    // Driver 2 without Z is dropped and recorded; the others survive.
    auto source = three_driver_source();
    source.positions["2"].channels.erase(channel::kZ);
    RacePipeline pipeline(source, PipelineConfig{});

    const RaceDataset dataset = pipeline.run();
    ASSERT_EQ(dataset.tracks.size(), 2u);
    EXPECT_EQ(dataset.tracks[0].driver.id, "1");
    EXPECT_EQ(dataset.tracks[1].driver.id, "3");
    ASSERT_EQ(dataset.skipped.size(), 1u);
    EXPECT_EQ(dataset.skipped[0].driver_id, "2");
    EXPECT_NE(dataset.skipped[0].reason.find("Z"), std::string::npos);
    EXPECT_EQ(dataset.roster.size(), 3u);
}

TEST(RacePipelineTest, SkipsDriverWhoseSourceThrows) {
    // A driver with no position data at all is skipped like a malformed one.
    auto source = three_driver_source();
    source.positions.erase("3");
    RacePipeline pipeline(source, PipelineConfig{});

    const RaceDataset dataset = pipeline.run();
    EXPECT_EQ(dataset.tracks.size(), 2u);
    ASSERT_EQ(dataset.skipped.size(), 1u);
    EXPECT_EQ(dataset.skipped[0].driver_id, "3");
}

TEST(RacePipelineTest, FailsWhenNoDriverIsUsable) {
    // Every driver lacking required channels is fatal, not an empty dataset.
    auto source = three_driver_source();
    for (auto& kv : source.positions) {
        kv.second.channels.erase(channel::kZ);
    }
    RacePipeline pipeline(source, PipelineConfig{});
    EXPECT_THROW(pipeline.run(), NoUsableDataError);
}

TEST(RacePipelineTest, SourceFailureIsFatal) {
    // An unavailable session propagates as SourceUnavailableError.
    auto source = three_driver_source();
    source.fail_load = true;
    RacePipeline pipeline(source, PipelineConfig{});
    EXPECT_THROW(pipeline.run(), SourceUnavailableError);
    EXPECT_EQ(source.load_calls, 1);
}

TEST(RacePipelineTest, RepeatedRunsAreByteIdentical) {
    // Same input twice gives the same serialized artifact.
    auto source = three_driver_source();
    RacePipeline pipeline(source, PipelineConfig{});
    DatasetExporter exporter(ExportConfig{});

    const auto first = exporter.to_json(pipeline.run()).dump(2);
    const auto second = exporter.to_json(pipeline.run()).dump(2);
    EXPECT_EQ(first, second);
}

TEST(RacePipelineTest, SummaryCountsPointsAndDrivers) {
    // Summary totals match the processed tracks.
    auto source = three_driver_source();
    source.positions["2"].channels.erase(channel::kZ);
    RacePipeline pipeline(source, PipelineConfig{});

    const RunSummary summary = summarize(pipeline.run());
    EXPECT_EQ(summary.total_points, 5u);
    EXPECT_EQ(summary.drivers_processed, 2u);
    EXPECT_EQ(summary.drivers_skipped, 1u);
}

TEST(RacePipelineTest, LogsEachTrackStartAtDebug) {
    // The first raw sample of every extracted driver is reported in source units.
    auto source = three_driver_source();
    RacePipeline pipeline(source, PipelineConfig{});

    Logger::set_min_level(LogLevel::Debug);
    testing::internal::CaptureStdout();
    pipeline.run();
    const std::string out = testing::internal::GetCapturedStdout();
    Logger::set_min_level(LogLevel::Info);

    EXPECT_NE(out.find("Driver 3: 3 samples, start at t=16s, position [-200, 10, 9]"), std::string::npos);
    EXPECT_NE(out.find("Driver 1: 2 samples, start at t=20s, position [0, 0, 10]"), std::string::npos);
}

} // namespace f1ar
