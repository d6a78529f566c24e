#include "f1ar/race_pipeline.hpp"

#include <exception>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "f1ar/errors.hpp"
#include "f1ar/logger.hpp"

namespace f1ar {
namespace {

void log_track_start(const DriverTrack& track) {
    const RawSample first = track.sample(0);
    std::ostringstream line;
    line << "Driver " << track.driver.id << ": " << track.sample_count() << " samples, start at t="
         << first.time << "s, position [" << first.position.x() << ", " << first.position.y() << ", "
         << first.position.z() << "]";
    Logger::log(LogLevel::Debug, line.str());
}

} // namespace

RacePipeline::RacePipeline(ITelemetrySource& source, const PipelineConfig& config)
    : source_(source),
      config_(config),
      extractor_(config.mapper),
      assembler_(config.assembler) {}

RaceDataset RacePipeline::run() {
    std::ostringstream banner;
    banner << "Loading " << config_.session.year << " " << config_.session.grand_prix << " "
           << config_.session.session_type << " session";
    Logger::log(LogLevel::Info, banner.str());

    SessionInfo session;
    try {
        session = source_.load_session();
    } catch (const SourceUnavailableError&) {
        throw;
    } catch (const std::exception& e) {
        throw SourceUnavailableError(std::string("Failed to load session: ") + e.what());
    }

    std::ostringstream loaded;
    loaded << "Session loaded: " << session.metadata.session_name << " ("
           << session.drivers.size() << " drivers)";
    Logger::log(LogLevel::Info, loaded.str());

    std::vector<DriverTrack> tracks;
    std::vector<SkippedDriver> skipped;
    tracks.reserve(session.drivers.size());

    for (const auto& driver : session.drivers) {
        Logger::log(LogLevel::Info, "Processing driver " + driver.id + " (" + driver.full_name + ")");
        try {
            const ChannelSeries position = source_.position_data(driver.id);
            const ChannelSeries car = source_.car_data(driver.id);
            DriverTrack track = extractor_.extract(driver, position, car);
            log_track_start(track);
            tracks.push_back(std::move(track));
        } catch (const std::exception& e) {
            Logger::log(LogLevel::Warn, "Skipping driver " + driver.id + ": " + e.what());
            skipped.push_back(SkippedDriver{driver.id, e.what()});
        }
    }

    Logger::log(LogLevel::Info, "Normalizing coordinates");
    RaceDataset dataset = assembler_.assemble(session, std::move(tracks));
    dataset.skipped = std::move(skipped);
    return dataset;
}

RunSummary summarize(const RaceDataset& dataset) {
    RunSummary summary;
    for (const auto& track : dataset.tracks) {
        summary.total_points += track.sample_count();
    }
    summary.drivers_processed = dataset.tracks.size();
    summary.drivers_skipped = dataset.skipped.size();
    return summary;
}

void log_summary(const RaceDataset& dataset) {
    const RunSummary summary = summarize(dataset);

    Logger::log(LogLevel::Info, "Total data points: " + std::to_string(summary.total_points));
    Logger::log(LogLevel::Info, "Drivers processed: " + std::to_string(summary.drivers_processed));
    if (summary.drivers_skipped > 0) {
        Logger::log(LogLevel::Warn, "Drivers skipped: " + std::to_string(summary.drivers_skipped));
        for (const auto& skip : dataset.skipped) {
            Logger::log(LogLevel::Warn, "  " + skip.driver_id + ": " + skip.reason);
        }
    }

    const char* axes[] = {"X", "Y", "Z"};
    std::ostringstream range;
    range << std::fixed << std::setprecision(1) << "Coordinate range:";
    for (Eigen::Index axis = 0; axis < 3; ++axis) {
        range << (axis == 0 ? " " : ", ") << axes[axis] << "[" << dataset.bounds.min(axis) << ", "
              << dataset.bounds.max(axis) << "]";
    }
    Logger::log(LogLevel::Info, range.str());
}

} // namespace f1ar
