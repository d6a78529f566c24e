#include "f1ar/driver_track_extractor.hpp"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include "f1ar/channel_merge.hpp"
#include "f1ar/errors.hpp"
#include "f1ar/logger.hpp"
#include "f1ar/validator.hpp"

namespace f1ar {
namespace {

std::string join(const std::vector<std::string>& names) {
    std::ostringstream out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << names[i];
    }
    return out.str();
}

std::vector<double> optional_channel(const ChannelSeries& series,
                                     const std::string& name,
                                     std::size_t count,
                                     const std::string& driver_id) {
    const auto it = series.channels.find(name);
    if (it == series.channels.end()) {
        Logger::log(LogLevel::Debug, "Driver " + driver_id + " has no " + name + " channel; using zeros.");
        return std::vector<double>(count, 0.0);
    }
    return it->second;
}

} // namespace

DriverTrackExtractor::DriverTrackExtractor(const CoordinateMapperConfig& config) : mapper_(config) {}

DriverTrack DriverTrackExtractor::extract(const DriverInfo& driver,
                                          const ChannelSeries& position,
                                          const ChannelSeries& car) const {
    const ChannelSeries merged = merge_channels(position, car);

    const auto missing = Validator::missing_required_channels(merged);
    if (!missing.empty()) {
        throw ExtractionError("Missing required channels for driver " + driver.id + ": " + join(missing));
    }

    const std::size_t count = merged.size();
    if (count == 0) {
        throw ExtractionError("No positional samples for driver " + driver.id);
    }

    DriverTrack track;
    track.driver = driver;

    track.times.reserve(count);
    for (const auto& t : *merged.session_time) {
        track.times.push_back(to_seconds(t));
    }
    if (!Validator::validate_time_axis(track.times)) {
        throw ExtractionError("Invalid SessionTime axis for driver " + driver.id);
    }

    const auto& xs = merged.channels.at(channel::kX);
    const auto& ys = merged.channels.at(channel::kY);
    const auto& zs = merged.channels.at(channel::kZ);
    track.source_positions.resize(static_cast<Eigen::Index>(count), 3);
    for (std::size_t i = 0; i < count; ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        track.source_positions(row, 0) = xs[i];
        track.source_positions(row, 1) = ys[i];
        track.source_positions(row, 2) = zs[i];
    }
    if (!Validator::validate_positions(track.source_positions)) {
        throw ExtractionError("Non-finite position samples for driver " + driver.id);
    }

    track.throttle = optional_channel(merged, channel::kThrottle, count, driver.id);
    track.brake = optional_channel(merged, channel::kBrake, count, driver.id);
    track.speed = optional_channel(merged, channel::kSpeed, count, driver.id);

    track.positions = mapper_.process(track.source_positions);
    return track;
}

} // namespace f1ar
