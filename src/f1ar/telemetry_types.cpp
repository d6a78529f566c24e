#include "f1ar/telemetry_types.hpp"

#include <stdexcept>
#include <string>

namespace f1ar {

bool ChannelSeries::has_channel(const std::string& name) const {
    if (name == channel::kSessionTime) {
        return session_time.has_value();
    }
    return channels.find(name) != channels.end();
}

std::size_t ChannelSeries::size() const {
    if (session_time.has_value()) {
        return session_time->size();
    }
    if (!channels.empty()) {
        return channels.begin()->second.size();
    }
    return 0;
}

RawSample DriverTrack::sample(std::size_t index) const {
    if (index >= times.size()) {
        throw std::out_of_range("Sample index " + std::to_string(index) + " out of range for driver " +
                                driver.id);
    }
    RawSample out;
    out.position = source_positions.row(static_cast<Eigen::Index>(index)).transpose();
    out.time = times[index];
    out.throttle = throttle[index];
    out.brake = brake[index];
    out.speed = speed[index];
    return out;
}

} // namespace f1ar
