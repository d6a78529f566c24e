#pragma once
// Upstream telemetry source abstraction for cached and mock sessions.

#include <string>

#include "f1ar/telemetry_types.hpp"

namespace f1ar {

class ITelemetrySource {
public:
    virtual ~ITelemetrySource() = default;

    // Throws SourceUnavailableError when the session cannot be loaded.
    virtual SessionInfo load_session() = 0;

    virtual ChannelSeries position_data(const std::string& driver_id) = 0;
    virtual ChannelSeries car_data(const std::string& driver_id) = 0;
};

} // namespace f1ar
