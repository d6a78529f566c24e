#pragma once

#include "f1ar/coordinate_mapper.hpp"
#include "f1ar/telemetry_types.hpp"

namespace f1ar {

// Merges one driver's position and car series, validates the required
// channels and returns a time-ordered track in target units. Spatial
// normalization and the time shift are left to the assembler.
// Throws ExtractionError when X, Y, Z or SessionTime is missing or the
// positional samples are empty or non-finite; std::invalid_argument when a
// series is malformed.
class DriverTrackExtractor {
public:
    explicit DriverTrackExtractor(const CoordinateMapperConfig& config);
    DriverTrack extract(const DriverInfo& driver,
                        const ChannelSeries& position,
                        const ChannelSeries& car) const;

private:
    CoordinateMapper mapper_;
};

} // namespace f1ar
