#pragma once

#include "f1ar/telemetry_types.hpp"

namespace f1ar {

// Returns one series on the positional SessionTime axis, stably sorted by time.
// Car channels not already present in the position series are resampled onto
// that axis from the car sample nearest in time (ties resolve to the earlier
// sample). If either input lacks a SessionTime axis no car channels are merged.
// Throws std::invalid_argument if a channel's length disagrees with its time axis.
ChannelSeries merge_channels(const ChannelSeries& position, const ChannelSeries& car);

} // namespace f1ar
