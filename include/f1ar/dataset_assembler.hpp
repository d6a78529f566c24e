#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "f1ar/telemetry_types.hpp"

namespace f1ar {

enum class ReferencePathRule {
    FirstDriver,
    LongestTrack
};

// Accepts "first" or "longest". Throws std::runtime_error otherwise.
ReferencePathRule parse_reference_path_rule(const std::string& value);
std::string to_string(ReferencePathRule rule);

struct AssemblerConfig {
    ReferencePathRule reference_path = ReferencePathRule::FirstDriver;
};

// Tracks come from DriverTrackExtractor: time-ordered, target units, not yet
// normalized. Every track is normalized against one set of bounds computed over
// the concatenation of all tracks, and every timestamp is shifted by the
// earliest first timestamp across all tracks.
// Throws NoUsableDataError when tracks is empty.
class DatasetAssembler {
public:
    explicit DatasetAssembler(const AssemblerConfig& config);
    RaceDataset assemble(const SessionInfo& session, std::vector<DriverTrack> tracks) const;

private:
    std::size_t select_reference(const std::vector<DriverTrack>& tracks) const;

    AssemblerConfig config_;
};

} // namespace f1ar
