#pragma once
// Session data read from an on-disk cache directory.

#include <filesystem>
#include <istream>
#include <string>

#include "f1ar/config.hpp"
#include "f1ar/telemetry_source.hpp"

namespace f1ar {

// Header row first; one column per channel. SessionTime cells go through
// parse_session_duration, other cells must be numbers, True/False or empty
// (read as NaN). A column with any other cell is dropped.
// Throws std::invalid_argument on a missing header or a ragged row.
ChannelSeries read_channel_csv(std::istream& in);

// Layout under <cache_dir>/<year>/<grand_prix>/<session_type>/:
//   session.yaml                 metadata and driver roster
//   position_data/<driver>.csv   X, Y, Z, SessionTime
//   car_data/<driver>.csv        Throttle, Brake, Speed, SessionTime
// The cache directory is created if absent and never cleared.
class CachedSessionSource : public ITelemetrySource {
public:
    explicit CachedSessionSource(const PipelineConfig& config);

    SessionInfo load_session() override;
    ChannelSeries position_data(const std::string& driver_id) override;
    ChannelSeries car_data(const std::string& driver_id) override;

    const std::filesystem::path& session_dir() const { return session_dir_; }

private:
    SessionConfig session_;
    std::filesystem::path session_dir_;
};

} // namespace f1ar
