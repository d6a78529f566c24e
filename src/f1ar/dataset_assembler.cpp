#include "f1ar/dataset_assembler.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include "f1ar/errors.hpp"
#include "f1ar/normalizer.hpp"

namespace f1ar {
namespace {

Eigen::MatrixXd concatenate_positions(const std::vector<DriverTrack>& tracks) {
    Eigen::Index total_rows = 0;
    for (const auto& track : tracks) {
        total_rows += track.positions.rows();
    }

    Eigen::MatrixXd all(total_rows, 3);
    Eigen::Index offset = 0;
    for (const auto& track : tracks) {
        all.middleRows(offset, track.positions.rows()) = track.positions;
        offset += track.positions.rows();
    }
    return all;
}

double earliest_start(const std::vector<DriverTrack>& tracks) {
    double global_min = tracks.front().times.front();
    for (const auto& track : tracks) {
        global_min = std::min(global_min, track.times.front());
    }
    return global_min;
}

} // namespace

ReferencePathRule parse_reference_path_rule(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    if (lower == "first") {
        return ReferencePathRule::FirstDriver;
    }
    if (lower == "longest") {
        return ReferencePathRule::LongestTrack;
    }
    throw std::runtime_error("Unknown reference path rule: " + value);
}

std::string to_string(ReferencePathRule rule) {
    switch (rule) {
        case ReferencePathRule::FirstDriver:
            return "first";
        case ReferencePathRule::LongestTrack:
            return "longest";
    }
    return "first";
}

DatasetAssembler::DatasetAssembler(const AssemblerConfig& config) : config_(config) {}

RaceDataset DatasetAssembler::assemble(const SessionInfo& session, std::vector<DriverTrack> tracks) const {
    if (tracks.empty()) {
        throw NoUsableDataError("No telemetry data could be processed for " +
                                std::to_string(session.metadata.year) + " " + session.metadata.grand_prix +
                                " " + session.metadata.session_type);
    }
    for (const auto& track : tracks) {
        if (track.times.empty() || track.positions.rows() != static_cast<Eigen::Index>(track.times.size())) {
            throw std::invalid_argument("Track for driver " + track.driver.id +
                                        " has mismatched position and time samples.");
        }
    }

    RaceDataset dataset;
    dataset.metadata = session.metadata;
    dataset.roster = session.drivers;

    // Both reductions must see every track before any track is rewritten.
    dataset.bounds = compute_bounds(concatenate_positions(tracks));
    dataset.time_zero = earliest_start(tracks);

    for (auto& track : tracks) {
        for (auto& t : track.times) {
            t -= dataset.time_zero;
        }
        track.positions_normalized = apply_bounds(track.positions, dataset.bounds);
    }

    const std::size_t reference = select_reference(tracks);
    dataset.reference_driver = tracks[reference].driver.id;
    dataset.track_path = tracks[reference].positions_normalized;
    dataset.track_description = config_.reference_path == ReferencePathRule::FirstDriver
                                    ? "Reference track path from first driver"
                                    : "Reference track path from driver with the most samples";

    dataset.tracks = std::move(tracks);
    return dataset;
}

std::size_t DatasetAssembler::select_reference(const std::vector<DriverTrack>& tracks) const {
    if (config_.reference_path == ReferencePathRule::FirstDriver) {
        return 0;
    }
    std::size_t best = 0;
    for (std::size_t i = 1; i < tracks.size(); ++i) {
        if (tracks[i].sample_count() > tracks[best].sample_count()) {
            best = i;
        }
    }
    return best;
}

} // namespace f1ar
