#pragma once
// Session, driver and dataset types shared across the pipeline.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "f1ar/session_time.hpp"

namespace f1ar {

namespace channel {
constexpr const char* kX = "X";
constexpr const char* kY = "Y";
constexpr const char* kZ = "Z";
constexpr const char* kSessionTime = "SessionTime";
constexpr const char* kThrottle = "Throttle";
constexpr const char* kBrake = "Brake";
constexpr const char* kSpeed = "Speed";
} // namespace channel

struct DriverInfo {
    std::string id;
    std::string full_name;
    std::string abbreviation;
    std::string team_name;
};

struct SessionMetadata {
    int year = 0;
    std::string grand_prix;
    std::string session_type;
    std::string session_name;
    std::string event_date;
    std::optional<int> total_laps;
    std::optional<double> track_length_km;
};

struct SessionInfo {
    SessionMetadata metadata;
    std::vector<DriverInfo> drivers;
};

// Column-oriented samples as delivered by the source. Every channel has one
// value per SessionTime entry.
struct ChannelSeries {
    std::optional<std::vector<SessionDuration>> session_time;
    std::map<std::string, std::vector<double>> channels;

    bool has_channel(const std::string& name) const;
    std::size_t size() const;
};

// One instant for one driver in source units and convention.
struct RawSample {
    Eigen::Vector3d position = Eigen::Vector3d::Zero();
    double time = 0.0;
    double throttle = 0.0;
    double brake = 0.0;
    double speed = 0.0;
};

// Rows are samples in chronological order.
struct DriverTrack {
    DriverInfo driver;
    Eigen::MatrixXd source_positions;      // (N, 3) source units, [x, y, altitude]
    Eigen::MatrixXd positions;             // (N, 3) target units, [x, up, depth]
    Eigen::MatrixXd positions_normalized;  // (N, 3) filled once shared bounds exist
    std::vector<double> times;             // seconds
    std::vector<double> throttle;
    std::vector<double> brake;
    std::vector<double> speed;

    std::size_t sample_count() const { return times.size(); }
    RawSample sample(std::size_t index) const;
};

struct Bounds3D {
    Eigen::Vector3d min = Eigen::Vector3d::Zero();
    Eigen::Vector3d max = Eigen::Vector3d::Zero();
    Eigen::Vector3d range = Eigen::Vector3d::Ones();
};

struct SkippedDriver {
    std::string driver_id;
    std::string reason;
};

struct RaceDataset {
    SessionMetadata metadata;
    Bounds3D bounds;
    std::vector<DriverInfo> roster;
    std::vector<DriverTrack> tracks;
    std::vector<SkippedDriver> skipped;
    std::string reference_driver;
    std::string track_description;
    Eigen::MatrixXd track_path;
    double time_zero = 0.0;
};

} // namespace f1ar
