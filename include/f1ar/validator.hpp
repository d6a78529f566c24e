#pragma once
// Validation helpers for merged channel series and extracted tracks.

#include <string>
#include <vector>

#include <Eigen/Core>

#include "f1ar/telemetry_types.hpp"

namespace f1ar {

class Validator {
public:
    // Names of X, Y, Z and SessionTime absent from the series, in that order.
    static std::vector<std::string> missing_required_channels(const ChannelSeries& series);
    static bool validate_positions(const Eigen::MatrixXd& positions);
    static bool validate_time_axis(const std::vector<double>& times);
};

} // namespace f1ar
