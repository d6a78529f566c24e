#include "f1ar/validator.hpp"

#include <cmath>
#include <cstddef>

namespace f1ar {

std::vector<std::string> Validator::missing_required_channels(const ChannelSeries& series) {
    std::vector<std::string> missing;
    for (const char* name : {channel::kX, channel::kY, channel::kZ, channel::kSessionTime}) {
        if (!series.has_channel(name)) {
            missing.emplace_back(name);
        }
    }
    return missing;
}

bool Validator::validate_positions(const Eigen::MatrixXd& positions) {
    if (positions.rows() == 0 || positions.cols() != 3) {
        return false;
    }
    return positions.allFinite();
}

bool Validator::validate_time_axis(const std::vector<double>& times) {
    if (times.empty()) {
        return false;
    }
    for (std::size_t i = 0; i < times.size(); ++i) {
        if (!std::isfinite(times[i])) {
            return false;
        }
        if (i > 0 && times[i] < times[i - 1]) {
            return false;
        }
    }
    return true;
}

} // namespace f1ar
