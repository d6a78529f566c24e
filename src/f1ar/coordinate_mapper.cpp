#include "f1ar/coordinate_mapper.hpp"

#include <stdexcept>
#include <string>

namespace f1ar {

CoordinateMapper::CoordinateMapper(const CoordinateMapperConfig& config) : config_(config) {
    if (!(config_.unit_scale > 0.0)) {
        throw std::invalid_argument("`unit_scale` must be > 0.");
    }
}

Eigen::MatrixXd CoordinateMapper::process(const Eigen::MatrixXd& points) const {
    if (points.cols() != 3) {
        throw std::invalid_argument(
            "`points` must be 2D with exactly 3 columns, got cols=" + std::to_string(points.cols()));
    }

    const Eigen::MatrixXd scaled = points.array() / config_.unit_scale;

    Eigen::MatrixXd out(points.rows(), 3);
    out.col(0) = scaled.col(0);
    out.col(1) = scaled.col(2);
    out.col(2) = scaled.col(1);
    return out;
}

} // namespace f1ar
