#include "f1ar/normalizer.hpp"

#include <stdexcept>
#include <string>

namespace f1ar {

Bounds3D compute_bounds(const Eigen::MatrixXd& points) {
    if (points.cols() != 3) {
        throw std::invalid_argument(
            "`points` must be 2D with exactly 3 columns, got cols=" + std::to_string(points.cols()));
    }
    if (points.rows() == 0) {
        throw std::invalid_argument("Cannot compute bounds of an empty point set.");
    }

    Bounds3D bounds;
    bounds.min = points.colwise().minCoeff().transpose();
    bounds.max = points.colwise().maxCoeff().transpose();
    bounds.range = bounds.max - bounds.min;
    for (Eigen::Index axis = 0; axis < 3; ++axis) {
        if (bounds.range(axis) == 0.0) {
            bounds.range(axis) = 1.0;
        }
    }
    return bounds;
}

Eigen::MatrixXd apply_bounds(const Eigen::MatrixXd& points, const Bounds3D& bounds) {
    if (points.cols() != 3) {
        throw std::invalid_argument(
            "`points` must be 2D with exactly 3 columns, got cols=" + std::to_string(points.cols()));
    }

    Eigen::MatrixXd out(points.rows(), 3);
    for (Eigen::Index axis = 0; axis < 3; ++axis) {
        out.col(axis) =
            (points.col(axis).array() - bounds.min(axis)) / bounds.range(axis) - 0.5;
    }
    return out;
}

} // namespace f1ar
