#pragma once

#include <Eigen/Core>

#include "f1ar/telemetry_types.hpp"

namespace f1ar {

// Points is (N, 3) with N >= 1. Per-axis min/max over every row; an axis whose
// range is exactly zero stores a range of 1.
// Throws std::invalid_argument on malformed or empty input.
Bounds3D compute_bounds(const Eigen::MatrixXd& points);

// Returns (points - min) / range - 0.5 per axis. The result lies in [-0.5, 0.5]
// only when bounds were computed over a superset of points.
// Throws std::invalid_argument on malformed input.
Eigen::MatrixXd apply_bounds(const Eigen::MatrixXd& points, const Bounds3D& bounds);

} // namespace f1ar
