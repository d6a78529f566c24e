#pragma once

#include <Eigen/Core>

namespace f1ar {

struct CoordinateMapperConfig {
    // Source units per target unit.
    double unit_scale = 10.0;
};

// Points is (N, 3) in source units, columns [x, y, z] with y as ground depth and
// z as altitude. Returns (N, 3) target points [x, z, y] after dividing every
// component by unit_scale.
// Throws std::invalid_argument on malformed input or invalid config values.
class CoordinateMapper {
public:
    explicit CoordinateMapper(const CoordinateMapperConfig& config);
    Eigen::MatrixXd process(const Eigen::MatrixXd& points) const;

private:
    CoordinateMapperConfig config_;
};

} // namespace f1ar
