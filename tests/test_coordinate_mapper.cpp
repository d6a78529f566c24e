#include <stdexcept>

#include <gtest/gtest.h>

#include "f1ar/coordinate_mapper.hpp"

namespace f1ar {

TEST(CoordinateMapperTest, MapsGroundPlaneToUpAxisConvention) {
    // Source (100, 200, 0) in tenths becomes target (10, 0, 20).
    CoordinateMapper mapper(CoordinateMapperConfig{});
    Eigen::MatrixXd points(1, 3);
    points << 100.0, 200.0, 0.0;

    const Eigen::MatrixXd mapped = mapper.process(points);
    ASSERT_EQ(mapped.rows(), 1);
    EXPECT_DOUBLE_EQ(mapped(0, 0), 10.0);
    EXPECT_DOUBLE_EQ(mapped(0, 1), 0.0);
    EXPECT_DOUBLE_EQ(mapped(0, 2), 20.0);
}

TEST(CoordinateMapperTest, AltitudeBecomesUpAxis) {
    // Altitude lands in the second target column; every axis is scaled.
    CoordinateMapper mapper(CoordinateMapperConfig{});
    Eigen::MatrixXd points(2, 3);
    points << -50.0, 30.0, 15.0,
              7.0, -9.0, -4.0;

    const Eigen::MatrixXd mapped = mapper.process(points);
    EXPECT_DOUBLE_EQ(mapped(0, 0), -5.0);
    EXPECT_DOUBLE_EQ(mapped(0, 1), 1.5);
    EXPECT_DOUBLE_EQ(mapped(0, 2), 3.0);
    EXPECT_DOUBLE_EQ(mapped(1, 0), 0.7);
    EXPECT_DOUBLE_EQ(mapped(1, 1), -0.4);
    EXPECT_DOUBLE_EQ(mapped(1, 2), -0.9);
}

TEST(CoordinateMapperTest, EmptyInputYieldsEmptyOutput) {
    // Zero rows pass through.
    CoordinateMapper mapper(CoordinateMapperConfig{});
    const Eigen::MatrixXd mapped = mapper.process(Eigen::MatrixXd(0, 3));
    EXPECT_EQ(mapped.rows(), 0);
    EXPECT_EQ(mapped.cols(), 3);
}

TEST(CoordinateMapperTest, RejectsMalformedShape) {
    // Only 3-wide input is accepted.
    CoordinateMapper mapper(CoordinateMapperConfig{});
    EXPECT_THROW(mapper.process(Eigen::MatrixXd::Zero(4, 2)), std::invalid_argument);
    EXPECT_THROW(mapper.process(Eigen::MatrixXd::Zero(4, 4)), std::invalid_argument);
}

TEST(CoordinateMapperTest, RejectsNonPositiveScale) {
    // A zero or negative unit scale is a config error.
    EXPECT_THROW(CoordinateMapper(CoordinateMapperConfig{0.0}), std::invalid_argument);
    EXPECT_THROW(CoordinateMapper(CoordinateMapperConfig{-10.0}), std::invalid_argument);
}

} // namespace f1ar
