#include "geom.hpp"

#include <gtest/gtest.h>

namespace {

using geom::Pi;
using geom::Radians;
using Vec = geom::Vec<double>;

TEST(RadiansTest, WrapsIntoHalfOpenInterval) {
  EXPECT_NEAR(Radians{1.5 * Pi}.value(), -0.5 * Pi, 1e-12);
  EXPECT_NEAR(Radians{-Pi}.value(), Pi, 1e-12);
  EXPECT_NEAR((Radians{0.75 * Pi} + Radians{0.5 * Pi}).value(), -0.75 * Pi, 1e-12);
  EXPECT_NEAR((Radians{-0.75 * Pi} - Radians{0.5 * Pi}).value(), 0.75 * Pi, 1e-12);
}

TEST(RadiansTest, Degrees) {
  EXPECT_NEAR(Radians::FromDegrees(90.0).value(), Pi / 2, 1e-12);
  EXPECT_NEAR(geom::ToDegrees(Radians{Pi / 4}), 45.0, 1e-12);
}

TEST(BearingTest, MeasuredClockwiseFromNorth) {
  EXPECT_NEAR(geom::Bearing(Vec{0.0, 1.0}).value(), 0.0, 1e-12);
  EXPECT_NEAR(geom::Bearing(Vec{1.0, 0.0}).value(), Pi / 2, 1e-12);
  EXPECT_NEAR(geom::Bearing(Vec{0.0, -1.0}).value(), Pi, 1e-12);
  EXPECT_NEAR(geom::Bearing(Vec{-1.0, 0.0}).value(), -Pi / 2, 1e-12);
}

TEST(BearingTest, FromBearingInvertsBearing) {
  const auto v = geom::FromBearing(2.0, geom::QuarterTurn);
  EXPECT_NEAR(v.dx, 2.0, 1e-12);
  EXPECT_NEAR(v.dy, 0.0, 1e-12);

  const auto w = Vec{3.0, -4.0};
  const auto back = geom::FromBearing(w.norm(), geom::Bearing(w));
  EXPECT_NEAR(back.dx, 3.0, 1e-12);
  EXPECT_NEAR(back.dy, -4.0, 1e-12);
}

TEST(VecTest, DotAndCross) {
  const auto u = Vec{1.0, 2.0};
  const auto v = Vec{-2.0, 1.0};
  EXPECT_DOUBLE_EQ(dot(u, v), 0.0);
  EXPECT_DOUBLE_EQ(cross(u, v), 5.0);
  EXPECT_NEAR(u.unit().norm(), 1.0, 1e-15);
}

} // anonymous
