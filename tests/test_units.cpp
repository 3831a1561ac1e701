#include "Units.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace {

using namespace thalweg;

double InMeters(Distance d) { return ToUnits(d, LinearUnit::Meters); }

TEST(UnitsTest, ParsesArcGisUnitNames) {
  EXPECT_EQ(ParseLinearUnit("Meters"), LinearUnit::Meters);
  EXPECT_EQ(ParseLinearUnit("feetus"), LinearUnit::FeetUS);
  EXPECT_EQ(ParseLinearUnit("Foot_US"), LinearUnit::FeetUS);
  EXPECT_EQ(ParseLinearUnit(" Inches "), LinearUnit::Inches);
  EXPECT_EQ(ParseLinearUnit("FEET"), LinearUnit::Feet);
  EXPECT_THROW(ParseLinearUnit("furlongs"), std::invalid_argument);
}

TEST(UnitsTest, ParseLengthWithUnit) {
  EXPECT_NEAR(InMeters(ParseLength("100 FeetUS", LinearUnit::Meters)),
              100.0 * 1200.0 / 3937.0, 1e-9);
  EXPECT_NEAR(InMeters(ParseLength("100 Feet", LinearUnit::Meters)), 30.48, 1e-9);
  EXPECT_NEAR(InMeters(ParseLength("2 Inches", LinearUnit::Meters)), 0.0508, 1e-12);
  EXPECT_NEAR(InMeters(ParseLength("3km", LinearUnit::Meters)), 3000.0, 1e-9);
}

TEST(UnitsTest, BareNumberUsesDefaultUnit) {
  EXPECT_NEAR(InMeters(ParseLength("10", LinearUnit::Meters)), 10.0, 1e-12);
  EXPECT_NEAR(InMeters(ParseLength("10", LinearUnit::Feet)), 3.048, 1e-12);
}

TEST(UnitsTest, RejectsMalformedLengths) {
  EXPECT_THROW(ParseLength("", LinearUnit::Meters), std::invalid_argument);
  EXPECT_THROW(ParseLength("ten meters", LinearUnit::Meters), std::invalid_argument);
  EXPECT_THROW(ParseLength("10 parsecs", LinearUnit::Meters), std::invalid_argument);
}

TEST(UnitsTest, ConvertsToDataUnits) {
  const auto d = MakeDistance(1.0, LinearUnit::Meters);
  EXPECT_NEAR(ToUnits(d, LinearUnit::Feet), 3.280839895, 1e-9);
  EXPECT_NEAR(ToUnits(d, LinearUnit::Inches), 39.37007874, 1e-8);
  EXPECT_NEAR(ToUnits(d, LinearUnit::Centimeters), 100.0, 1e-9);
  // 0.2 inch threshold in a metre DEM.
  EXPECT_NEAR(ToUnits(MakeDistance(2.0, LinearUnit::Inches), LinearUnit::Meters),
              0.0508, 1e-12);
}

TEST(UnitsTest, RecognisesSpatialReferenceUnits) {
  EXPECT_EQ(LinearUnitFromMetres(1.0), LinearUnit::Meters);
  EXPECT_EQ(LinearUnitFromMetres(0.3048), LinearUnit::Feet);
  EXPECT_EQ(LinearUnitFromMetres(1200.0 / 3937.0), LinearUnit::FeetUS);
  EXPECT_FALSE(LinearUnitFromMetres(0.5).has_value());
  EXPECT_FALSE(LinearUnitFromMetres(0.0).has_value());
}

TEST(UnitsTest, NamesRoundTrip) {
  for (auto u : {LinearUnit::Meters, LinearUnit::FeetUS, LinearUnit::Yards})
    EXPECT_EQ(ParseLinearUnit(Name(u)), u);
}

} // anonymous
