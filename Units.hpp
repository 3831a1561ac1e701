/// @file
/// Linear units for user-entered lengths ("100 FeetUS", "0.2 Meters").
#pragma once

#include <mp-units/systems/isq/space_and_time.h>
#include <mp-units/systems/si/units.h>

#include <optional>
#include <string_view>

namespace thalweg {

using mp_units::quantity;
using mp_units::si::metre;

using Distance = quantity<mp_units::isq::distance[metre]>;

/// Unit names follow the ArcGIS linear-unit spelling.
enum class LinearUnit {
  Meters, Centimeters, Millimeters, Kilometers,
  Feet, FeetUS, Inches, Yards
}; // LinearUnit

/// Accepts plural and singular names, case-insensitively ("feetus",
/// "Foot_US", "Meter").  Throws std::invalid_argument for anything else.
LinearUnit ParseLinearUnit(std::string_view name);

std::string_view Name(LinearUnit unit) noexcept;

Distance MakeDistance(double value, LinearUnit unit);

/// "<number> [unit]".  A bare number is in defaultUnit.
Distance ParseLength(std::string_view text, LinearUnit defaultUnit);

/// Numerical value of d expressed in unit.
double ToUnits(Distance d, LinearUnit unit);

/// Matches a spatial reference's metres-per-unit factor to a known unit.
std::optional<LinearUnit> LinearUnitFromMetres(double metresPerUnit);

} // thalweg
