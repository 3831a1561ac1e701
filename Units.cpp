#include "Units.hpp"

#include <mp-units/systems/international.h>
#include <mp-units/systems/si/prefixes.h>
#include <mp-units/systems/usc.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace thalweg {

namespace {

namespace si   = mp_units::si;
namespace intl = mp_units::international;
namespace usc  = mp_units::usc;

constexpr auto AllUnits = std::array{
  LinearUnit::Meters, LinearUnit::Centimeters, LinearUnit::Millimeters,
  LinearUnit::Kilometers, LinearUnit::Feet, LinearUnit::FeetUS,
  LinearUnit::Inches, LinearUnit::Yards
};

constexpr std::pair<std::string_view, LinearUnit> Aliases[] = {
  {"meters",      LinearUnit::Meters},
  {"meter",       LinearUnit::Meters},
  {"m",           LinearUnit::Meters},
  {"centimeters", LinearUnit::Centimeters},
  {"centimeter",  LinearUnit::Centimeters},
  {"cm",          LinearUnit::Centimeters},
  {"millimeters", LinearUnit::Millimeters},
  {"millimeter",  LinearUnit::Millimeters},
  {"mm",          LinearUnit::Millimeters},
  {"kilometers",  LinearUnit::Kilometers},
  {"kilometer",   LinearUnit::Kilometers},
  {"km",          LinearUnit::Kilometers},
  {"feet",        LinearUnit::Feet},
  {"foot",        LinearUnit::Feet},
  {"ft",          LinearUnit::Feet},
  {"feetus",      LinearUnit::FeetUS},
  {"foot_us",     LinearUnit::FeetUS},
  {"inches",      LinearUnit::Inches},
  {"inch",        LinearUnit::Inches},
  {"in",          LinearUnit::Inches},
  {"yards",       LinearUnit::Yards},
  {"yard",        LinearUnit::Yards},
  {"yd",          LinearUnit::Yards},
};

std::string Lower(std::string_view s) {
  auto out = std::string{};
  out.reserve(s.size());
  for (auto ch : s)
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  return out;
} // Lower

std::string_view Trim(std::string_view s) noexcept {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
    s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
    s.remove_suffix(1);
  return s;
} // Trim

} // anonymous

LinearUnit ParseLinearUnit(std::string_view name) {
  const auto key = Lower(Trim(name));
  for (const auto& [alias, unit] : Aliases) {
    if (alias == key)
      return unit;
  }
  throw std::invalid_argument{"unknown linear unit: \"" + std::string{name} + '"'};
} // ParseLinearUnit

std::string_view Name(LinearUnit unit) noexcept {
  switch (unit) {
    case LinearUnit::Meters:      return "Meters";
    case LinearUnit::Centimeters: return "Centimeters";
    case LinearUnit::Millimeters: return "Millimeters";
    case LinearUnit::Kilometers:  return "Kilometers";
    case LinearUnit::Feet:        return "Feet";
    case LinearUnit::FeetUS:      return "FeetUS";
    case LinearUnit::Inches:      return "Inches";
    case LinearUnit::Yards:       return "Yards";
  }
  return "Unknown";
} // Name

Distance MakeDistance(double value, LinearUnit unit) {
  switch (unit) {
    case LinearUnit::Meters:      return value * si::metre;
    case LinearUnit::Centimeters: return value * si::centi<si::metre>;
    case LinearUnit::Millimeters: return value * si::milli<si::metre>;
    case LinearUnit::Kilometers:  return value * si::kilo<si::metre>;
    case LinearUnit::Feet:        return value * intl::foot;
    case LinearUnit::FeetUS:      return value * usc::survey1893::us_survey_foot;
    case LinearUnit::Inches:      return value * intl::inch;
    case LinearUnit::Yards:       return value * intl::yard;
  }
  throw std::invalid_argument{"MakeDistance: invalid unit"};
} // MakeDistance

Distance ParseLength(std::string_view text, LinearUnit defaultUnit) {
  const auto s = Trim(text);
  auto value = 0.0;
  const auto* first = s.data();
  const auto* last  = s.data() + s.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || !std::isfinite(value))
    throw std::invalid_argument{"not a length: \"" + std::string{text} + '"'};
  const auto rest = Trim(std::string_view{ptr, static_cast<std::size_t>(last - ptr)});
  const auto unit = rest.empty() ? defaultUnit : ParseLinearUnit(rest);
  return MakeDistance(value, unit);
} // ParseLength

double ToUnits(Distance d, LinearUnit unit) {
  switch (unit) {
    case LinearUnit::Meters:      return d.numerical_value_in(si::metre);
    case LinearUnit::Centimeters: return d.numerical_value_in(si::centi<si::metre>);
    case LinearUnit::Millimeters: return d.numerical_value_in(si::milli<si::metre>);
    case LinearUnit::Kilometers:  return d.numerical_value_in(si::kilo<si::metre>);
    case LinearUnit::Feet:        return d.numerical_value_in(intl::foot);
    case LinearUnit::FeetUS:
      return d.numerical_value_in(usc::survey1893::us_survey_foot);
    case LinearUnit::Inches:      return d.numerical_value_in(intl::inch);
    case LinearUnit::Yards:       return d.numerical_value_in(intl::yard);
  }
  throw std::invalid_argument{"ToUnits: invalid unit"};
} // ToUnits

std::optional<LinearUnit> LinearUnitFromMetres(double metresPerUnit) {
  constexpr auto RelTol = 1.0e-9;
  if (!(metresPerUnit > 0.0))
    return std::nullopt;
  // Survey and international feet differ by 2 ppm, so match tightly.
  auto it = std::find_if(AllUnits.begin(), AllUnits.end(), [&](LinearUnit u) {
    const auto m = MakeDistance(1.0, u).numerical_value_in(si::metre);
    return std::abs(m - metresPerUnit) <= RelTol * m;
  });
  if (it == AllUnits.end())
    return std::nullopt;
  return *it;
} // LinearUnitFromMetres

} // thalweg
