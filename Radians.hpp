#pragma once

#include <numbers>
#include <cmath>

namespace geom {

constexpr auto Pi = std::numbers::pi;
constexpr auto TwoPi = 2.0 * Pi;
constexpr auto HalfPi = Pi / 2.0;
constexpr auto DegPerRad = 180.0 / Pi;
constexpr auto RadPerDeg = Pi / 180.0;

/// Plane angle wrapped to (-Pi, Pi].
class Radians {
  double _value = 0.0;

  constexpr Radians& _wrap(double x) noexcept {
    if (x > Pi)
      x -= TwoPi;
    else if (x <= -Pi)
      x += TwoPi;
    _value = x;
    return *this;
  }

public:
  static constexpr struct NoWrapT { } NoWrap{};

  constexpr Radians() noexcept = default;
  constexpr explicit Radians(double theta) noexcept
    : _value{std::remainder(theta, TwoPi)}
  {
    if (_value == -Pi)
      _value = Pi;
  }
  constexpr Radians(double v, NoWrapT) noexcept : _value{v} { }
  constexpr Radians(const Radians&) noexcept = default;
  constexpr Radians& operator=(const Radians&) noexcept = default;
  constexpr bool operator==(const Radians&) const noexcept = default;

  constexpr double value() const noexcept { return _value; }
  constexpr double degrees() const noexcept { return _value * DegPerRad; }

  constexpr Radians& operator+=(const Radians& rhs) noexcept
    { return _wrap(_value + rhs._value); }
  constexpr Radians& operator-=(const Radians& rhs) noexcept
    { return _wrap(_value - rhs._value); }

  constexpr Radians operator+(const Radians& rhs) const noexcept
    { return Radians{*this} += rhs; }
  constexpr Radians operator-(const Radians& rhs) const noexcept
    { return Radians{*this} -= rhs; }

  static constexpr Radians FromDegrees(double deg) noexcept
    { return Radians{deg * RadPerDeg}; }

}; // Radians

constexpr Radians atan2(double y, double x) noexcept
  { return Radians{std::atan2(y, x), Radians::NoWrap}; }

constexpr double sin(const Radians& x) noexcept { return std::sin(x.value()); }
constexpr double cos(const Radians& x) noexcept { return std::cos(x.value()); }

constexpr Radians QuarterTurn = Radians{HalfPi, Radians::NoWrap};

constexpr double ToDegrees(Radians theta) noexcept
  { return theta.degrees(); }

} // geom
