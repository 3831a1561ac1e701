#pragma once
#include "Radians.hpp"

#include <boost/geometry/core/access.hpp>
#include <boost/geometry/core/coordinate_dimension.hpp>
#include <boost/geometry/core/coordinate_system.hpp>
#include <boost/geometry/core/coordinate_type.hpp>
#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/core/tags.hpp>
#include <boost/geometry/geometries/concepts/point_concept.hpp>

#include <type_traits>
#include <cstddef>
#include <cmath>

namespace geom {

template<typename Units=double>
struct Vec {
  using value_type = Units;
  value_type dx = value_type{};
  value_type dy = value_type{};
  constexpr Vec() noexcept = default;
  constexpr Vec(const Vec&) noexcept = default;
  constexpr Vec& operator=(const Vec&) noexcept = default;
  constexpr bool operator==(const Vec&) const noexcept = default;
  constexpr Vec(value_type dx_, value_type dy_) : dx{dx_}, dy{dy_} { }
  constexpr Vec operator-() const noexcept { return Vec{-dx, -dy}; }
  constexpr Vec& operator+=(const Vec& rhs) noexcept
    { dx += rhs.dx; dy += rhs.dy; return *this; }
  constexpr Vec& operator*=(double s) noexcept
    { dx *= s; dy *= s; return *this; }
  constexpr Vec operator+(const Vec& rhs) const noexcept
    { return Vec{dx+rhs.dx, dy+rhs.dy}; }
  constexpr Vec operator-(const Vec& rhs) const noexcept
    { return Vec{dx-rhs.dx, dy-rhs.dy}; }
  constexpr Vec operator*(double s) const noexcept
    { return Vec{dx*s, dy*s}; }
  constexpr Vec operator/(double s) const noexcept
    { return Vec{dx/s, dy/s}; }
  constexpr value_type norm2() const noexcept { return dx*dx + dy*dy; }
  constexpr value_type norm() const noexcept { return std::hypot(dx, dy); }
  constexpr Vec unit() const noexcept { return *this / norm(); }
  friend constexpr Vec operator*(double s, const Vec& rhs)
    { return rhs * s; }
  friend constexpr value_type dot(const Vec& u, const Vec& v)
    { return u.dx * v.dx + u.dy * v.dy; }
  friend constexpr value_type cross(const Vec& u, const Vec& v) noexcept
    { return u.dx * v.dy - u.dy * v.dx; }
}; // Vec

template<typename Units=double>
struct Pt {
  Units x = Units{};
  Units y = Units{};
  constexpr Pt() = default;
  constexpr Pt(const Pt&) = default;
  constexpr Pt& operator=(const Pt&) = default;
  constexpr bool operator==(const Pt&) const = default;
  constexpr Pt(Units x_, Units y_) : x{x_}, y{y_} { }
}; // Pt

} // geom

namespace boost::geometry::traits {

template<typename U>
struct tag<geom::Pt<U>> { using type = point_tag; };

template<typename U>
struct coordinate_type<geom::Pt<U>> { using type = U; };

template<typename U>
struct coordinate_system<geom::Pt<U>> { using type = cs::cartesian; };

template<typename U>
struct dimension<geom::Pt<U>> : std::integral_constant<std::size_t, 2> { };

template<std::size_t Dim, typename U>
requires (Dim == 0 || Dim == 1)
struct access<geom::Pt<U>, Dim> {
  static constexpr U get(const geom::Pt<U>& p) {
    if constexpr (Dim == 0)
      return p.x;
    else
      return p.y;
  }
  static constexpr void set(geom::Pt<U>& p, U v) {
    if constexpr (Dim == 0)
      p.x = v;
    else
      p.y = v;
  }
}; // access

template<typename U>
struct make<geom::Pt<U>> {
  using point_type = geom::Pt<U>;
  static constexpr auto is_specialized = true;
  static constexpr point_type apply(U x, U y)
    { return point_type{x, y}; }
}; // make

} // boost::geometry::traits

namespace geom {

template<typename U>
constexpr Vec<U> operator-(const Pt<U>& lhs, const Pt<U>& rhs) noexcept
  { return Vec<U>{lhs.x-rhs.x, lhs.y-rhs.y}; }

template<typename U>
constexpr Pt<U> operator+(const Pt<U>& p, const Vec<U>& v) noexcept
  { return Pt<U>{p.x + v.dx, p.y + v.dy}; }

template<typename U>
constexpr Pt<U> operator-(const Pt<U>& p, const Vec<U>& v) noexcept
  { return Pt<U>{p.x - v.dx, p.y - v.dy}; }

template<typename U>
constexpr U Dist(const Pt<U>& a, const Pt<U>& b) noexcept
  { return (b - a).norm(); }

template<typename U>
constexpr U Dist2(const Pt<U>& a, const Pt<U>& b) noexcept
  { return (b - a).norm2(); }

template<typename U>
constexpr Pt<U> Lerp(const Pt<U>& a, const Pt<U>& b, double t) noexcept
  { return a + (b - a) * t; }

// Bearings are survey angles: measured clockwise from the +Y (north) axis,
// so bearing 0 points up and bearing Pi/2 points along +X.  A bearing b
// with distance d is the displacement (d sin b, d cos b).

template<typename U>
constexpr Radians Bearing(const Vec<U>& v) noexcept
  { return geom::atan2(v.dx, v.dy); }

template<typename U=double>
constexpr Vec<U> FromBearing(U dist, Radians bearing) noexcept
  { return Vec<U>{dist * sin(bearing), dist * cos(bearing)}; }

namespace test {
constexpr auto p0 = Pt{0.0, 0.0};
constexpr auto p1 = Pt{3.0, 0.0};
constexpr auto p2 = Pt{3.0, 4.0};
constexpr auto vh = (p1 - p0) + (p2 - p1);
static_assert(p0 + vh == p2);
static_assert(vh.norm2() == 25.0);
static_assert(Dist2(p0, p2) == 25.0);
static_assert(Lerp(p0, p1, 0.5) == Pt{1.5, 0.0});
} // test

} // geom
