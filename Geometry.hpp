/// @file
/// Geometry vocabulary shared by every thalweg module.
#pragma once

#include "geom.hpp"

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_linestring.hpp>
#include <boost/geometry/geometries/segment.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace thalweg {

namespace ggl = boost::geometry;

using Meters   = double;
using Pt       = geom::Pt<double>;
using Disp     = geom::Vec<double>;
using Reach    = ggl::model::linestring<Pt>;
using Polyline = ggl::model::multi_linestring<Reach>;
using Transect = ggl::model::segment<Pt>;
using Box      = ggl::model::box<Pt>;
using Points   = std::vector<Pt>;

/// A reach is too short, or collapses, near the point of interest, so no
/// tangent direction can be established there.
class DegenerateGeometryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
}; // DegenerateGeometryError

/// Transect width and sample spacing do not place an exact sample on the
/// transect midpoint.
class InvalidSamplingConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
}; // InvalidSamplingConfigurationError

inline Meters Length(const Transect& t) noexcept
  { return geom::Dist(t.first, t.second); }

inline Pt Midpoint(const Transect& t) noexcept
  { return geom::Lerp(t.first, t.second, 0.5); }

} // thalweg
