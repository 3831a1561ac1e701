/// @file
/// Perpendicular transects across a reach.
///
/// Directions follow the survey convention of geom::Bearing: angles are
/// measured clockwise from the +Y (north) axis.  The local tangent bearing
/// b at the point of interest is atan2(dX, dY); the transect runs from the
/// endpoint at bearing b - 90 deg (left of the direction of travel) to the
/// endpoint at bearing b + 90 deg (right of it).
#pragma once

#include "Geometry.hpp"
#include "Polyline.hpp"

#include <vector>

namespace thalweg {

namespace Tune {

/// Offset along the reach used to estimate the tangent, in line units.
constexpr Meters TangentProbe = 1.0e-5;

} // Tune

/// Transect of total length width centred on the projection of point onto
/// line.  Throws DegenerateGeometryError when no tangent can be formed and
/// std::invalid_argument when width is not a positive finite length.
Transect BuildTransect(const ArcLine& line, const Pt& point, Meters width);

/// Transect centred on the point at arc length distance along line.
Transect TransectAt(const ArcLine& line, Meters distance, Meters width);

/// Cross-sections at arc length 0, interval, 2*interval, ... and at the end
/// of the line (exactly once).  Throws std::invalid_argument when interval
/// is not positive or would place more than Tune::MaxDivisions stations.
std::vector<Transect>
GenerateCrossSections(const ArcLine& line, Meters interval, Meters width);

} // thalweg
