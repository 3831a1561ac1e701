/// @file
/// Low points along a line profile, separated by rises of at least a
/// threshold on both sides.
#pragma once

#include "ElevationSource.hpp"
#include "Geometry.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <vector>

namespace thalweg {

/// Indices into elevations of the accepted minimums, in order.  A low
/// point is accepted once the profile has climbed at least threshold out
/// of it and it lies at least threshold below the previous local maximum
/// (the first low point needs only the climb; the final one only the
/// drop from the last maximum).
std::vector<gsl_lite::index>
LocalMinimumIndices(const std::vector<double>& elevations, double threshold);

/// Densifies each reach to interval, samples the DEM at every vertex and
/// returns the accepted minimums.  Vertices without elevation are skipped.
Points FindLocalMinimums(const Polyline& lines, const ElevationSource& dem,
                         Meters interval, double threshold);

} // thalweg
