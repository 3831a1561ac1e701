/// @file
/// Moves stream centerline vertices onto nearby low ground.
#pragma once

#include "ElevationSource.hpp"
#include "Geometry.hpp"
#include "Relax.hpp"

#include <cstddef>

namespace thalweg {

struct RelaxOptions {
  Meters searchDistance = 0.0;  ///< transect half-width, line units
  Meters spacing = 1.0;         ///< sample spacing, line units
  double threshold = Tune::ElevationDeltaThreshold;  ///< z units
}; // RelaxOptions

struct RelaxStats {
  std::size_t vertices   = 0;
  std::size_t moved      = 0;
  std::size_t noData     = 0;  ///< kept: no elevation at the vertex
  std::size_t degenerate = 0;  ///< kept: no tangent at the vertex
  RelaxStats& operator+=(const RelaxStats& rhs) noexcept;
}; // RelaxStats

/// Relaxes every vertex of one reach.  A vertex whose transect cannot be
/// built, or whose own elevation is NoData, is kept where it is.  Throws
/// InvalidSamplingConfigurationError before touching any vertex when
/// 2 * searchDistance and spacing do not give a midpoint sample.
Reach RelaxReach(const Reach& reach, const ElevationSource& dem,
                 const RelaxOptions& options, RelaxStats& stats);

/// Relaxes each reach in turn, then repairs the self intersections the
/// moves introduced.  Reaches that are degenerate to begin with are
/// copied through unchanged.
Polyline RelaxPolyline(const Polyline& lines, const ElevationSource& dem,
                       const RelaxOptions& options);

} // thalweg
