/// @file
/// Arc-length parameterised reaches and the small set of line operations
/// the relaxation tools need.
#pragma once

#include "Geometry.hpp"

#include <vector>

namespace thalweg {

namespace Tune {

/// Most pieces a reach or segment may be split into by a spacing.
constexpr double MaxDivisions = 1.0e7;

} // Tune

/// Number of spacing steps needed to cover length, rounded up.  Throws
/// std::invalid_argument when spacing is not positive or the count would
/// exceed Tune::MaxDivisions.
long DivisionCount(Meters length, Meters spacing);

/// Throws DegenerateGeometryError unless the reach has at least two
/// vertices and no two consecutive vertices coincide.
void ValidateReach(const Reach& reach);

/// A reach addressed by distance along it.  Distances are in the reach's
/// native linear unit and are clamped to [0, Length()].
class ArcLine {
public:
  struct Projection {
    Pt     point;     ///< closest point on the reach
    Meters distance;  ///< arc length from the first vertex to point
  }; // Projection

  explicit ArcLine(Reach reach);

  Meters Length() const noexcept { return _s.back(); }
  const Reach& reach() const noexcept { return _reach; }

  Pt PositionAt(Meters distance) const;

  /// Closest point on the reach.  When two segments are equally close the
  /// earlier one wins.
  Projection Project(const Pt& p) const;

private:
  Reach _reach;
  std::vector<Meters> _s;  // cumulative arc length at each vertex
}; // ArcLine

/// Collects relaxed vertices in order, dropping a vertex equal to the
/// previous one so the result keeps the reach invariant.
class ReachBuilder {
public:
  void Append(const Pt& p);
  std::size_t size() const noexcept { return _reach.size(); }
  Reach Take();
private:
  Reach _reach;
}; // ReachBuilder

/// Splits every segment longer than maxSpacing into ceil(len / maxSpacing)
/// equal parts.  Original vertices are kept.  Throws std::invalid_argument
/// when maxSpacing would split a segment too finely.
Reach Densify(const Reach& reach, Meters maxSpacing);

/// Pieces of each reach inside the box.  Pieces that reduce to a single
/// point are dropped.
Polyline ClipToExtent(const Polyline& lines, const Box& extent);

} // thalweg
