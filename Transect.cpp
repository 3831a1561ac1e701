#include "Transect.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace thalweg {

Transect TransectAt(const ArcLine& line, Meters distance, Meters width) {
  if (!(width > Meters{0}) || !std::isfinite(width))
    throw std::invalid_argument{"transect width must be a positive length"};

  const auto origin = line.PositionAt(distance);
  const auto lo = std::clamp(distance - Tune::TangentProbe, Meters{0}, line.Length());
  const auto hi = std::clamp(distance + Tune::TangentProbe, Meters{0}, line.Length());
  const auto before = line.PositionAt(lo);
  const auto after  = line.PositionAt(hi);
  if (before == after)
    throw DegenerateGeometryError{"cannot establish a tangent at the transect point"};

  const auto bearing = geom::Bearing(after - before);
  const auto half    = width / 2;
  const auto first   = origin + geom::FromBearing(half, bearing - geom::QuarterTurn);
  const auto second  = origin + geom::FromBearing(half, bearing + geom::QuarterTurn);
  return Transect{first, second};
} // TransectAt

Transect BuildTransect(const ArcLine& line, const Pt& point, Meters width) {
  const auto projected = line.Project(point);
  return TransectAt(line, projected.distance, width);
} // BuildTransect

std::vector<Transect>
GenerateCrossSections(const ArcLine& line, Meters interval, Meters width) {
  if (!(interval > Meters{0}))
    throw std::invalid_argument{"cross-section interval must be > 0"};
  const auto length = line.Length();
  const auto stations = DivisionCount(length, interval);
  auto out = std::vector<Transect>{};
  out.reserve(static_cast<std::size_t>(stations) + 1);
  for (auto k = 0L; ; ++k) {
    const auto s = std::min(k * interval, length);
    out.push_back(TransectAt(line, s, width));
    if (s >= length)
      break;
  }
  return out;
} // GenerateCrossSections

} // thalweg
