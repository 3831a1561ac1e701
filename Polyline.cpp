#include "Polyline.hpp"

#include <boost/geometry/algorithms/intersection.hpp>
#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace thalweg {

long DivisionCount(Meters length, Meters spacing) {
  if (!(spacing > Meters{0}))
    throw std::invalid_argument{"spacing must be > 0"};
  const auto ratio = std::ceil(length / spacing);
  if (!(ratio <= Tune::MaxDivisions)) {
    throw std::invalid_argument{"spacing " + std::to_string(spacing)
        + " is too fine for length " + std::to_string(length)};
  }
  return static_cast<long>(ratio);
} // DivisionCount

void ValidateReach(const Reach& reach) {
  if (std::ssize(reach) < 2)
    throw DegenerateGeometryError{"reach has fewer than 2 vertices"};
  for (gsl::index i = 1; i != std::ssize(reach); ++i) {
    if (reach[i] == reach[i-1])
      throw DegenerateGeometryError{
          "reach repeats vertex " + std::to_string(i-1)};
  }
} // ValidateReach

ArcLine::ArcLine(Reach reach)
  : _reach{std::move(reach)}
{
  ValidateReach(_reach);
  _s.reserve(_reach.size());
  _s.push_back(Meters{0});
  for (gsl::index i = 1; i != std::ssize(_reach); ++i)
    _s.push_back(_s.back() + geom::Dist(_reach[i-1], _reach[i]));
  gsl_Ensures(_s.back() > Meters{0});
} // ArcLine

Pt ArcLine::PositionAt(Meters distance) const {
  const auto s = std::clamp(distance, Meters{0}, Length());
  if (s >= Length())
    return _reach.back();
  // Segment j satisfies _s[j] <= s < _s[j+1].
  auto upper = std::upper_bound(_s.begin(), _s.end(), s);
  const auto j = std::distance(_s.begin(), upper) - 1;
  gsl_Expects(j >= 0 && j + 1 < std::ssize(_reach));
  const auto t = (s - _s[j]) / (_s[j+1] - _s[j]);
  return geom::Lerp(_reach[j], _reach[j+1], t);
} // PositionAt

ArcLine::Projection ArcLine::Project(const Pt& p) const {
  auto best = Projection{_reach.front(), Meters{0}};
  auto best_d2 = geom::Dist2(p, best.point);
  for (gsl::index j = 0; j + 1 != std::ssize(_reach); ++j) {
    const auto& a = _reach[j];
    const auto  v = _reach[j+1] - a;
    const auto  t = std::clamp(dot(p - a, v) / v.norm2(), 0.0, 1.0);
    const auto  q = a + v * t;
    const auto d2 = geom::Dist2(p, q);
    if (d2 < best_d2) {
      best_d2 = d2;
      best = Projection{q, _s[j] + t * (_s[j+1] - _s[j])};
    }
  }
  return best;
} // Project

void ReachBuilder::Append(const Pt& p) {
  if (!_reach.empty() && _reach.back() == p)
    return;
  _reach.push_back(p);
} // Append

Reach ReachBuilder::Take() {
  auto out = Reach{};
  std::swap(out, _reach);
  return out;
} // Take

Reach Densify(const Reach& reach, Meters maxSpacing) {
  if (!(maxSpacing > Meters{0}))
    throw std::invalid_argument{"Densify: spacing must be > 0"};
  auto out = Reach{};
  if (reach.empty())
    return out;
  out.push_back(reach.front());
  for (gsl::index i = 1; i != std::ssize(reach); ++i) {
    const auto& a = reach[i-1];
    const auto& b = reach[i];
    const auto len = geom::Dist(a, b);
    const auto parts = std::max(1L, DivisionCount(len, maxSpacing));
    for (auto k = 1L; k < parts; ++k)
      out.push_back(geom::Lerp(a, b, static_cast<double>(k) / parts));
    out.push_back(b);
  }
  return out;
} // Densify

Polyline ClipToExtent(const Polyline& lines, const Box& extent) {
  auto out = Polyline{};
  for (const auto& reach : lines) {
    auto pieces = Polyline{};
    ggl::intersection(reach, extent, pieces);
    for (const auto& piece : pieces) {
      auto builder = ReachBuilder{};
      for (const auto& p : piece)
        builder.Append(p);
      if (builder.size() >= 2)
        out.push_back(builder.Take());
    }
  }
  return out;
} // ClipToExtent

} // thalweg
