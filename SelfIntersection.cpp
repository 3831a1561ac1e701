#include "SelfIntersection.hpp"
#include "Polyline.hpp"

#include <boost/geometry/algorithms/intersection.hpp>
#include <boost/geometry/algorithms/intersects.hpp>
#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <algorithm>
#include <iterator>
#include <optional>
#include <vector>

namespace thalweg {

namespace {

Reach Dedupe(const Reach& reach) {
  auto builder = ReachBuilder{};
  for (const auto& p : reach)
    builder.Append(p);
  return builder.Take();
} // Dedupe

// Where segment j meets segment i, taking the meeting point nearest the
// start of segment i when they overlap.
std::optional<Pt> Crossing(const Reach& r, gsl::index i, gsl::index j) {
  const auto a = Transect{r[i], r[i+1]};
  const auto b = Transect{r[j], r[j+1]};
  if (!ggl::intersects(a, b))
    return std::nullopt;
  auto hits = std::vector<Pt>{};
  ggl::intersection(a, b, hits);
  if (hits.empty())
    return std::nullopt;
  return *std::min_element(hits.begin(), hits.end(),
      [&](const Pt& p, const Pt& q)
        { return geom::Dist2(r[i], p) < geom::Dist2(r[i], q); });
} // Crossing

// Cuts out the first loop found; false when the reach is already simple.
bool CutFirstLoop(Reach& r) {
  const auto nseg = std::ssize(r) - 1;
  const auto closed = r.front() == r.back();
  for (gsl::index i = 0; i < nseg; ++i) {
    for (auto j = i + 2; j < nseg; ++j) {
      if (closed && i == 0 && j == nseg - 1)
        continue;
      const auto x = Crossing(r, i, j);
      if (!x)
        continue;
      auto cut = Reach{};
      cut.insert(cut.end(), r.begin(), r.begin() + i + 1);
      cut.push_back(*x);
      cut.insert(cut.end(), r.begin() + j + 1, r.end());
      r = Dedupe(cut);
      return true;
    }
  }
  return false;
} // CutFirstLoop

} // anonymous

Reach RepairSelfIntersections(const Reach& reach) {
  auto r = Dedupe(reach);
  // Every cut removes at least one vertex, so this terminates.
  while (std::ssize(r) > 3 && CutFirstLoop(r)) { }
  return r;
} // RepairSelfIntersections

} // thalweg
