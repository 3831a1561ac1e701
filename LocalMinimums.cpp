#include "LocalMinimums.hpp"
#include "Log.hpp"
#include "Polyline.hpp"

#include <iterator>
#include <optional>

namespace gsl = gsl_lite;

namespace thalweg {

std::vector<gsl::index>
LocalMinimumIndices(const std::vector<double>& elevations, double threshold) {
  auto out = std::vector<gsl::index>{};
  const auto n = std::ssize(elevations);
  if (n == 0)
    return out;

  auto low     = gsl::index{0};
  auto prev    = std::optional<double>{};
  auto prevMax = std::optional<double>{};
  auto dropFromMax = [&] {
    return prevMax ? *prevMax - elevations[low] : threshold;
  };

  for (gsl::index i = 0; i != n; ++i) {
    const auto cur = elevations[i];
    if (i == n - 1) {
      if (cur < elevations[low])
        low = i;
      if (dropFromMax() >= threshold)
        out.push_back(low);
    }
    else if (prev && *prev > cur) {
      const auto delta1 = dropFromMax();
      const auto delta2 = *prev - elevations[low];
      if (delta1 >= threshold && delta2 >= threshold) {
        out.push_back(low);
        prevMax = prev;
        low = i;
      }
      else if (delta2 >= threshold) {
        prevMax = prev;
        low = i;
      }
      else if (cur < elevations[low]) {
        low = i;
      }
    }
    prev = cur;
  }
  return out;
} // LocalMinimumIndices

Points FindLocalMinimums(const Polyline& lines, const ElevationSource& dem,
                         Meters interval, double threshold)
{
  auto out = Points{};
  for (const auto& reach : lines) {
    const auto dense = Densify(reach, interval);
    auto pts   = Points{};
    auto elevs = std::vector<double>{};
    pts.reserve(dense.size());
    elevs.reserve(dense.size());
    for (const auto& p : dense) {
      if (const auto z = dem.Sample(p)) {
        pts.push_back(p);
        elevs.push_back(*z);
      }
    }
    if (pts.size() != dense.size())
      Warn(dense.size() - pts.size(), " vertices without elevation skipped");
    for (auto i : LocalMinimumIndices(elevs, threshold))
      out.push_back(pts[i]);
  }
  return out;
} // FindLocalMinimums

} // thalweg
