#include "CenterlineAdjuster.hpp"
#include "Log.hpp"
#include "Polyline.hpp"
#include "Sampler.hpp"
#include "SelfIntersection.hpp"
#include "Transect.hpp"

#include <gsl-lite/gsl-lite.hpp>
namespace gsl = gsl_lite;

#include <iterator>

namespace thalweg {

RelaxStats& RelaxStats::operator+=(const RelaxStats& rhs) noexcept {
  vertices   += rhs.vertices;
  moved      += rhs.moved;
  noData     += rhs.noData;
  degenerate += rhs.degenerate;
  return *this;
} // operator+=

Reach RelaxReach(const Reach& reach, const ElevationSource& dem,
                 const RelaxOptions& options, RelaxStats& stats)
{
  const auto width = 2 * options.searchDistance;
  ValidateSamplingConfiguration(width, options.spacing);

  const auto line = ArcLine{reach};
  auto builder = ReachBuilder{};
  for (gsl::index i = 0; i != std::ssize(reach); ++i) {
    const auto& vertex = reach[i];
    auto next = vertex;
    ++stats.vertices;
    try {
      const auto transect = BuildTransect(line, vertex, width);
      const auto profile  = SampleTransect(transect, dem, options.spacing);
      const auto reference = dem.Sample(vertex);
      if (reference) {
        const auto chosen = SelectSample(profile, *reference,
                                         options.searchDistance,
                                         options.threshold);
        if (chosen) {
          next = profile[*chosen].point;
          ++stats.moved;
        }
      } else {
        ++stats.noData;
      }
    }
    catch (const DegenerateGeometryError& e) {
      Warn("vertex ", i, " kept: ", e.what());
      ++stats.degenerate;
    }
    builder.Append(next);
  }

  auto relaxed = builder.Take();
  if (std::ssize(relaxed) < 2) {
    Warn("relaxed reach collapsed to a point; keeping the original");
    return reach;
  }
  return relaxed;
} // RelaxReach

Polyline RelaxPolyline(const Polyline& lines, const ElevationSource& dem,
                       const RelaxOptions& options)
{
  ValidateSamplingConfiguration(2 * options.searchDistance, options.spacing);

  auto out = Polyline{};
  auto total = RelaxStats{};
  const auto n = std::ssize(lines);
  for (gsl::index k = 0; k != n; ++k) {
    const auto& reach = lines[k];
    try {
      ValidateReach(reach);
    }
    catch (const DegenerateGeometryError& e) {
      Warn("reach ", k+1, " of ", n, " copied unchanged: ", e.what());
      out.push_back(reach);
      continue;
    }
    auto stats = RelaxStats{};
    auto relaxed = RelaxReach(reach, dem, options, stats);
    out.push_back(RepairSelfIntersections(relaxed));
    total += stats;
    Log("relaxed reach ", k+1, " of ", n, ": moved ", stats.moved, " of ",
        stats.vertices, " vertices");
  }
  if (total.noData != 0)
    Warn(total.noData, " vertices kept where the DEM has no data");
  return out;
} // RelaxPolyline

} // thalweg
