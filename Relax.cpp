#include "Relax.hpp"

#include <cmath>
#include <iterator>
#include <stdexcept>

namespace gsl = gsl_lite;

namespace thalweg {

double AdjustmentWeight(double delta, Meters offset, Meters maxAdjustment) noexcept {
  const auto r = offset / maxAdjustment;
  return delta * std::exp(-r * r);
} // AdjustmentWeight

std::optional<gsl::index>
SelectSample(const Profile& profile, double referenceElevation,
             Meters maxAdjustment, double threshold)
{
  if (!(maxAdjustment > Meters{0}))
    throw std::invalid_argument{"maximum adjustment distance must be > 0"};
  if (profile.empty())
    return std::nullopt;

  const auto mid    = MidIndex(profile);
  const auto center = profile[mid].distance;

  auto best        = std::optional<gsl::index>{};
  auto best_weight = 0.0;
  for (gsl::index i = 0; i != std::ssize(profile); ++i) {
    const auto& s = profile[i];
    const auto elevation = (i == mid) ? std::optional{referenceElevation}
                                      : s.elevation;
    if (!elevation)
      continue;
    const auto delta = referenceElevation - *elevation;
    if (!(delta > threshold))
      continue;
    const auto weight = AdjustmentWeight(delta, std::abs(s.distance - center),
                                         maxAdjustment);
    if (best && !(weight > best_weight))
      continue;
    best = i;
    best_weight = weight;
  }
  return best;
} // SelectSample

Pt Relax(const Profile& profile, double referenceElevation,
         Meters maxAdjustment, double threshold)
{
  gsl_Expects(!profile.empty());
  const auto chosen = SelectSample(profile, referenceElevation, maxAdjustment,
                                   threshold);
  return profile[chosen.value_or(MidIndex(profile))].point;
} // Relax

} // thalweg
