/// @file
/// Choosing a lower position for a line vertex from the elevation profile
/// of the transect through it.
///
/// Each sample with a known elevation gets a drop
///   delta = reference - elevation
/// and is eligible only when delta exceeds the threshold.  Eligible samples
/// are scored
///   weight = delta * exp(-(offset / maxAdjustment)^2)
/// where offset is the sample's distance from the transect midpoint, so a
/// modest drop near the vertex can beat a deeper one near the transect
/// ends.  The highest weight wins; on an exact tie the sample met first
/// (nearest the transect's first endpoint) is kept.
#pragma once

#include "Sampler.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <optional>

namespace thalweg {

namespace Tune {

/// Smallest elevation drop, in z units, worth moving a vertex for.
constexpr double ElevationDeltaThreshold = 0.2;

} // Tune

double AdjustmentWeight(double delta, Meters offset, Meters maxAdjustment) noexcept;

/// Index of the winning sample, or empty when none qualifies.  The
/// midpoint sample is scored with referenceElevation in place of its
/// sampled value.  Throws std::invalid_argument if maxAdjustment <= 0.
std::optional<gsl_lite::index>
SelectSample(const Profile& profile, double referenceElevation,
             Meters maxAdjustment,
             double threshold = Tune::ElevationDeltaThreshold);

/// Position of the winning sample, or of the midpoint sample (the
/// unrelaxed vertex) when none qualifies.
Pt Relax(const Profile& profile, double referenceElevation,
         Meters maxAdjustment,
         double threshold = Tune::ElevationDeltaThreshold);

} // thalweg
