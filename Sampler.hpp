/// @file
/// Elevation profiles along transects.
#pragma once

#include "ElevationSource.hpp"
#include "Geometry.hpp"

#include <gsl-lite/gsl-lite.hpp>

#include <iterator>
#include <optional>
#include <vector>

namespace thalweg {

struct Sample {
  Meters distance;                  ///< from the transect's first endpoint
  Pt     point;
  std::optional<double> elevation;  ///< empty where the surface has NoData
}; // Sample

using Profile = std::vector<Sample>;

/// Number of spacing intervals across a transect of the given width.  The
/// count must be an even integer (at least 2) so that one sample falls
/// exactly on the transect midpoint; otherwise throws
/// InvalidSamplingConfigurationError.
gsl_lite::index ValidateSamplingConfiguration(Meters width, Meters spacing);

/// Samples every spacing along the transect, both endpoints included.
/// The result always holds an odd number of samples.
Profile SampleTransect(const Transect& transect, const ElevationSource& source,
                       Meters spacing);

inline gsl_lite::index MidIndex(const Profile& profile) {
  gsl_Expects(!profile.empty());
  return (std::ssize(profile) - 1) / 2;
}

} // thalweg
