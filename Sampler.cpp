#include "Sampler.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace gsl = gsl_lite;

namespace thalweg {

namespace Tune {

// Relative slack allowed when checking width / spacing for a whole number.
constexpr double IntervalTolerance = 1.0e-9;

} // Tune

gsl::index ValidateSamplingConfiguration(Meters width, Meters spacing) {
  auto fail = [&](const char* why) {
    auto msg = std::ostringstream{};
    msg << "transect width " << width << " and sample spacing " << spacing
        << ' ' << why;
    throw InvalidSamplingConfigurationError{msg.str()};
  };
  if (!(spacing > Meters{0}) || !std::isfinite(spacing))
    fail("(spacing must be a positive length)");
  if (!(width > Meters{0}) || !std::isfinite(width))
    fail("(width must be a positive length)");

  const auto ratio = width / spacing;
  const auto whole = std::round(ratio);
  if (std::abs(ratio - whole) > Tune::IntervalTolerance * std::max(1.0, ratio))
    fail("do not give a whole number of samples");
  const auto intervals = static_cast<gsl::index>(whole);
  if (intervals < 2 || intervals % 2 != 0)
    fail("do not give a sample at the transect midpoint");
  return intervals;
} // ValidateSamplingConfiguration

Profile SampleTransect(const Transect& transect, const ElevationSource& source,
                       Meters spacing)
{
  const auto intervals = ValidateSamplingConfiguration(Length(transect), spacing);
  auto profile = Profile{};
  profile.reserve(static_cast<std::size_t>(intervals) + 1);
  for (gsl::index i = 0; i <= intervals; ++i) {
    const auto t = static_cast<double>(i) / intervals;
    const auto p = geom::Lerp(transect.first, transect.second, t);
    profile.push_back(Sample{i * spacing, p, source.Sample(p)});
  }
  gsl_Ensures(std::ssize(profile) % 2 == 1);
  return profile;
} // SampleTransect

} // thalweg
