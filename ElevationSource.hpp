#pragma once

#include "Geometry.hpp"

#include <optional>

namespace thalweg {

/// Point elevation queries against a surface.  An empty result means
/// NoData: outside the surface, a NoData cell, or a non-finite value.
class ElevationSource {
public:
  virtual ~ElevationSource() = default;
  virtual std::optional<double> Sample(const Pt& p) const = 0;
}; // ElevationSource

} // thalweg
