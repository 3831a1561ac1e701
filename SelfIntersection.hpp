#pragma once

#include "Geometry.hpp"

namespace thalweg {

/// Removes the loops a reach forms where it crosses itself: whenever two
/// non-adjacent segments meet, the vertices between them are replaced by
/// the meeting point.  Consecutive duplicate vertices are dropped too.
Reach RepairSelfIntersections(const Reach& reach);

} // thalweg
