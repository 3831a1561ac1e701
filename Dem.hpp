/// @file
/// Loading elevation rasters through GDAL.
#pragma once

#include "Raster.hpp"
#include "Units.hpp"

#include <filesystem>
#include <optional>

namespace thalweg {

struct Dem {
  Raster surface;
  /// Horizontal unit of a projected spatial reference, when recognised.
  std::optional<LinearUnit> linearUnit;
}; // Dem

/// Reads band 1 of any GDAL-readable raster into memory.  Throws
/// std::runtime_error carrying GDAL's message on failure.
Dem LoadDem(const std::filesystem::path& path);

} // thalweg
