/// @file
/// Immutable in-memory elevation grid.
#pragma once

#include "ElevationSource.hpp"

#include <array>
#include <optional>
#include <utility>
#include <vector>

namespace thalweg {

/// Six-coefficient affine transform in the GDAL convention:
///   x = c[0] + col * c[1] + row * c[2]
///   y = c[3] + col * c[4] + row * c[5]
/// (col, row) address the upper-left corner of a cell.
using GeoTransform = std::array<double, 6>;

class Raster final : public ElevationSource {
public:
  /// values are row-major, cols * rows of them.  Throws
  /// std::invalid_argument on a size mismatch or a singular transform.
  Raster(const GeoTransform& transform, int cols, int rows,
         std::vector<float> values, std::optional<double> noData = {});

  int cols() const noexcept { return _cols; }
  int rows() const noexcept { return _rows; }
  const GeoTransform& transform() const noexcept { return _gt; }
  std::optional<double> noData() const noexcept { return _noData; }

  /// (col, row) of the cell containing p, or empty outside the grid.
  std::optional<std::pair<int, int>> CellOf(const Pt& p) const noexcept;

  /// Value of the cell containing p; no interpolation.
  std::optional<double> Sample(const Pt& p) const override;

private:
  GeoTransform _gt;
  GeoTransform _inv;
  int _cols;
  int _rows;
  std::vector<float> _values;
  std::optional<double> _noData;
}; // Raster

} // thalweg
