#include "Raster.hpp"

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace thalweg {

namespace {

GeoTransform Invert(const GeoTransform& g) {
  const auto det = g[1] * g[5] - g[2] * g[4];
  if (det == 0.0 || !std::isfinite(det))
    throw std::invalid_argument{"raster geotransform is not invertible"};
  // col = inv[0] + x * inv[1] + y * inv[2], likewise for row.
  auto inv = GeoTransform{};
  inv[1] =  g[5] / det;
  inv[2] = -g[2] / det;
  inv[4] = -g[4] / det;
  inv[5] =  g[1] / det;
  inv[0] = -g[0] * inv[1] - g[3] * inv[2];
  inv[3] = -g[0] * inv[4] - g[3] * inv[5];
  return inv;
} // Invert

} // anonymous

Raster::Raster(const GeoTransform& transform, int cols, int rows,
               std::vector<float> values, std::optional<double> noData)
  : _gt{transform}
  , _inv{Invert(transform)}
  , _cols{cols}
  , _rows{rows}
  , _values{std::move(values)}
  , _noData{noData}
{
  if (cols <= 0 || rows <= 0)
    throw std::invalid_argument{"raster must have at least one cell"};
  const auto expected = static_cast<std::size_t>(cols) * static_cast<std::size_t>(rows);
  if (_values.size() != expected) {
    throw std::invalid_argument{"raster has " + std::to_string(_values.size())
        + " values, expected " + std::to_string(expected)};
  }
} // Raster

std::optional<std::pair<int, int>> Raster::CellOf(const Pt& p) const noexcept {
  const auto col = std::floor(_inv[0] + p.x * _inv[1] + p.y * _inv[2]);
  const auto row = std::floor(_inv[3] + p.x * _inv[4] + p.y * _inv[5]);
  if (!(col >= 0.0 && col < _cols && row >= 0.0 && row < _rows))
    return std::nullopt;
  return std::pair{static_cast<int>(col), static_cast<int>(row)};
} // CellOf

std::optional<double> Raster::Sample(const Pt& p) const {
  const auto cell = CellOf(p);
  if (!cell)
    return std::nullopt;
  const auto [col, row] = *cell;
  const auto v = _values[static_cast<std::size_t>(row) * _cols + col];
  if (!std::isfinite(v))
    return std::nullopt;
  if (_noData && v == static_cast<float>(*_noData))
    return std::nullopt;
  return static_cast<double>(v);
} // Sample

} // thalweg
