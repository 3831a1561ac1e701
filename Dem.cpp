#include "Dem.hpp"
#include "Log.hpp"

#include <gdal_priv.h>
#include <ogr_spatialref.h>
#include <cpl_error.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace thalweg {

namespace {

struct DatasetCloser {
  void operator()(GDALDataset* ds) const noexcept
    { GDALClose(static_cast<GDALDatasetH>(ds)); }
}; // DatasetCloser

using DatasetPtr = std::unique_ptr<GDALDataset, DatasetCloser>;

[[noreturn]] void GdalFail(const std::string& what) {
  auto msg = what;
  const auto* detail = CPLGetLastErrorMsg();
  if (detail != nullptr && detail[0] != '\0') {
    msg += ": ";
    msg += detail;
  }
  throw std::runtime_error{msg};
} // GdalFail

} // anonymous

Dem LoadDem(const std::filesystem::path& path) {
  GDALAllRegister();
  auto ds = DatasetPtr{static_cast<GDALDataset*>(
                        GDALOpen(path.string().c_str(), GA_ReadOnly))};
  if (!ds)
    GdalFail("cannot open raster " + path.string());
  if (ds->GetRasterCount() < 1)
    throw std::runtime_error{"raster has no bands: " + path.string()};

  auto gt = GeoTransform{};
  if (ds->GetGeoTransform(gt.data()) != CE_None) {
    Warn(path.string(), " has no geotransform; using pixel coordinates");
    gt = GeoTransform{0.0, 1.0, 0.0, 0.0, 0.0, 1.0};
  }

  const auto cols = ds->GetRasterXSize();
  const auto rows = ds->GetRasterYSize();
  auto* band = ds->GetRasterBand(1);
  auto values = std::vector<float>(static_cast<std::size_t>(cols) * rows);
  const auto err = band->RasterIO(GF_Read, 0, 0, cols, rows, values.data(),
                                  cols, rows, GDT_Float32, 0, 0);
  if (err != CE_None)
    GdalFail("cannot read raster " + path.string());

  auto hasNoData = 0;
  const auto noDataValue = band->GetNoDataValue(&hasNoData);
  auto noData = std::optional<double>{};
  if (hasNoData)
    noData = noDataValue;

  auto unit = std::optional<LinearUnit>{};
  if (const auto* srs = ds->GetSpatialRef(); srs != nullptr && srs->IsProjected())
    unit = LinearUnitFromMetres(srs->GetLinearUnits());

  Log("loaded DEM ", path.string(), " (", cols, " x ", rows, " cells)");
  return Dem{Raster{gt, cols, rows, std::move(values), noData}, unit};
} // LoadDem

} // thalweg
