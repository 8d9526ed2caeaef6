// Copyright (c) 2024-2025 palmprep contributors

// This file is part of palmprep

// palmprep is free software: you can redistribute it and/or modify it under
// the terms of the GNU General Public License as published by the Free
// Software Foundation, either version 3 of the License, or (at your option) any
// later version. palmprep is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General
// Public License for more details. You should have received a copy of the GNU
// General Public License along with palmprep. If not, see
// <https://www.gnu.org/licenses/>.

#include <fmt/format.h>
#include <gdal_priv.h>
#include <palmprep/io/RasterReader.hpp>
#include <palmprep/logger/logger.h>

#include "OGRConversion.hpp"

namespace palmprep::io {

  struct RasterReaderGDAL : public RasterReaderInterface {
    RasterReaderGDAL() { GDALAllRegister(); }

    RasterLayer read(const std::string& source) override {
      GDALDatasetUniquePtr dataset(GDALDataset::Open(
          source.c_str(), GDAL_OF_RASTER | GDAL_OF_READONLY));
      if (!dataset) {
        throw AcquisitionFailure(
            fmt::format("Cannot open raster {}", source));
      }
      double gt[6];
      if (dataset->GetGeoTransform(gt) != CE_None) {
        throw ValidationError(
            fmt::format("Raster {} has no geotransform", source));
      }
      if (gt[2] != 0 || gt[4] != 0 || gt[5] >= 0) {
        throw ValidationError(
            fmt::format("Raster {} is not north-up", source));
      }

      GridSpec grid;
      grid.origin_x = gt[0];
      grid.origin_y = gt[3];
      grid.res_x = gt[1];
      grid.res_y = -gt[5];
      grid.nx = dataset->GetRasterXSize();
      grid.ny = dataset->GetRasterYSize();
      grid.crs = ogr::to_reference_system(dataset->GetSpatialRef());

      auto* band = dataset->GetRasterBand(1);
      if (!band) {
        throw ValidationError(fmt::format("Raster {} has no bands", source));
      }
      int has_nodata = 0;
      double nodata = band->GetNoDataValue(&has_nodata);
      RasterLayer raster(grid, has_nodata ? nodata : -9999);
      if (band->RasterIO(GF_Read, 0, 0, grid.nx, grid.ny,
                         raster.values.data(), grid.nx, grid.ny, GDT_Float64,
                         0, 0) != CE_None) {
        throw AcquisitionFailure(
            fmt::format("Failed to read raster {}", source));
      }
      logger::Logger::get_logger().debug("Read {} x {} raster {}", grid.nx,
                                         grid.ny, source);
      return raster;
    }
  };

  std::unique_ptr<RasterReaderInterface> createRasterReaderGDAL() {
    return std::make_unique<RasterReaderGDAL>();
  };
}  // namespace palmprep::io
