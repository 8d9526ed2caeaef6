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

#include <cpl_string.h>
#include <filesystem>
#include <fmt/format.h>
#include <gdal_priv.h>
#include <palmprep/io/RasterWriter.hpp>
#include <palmprep/logger/logger.h>

#include "OGRConversion.hpp"

namespace palmprep::io {

  namespace fs = std::filesystem;

  struct RasterWriterGDAL : public RasterWriterInterface {
    RasterWriterGDAL() { GDALAllRegister(); }

    void write(const std::string& destination,
               const RasterLayer& raster) override {
      auto* driver =
          GetGDALDriverManager()->GetDriverByName(gdaldriver_.c_str());
      if (!driver) {
        throw palmprepException(
            fmt::format("GDAL driver {} not available", gdaldriver_));
      }
      auto parent = fs::path(destination).parent_path();
      if (!parent.empty()) fs::create_directories(parent);

      CPLStringList options;
      for (const auto& option : creation_options_) {
        options.AddString(option.c_str());
      }
      const auto& grid = raster.grid;
      GDALDatasetUniquePtr dataset(
          driver->Create(destination.c_str(), grid.nx, grid.ny, 1,
                         GDT_Float32, options.List()));
      if (!dataset) {
        throw palmprepException(fmt::format("Cannot create {}", destination));
      }
      double gt[6] = {grid.origin_x, grid.res_x, 0,
                      grid.origin_y, 0,          -grid.res_y};
      dataset->SetGeoTransform(gt);
      if (grid.crs.is_defined()) {
        auto srs = ogr::to_ogr_srs(grid.crs);
        dataset->SetSpatialRef(&srs);
      }
      auto* band = dataset->GetRasterBand(1);
      band->SetNoDataValue(raster.nodata);
      // RasterIO takes a non-const buffer even for writing.
      auto values = raster.values;
      if (band->RasterIO(GF_Write, 0, 0, grid.nx, grid.ny, values.data(),
                         grid.nx, grid.ny, GDT_Float64, 0, 0) != CE_None) {
        throw palmprepException(
            fmt::format("Failed to write raster {}", destination));
      }
      logger::Logger::get_logger().debug("Wrote {}", destination);
    }
  };

  std::unique_ptr<RasterWriterInterface> createRasterWriterGDAL() {
    return std::make_unique<RasterWriterGDAL>();
  };
}  // namespace palmprep::io
