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
#include <fmt/format.h>
#include <gdal_priv.h>
#include <gdalwarper.h>
#include <palmprep/logger/logger.h>
#include <palmprep/misc/RasterWarper.hpp>

#include "../io/OGRConversion.hpp"

namespace palmprep::misc {

  namespace {
    GDALDatasetUniquePtr create_mem(const GridSpec& grid, double nodata) {
      auto* driver = GetGDALDriverManager()->GetDriverByName("MEM");
      if (!driver) throw palmprepException("GDAL MEM driver not available");
      GDALDatasetUniquePtr dataset(driver->Create(
          "", static_cast<int>(grid.nx), static_cast<int>(grid.ny), 1,
          GDT_Float64, nullptr));
      if (!dataset) throw palmprepException("Cannot create MEM raster");
      double gt[6] = {grid.origin_x, grid.res_x, 0,
                      grid.origin_y, 0,          -grid.res_y};
      dataset->SetGeoTransform(gt);
      auto srs = io::ogr::to_ogr_srs(grid.crs);
      dataset->SetSpatialRef(&srs);
      dataset->GetRasterBand(1)->SetNoDataValue(nodata);
      return dataset;
    }

    GDALResampleAlg to_gdal(ResamplingKernel kernel) {
      return kernel == ResamplingKernel::Nearest ? GRA_NearestNeighbour
                                                 : GRA_Bilinear;
    }
  }  // namespace

  struct RasterWarperGDAL : public RasterWarperInterface {
    RasterWarperGDAL() { GDALAllRegister(); }

    RasterLayer warp(const RasterLayer& source, const GridSpec& target,
                     ResamplingKernel kernel) override {
      if (!source.grid.crs.is_defined() || !target.crs.is_defined()) {
        throw ValidationError("Warping requires a defined CRS on both grids.");
      }
      auto src = create_mem(source.grid, source.nodata);
      auto values = source.values;
      if (src->GetRasterBand(1)->RasterIO(
              GF_Write, 0, 0, static_cast<int>(source.grid.nx),
              static_cast<int>(source.grid.ny), values.data(),
              static_cast<int>(source.grid.nx),
              static_cast<int>(source.grid.ny), GDT_Float64, 0,
              0) != CE_None) {
        throw palmprepException("Cannot load raster for warping");
      }
      auto dst = create_mem(target, source.nodata);
      dst->GetRasterBand(1)->Fill(source.nodata);

      GDALWarpOptions* options = GDALCreateWarpOptions();
      options->hSrcDS = GDALDataset::ToHandle(src.get());
      options->hDstDS = GDALDataset::ToHandle(dst.get());
      options->nBandCount = 1;
      options->panSrcBands =
          static_cast<int*>(CPLMalloc(sizeof(int) * options->nBandCount));
      options->panSrcBands[0] = 1;
      options->panDstBands =
          static_cast<int*>(CPLMalloc(sizeof(int) * options->nBandCount));
      options->panDstBands[0] = 1;
      options->padfSrcNoDataReal =
          static_cast<double*>(CPLMalloc(sizeof(double)));
      options->padfSrcNoDataReal[0] = source.nodata;
      options->padfDstNoDataReal =
          static_cast<double*>(CPLMalloc(sizeof(double)));
      options->padfDstNoDataReal[0] = source.nodata;
      options->eResampleAlg = to_gdal(kernel);
      options->papszWarpOptions =
          CSLSetNameValue(options->papszWarpOptions, "INIT_DEST", "NO_DATA");
      options->pTransformerArg = GDALCreateGenImgProjTransformer2(
          options->hSrcDS, options->hDstDS, nullptr);
      options->pfnTransformer = GDALGenImgProjTransform;
      if (!options->pTransformerArg) {
        GDALDestroyWarpOptions(options);
        throw palmprepException("Cannot create warp transformer");
      }

      CPLErr err;
      {
        GDALWarpOperation operation;
        err = operation.Initialize(options);
        if (err == CE_None) {
          err = operation.ChunkAndWarpImage(0, 0, static_cast<int>(target.nx),
                                            static_cast<int>(target.ny));
        }
      }
      GDALDestroyGenImgProjTransformer(options->pTransformerArg);
      GDALDestroyWarpOptions(options);
      if (err != CE_None) {
        throw palmprepException(fmt::format("Warping failed: {}",
                                            CPLGetLastErrorMsg()));
      }

      RasterLayer result(target, source.nodata);
      if (dst->GetRasterBand(1)->RasterIO(
              GF_Read, 0, 0, static_cast<int>(target.nx),
              static_cast<int>(target.ny), result.values.data(),
              static_cast<int>(target.nx), static_cast<int>(target.ny),
              GDT_Float64, 0, 0) != CE_None) {
        throw palmprepException("Cannot read warped raster");
      }
      logger::Logger::get_logger().debug(
          "Warped {} x {} to {} x {} ({})", source.grid.nx, source.grid.ny,
          target.nx, target.ny, to_string(kernel));
      return result;
    }
  };

  std::unique_ptr<RasterWarperInterface> createRasterWarperGDAL() {
    return std::make_unique<RasterWarperGDAL>();
  };
}  // namespace palmprep::misc
