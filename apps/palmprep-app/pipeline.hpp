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


#pragma once
#include <filesystem>
#include <optional>
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/CsdConfigWriter.hpp>
#include <palmprep/io/MetadataWriter.hpp>
#include <palmprep/io/PalmExport.hpp>
#include <palmprep/io/RasterReader.hpp>
#include <palmprep/io/RasterWriter.hpp>
#include <palmprep/io/TileFetcher.hpp>
#include <palmprep/io/VectorReader.hpp>
#include <palmprep/io/VectorTranslator.hpp>
#include <palmprep/io/VectorWriter.hpp>
#include <palmprep/logger/logger.h>
#include <palmprep/misc/RasterWarper.hpp>
#include <palmprep/misc/Vector2DOps.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <palmprep/processing/AoiValidator.hpp>
#include <palmprep/processing/BuildingClassifier.hpp>
#include <palmprep/processing/BuildingRasteriser.hpp>
#include <palmprep/processing/FeatureEnricher.hpp>
#include <palmprep/processing/GeometryNormalizer.hpp>
#include <palmprep/processing/GridAligner.hpp>
#include <palmprep/processing/LandCoverReclassifier.hpp>
#include <palmprep/processing/Mosaic.hpp>
#include <palmprep/processing/ZonalYearExtractor.hpp>
#include <palmprep/tiling/TileAcquirer.hpp>
#include <palmprep/tiling/TileGrid.hpp>
#include <string>
#include <vector>

#include "config.hpp"

namespace pp = palmprep;

// Collaborators shared by the pipeline stages
struct PipelineContext {
  std::unique_ptr<pp::misc::projHelperInterface> pj =
      pp::misc::createProjHelperOGR();
  std::unique_ptr<pp::misc::Vector2DOpsInterface> ops =
      pp::misc::createVector2DOpsGEOS();
  std::unique_ptr<pp::misc::RasterWarperInterface> warper =
      pp::misc::createRasterWarperGDAL();
  std::unique_ptr<pp::io::VectorReaderInterface> vector_reader =
      pp::io::createVectorReaderOGR();
  std::unique_ptr<pp::io::VectorWriterInterface> vector_writer =
      pp::io::createVectorWriterOGR();
  std::unique_ptr<pp::io::RasterReaderInterface> raster_reader =
      pp::io::createRasterReaderGDAL();
  std::unique_ptr<pp::io::RasterWriterInterface> raster_writer =
      pp::io::createRasterWriterGDAL();
  std::unique_ptr<pp::io::TileFetcherInterface> fetcher;

  explicit PipelineContext(const PalmprepConfig& cfg)
      : fetcher(pp::io::createTileFetcherCurl(
            pp::io::TileFetchConfig{.timeout_seconds = cfg.http_timeout,
                                    .max_retries = cfg.http_max_retries,
                                    .backoff_ms = cfg.http_backoff_ms})) {}
};

inline std::vector<std::string> tile_names(
    const std::vector<pp::tiling::Tile>& tiles) {
  std::vector<std::string> names;
  for (const auto& tile : tiles) names.push_back(tile.name);
  return names;
}

inline pp::AreaOfInterest read_aoi(const PalmprepConfig& cfg,
                                   PipelineContext& ctx) {
  auto& logger = pp::logger::Logger::get_logger();
  logger.info("Reading area of interest from {}", cfg.aoi_path);
  ctx.vector_reader->open(cfg.aoi_path);
  auto aoi = pp::processing::validate_aoi(
      ctx.vector_reader->read_layer(cfg.aoi_layer));
  auto box = aoi.box();
  logger.info("AOI has {} polygon(s), extent [{}, {}, {}, {}] in {}",
              aoi.geometry.size(), box.pmin[0], box.pmin[1], box.pmax[0],
              box.pmax[1], aoi.crs.user_input());
  return aoi;
}

// Settlement extent tiles, mosaicked and clipped to the AOI
inline pp::RasterLayer acquire_wsf(const PalmprepConfig& cfg,
                                   PipelineContext& ctx,
                                   pp::tiling::TileAcquirer& acquirer,
                                   const pp::AreaOfInterest& aoi,
                                   std::vector<std::string>& tiles_used) {
  auto& logger = pp::logger::Logger::get_logger();
  pp::tiling::TileGridIndexer indexer(pp::tiling::TileGridSpec::wsf_evolution());
  auto region = ctx.pj->transform(aoi, indexer.spec().crs);
  auto tiles = indexer.intersecting_tiles(region.geometry);
  logger.info("{} WSF evolution tile(s) intersect the AOI", tiles.size());
  tiles_used = tile_names(tiles);

  auto rasters = acquirer.acquire_rasters(
      tiles, cfg.wsf_base_url, (fs::path(cfg.cache_dir) / "wsf").string(),
      *ctx.raster_reader);
  return pp::processing::mosaic_and_clip(rasters, region.geometry);
}

// Building models from all intersecting tiles, merged in the target CRS
inline pp::FeatureSet acquire_lod2(const PalmprepConfig& cfg,
                                   PipelineContext& ctx,
                                   pp::tiling::TileAcquirer& acquirer,
                                   const pp::AreaOfInterest& aoi,
                                   const pp::ReferenceSystem& target,
                                   std::vector<std::string>& tiles_used) {
  auto& logger = pp::logger::Logger::get_logger();
  pp::tiling::TileGridIndexer indexer(pp::tiling::TileGridSpec::lod2_bavaria());
  auto region = ctx.pj->transform(aoi, indexer.spec().crs);
  auto tiles = indexer.intersecting_tiles(region.geometry);
  logger.info("{} LoD2 tile(s) intersect the AOI", tiles.size());
  tiles_used = tile_names(tiles);

  auto sets = acquirer.acquire_vectors(
      tiles, cfg.lod2_base_url, (fs::path(cfg.cache_dir) / "lod2").string(),
      target, *ctx.vector_reader, *ctx.vector_writer, *ctx.pj);
  auto merged = pp::processing::merge_feature_sets(std::move(sets));
  logger.info("Merged {} building feature(s)", merged.size());
  return merged;
}

inline pp::io::CsdConfiguration csd_configuration(const PalmprepConfig& cfg,
                                                  const pp::GridSpec& grid) {
  pp::io::CsdConfiguration csd;
  csd.prefix = cfg.csd_prefix;
  csd.attributes = cfg.csd_attributes;
  csd.epsg = cfg.target_epsg;
  csd.season = cfg.season;
  csd.output_path = cfg.output_path;
  csd.file_out =
      cfg.csd_file_out.empty() ? cfg.prefix + "_static" : cfg.csd_file_out;
  csd.input_root_path = cfg.output_path;
  csd.input_files = cfg.csd_files;
  csd.domain.set_grid(grid);
  csd.domain.dz = cfg.dz;
  csd.domain.bridge_depth = cfg.bridge_depth;
  csd.domain.buildings_3d = cfg.buildings_3d;
  csd.domain.street_trees = cfg.street_trees;
  csd.domain.overhanging_trees = cfg.overhanging_trees;
  csd.domain.generate_vegetation_patches = cfg.generate_vegetation_patches;
  return csd;
}

inline void run_pipeline(const PalmprepConfig& cfg) {
  auto& logger = pp::logger::Logger::get_logger();
  PipelineContext ctx(cfg);
  pp::io::RunMetadata metadata;
  metadata.prefix = cfg.prefix;

  auto target = pp::ReferenceSystem::epsg(cfg.target_epsg);
  pp::processing::require_projected(target, *ctx.pj);
  auto aoi = read_aoi(cfg, ctx);

  pp::tiling::TileAcquirer acquirer(*ctx.fetcher);
  auto wsf = acquire_wsf(cfg, ctx, acquirer, aoi, metadata.wsf_tiles);
  auto lod2 =
      acquire_lod2(cfg, ctx, acquirer, aoi, target, metadata.lod2_tiles);

  // geometry cleanup
  auto translator = pp::io::createVectorTranslatorOGR(cfg.cache_dir);
  pp::processing::GeometryNormalizer normalizer(*ctx.ops, translator.get());
  auto report = normalizer.normalize(lod2);
  logger.info("Geometry normalisation finished in state {} ({} feature(s) "
              "repaired)",
              pp::processing::to_string(report.state()),
              report.repaired.size());

  // clip, identify and split off bridges
  pp::processing::FeatureEnricher enricher(
      *ctx.ops, *ctx.pj,
      {.function_attribute = cfg.function_attribute,
       .bridge_code = cfg.bridge_code,
       .id_attribute = cfg.id_attribute});
  auto enriched = enricher.enrich(report.features, aoi, target);
  metadata.building_count = enriched.buildings.size();
  metadata.bridge_count = enriched.bridges.size();

  pp::processing::ZonalYearExtractor zonal(*ctx.pj);
  zonal.extract(enriched.buildings, wsf);

  pp::processing::BuildingClassifier classifier(
      {.function_attribute = cfg.function_attribute,
       .year_attribute = zonal.attribute_,
       .bridge_code = cfg.bridge_code,
       .residential_code = cfg.residential_code});
  classifier.classify(enriched.buildings);

  // align all rasters on the reference grid
  pp::NamedRasters inputs;
  if (!cfg.dem_path.empty()) {
    inputs.emplace_back("terrain_height",
                        ctx.raster_reader->read(cfg.dem_path));
  }
  if (!cfg.landcover_path.empty()) {
    inputs.emplace_back("LC", ctx.raster_reader->read(cfg.landcover_path));
  }
  inputs.emplace_back("WSF", std::move(wsf));
  for (const auto& [name, path] : cfg.extra_rasters) {
    inputs.emplace_back(name, ctx.raster_reader->read(path));
  }

  pp::processing::GridAligner aligner(*ctx.warper, *ctx.pj);
  auto aligned = aligner.align(
      inputs, aoi,
      {.target_crs = target,
       .resolution = cfg.resolution,
       .categorical_markers = cfg.categorical_markers});
  metadata.grid = aligned.grid;

  pp::NamedRasters outputs;
  for (auto& [name, layer] : aligned.layers) {
    if (name == "LC") {
      for (auto& surface : pp::processing::reclassify_landcover(layer)) {
        outputs.push_back(std::move(surface));
      }
    }
    outputs.emplace_back(name, std::move(layer));
  }

  auto building_layers = pp::processing::rasterise_buildings(
      enriched.buildings, enriched.bridges, aligned.grid,
      {.id_attribute = cfg.id_attribute,
       .height_attribute = cfg.height_attribute});
  for (auto& layer : building_layers) {
    outputs.push_back(std::move(layer));
  }

  metadata.exports = pp::io::export_rasters(
      outputs, cfg.output_path, cfg.prefix, std::nullopt, *ctx.raster_writer);

  if (cfg.write_metadata) {
    auto path =
        (fs::path(cfg.output_path) / (cfg.prefix + "_metadata.json")).string();
    pp::io::createMetadataWriterJSON()->write(path, metadata);
    logger.info("Run metadata written to {}", path);
  }

  if (cfg.write_csd_config) {
    auto path = pp::io::write_csd_configuration(
        csd_configuration(cfg, aligned.grid), cfg.output_path);
    logger.info("CSD configuration written to {}", path);
  }
}
