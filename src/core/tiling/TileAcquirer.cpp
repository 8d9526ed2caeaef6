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

#include <filesystem>
#include <fmt/format.h>
#include <palmprep/logger/logger.h>
#include <palmprep/tiling/TileAcquirer.hpp>

namespace palmprep::tiling {

  namespace fs = std::filesystem;

  namespace {
    // `{stem}.part{ext}` next to `destination`. Files are written there and
    // only moved into place once complete.
    fs::path partial_path(const fs::path& destination) {
      auto partial = destination;
      partial.replace_extension(".part" + destination.extension().string());
      return partial;
    }

    void discard(const fs::path& path) {
      std::error_code ec;
      fs::remove(path, ec);
      if (ec) {
        throw AcquisitionFailure(fmt::format("Cannot remove {}: {}",
                                             path.string(), ec.message()));
      }
    }

    void commit(const fs::path& partial, const fs::path& destination) {
      std::error_code ec;
      fs::rename(partial, destination, ec);
      if (ec) {
        discard(partial);
        throw AcquisitionFailure(fmt::format("Cannot move {} to {}: {}",
                                             partial.string(),
                                             destination.string(),
                                             ec.message()));
      }
    }
  }  // namespace

  std::string converted_tile_path(const Tile& tile,
                                  const std::string& cache_dir) {
    fs::path p = fs::path(cache_dir) / tile.name;
    p.replace_extension(".gpkg");
    return p.string();
  }

  std::string TileAcquirer::download(const Tile& tile,
                                     const std::string& base_url,
                                     const std::string& cache_dir) {
    auto& logger = logger::Logger::get_logger();
    fs::create_directories(cache_dir);
    auto destination = (fs::path(cache_dir) / tile.name).string();
    if (fs::exists(destination)) {
      logger.debug("Using cached tile {}", destination);
      return destination;
    }
    auto url = base_url + tile.name;
    logger.info("Downloading {}", url);
    auto partial = partial_path(destination);
    discard(partial);
    try {
      fetcher_.fetch(url, partial.string());
    } catch (const std::exception&) {
      discard(partial);
      throw;
    }
    commit(partial, destination);
    return destination;
  }

  std::vector<RasterLayer> TileAcquirer::acquire_rasters(
      const std::vector<Tile>& tiles, const std::string& base_url,
      const std::string& cache_dir, io::RasterReaderInterface& reader) {
    auto& logger = logger::Logger::get_logger();
    std::vector<RasterLayer> rasters;
    rasters.reserve(tiles.size());
    for (const auto& tile : tiles) {
      try {
        auto path = download(tile, base_url, cache_dir);
        rasters.push_back(reader.read(path));
        logger.trace("raster_tiles", rasters.size());
      } catch (const palmprepException& e) {
        logger.warning("Skipping tile {}. {}", tile.name, e.what());
      }
    }
    if (rasters.empty()) {
      throw EmptyResultError(
          "Tiles were identified but none could be downloaded or read.");
    }
    logger.info("Acquired {} of {} raster tiles", rasters.size(),
                tiles.size());
    return rasters;
  }

  std::vector<FeatureSet> TileAcquirer::acquire_vectors(
      const std::vector<Tile>& tiles, const std::string& base_url,
      const std::string& cache_dir, const ReferenceSystem& target,
      io::VectorReaderInterface& reader, io::VectorWriterInterface& writer,
      misc::projHelperInterface& pjHelper) {
    auto& logger = logger::Logger::get_logger();
    std::vector<FeatureSet> sets;
    sets.reserve(tiles.size());
    for (const auto& tile : tiles) {
      auto gpkg = converted_tile_path(tile, cache_dir);
      try {
        if (fs::exists(gpkg)) {
          logger.debug("Using converted tile {}", gpkg);
          try {
            reader.open(gpkg);
            auto features = reader.read_layer();
            if (!features.empty()) {
              sets.push_back(std::move(features));
              logger.trace("vector_tiles", sets.size());
              continue;
            }
            logger.warning("Converted tile {} is empty, converting again",
                           gpkg);
          } catch (const palmprepException& e) {
            logger.warning("Converted tile {} is unreadable, converting "
                           "again. {}",
                           gpkg, e.what());
          }
          discard(gpkg);
        }
        auto raw = download(tile, base_url, cache_dir);
        reader.open(raw);
        auto features = reader.read_all_layers();
        if (features.empty()) {
          logger.warning("Skipping tile {}. No features could be read.",
                         tile.name);
          continue;
        }
        auto reprojected = pjHelper.transform(features, target);
        auto partial = partial_path(gpkg);
        discard(partial);
        try {
          writer.write(partial.string(), reprojected);
        } catch (const std::exception&) {
          discard(partial);
          throw;
        }
        commit(partial, gpkg);
        sets.push_back(std::move(reprojected));
        logger.trace("vector_tiles", sets.size());
      } catch (const palmprepException& e) {
        logger.warning("Skipping tile {}. {}", tile.name, e.what());
      }
    }
    if (sets.empty()) {
      throw EmptyResultError("No tiles could be downloaded or read.");
    }
    logger.info("Acquired {} of {} vector tiles", sets.size(), tiles.size());
    return sets;
  }

}  // namespace palmprep::tiling
