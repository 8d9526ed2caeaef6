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
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/RasterReader.hpp>
#include <palmprep/io/TileFetcher.hpp>
#include <palmprep/io/VectorReader.hpp>
#include <palmprep/io/VectorWriter.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <palmprep/tiling/TileGrid.hpp>
#include <string>
#include <vector>

namespace palmprep::tiling {

  // Sequential tile acquisition. Individual tile failures are logged and
  // skipped, the run only fails when nothing usable is left.
  class TileAcquirer {
    io::TileFetcherInterface& fetcher_;

   public:
    explicit TileAcquirer(io::TileFetcherInterface& fetcher)
        : fetcher_(fetcher){};

    // Path of the tile in `cache_dir`, downloaded first if missing. The
    // download goes to a `.part` file that is renamed on success, so an
    // interrupted transfer never looks like a cached tile. Throws
    // AcquisitionFailure.
    std::string download(const Tile& tile, const std::string& base_url,
                         const std::string& cache_dir);

    std::vector<RasterLayer> acquire_rasters(
        const std::vector<Tile>& tiles, const std::string& base_url,
        const std::string& cache_dir, io::RasterReaderInterface& reader);

    // Vector tiles are read across all layers, reprojected to `target` and
    // cached as `{tile}.gpkg`. A cached GeoPackage is loaded directly on
    // reruns and no download happens for that tile. An empty or unreadable
    // GeoPackage is deleted and the tile converted again.
    std::vector<FeatureSet> acquire_vectors(
        const std::vector<Tile>& tiles, const std::string& base_url,
        const std::string& cache_dir, const ReferenceSystem& target,
        io::VectorReaderInterface& reader, io::VectorWriterInterface& writer,
        misc::projHelperInterface& pjHelper);
  };

  std::string converted_tile_path(const Tile& tile,
                                  const std::string& cache_dir);

}  // namespace palmprep::tiling
