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

#include <cmath>
#include <fmt/format.h>
#include <palmprep/common/GeometryPredicates.hpp>
#include <palmprep/logger/logger.h>
#include <palmprep/tiling/TileGrid.hpp>

namespace palmprep::tiling {

  TileGridSpec TileGridSpec::wsf_evolution() {
    return TileGridSpec{.name = "wsf",
                        .spacing = 2,
                        .crs = ReferenceSystem::epsg(4326),
                        .filename_pattern = "WSFevolution_v1_{x}_{y}.tif",
                        .index_divisor = 1};
  }

  TileGridSpec TileGridSpec::lod2_bavaria() {
    return TileGridSpec{.name = "lod2",
                        .spacing = 2000,
                        .crs = ReferenceSystem::epsg(25832),
                        .filename_pattern = "{x}_{y}.gml",
                        .index_divisor = 1000};
  }

  TileGridIndexer::TileGridIndexer(TileGridSpec spec) : spec_(std::move(spec)) {
    if (!(spec_.spacing > 0)) {
      throw ValidationError(
          fmt::format("Tile spacing of grid '{}' must be positive.", spec_.name));
    }
    if (!(spec_.index_divisor > 0)) {
      throw ValidationError(fmt::format(
          "Tile index divisor of grid '{}' must be positive.", spec_.name));
    }
  }

  std::string TileGridIndexer::tile_name(double x, double y) const {
    auto ix = static_cast<long long>(std::floor(x / spec_.index_divisor));
    auto iy = static_cast<long long>(std::floor(y / spec_.index_divisor));
    return fmt::format(fmt::runtime(spec_.filename_pattern), fmt::arg("x", ix),
                       fmt::arg("y", iy));
  }

  std::vector<Tile> TileGridIndexer::candidates(const Box& bbox) const {
    std::vector<Tile> tiles;
    if (bbox.isEmpty()) return tiles;
    const double s = spec_.spacing;
    auto kx0 = static_cast<long long>(std::floor(bbox.pmin[0] / s));
    auto kx1 = static_cast<long long>(std::ceil(bbox.pmax[0] / s)) - 1;
    auto ky0 = static_cast<long long>(std::floor(bbox.pmin[1] / s));
    auto ky1 = static_cast<long long>(std::ceil(bbox.pmax[1] / s)) - 1;
    for (auto kx = kx0; kx <= kx1; ++kx) {
      for (auto ky = ky0; ky <= ky1; ++ky) {
        double x = kx * s;
        double y = ky * s;
        tiles.push_back(Tile{x, y, s, tile_name(x, y)});
      }
    }
    return tiles;
  }

  std::vector<Tile> TileGridIndexer::intersecting_tiles(
      const MultiPolygon& aoi) const {
    auto& logger = logger::Logger::get_logger();
    auto all = candidates(compute_box(aoi));
    std::vector<Tile> tiles;
    for (auto& tile : all) {
      if (multipolygon_intersects_box(aoi, tile.box())) {
        tiles.push_back(std::move(tile));
      }
    }
    logger.debug("{} of {} candidate {} tiles intersect the AOI", tiles.size(),
                 all.size(), spec_.name);
    if (tiles.empty()) {
      throw NoIntersectingTiles(
          fmt::format("No {} tiles intersect AOI.", spec_.name));
    }
    return tiles;
  }

}  // namespace palmprep::tiling
