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
#include <palmprep/common/datastructures.hpp>
#include <string>
#include <vector>

namespace palmprep::tiling {

  // Regular square tile grid whose tile origins are integer multiples of
  // `spacing` in the grid's own CRS.
  struct TileGridSpec {
    std::string name;
    double spacing;
    ReferenceSystem crs;
    // fmt pattern with {x} and {y}, the lower left corner divided by
    // `index_divisor`.
    std::string filename_pattern;
    double index_divisor = 1;

    // 2x2 degree WGS84 grid of the World Settlement Footprint evolution.
    static TileGridSpec wsf_evolution();
    // 2x2 km ETRS89 / UTM 32N grid of the Bavarian LoD2 CityGML tiles.
    static TileGridSpec lod2_bavaria();
  };

  struct Tile {
    double x;
    double y;
    double size;
    std::string name;

    Box box() const { return Box{x, y, x + size, y + size}; }
    bool operator==(const Tile& other) const {
      return x == other.x && y == other.y && size == other.size &&
             name == other.name;
    }
  };

  class TileGridIndexer {
    TileGridSpec spec_;

   public:
    explicit TileGridIndexer(TileGridSpec spec);

    const TileGridSpec& spec() const { return spec_; }

    std::string tile_name(double x, double y) const;

    // Tiles on the grid covering `bbox`, from floor(min / spacing) up to
    // the last multiple below the max edge.
    std::vector<Tile> candidates(const Box& bbox) const;

    // Candidates whose rectangle intersects the polygon itself. `aoi` must
    // be in the grid CRS. Throws NoIntersectingTiles if none remains.
    std::vector<Tile> intersecting_tiles(const MultiPolygon& aoi) const;
  };

}  // namespace palmprep::tiling
