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


#include <palmprep/tiling/TileGrid.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::tiling;
using palmprep::testing::rect;

TEST_CASE("WSF tiles are named after their lower left corner") {
  TileGridIndexer indexer(TileGridSpec::wsf_evolution());
  CHECK(indexer.tile_name(10, 46) == "WSFevolution_v1_10_46.tif");
  CHECK(indexer.tile_name(-2, -4) == "WSFevolution_v1_-2_-4.tif");
}

TEST_CASE("LoD2 tiles use kilometre indices") {
  TileGridIndexer indexer(TileGridSpec::lod2_bavaria());
  CHECK(indexer.tile_name(690000, 5334000) == "690_5334.gml");
}

TEST_CASE("A small AOI inside one WSF tile yields exactly that tile") {
  TileGridIndexer indexer(TileGridSpec::wsf_evolution());
  auto tiles = indexer.intersecting_tiles({rect(11.5, 48.1, 11.6, 48.2)});
  REQUIRE(tiles.size() == 1);
  CHECK(tiles[0].name == "WSFevolution_v1_10_48.tif");
  CHECK(tiles[0].x == 10);
  CHECK(tiles[0].y == 48);
  CHECK(tiles[0].size == 2);
}

TEST_CASE("An AOI crossing a tile border yields both tiles") {
  TileGridIndexer indexer(TileGridSpec::lod2_bavaria());
  auto tiles = indexer.intersecting_tiles({rect(691500, 5334500, 692500,
                                                5335500)});
  std::set<std::string> names;
  for (const auto& t : tiles) names.insert(t.name);
  CHECK(names == std::set<std::string>{"690_5334.gml", "692_5334.gml"});
}

TEST_CASE("Tiles only touched by the AOI bounding box are dropped") {
  TileGridIndexer indexer(TileGridSpec::lod2_bavaria());
  // L-shaped AOI, its bounding box covers four tiles but the polygon only
  // three of them
  Polygon l_shape;
  l_shape.exterior = {{0, 0, 0},       {3900, 0, 0},    {3900, 1000, 0},
                      {1000, 1000, 0}, {1000, 3900, 0}, {0, 3900, 0}};
  auto candidates = indexer.candidates(l_shape.box());
  CHECK(candidates.size() == 4);
  auto tiles = indexer.intersecting_tiles({l_shape});
  CHECK(tiles.size() == 3);
  for (const auto& t : tiles) CHECK(t.name != "2_2.gml");
}

TEST_CASE("An AOI on a tile boundary does not create a tile beyond it") {
  TileGridIndexer indexer(TileGridSpec::lod2_bavaria());
  auto candidates = indexer.candidates(Box{2000, 2000, 4000, 4000});
  REQUIRE(candidates.size() == 1);
  CHECK(candidates[0].name == "2_2.gml");
}

TEST_CASE("Identical inputs give identical tile lists") {
  TileGridIndexer indexer(TileGridSpec::wsf_evolution());
  MultiPolygon aoi{rect(9.5, 47.5, 12.5, 50.5)};
  CHECK(indexer.intersecting_tiles(aoi) == indexer.intersecting_tiles(aoi));
}

TEST_CASE("An empty AOI has no intersecting tiles") {
  TileGridIndexer indexer(TileGridSpec::wsf_evolution());
  CHECK_THROWS_AS(indexer.intersecting_tiles({}), NoIntersectingTiles);
  CHECK_THROWS_AS(indexer.intersecting_tiles({}), EmptyResultError);
}

TEST_CASE("Tile grids need a positive spacing") {
  auto spec = TileGridSpec::wsf_evolution();
  spec.spacing = 0;
  CHECK_THROWS_AS(TileGridIndexer(spec), ValidationError);
}
