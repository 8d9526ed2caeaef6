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


#include <palmprep/processing/Mosaic.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::processing;
using namespace palmprep::testing;

TEST_CASE("Adjacent tiles mosaic into one raster") {
  auto left = filled(make_grid(0, 4, 1, 4, 4), 1);
  auto right = filled(make_grid(4, 4, 1, 4, 4), 2);
  auto merged = mosaic_rasters({left, right});
  CHECK(merged.grid.nx == 8);
  CHECK(merged.grid.ny == 4);
  CHECK(merged.at(0, 0) == 1);
  CHECK(merged.at(7, 3) == 2);
}

TEST_CASE("Overlapping tiles keep the first valid value") {
  auto first = filled(make_grid(0, 4, 1, 4, 4), 1);
  first.at(3, 0) = first.nodata;
  auto second = filled(make_grid(2, 4, 1, 4, 4), 2);
  auto merged = mosaic_rasters({first, second});
  CHECK(merged.grid.nx == 6);
  CHECK(merged.at(2, 0) == 1);
  CHECK(merged.at(3, 0) == 2);
  CHECK(merged.at(5, 0) == 2);
}

TEST_CASE("Tiles with different resolution are rejected") {
  auto a = filled(make_grid(0, 4, 1, 4, 4), 1);
  auto b = filled(make_grid(4, 4, 2, 2, 2), 1);
  CHECK_THROWS_AS(mosaic_rasters({a, b}), ValidationError);
}

TEST_CASE("Mosaic and clip keeps only cells inside the AOI") {
  auto tile = filled(make_grid(0, 10, 1, 10, 10), 2000);
  auto clipped = mosaic_and_clip({tile}, {rect(2, 2, 6, 5)});
  CHECK(clipped.grid.origin_x == 2);
  CHECK(clipped.grid.origin_y == 5);
  CHECK(clipped.grid.nx == 4);
  CHECK(clipped.grid.ny == 3);
  CHECK(clipped.at(0, 0) == 2000);
}

TEST_CASE("Cells outside a non-rectangular AOI become nodata") {
  auto tile = filled(make_grid(0, 4, 1, 4, 4), 2000);
  Polygon triangle;
  triangle.exterior = {{0, 0, 0}, {4, 0, 0}, {0, 4, 0}};
  auto clipped = mosaic_and_clip({tile}, {triangle});
  CHECK(clipped.is_nodata(3, 0));
  CHECK_FALSE(clipped.is_nodata(0, 3));
}

TEST_CASE("Cells partly covered by the AOI are kept") {
  auto tile = filled(make_grid(0, 100, 10, 10, 10), 1990);
  auto clipped = mosaic_and_clip({tile}, {rect(0, 0, 34, 100)});
  CHECK(clipped.grid.nx == 4);
  CHECK(clipped.grid.ny == 10);
  for (size_t row = 0; row < clipped.grid.ny; ++row) {
    CHECK(clipped.at(3, row) == 1990);
  }
}

TEST_CASE("An AOI inside a single cell keeps that cell") {
  auto tile = filled(make_grid(0, 100, 10, 10, 10), 1990);
  auto clipped = mosaic_and_clip({tile}, {rect(11, 81, 14, 84)});
  CHECK(clipped.grid.origin_x == 10);
  CHECK(clipped.grid.origin_y == 90);
  CHECK(clipped.grid.nx == 1);
  CHECK(clipped.grid.ny == 1);
  CHECK(clipped.at(0, 0) == 1990);
}

TEST_CASE("mask_outside keeps cells the AOI only grazes") {
  auto raster = filled(make_grid(0, 4, 1, 4, 4), 7);
  Polygon triangle;
  triangle.exterior = {{0, 0, 0}, {2.8, 0, 0}, {0, 2.8, 0}};
  mask_outside(raster, {triangle});
  // centre (1.5, 1.5) lies outside, the hypotenuse still crosses the cell
  CHECK(raster.at(1, 2) == 7);
  CHECK(raster.is_nodata(2, 2));
  CHECK(raster.is_nodata(3, 0));
}

TEST_CASE("An AOI over nodata only is an empty result") {
  RasterLayer tile(make_grid(0, 4, 1, 4, 4), -9999);
  CHECK_THROWS_AS(mosaic_and_clip({tile}, {rect(1, 1, 3, 3)}),
                  EmptyResultError);
}

TEST_CASE("Cropping outside the raster is an empty result") {
  auto tile = filled(make_grid(0, 4, 1, 4, 4), 1);
  CHECK_THROWS_AS(crop_to_box(tile, Box{10, 10, 12, 12}), EmptyResultError);
}

TEST_CASE("Feature sets are merged in order") {
  FeatureSet a, b;
  a.crs = b.crs = ReferenceSystem::epsg(25832);
  a.features.push_back(make_feature(rect_geometry(0, 0, 1, 1), "a"));
  b.features.push_back(make_feature(rect_geometry(1, 1, 2, 2), "b"));
  b.features.push_back(make_feature(rect_geometry(2, 2, 3, 3), "c"));
  std::vector<FeatureSet> sets;
  sets.push_back(a);
  sets.push_back(b);
  auto merged = merge_feature_sets(std::move(sets));
  REQUIRE(merged.size() == 3);
  CHECK(*merged.features[2].attributes.get_as_string("function") == "c");
}

TEST_CASE("Feature sets in different CRS are not merged") {
  FeatureSet a, b;
  a.crs = ReferenceSystem::epsg(25832);
  b.crs = ReferenceSystem::epsg(4326);
  std::vector<FeatureSet> sets;
  sets.push_back(a);
  sets.push_back(b);
  CHECK_THROWS_AS(merge_feature_sets(std::move(sets)), ValidationError);
}
