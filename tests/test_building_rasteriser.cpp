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


#include <palmprep/processing/BuildingRasteriser.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::processing;
using namespace palmprep::testing;

namespace {
  Feature building(Geometry g, int id, int type, double height) {
    auto f = make_feature(std::move(g));
    f.attributes.insert("ID", id);
    f.attributes.insert("palm_type", type);
    f.attributes.insert("measuredHeight", height);
    return f;
  }

  FeatureSet set_of(std::vector<Feature> features) {
    FeatureSet fs;
    fs.crs = ReferenceSystem::epsg(25832);
    fs.features = std::move(features);
    return fs;
  }
}  // namespace

TEST_CASE("Buildings burn into every touched cell with the maximum value") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  auto fs = set_of({building(rect_geometry(1, 21, 9, 29), 1, 2, 12.5),
                    building(rect_geometry(5, 21, 15, 29), 2, 4, 8.0)});
  auto raster = rasterise_max(fs, "measuredHeight", grid, -9999);
  CHECK(raster.at(0, 0) == 12.5);
  CHECK(raster.at(1, 0) == 8.0);
  CHECK(raster.is_nodata(2, 0));
  CHECK(raster.is_nodata(0, 1));
}

TEST_CASE("Features without the attribute are skipped") {
  auto grid = make_grid(0, 10, 10, 1, 1);
  auto fs = set_of({make_feature(rect_geometry(1, 1, 9, 9))});
  fs.features.push_back(building(rect_geometry(20, 20, 30, 30), 1, 1, 3));
  auto raster = rasterise_max(fs, "measuredHeight", grid, -9999);
  CHECK(raster.all_nodata());
}

TEST_CASE("Buildings and bridges produce their layers") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  auto buildings = set_of({building(rect_geometry(1, 21, 9, 29), 1, 2, 12)});
  auto bridges = set_of({building(rect_geometry(21, 1, 29, 9), 2, 7, 5)});
  auto layers = rasterise_buildings(buildings, bridges, grid);
  std::vector<std::string> names;
  for (const auto& [name, raster] : layers) {
    names.push_back(name);
    CHECK(raster.grid.same_grid(grid));
  }
  CHECK(names == std::vector<std::string>{"building_type", "building_id",
                                          "building_height", "bridges_id",
                                          "bridges_height"});
  CHECK(layers[0].second.at(0, 0) == 2);
  CHECK(layers[3].second.at(2, 2) == 2);
}

TEST_CASE("No bridges means no bridge layers") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  auto buildings = set_of({building(rect_geometry(1, 21, 9, 29), 1, 2, 12)});
  auto layers = rasterise_buildings(buildings, set_of({}), grid);
  CHECK(layers.size() == 3);
}

TEST_CASE("Missing building attributes are reported") {
  auto grid = make_grid(0, 30, 10, 3, 3);
  auto buildings = set_of({make_feature(rect_geometry(1, 21, 9, 29))});
  CHECK_THROWS_AS(rasterise_buildings(buildings, set_of({}), grid),
                  ValidationError);
}
