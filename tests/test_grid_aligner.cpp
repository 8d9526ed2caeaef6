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


#include <palmprep/processing/GridAligner.hpp>

#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::processing;
using namespace palmprep::testing;
using palmprep::misc::ResamplingKernel;

TEST_CASE("Extents snap outward to the resolution") {
  auto snapped = snap_extent(Box{691003, 5334007, 691998, 5334991}, 10);
  CHECK(snapped.pmin[0] == 691000);
  CHECK(snapped.pmin[1] == 5334000);
  CHECK(snapped.pmax[0] == 692000);
  CHECK(snapped.pmax[1] == 5335000);
}

TEST_CASE("Snapping an aligned extent changes nothing") {
  Box aligned{100, 200, 300, 400};
  CHECK(snap_extent(aligned, 10) == aligned);
  CHECK(snap_extent(snap_extent(Box{0.3, 0.7, 9.2, 9.9}, 0.5),
                    0.5) == snap_extent(Box{0.3, 0.7, 9.2, 9.9}, 0.5));
}

TEST_CASE("Resolution must be positive") {
  CHECK_THROWS_AS(snap_extent(Box{0, 0, 1, 1}, 0), ValidationError);
  CHECK_THROWS_AS(snap_extent(Box{0, 0, 1, 1}, -5), ValidationError);
}

TEST_CASE("Kernel selection by layer name") {
  vec1s markers{"LC", "WSF"};
  CHECK(select_kernel("LC", markers) == ResamplingKernel::Nearest);
  CHECK(select_kernel("lc_urban", markers) == ResamplingKernel::Nearest);
  CHECK(select_kernel("WSF_evolution", markers) == ResamplingKernel::Nearest);
  CHECK(select_kernel("terrain_height", markers) ==
        ResamplingKernel::Bilinear);
  CHECK(select_kernel("wsf", {}) == ResamplingKernel::Bilinear);
}

TEST_CASE("Aligned layers share the reference grid") {
  IdentityProjHelper pj;
  SamplingWarper warper;
  GridAligner aligner(warper, pj);
  AreaOfInterest aoi{{rect(3, 3, 47, 27)}, ReferenceSystem::epsg(25832)};

  NamedRasters layers;
  layers.emplace_back("terrain_height",
                      filled(make_grid(0, 30, 1, 50, 30), 500));
  layers.emplace_back("LC", filled(make_grid(0, 30, 5, 10, 6), 4));

  auto aligned = aligner.align(layers, aoi, {.resolution = 10});
  CHECK(aligned.grid.origin_x == 0);
  CHECK(aligned.grid.origin_y == 30);
  CHECK(aligned.grid.nx == 5);
  CHECK(aligned.grid.ny == 3);
  REQUIRE(aligned.layers.size() == 2);
  for (const auto& [name, layer] : aligned.layers) {
    CHECK(layer.grid.same_grid(aligned.grid));
  }
  CHECK(aligned.layers[0].first == "terrain_height");
  CHECK(aligned.layers[1].second.at(2, 1) == 4);
  CHECK(warper.kernels == std::vector<ResamplingKernel>{
                              ResamplingKernel::Bilinear,
                              ResamplingKernel::Nearest});
}

TEST_CASE("Cells the AOI does not touch are masked") {
  IdentityProjHelper pj;
  SamplingWarper warper;
  GridAligner aligner(warper, pj);
  Polygon triangle;
  triangle.exterior = {{0, 0, 0}, {45, 0, 0}, {0, 45, 0}};
  AreaOfInterest aoi{{triangle}, ReferenceSystem::epsg(25832)};
  NamedRasters layers;
  layers.emplace_back("terrain_height",
                      filled(make_grid(0, 50, 1, 50, 50), 500));
  auto aligned = aligner.align(layers, aoi, {.resolution = 10});
  const auto& layer = aligned.layers[0].second;
  REQUIRE(layer.grid.nx == 5);
  REQUIRE(layer.grid.ny == 5);
  // centre outside, part of the cell inside the triangle
  CHECK(layer.at(1, 1) == 500);
  CHECK(layer.at(0, 0) == 500);
  CHECK(layer.is_nodata(2, 1));
  CHECK(layer.is_nodata(4, 0));
  CHECK_FALSE(layer.is_nodata(0, 4));
}
