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
#include <fstream>
#include <palmprep/io/CsdConfigWriter.hpp>
#include <sstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "fakes.hpp"

using namespace palmprep;
using namespace palmprep::io;
using namespace palmprep::testing;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("Input files are discovered by case insensitive substring") {
  TempDir dir("csd_discover");
  dir.touch("MUC_Building_Height_10.tif");
  dir.touch("MUC_terrain_height_10.tif");
  dir.touch("a_zt.tif");

  CHECK(discover_file(dir.str(), "building_height|buildings_2d") ==
        "MUC_Building_Height_10.tif");
  // Sorted order decides between several matches.
  CHECK(discover_file(dir.str(), "terrain_height|zt") ==
        "MUC_terrain_height_10.tif");
  CHECK(discover_file(dir.str(), "soil_type").empty());
}

TEST_CASE("Explicit input files win over discovery") {
  TempDir dir("csd_resolve");
  dir.touch("MUC_vegetation_type_10.tif");
  CsdConfiguration config;
  config.input_root_path = dir.str();
  config.input_files["file_zt"] = "dem.tif";

  auto files = resolve_input_files(config);
  CHECK(files.at("file_zt") == "dem.tif");
  CHECK(files.at("file_vegetation_type") == "MUC_vegetation_type_10.tif");
  CHECK(files.at("file_soil_type").empty());
  CHECK(files.size() == csd_file_fields().size());
}

TEST_CASE("Configuration text") {
  CsdConfiguration config;
  config.attributes.acronym = "MUC";
  config.attributes.origin_time = "2024-07-01 12:00:00 +00";
  config.epsg = 25832;
  config.domain.set_grid(make_grid(690000, 5340100, 10, 30, 10));

  StrMap files{{"file_zt", "MUC_terrain_height_10.tif"}};
  auto text = format_csd_configuration(config, files);

  CHECK_THAT(text, ContainsSubstring("  file_zt: MUC_terrain_height_10.tif\n"));
  CHECK_THAT(text, ContainsSubstring("  # file_soil_type: not found\n"));
  CHECK_THAT(text, ContainsSubstring("epsg: 25832"));
  CHECK_THAT(text, ContainsSubstring("origin_time: \"2024-07-01 12:00:00 +00\""));
  CHECK_THAT(text, ContainsSubstring("domain_root:"));
  CHECK_THAT(text, ContainsSubstring("  origin_x: 690000\n"));
  CHECK_THAT(text, ContainsSubstring("  origin_y: 5340000\n"));
  CHECK_THAT(text, ContainsSubstring("  nx: 30\n"));
  CHECK_THAT(text, ContainsSubstring("  buildings_3d: true\n"));
}

TEST_CASE("Writing the configuration file") {
  TempDir input("csd_in");
  TempDir output("csd_out");
  input.touch("p_building_id_10.tif");

  CsdConfiguration config;
  config.prefix = "MUC";
  config.input_root_path = input.str();

  SECTION("file is written under the prefix") {
    auto path = write_csd_configuration(config, output.str());
    CHECK(std::filesystem::path(path).filename() ==
          "MUC_csd_configuration.yml");
    std::ifstream ifs(path);
    std::stringstream content;
    content << ifs.rdbuf();
    CHECK_THAT(content.str(),
               ContainsSubstring("  file_building_id: p_building_id_10.tif"));
  }

  SECTION("missing output directory") {
    CHECK_THROWS_AS(
        write_csd_configuration(config, (output.path / "missing").string()),
        ValidationError);
  }

  SECTION("missing input directory") {
    config.input_root_path = (input.path / "missing").string();
    CHECK_THROWS_WITH(write_csd_configuration(config, output.str()),
                      ContainsSubstring("Input directory does not exist"));
  }
}
