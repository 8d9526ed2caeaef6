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


#include <fstream>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "config.hpp"
#include "fakes.hpp"

using Catch::Matchers::ContainsSubstring;
using palmprep::testing::TempDir;

namespace {
  template <size_t N>
  CLIArgs make_args(const char* (&argv)[N]) {
    return CLIArgs(static_cast<int>(N), argv);
  }
}  // namespace

TEST_CASE("Positional arguments set the AOI and the output directory") {
  PalmprepConfigHandler handler;
  const char* argv[] = {"/usr/bin/palmprep", "aoi.gpkg", "out"};
  auto args = make_args(argv);
  CHECK(args.program_name == "palmprep");

  handler.parse_cli_second_pass(args);
  CHECK(handler.cfg_.aoi_path == "aoi.gpkg");
  CHECK(handler.cfg_.output_path == "out");
}

TEST_CASE("Options of every type are parsed") {
  PalmprepConfigHandler handler;
  const char* argv[] = {"palmprep",
                        "-r",
                        "5",
                        "--prefix",
                        "MUC",
                        "--http-max-retries",
                        "0",
                        "--categorical-markers",
                        "LC,WSF,IMP",
                        "--extra-raster",
                        "LC_urban=urban.tif,lai=lai.tif",
                        "--no-metadata",
                        "--csd-config",
                        "aoi.gpkg",
                        "out"};
  auto args = make_args(argv);
  handler.parse_cli_second_pass(args);

  const auto& cfg = handler.cfg_;
  CHECK(cfg.resolution == 5.0);
  CHECK(cfg.prefix == "MUC");
  CHECK(cfg.http_max_retries == 0);
  CHECK(cfg.categorical_markers == palmprep::vec1s{"LC", "WSF", "IMP"});
  CHECK(cfg.extra_rasters.at("LC_urban") == "urban.tif");
  CHECK(cfg.extra_rasters.at("lai") == "lai.tif");
  CHECK_FALSE(cfg.write_metadata);
  CHECK(cfg.write_csd_config);
}

TEST_CASE("Unknown and malformed arguments are rejected") {
  PalmprepConfigHandler handler;
  SECTION("unknown option") {
    const char* argv[] = {"palmprep", "--bogus", "aoi.gpkg", "out"};
    auto args = make_args(argv);
    CHECK_THROWS_WITH(handler.parse_cli_second_pass(args),
                      ContainsSubstring("Unknown argument: --bogus"));
  }
  SECTION("malformed key=value list") {
    const char* argv[] = {"palmprep", "--extra-raster", "novalue", "a", "b"};
    auto args = make_args(argv);
    CHECK_THROWS(handler.parse_cli_second_pass(args));
  }
  SECTION("missing output directory") {
    const char* argv[] = {"palmprep"};
    auto args = make_args(argv);
    CHECK_THROWS(handler.parse_cli_second_pass(args));
  }
}

TEST_CASE("The first pass only consumes program control arguments") {
  TempDir dir("app_first_pass");
  dir.touch("palmprep.toml");
  auto config_path = (dir.path / "palmprep.toml").string();

  PalmprepConfigHandler handler;
  const char* argv[] = {"palmprep", "-c",      config_path.c_str(),
                        "--loglevel", "debug", "-r",
                        "2",          "out"};
  auto args = make_args(argv);
  handler.parse_cli_first_pass(args);

  CHECK(handler._config_path == config_path);
  CHECK(handler._loglevel == palmprep::logger::LogLevel::debug);
  CHECK(args.args == std::list<std::string>{"-r", "2", "out"});
}

TEST_CASE("Config files set parameters by long name") {
  TempDir dir("app_config_file");
  auto config_path = (dir.path / "palmprep.toml").string();
  PalmprepConfigHandler handler;
  handler._config_path = config_path;

  SECTION("valid file") {
    {
      std::ofstream ofs(config_path);
      ofs << "aoi = \"aoi.gpkg\"\n"
             "output-directory = \"out\"\n"
             "resolution = 5\n"
             "categorical-markers = [\"LC\"]\n"
             "csd-files = { file_zt = \"dem.tif\" }\n"
             "season = \"winter\"\n";
    }
    handler.parse_config_file();
    const auto& cfg = handler.cfg_;
    CHECK(cfg.aoi_path == "aoi.gpkg");
    CHECK(cfg.output_path == "out");
    CHECK(cfg.resolution == 5.0);
    CHECK(cfg.categorical_markers == palmprep::vec1s{"LC"});
    CHECK(cfg.csd_files.at("file_zt") == "dem.tif");
    CHECK(cfg.season == "winter");
  }

  SECTION("unknown key") {
    {
      std::ofstream ofs(config_path);
      ofs << "resolutoin = 5\n";
    }
    CHECK_THROWS_WITH(handler.parse_config_file(),
                      ContainsSubstring("Unknown parameter in config file"));
  }

  SECTION("syntax error") {
    {
      std::ofstream ofs(config_path);
      ofs << "resolution = = 5\n";
    }
    CHECK_THROWS_WITH(handler.parse_config_file(),
                      ContainsSubstring("Syntax error"));
  }

  SECTION("wrong value type in a table") {
    {
      std::ofstream ofs(config_path);
      ofs << "extra-raster = { LC = 3 }\n";
    }
    CHECK_THROWS(handler.parse_config_file());
  }
}

TEST_CASE("Validation of the parsed configuration") {
  TempDir dir("app_validate");
  dir.touch("aoi.gpkg");
  PalmprepConfigHandler handler;
  handler.cfg_.aoi_path = (dir.path / "aoi.gpkg").string();
  handler.cfg_.output_path = (dir.path / "out").string();
  handler.cfg_.cache_dir = (dir.path / "cache").string();

  CHECK_NOTHROW(handler.validate());

  SECTION("missing AOI file") {
    handler.cfg_.aoi_path = (dir.path / "missing.gpkg").string();
    CHECK_THROWS_WITH(handler.validate(), ContainsSubstring("parameter aoi"));
  }
  SECTION("non positive resolution") {
    handler.cfg_.resolution = 0;
    CHECK_THROWS_WITH(handler.validate(),
                      ContainsSubstring("parameter resolution"));
  }
  SECTION("tile server url without trailing slash") {
    handler.cfg_.wsf_base_url = "https://example.org/wsf";
    CHECK_THROWS_WITH(handler.validate(), ContainsSubstring("must end with"));
  }
  SECTION("too many download retries") {
    handler.cfg_.http_max_retries = 50;
    CHECK_THROWS_WITH(handler.validate(),
                      ContainsSubstring("parameter http-max-retries"));
  }
  SECTION("unknown season") {
    handler.cfg_.season = "spring";
    CHECK_THROWS_WITH(handler.validate(),
                      ContainsSubstring("not one of the allowed values"));
  }
}

TEST_CASE("Range validators") {
  namespace v = palmprep::validators;
  CHECK_FALSE(v::InRange<int>(1, 3)(2));
  CHECK(v::InRange<int>(1, 3)(4).value() == "Value 4 is out of range <1, 3>.");
  CHECK(v::HigherThan<double>(0)(0.0));
  CHECK_FALSE(v::HigherOrEqualTo<int>(0)(0));
  CHECK(v::NonEmptyEntries({"LC", ""}));
}
