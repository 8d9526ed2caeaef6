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
#include <filesystem>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <list>
#include <palmprep/common/common.hpp>
#include <palmprep/io/CsdConfigWriter.hpp>
#include <palmprep/logger/logger.h>
#include <sstream>
#include <string>
#include <system_error>
#include <toml++/toml.h>
#include <unordered_map>
#include <utility>
#include <vector>

#include "parameter.hpp"
#include "validators.hpp"

namespace fs = std::filesystem;
namespace check = palmprep::validators;

struct PalmprepConfig {
  // input
  std::string aoi_path;
  std::string aoi_layer;
  std::string dem_path;
  std::string landcover_path;
  palmprep::StrMap extra_rasters;

  // acquisition
  std::string wsf_base_url =
      "https://download.geoservice.dlr.de/WSF_EVO/files/";
  std::string lod2_base_url =
      "https://download1.bayernwolke.de/a/lod2/citygml/";
  std::string cache_dir = "cache";
  int http_timeout = 120;
  int http_max_retries = 3;
  int http_backoff_ms = 1000;

  // processing
  int target_epsg = 25832;
  double resolution = 10;
  std::string function_attribute = "function";
  std::string height_attribute = "measuredHeight";
  std::string id_attribute = "ID";
  std::string bridge_code = "53001_1800";
  std::string residential_code = "31001_1000";
  palmprep::vec1s categorical_markers = {"LC", "WSF"};

  // output
  std::string output_path;
  std::string prefix = "palm";
  bool write_metadata = true;

  // static driver configuration
  bool write_csd_config = false;
  palmprep::io::CsdAttributes csd_attributes;
  std::string csd_prefix = "static_driver";
  std::string season = "summer";
  std::string csd_file_out;
  palmprep::StrMap csd_files;
  double dz = 1.0;
  double bridge_depth = 3.0;
  bool buildings_3d = true;
  bool street_trees = true;
  bool overhanging_trees = true;
  bool generate_vegetation_patches = true;
};

namespace palmprep::validators {
  // Path exists validator, empty paths are accepted
  inline auto PathExists =
      [](const std::string& path) -> std::optional<std::string> {
    if (!path.empty() && !std::filesystem::exists(path)) {
      return std::format("Path {} does not exist.", path);
    }
    return std::nullopt;
  };

  // Every value of a key=value map must be an existing path
  inline auto PathsExist =
      [](const palmprep::StrMap& paths) -> std::optional<std::string> {
    for (const auto& [name, path] : paths) {
      if (!std::filesystem::exists(path)) {
        return std::format("Path {} for {} does not exist.", path, name);
      }
    }
    return std::nullopt;
  };

  // Create a validator for file path writeability
  inline auto DirIsWritable =
      [](const std::string& path) -> std::optional<std::string> {
    std::filesystem::path fs_path(path);

    // convert to absolute path
    auto abs_path = std::filesystem::absolute(fs_path);

    // find the first parent folders that already exists
    auto parent = abs_path;
    while (!std::filesystem::exists(parent)) {
      parent = parent.parent_path();
    }

    if (!std::filesystem::is_directory(parent)) {
      return std::format("Path {} is not a directory.", parent.string());
    }

    // Try to create a temporary file in parent
    auto testPath = parent / "write_test_tmp";
    bool writable = false;
    {
      std::ofstream test_file(testPath);
      writable = static_cast<bool>(test_file);
    }
    std::error_code ec;
    std::filesystem::remove(testPath, ec);
    if (writable) return std::nullopt;
    return std::format("Could not write to directory {}.", parent.string());
  };
}  // namespace palmprep::validators

struct CLIArgs {
  std::string program_name;
  std::list<std::string> args;

  CLIArgs(int argc, const char* argv[]) {
    program_name = argv[0];
    // get the name of the binary
    auto pos = program_name.find_last_of("/\\");
    if (pos != std::string::npos) {
      program_name = program_name.substr(pos + 1);
    }
    for (int i = 1; i < argc; i++) {
      args.push_back(argv[i]);
    }
  }
};

struct PalmprepConfigHandler {
  PalmprepConfig cfg_;

  using param_group_map = std::vector<std::pair<std::string, ParameterVector>>;

  param_group_map app_param_groups_;
  param_group_map param_groups_;
  std::unordered_map<std::string, ConfigParameter*> param_index_;
  std::unordered_map<std::string, ConfigParameter*> app_param_index_;

  // flags
  bool _print_help = false;
  bool _print_version = false;
  palmprep::logger::LogLevel _loglevel = palmprep::logger::LogLevel::info;
  std::string _config_path;

  // methods
  PalmprepConfigHandler() {
    ParameterVector input, acquisition, processing, output, csd;
    ParameterVector general;

    general.add("help", 'h', "Show help message", _print_help);
    general.add("version", 'v', "Show version", _print_version);
    general.add("config", 'c', "Configuration file", _config_path,
                {check::PathExists});
    general.add("loglevel", "Specify loglevel", _loglevel);

    input
        .add("aoi",
             "Area of interest. An OGR supported vector file with Polygon or "
             "MultiPolygon geometry and a defined CRS.",
             cfg_.aoi_path, {check::PathExists})
        .example_ = "\"aoi.gpkg\"";
    input.add("aoi-layer",
              "Select this layer name from `<aoi>`. By default the first layer "
              "is used.",
              cfg_.aoi_layer);
    input.add("dem",
              "Digital elevation model raster. Exported as `terrain_height`.",
              cfg_.dem_path, {check::PathExists});
    input.add("landcover",
              "Land cover classification raster. Aligned with nearest "
              "neighbour resampling and reclassified to PALM surface types.",
              cfg_.landcover_path, {check::PathExists});
    input
        .add("extra-raster",
             "Additional rasters to align and export, given as name=path. "
             "Names containing a categorical marker are resampled with "
             "nearest neighbour, others bilinearly.",
             cfg_.extra_rasters, {check::PathsExist})
        .example_ = "{ LC_urban = \"urban.tif\" }";

    acquisition.add("wsf-base-url",
                    "Base url of the WSF evolution tile server.",
                    cfg_.wsf_base_url, {check::BaseUrl});
    acquisition.add("lod2-base-url",
                    "Base url of the LoD2 CityGML tile server.",
                    cfg_.lod2_base_url, {check::BaseUrl});
    acquisition.add("cache-dir",
                    "Directory for downloaded and converted tiles. Existing "
                    "tiles are reused.",
                    cfg_.cache_dir, {check::DirIsWritable});
    acquisition.add("http-timeout", "Timeout for a single download in seconds.",
                    cfg_.http_timeout, {check::HigherThan<int>(0)});
    acquisition.add("http-max-retries",
                    "Number of retries after a failed download.",
                    cfg_.http_max_retries, {check::InRange<int>(0, 10)});
    acquisition.add("http-backoff-ms",
                    "Initial backoff between retries in milliseconds. Doubled "
                    "after every retry up to one minute.",
                    cfg_.http_backoff_ms, {check::HigherOrEqualTo<int>(0)});

    processing.add("target-epsg",
                   "EPSG code of the projected target CRS of all outputs.",
                   cfg_.target_epsg, {check::HigherThan<int>(0)});
    processing.add("resolution", 'r',
                   "Cell size of the output grid in target CRS units.",
                   cfg_.resolution, {check::HigherThan<double>(0)});
    processing.add("function-attribute",
                   "Building attribute with the function code.",
                   cfg_.function_attribute);
    processing.add("height-attribute",
                   "Building attribute with the measured building height.",
                   cfg_.height_attribute);
    processing.add("id-attribute",
                   "Attribute that receives the sequential building ID.",
                   cfg_.id_attribute);
    processing.add("bridge-code", "Function code of bridges.",
                   cfg_.bridge_code);
    processing.add("residential-code",
                   "Function code of residential buildings.",
                   cfg_.residential_code);
    processing.add("categorical-markers",
                   "Layer name markers that select nearest neighbour "
                   "resampling. Matched case-insensitively.",
                   cfg_.categorical_markers, {check::NonEmptyEntries});

    output.add("prefix", 'p', "Prefix of all output file names.", cfg_.prefix,
               {[](const std::string& s) -> std::optional<std::string> {
                 if (s.empty()) return "Prefix can not be empty.";
                 return std::nullopt;
               }});
    output.add("metadata", "Write a JSON summary of the run.",
               cfg_.write_metadata);
    output.add("csd-config",
               "Write a static driver (CSD) configuration file for the "
               "exported rasters.",
               cfg_.write_csd_config);

    csd.add("csd-prefix", "Prefix of the CSD configuration file.",
            cfg_.csd_prefix);
    csd.add("author", "Author of the static driver.",
            cfg_.csd_attributes.author);
    csd.add("contact-person", "Contact person.",
            cfg_.csd_attributes.contact_person);
    csd.add("acronym", "Institution acronym.", cfg_.csd_attributes.acronym);
    csd.add("comment", "Free comment.", cfg_.csd_attributes.comment);
    csd.add("data-content", "Description of the data content.",
            cfg_.csd_attributes.data_content);
    csd.add("location", "Location of the domain.",
            cfg_.csd_attributes.location);
    csd.add("site", "Site name.", cfg_.csd_attributes.site);
    csd.add("institution", "Institution.", cfg_.csd_attributes.institution);
    csd.add("palm-version", "PALM version.", cfg_.csd_attributes.palm_version);
    csd.add("references", "References.", cfg_.csd_attributes.references);
    csd.add("source", "Data sources.", cfg_.csd_attributes.source);
    csd.add("origin-time", "Origin time of the simulation.",
            cfg_.csd_attributes.origin_time)
        .example_ = "\"2023-07-01 12:00:00 +00\"";
    csd.add("season", "Season for the vegetation parameters.", cfg_.season,
            {check::OneOf<std::string>({"summer", "winter"})});
    csd.add("file-out",
            "Static driver output file. Defaults to `<prefix>_static`.",
            cfg_.csd_file_out);
    csd.add("csd-files",
            "Explicit input file names for the CSD input section, given as "
            "field=filename. Fields that are not given are discovered in the "
            "output directory.",
            cfg_.csd_files)
        .example_ = "{ file_lai = \"MUC_lai_10.tif\" }";
    csd.add("dz", "Vertical grid spacing.", cfg_.dz,
            {check::HigherThan<double>(0)});
    csd.add("bridge-depth", "Bridge depth in meters.", cfg_.bridge_depth,
            {check::HigherThan<double>(0)});
    csd.add("buildings-3d", "Enable 3D buildings.", cfg_.buildings_3d);
    csd.add("street-trees", "Enable street trees.", cfg_.street_trees);
    csd.add("overhanging-trees", "Enable overhanging trees.",
            cfg_.overhanging_trees);
    csd.add("vegetation-patches", "Generate vegetation patches.",
            cfg_.generate_vegetation_patches);

    param_groups_.emplace_back("Input", std::move(input));
    param_groups_.emplace_back("Acquisition", std::move(acquisition));
    param_groups_.emplace_back("Processing", std::move(processing));
    param_groups_.emplace_back("Output", std::move(output));
    param_groups_.emplace_back("Static driver configuration", std::move(csd));
    app_param_groups_.emplace_back("General", std::move(general));

    for (auto& [group_name, group] : param_groups_) {
      group.add_to_index(param_index_);
    }
    for (auto& [group_name, group] : app_param_groups_) {
      group.add_to_index(app_param_index_);
    }
  };

  void validate() {
    for (auto& [group_name, group] : param_groups_) {
      for (auto& param : group) {
        if (auto error_msg = param->validate()) {
          throw std::runtime_error(
              std::format("Validation error for {} parameter {}. {}",
                          group_name, param->longname_, *error_msg));
        }
      }
    }

    if (cfg_.aoi_path.empty()) {
      throw std::runtime_error("No area of interest specified.");
    }
    if (auto error_msg = check::DirIsWritable(cfg_.output_path)) {
      throw std::runtime_error(
          std::format("Can't write to output directory: {}", *error_msg));
    }
  }

  template <typename T, typename node>
  void get_toml_value(const node& config, const std::string& key, T& result) {
    if (auto tml_value = config[key].template value<T>();
        tml_value.has_value()) {
      result = *tml_value;
    } else {
      throw std::runtime_error(
          std::format("Failed to read value for {} from config file.", key));
    }
  }

  void print_help(std::string program_name) {
    // see http://docopt.org/
    std::cout << "Prepare static input rasters for PALM from WSF settlement "
                 "tiles and LoD2 building models\n\n";
    std::cout << "\033[1mUsage\033[0m:" << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] <aoi> <output-directory>" << "\n";
    std::cout << "  " << program_name;
    std::cout << " [options] (-c | --config) <config-file> [<aoi>] "
                 "<output-directory>"
              << "\n";
    std::cout << "  " << program_name;
    std::cout << " -h | --help" << "\n";
    std::cout << "  " << program_name;
    std::cout << " -v | --version" << "\n";
    std::cout << "\n";
    std::cout << "\033[1mPositional arguments:\033[0m" << "\n";
    std::cout << "  <aoi>                        Area of interest. Can be an "
                 "OGR supported file (eg. GPKG).\n";
    std::cout << "  <output-directory>           Output directory.\n";

    print_params(app_param_groups_);
    print_params(param_groups_);
  }

  // Utility function to wrap text to a specified width with proper indentation
  std::vector<std::string> wrap_text(const std::string& text, size_t max_width,
                                     size_t indent = 0) {
    std::vector<std::string> lines;
    std::string indent_str(indent, ' ');
    std::string current_line = indent_str;
    size_t current_width = indent;

    std::istringstream iss(text);
    std::string word;

    while (iss >> word) {
      if (current_width + word.length() + 1 > max_width &&
          current_line != indent_str) {
        lines.push_back(current_line);
        current_line = indent_str;
        current_width = indent;
      }
      if (current_line != indent_str) {
        current_line += " ";
        current_width += 1;
      }
      current_line += word;
      current_width += word.length();
    }
    if (current_line != indent_str) {
      lines.push_back(current_line);
    }
    return lines;
  }

  void print_params(param_group_map& params) {
    const size_t param_column_width = 35;
    const size_t desc_column_width = 65;
    const size_t width = param_column_width + desc_column_width;

    for (auto& [group_name, group] : params) {
      if (group.empty()) continue;
      std::cout << "\n";
      std::cout << "\033[1m" << group_name << " options:\033[0m\n";
      for (auto& param : group) {
        std::string param_text =
            param->cli_flag() + " " + param->type_description();
        auto wrapped_desc =
            wrap_text(param->description(), width, param_column_width + 2);
        auto wrapped_default =
            wrap_text("Default: " + param->default_to_string(), width,
                      param_column_width + 2);

        if (param_text.size() <= param_column_width - 2) {
          std::cout << "  " << std::setw(param_column_width) << std::left
                    << param_text;
          if (!wrapped_desc.empty()) {
            std::cout << wrapped_desc[0].substr(param_column_width + 2) << "\n";
          } else {
            std::cout << "\n";
          }
        } else {
          // parameter text too long, print it on its own line
          std::cout << "  " << param_text << "\n";
          if (!wrapped_desc.empty()) {
            std::cout << wrapped_desc[0] << "\n";
          }
        }
        for (size_t i = 1; i < wrapped_desc.size(); ++i) {
          std::cout << wrapped_desc[i] << "\n";
        }
        if (!param->example_.empty()) {
          std::cout << std::string(param_column_width + 2, ' ')
                    << "Example (toml): " << param->longname_ << " = "
                    << param->example_ << "\n";
        }
        for (const auto& line : wrapped_default) {
          if (line.size() > width - 3) {
            std::cout << "\033[34m" << line.substr(0, width - 3) << "..."
                      << "\033[0m" << "\n";
          } else {
            std::cout << "\033[34m" << line << "\033[0m" << "\n";
          }
        }
      }
    }
  }

  void print_version() { std::cout << std::format("palmprep {}\n", PP_VERSION); }

  void parse_cli_first_pass(CLIArgs& c) {
    // parse program control arguments (not in config file)
    auto it = c.args.begin();
    while (it != c.args.end()) {
      const std::string& arg = *it;
      std::string argname = "";
      if (arg.starts_with("--")) {
        argname = arg.substr(2);
      } else if (arg.starts_with("-")) {
        argname = arg.substr(1);
      }
      if (auto p = app_param_index_.find(argname);
          !argname.empty() && p != app_param_index_.end()) {
        it = c.args.erase(it);
        it = p->second->set(c.args, it);
        if (auto error_msg = p->second->validate()) {
          throw std::runtime_error(std::format("Invalid argument for {}. {}",
                                               arg, *error_msg));
        }
      } else {
        ++it;
      }
    }
  }

  void parse_cli_second_pass(CLIArgs& c) {
    auto it = c.args.begin();
    while (it != c.args.end()) {
      std::string arg = *it;

      try {
        if (arg.starts_with("--no-")) {
          auto argname = arg.substr(5);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            p->second->unset();
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("--")) {
          auto argname = arg.substr(2);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else if (arg.starts_with("-")) {
          auto argname = arg.substr(1);
          if (auto p = param_index_.find(argname); p != param_index_.end()) {
            it = c.args.erase(it);
            it = p->second->set(c.args, it);
          } else {
            throw std::runtime_error(std::format("Unknown argument: {}.", arg));
          }
        } else {
          ++it;
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            std::format("Error parsing argument: {}. {}.", arg, e.what()));
      }
    }

    // c.args now only contains positional arguments, either only the output
    // directory or the aoi followed by the output directory
    bool aoi_set = cfg_.aoi_path.size() > 0;
    bool output_set = cfg_.output_path.size() > 0;

    if (aoi_set && output_set && c.args.size() == 0) {
      // all set
    } else if (aoi_set && c.args.size() == 1) {
      cfg_.output_path = c.args.back();
    } else if (c.args.size() == 2) {
      cfg_.output_path = c.args.back();
      c.args.pop_back();
      cfg_.aoi_path = c.args.back();
    } else {
      throw std::runtime_error(
          "Unable to set input and output. Need to provide at least <output "
          "directory> and set the aoi in the config file or provide both "
          "<aoi> <output directory>.");
    }
  };

  void parse_config_file() {
    toml::table config;
    try {
      config = toml::parse_file(_config_path);
    } catch (const toml::parse_error& e) {
      throw std::runtime_error(
          std::format("Syntax error. {}", std::string(e.description())));
    }

    for (const auto& [key, value] : config) {
      try {
        if (key == "output-directory") {
          get_toml_value(config, "output-directory", cfg_.output_path);
        } else if (auto p = param_index_.find(std::string(key.str()));
                   p != param_index_.end()) {
          p->second->set_from_toml(config, std::string(key.str()));
        } else {
          throw std::runtime_error(
              std::format("Unknown parameter in config file: {}.", key.str()));
        }
      } catch (const std::exception& e) {
        throw std::runtime_error(
            std::format("Failed to read value for {} from config file. {}",
                        key.str(), e.what()));
      }
    }
  }
};

template <>
struct fmt::formatter<PalmprepConfigHandler> {
  static constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }
  template <typename Context>
  auto format(PalmprepConfigHandler const& cfgh, Context& ctx) const {
    fmt::format_to(ctx.out(), "PalmprepConfig(output_directory={}",
                   cfgh.cfg_.output_path);

    for (const auto& [groupname, param_list] : cfgh.param_groups_) {
      for (const auto& param : param_list) {
        fmt::format_to(ctx.out(), ", {}={}", param->longname_,
                       param->to_string());
      }
    }

    return fmt::format_to(ctx.out(), ")");
  }
};
