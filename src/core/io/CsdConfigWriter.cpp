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

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/CsdConfigWriter.hpp>
#include <palmprep/logger/logger.h>

namespace palmprep::io {

  namespace fs = std::filesystem;

  namespace {
    const char* kRule =
        "#---------------------------------------------------------------------"
        "------#\n";

    const char* bool_text(bool value) { return value ? "true" : "false"; }

    std::string lookup(const StrMap& files, const std::string& key) {
      auto it = files.find(key);
      return it == files.end() ? std::string() : it->second;
    }

    template <typename Out>
    void file_entry(Out out, const StrMap& files, const std::string& key) {
      auto name = lookup(files, key);
      if (name.empty()) {
        fmt::format_to(out, "  # {}: not found\n", key);
      } else {
        fmt::format_to(out, "  {}: {}\n", key, name);
      }
    }

    template <typename Out>
    void section(Out out, const char* title) {
      fmt::format_to(out, "{}# {}\n{}", kRule, title, kRule);
    }
  }  // namespace

  void CsdDomain::set_grid(const GridSpec& grid) {
    pixel_size = grid.res_x;
    origin_x = grid.min_x();
    origin_y = grid.min_y();
    nx = grid.nx;
    ny = grid.ny;
  }

  const std::vector<CsdFileField>& csd_file_fields() {
    static const std::vector<CsdFileField> fields = {
        {"file_zt", "terrain_height|zt"},
        {"file_buildings_2d", "building_height|buildings_2d"},
        {"file_building_id", "building_id"},
        {"file_building_type", "building_type"},
        {"file_bridges_2d", "bridges_height|bridges_2d"},
        {"file_bridges_id", "bridges_id"},
        {"file_vegetation_type", "vegetation_type"},
        {"file_vegetation_height", "vegetation_height"},
        {"file_tree_height", "tree_height"},
        {"file_tree_crown_diameter", "tree_crown_diameter"},
        {"file_tree_trunk_diameter", "tree_trunk_diameter"},
        {"file_tree_type", "tree_type"},
        {"file_lai", "lai|leaf_area_index"},
        {"file_water_type", "water_type"},
        {"file_pavement_type", "pavement_type"},
        {"file_soil_type", "soil_type"},
    };
    return fields;
  }

  std::string discover_file(const std::string& dir,
                            const std::string& patterns) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
      names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    auto alternatives = split_string(to_lower(patterns), "|");
    for (const auto& name : names) {
      auto lower = to_lower(name);
      for (const auto& alt : alternatives) {
        if (!alt.empty() && lower.find(alt) != std::string::npos) return name;
      }
    }
    return "";
  }

  StrMap resolve_input_files(const CsdConfiguration& config) {
    StrMap files;
    for (const auto& field : csd_file_fields()) {
      auto given = lookup(config.input_files, field.key);
      files[field.key] =
          given.empty() ? discover_file(config.input_root_path, field.patterns)
                        : given;
    }
    return files;
  }

  std::string format_csd_configuration(const CsdConfiguration& config,
                                       const StrMap& files) {
    const auto& a = config.attributes;
    const auto& d = config.domain;
    std::string text;
    auto out = std::back_inserter(text);

    fmt::format_to(out, "# -*- coding: utf-8 -*-\n{}", kRule);
    fmt::format_to(out,
                   "# PALM-4U static driver configuration for {} ({} m "
                   "resolution)\n",
                   a.acronym, d.pixel_size);
    section(out, "Attributes section");
    fmt::format_to(out, "attributes:\n");
    fmt::format_to(out, "  author: {}\n", a.author);
    fmt::format_to(out, "  contact_person: {}\n", a.contact_person);
    fmt::format_to(out, "  acronym: {}\n", a.acronym);
    fmt::format_to(out, "  comment: {}\n", a.comment);
    fmt::format_to(out, "  data_content: {}\n", a.data_content);
    fmt::format_to(out, "  location: {}\n", a.location);
    fmt::format_to(out, "  site: {}\n", a.site);
    fmt::format_to(out, "  institution: {}\n", a.institution);
    fmt::format_to(out, "  palm_version: {}\n", a.palm_version);
    fmt::format_to(out, "  references: {}\n", a.references);
    fmt::format_to(out, "  source: {}\n", a.source);
    fmt::format_to(out, "  origin_time: \"{}\"\n\n", a.origin_time);

    section(out, "Settings section");
    fmt::format_to(out, "settings:\n  epsg: {}\n  season: {}\n\n", config.epsg,
                   config.season);

    section(out, "Output section");
    fmt::format_to(out, "output:\n  path: {}\n  file_out: {}\n  version: {}\n\n",
                   config.output_path, config.file_out, config.version);

    section(out, "Input section");
    fmt::format_to(out, "input_root:\n  # input directory\n  path: {}\n  \n",
                   config.input_root_path);
    fmt::format_to(out, "  # terrain\n");
    file_entry(out, files, "file_zt");
    fmt::format_to(out, "\n  # buildings LOD1\n");
    file_entry(out, files, "file_buildings_2d");
    file_entry(out, files, "file_building_id");
    file_entry(out, files, "file_building_type");
    fmt::format_to(out, " \n  # bridges\n");
    file_entry(out, files, "file_bridges_2d");
    file_entry(out, files, "file_bridges_id");
    fmt::format_to(out, "  \n  # vegetation\n");
    file_entry(out, files, "file_vegetation_type");
    file_entry(out, files, "file_vegetation_height");
    fmt::format_to(out, "\n  # resolved vegetation (trees)\n");
    file_entry(out, files, "file_tree_height");
    file_entry(out, files, "file_tree_crown_diameter");
    file_entry(out, files, "file_tree_trunk_diameter");
    file_entry(out, files, "file_tree_type");
    file_entry(out, files, "file_lai");
    fmt::format_to(out, "  \n  # water\n");
    file_entry(out, files, "file_water_type");
    fmt::format_to(out, "\n  # pavement\n");
    file_entry(out, files, "file_pavement_type");
    fmt::format_to(out, "  \n");
    file_entry(out, files, "file_soil_type");
    fmt::format_to(out, "\n\n");

    fmt::format_to(out, "{}", kRule);
    fmt::format_to(out,
                   "# Domain definition (root domain)\n"
                   "# NOTE:\n"
                   "# The here defined domain needs to be completely within "
                   "the boundaries of the data. \n"
                   "# Palm-4U cannot handle non-rectangular domains\n");
    fmt::format_to(out, "{}", kRule);
    fmt::format_to(out, "domain_root:\n");
    fmt::format_to(out, "  pixel_size: {}\n", d.pixel_size);
    fmt::format_to(out, "  origin_x: {}\n", d.origin_x);
    fmt::format_to(out, "  origin_y: {}\n", d.origin_y);
    fmt::format_to(out, "  nx: {}\n", d.nx);
    fmt::format_to(out, "  ny: {}\n", d.ny);
    fmt::format_to(out, "  dz: {}\n", d.dz);
    fmt::format_to(out, "  bridge_depth: {}\n", d.bridge_depth);
    fmt::format_to(out, "  buildings_3d: {}\n", bool_text(d.buildings_3d));
    fmt::format_to(out, "  street_trees: {}\n", bool_text(d.street_trees));
    fmt::format_to(out, "  overhanging_trees: {}\n",
                   bool_text(d.overhanging_trees));
    fmt::format_to(out, "  generate_vegetation_patches: {}\n",
                   bool_text(d.generate_vegetation_patches));
    return text;
  }

  std::string write_csd_configuration(const CsdConfiguration& config,
                                      const std::string& output_dir) {
    if (!fs::is_directory(output_dir)) {
      throw ValidationError(
          fmt::format("Output directory does not exist: {}", output_dir));
    }
    if (!fs::is_directory(config.input_root_path)) {
      throw ValidationError(fmt::format("Input directory does not exist: {}",
                                        config.input_root_path));
    }
    auto files = resolve_input_files(config);
    auto path = (fs::path(output_dir) /
                 (config.prefix + "_csd_configuration.yml"))
                    .string();
    std::ofstream ofs(path);
    if (!ofs) {
      throw palmprepException(fmt::format("Cannot write {}", path));
    }
    ofs << format_csd_configuration(config, files);
    ofs.close();
    logger::Logger::get_logger().info("Configuration file created: {}", path);
    return path;
  }

}  // namespace palmprep::io
