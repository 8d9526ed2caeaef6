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
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/common.hpp>
#include <string>
#include <vector>

namespace palmprep::io {

  struct CsdAttributes {
    std::string author;
    std::string contact_person;
    std::string acronym;
    std::string comment;
    std::string data_content;
    std::string location;
    std::string site;
    std::string institution;
    std::string palm_version;
    std::string references;
    std::string source;
    // "YYYY-MM-DD HH:MM:SS +00"
    std::string origin_time;
  };

  struct CsdDomain {
    double pixel_size = 1.0;
    double origin_x = 0;
    double origin_y = 0;
    size_t nx = 0;
    size_t ny = 0;
    double dz = 1.0;
    double bridge_depth = 3.0;
    bool buildings_3d = true;
    bool street_trees = true;
    bool overhanging_trees = true;
    bool generate_vegetation_patches = true;

    // Lower left origin, cell counts and pixel size of `grid`.
    void set_grid(const GridSpec& grid);
  };

  struct CsdConfiguration {
    std::string prefix = "static_driver";
    CsdAttributes attributes;
    int epsg = 25832;
    std::string season = "summer";
    std::string output_path;
    std::string file_out;
    int version = 1;
    std::string input_root_path;
    // Explicit file names by field key (eg. "file_zt"), these win over
    // discovery.
    StrMap input_files;
    CsdDomain domain;
  };

  struct CsdFileField {
    std::string key;
    // Case insensitive substrings separated by '|'.
    std::string patterns;
  };

  // Input fields in output order.
  const std::vector<CsdFileField>& csd_file_fields();

  // First file name in `dir`, in sorted order, containing one of `patterns`.
  // Empty if none matches.
  std::string discover_file(const std::string& dir,
                            const std::string& patterns);

  // File name per field key, empty for fields without a file.
  StrMap resolve_input_files(const CsdConfiguration& config);

  std::string format_csd_configuration(const CsdConfiguration& config,
                                       const StrMap& files);

  // Writes `{prefix}_csd_configuration.yml` to `output_dir` and returns its
  // path. Throws ValidationError if the output or input directory is
  // missing.
  std::string write_csd_configuration(const CsdConfiguration& config,
                                      const std::string& output_dir);

}  // namespace palmprep::io
