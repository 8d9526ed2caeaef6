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
#include <optional>
#include <palmprep/common/Raster.hpp>
#include <palmprep/io/RasterWriter.hpp>
#include <string>
#include <vector>

namespace palmprep::io {

  struct ExportRecord {
    std::string objectname;
    std::string filename;
    std::string filepath;
  };

  // `{prefix}_{name}_{resolution}.tif`
  std::string export_filename(const std::string& prefix,
                              const std::string& name, int resolution);

  // Writes every layer to `output_dir`, creating it when missing. Without a
  // `resolution` the rounded x resolution of the first layer is used.
  std::vector<ExportRecord> export_rasters(const NamedRasters& rasters,
                                           const std::string& output_dir,
                                           const std::string& prefix,
                                           std::optional<int> resolution,
                                           RasterWriterInterface& writer);

}  // namespace palmprep::io
