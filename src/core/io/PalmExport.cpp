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

#include <cmath>
#include <filesystem>
#include <fmt/format.h>
#include <palmprep/logger/logger.h>
#include <palmprep/io/PalmExport.hpp>

namespace palmprep::io {

  namespace fs = std::filesystem;

  std::string export_filename(const std::string& prefix,
                              const std::string& name, int resolution) {
    return fmt::format("{}_{}_{}.tif", prefix, name, resolution);
  }

  std::vector<ExportRecord> export_rasters(const NamedRasters& rasters,
                                           const std::string& output_dir,
                                           const std::string& prefix,
                                           std::optional<int> resolution,
                                           RasterWriterInterface& writer) {
    auto& logger = logger::Logger::get_logger();
    if (rasters.empty()) {
      throw ValidationError("No rasters to export.");
    }
    for (const auto& [name, raster] : rasters) {
      if (name.empty()) {
        throw ValidationError("Every exported raster needs a name.");
      }
    }
    fs::create_directories(output_dir);

    int res = resolution.value_or(static_cast<int>(
        std::lround(rasters.front().second.grid.res_x)));

    std::vector<ExportRecord> records;
    records.reserve(rasters.size());
    for (const auto& [name, raster] : rasters) {
      auto filename = export_filename(prefix, name, res);
      auto filepath = (fs::path(output_dir) / filename).string();
      writer.write(filepath, raster);
      logger.info("Exported: {}", filename);
      records.push_back(ExportRecord{name, filename, filepath});
    }
    logger.info("All rasters exported to: {}", output_dir);
    return records;
  }

}  // namespace palmprep::io
