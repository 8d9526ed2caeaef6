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
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/MetadataWriter.hpp>
#include <palmprep/logger/logger.h>

namespace palmprep::io {

  namespace fs = std::filesystem;

  class MetadataWriterJSON : public MetadataWriterInterface {
    nlohmann::json grid2j(const GridSpec& grid) {
      nlohmann::json jgrid;
      jgrid["origin"] = {grid.origin_x, grid.origin_y};
      jgrid["resolution"] = {grid.res_x, grid.res_y};
      jgrid["size"] = {grid.nx, grid.ny};
      jgrid["extent"] = {grid.min_x(), grid.min_y(), grid.max_x(),
                         grid.max_y()};
      jgrid["crs"] = grid.crs.user_input();
      return jgrid;
    }

    void write_to_stream(const nlohmann::json& outputJSON,
                         std::ostream& output_stream) {
      try {
        if (indent_ > 0)
          output_stream << outputJSON.dump(indent_);
        else
          output_stream << outputJSON;
        output_stream << std::endl;
      } catch (const std::exception& e) {
        throw(palmprepException(e.what()));
      }
    }

   public:
    void write(const std::string& destination,
               const RunMetadata& metadata) override {
      nlohmann::json outputJSON;
      outputJSON["prefix"] = metadata.prefix;
      outputJSON["grid"] = grid2j(metadata.grid);
      outputJSON["tiles"] = {{"wsf", metadata.wsf_tiles},
                             {"lod2", metadata.lod2_tiles}};
      outputJSON["features"] = {{"buildings", metadata.building_count},
                                {"bridges", metadata.bridge_count}};
      auto exports = nlohmann::json::array();
      for (const auto& record : metadata.exports) {
        exports.push_back({{"objectname", record.objectname},
                           {"filename", record.filename},
                           {"filepath", record.filepath}});
      }
      outputJSON["exports"] = exports;

      auto parent = fs::path(destination).parent_path();
      if (!parent.empty()) fs::create_directories(parent);
      std::ofstream ofs(destination);
      if (!ofs) {
        throw palmprepException(fmt::format("Cannot write {}", destination));
      }
      write_to_stream(outputJSON, ofs);
      logger::Logger::get_logger().info("Wrote run metadata to {}",
                                        destination);
    }
  };

  std::unique_ptr<MetadataWriterInterface> createMetadataWriterJSON() {
    return std::make_unique<MetadataWriterJSON>();
  };
}  // namespace palmprep::io
