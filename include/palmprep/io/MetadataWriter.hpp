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
#include <memory>
#include <palmprep/common/Raster.hpp>
#include <palmprep/io/PalmExport.hpp>
#include <string>
#include <vector>

namespace palmprep::io {

  struct RunMetadata {
    std::string prefix;
    GridSpec grid;
    std::vector<std::string> wsf_tiles;
    std::vector<std::string> lod2_tiles;
    size_t building_count = 0;
    size_t bridge_count = 0;
    std::vector<ExportRecord> exports;
  };

  struct MetadataWriterInterface {
    int indent_ = 2;

    virtual ~MetadataWriterInterface() = default;

    virtual void write(const std::string& destination,
                       const RunMetadata& metadata) = 0;
  };

  std::unique_ptr<MetadataWriterInterface> createMetadataWriterJSON();
}  // namespace palmprep::io
