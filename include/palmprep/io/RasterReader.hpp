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
#include <string>

namespace palmprep::io {
  struct RasterReaderInterface {
    virtual ~RasterReaderInterface() = default;

    // Reads the first band. Throws AcquisitionFailure if the file cannot be
    // opened and ValidationError for rotated rasters.
    virtual RasterLayer read(const std::string& source) = 0;
  };

  std::unique_ptr<RasterReaderInterface> createRasterReaderGDAL();
}  // namespace palmprep::io
