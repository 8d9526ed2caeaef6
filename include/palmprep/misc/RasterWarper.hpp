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

namespace palmprep::misc {

  enum class ResamplingKernel { Nearest, Bilinear };

  inline const char* to_string(ResamplingKernel kernel) {
    return kernel == ResamplingKernel::Nearest ? "nearest" : "bilinear";
  }

  struct RasterWarperInterface {
    virtual ~RasterWarperInterface() = default;

    // Reprojects and resamples `source` onto exactly `target`. Cells without
    // source coverage are set to the source nodata value.
    virtual RasterLayer warp(const RasterLayer& source, const GridSpec& target,
                             ResamplingKernel kernel) = 0;
  };

  std::unique_ptr<RasterWarperInterface> createRasterWarperGDAL();
}  // namespace palmprep::misc
