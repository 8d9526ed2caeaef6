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
#include <palmprep/common/datastructures.hpp>
#include <string>
#include <vector>

namespace palmprep::io {
  struct VectorReaderInterface {
    std::string attribute_filter = "";

    virtual ~VectorReaderInterface() = default;

    virtual void open(const std::string& source) = 0;

    virtual std::vector<std::string> layer_names() = 0;

    // Reads one layer, the first one if `layer_name` is empty.
    virtual FeatureSet read_layer(const std::string& layer_name = "") = 0;

    // Reads and concatenates every layer of the opened source. Layers that
    // fail to read are skipped.
    virtual FeatureSet read_all_layers() = 0;
  };

  std::unique_ptr<VectorReaderInterface> createVectorReaderOGR();
}  // namespace palmprep::io
