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
#include <optional>
#include <palmprep/common/datastructures.hpp>
#include <string>

namespace palmprep::io {

  // Last resort geometry conversion through an external translation utility.
  struct VectorTranslatorInterface {
    virtual ~VectorTranslatorInterface() = default;

    // Round trips `features` through the utility with the output geometry
    // type forced to MultiPolygon. nullopt if the utility is unavailable or
    // failed.
    virtual std::optional<FeatureSet> force_multipolygon(
        const FeatureSet& features) = 0;

    // Command line a user can run to do the same conversion by hand.
    virtual std::string remediation_command() const = 0;
  };

  std::unique_ptr<VectorTranslatorInterface> createVectorTranslatorOGR(
      std::string work_dir);
}  // namespace palmprep::io
