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

#include <exception>
#include <palmprep/common/common.hpp>
#include <string>
#include <vector>

namespace palmprep {

  class palmprepException : public std::exception {
   public:
    explicit palmprepException(const std::string& message)
        : msg_("Error: " + message) {}
    virtual const char* what() const throw() { return msg_.c_str(); }

   protected:
    std::string msg_;
  };

  // Malformed inputs: bad AOI, missing attribute columns, undefined CRS.
  class ValidationError : public palmprepException {
   public:
    using palmprepException::palmprepException;
  };

  // A tile or file could not be retrieved.
  class AcquisitionFailure : public palmprepException {
   public:
    AcquisitionFailure(const std::string& message, long status = 0)
        : palmprepException(message), status_(status) {}
    long status() const { return status_; }

   private:
    long status_;
  };

  class GeometryRepairFailed : public palmprepException {
   public:
    GeometryRepairFailed(const std::string& message, vec1ui indices,
                         std::string remediation)
        : palmprepException(message),
          indices_(std::move(indices)),
          remediation_(std::move(remediation)) {}
    const vec1ui& indices() const { return indices_; }
    const std::string& remediation() const { return remediation_; }

   private:
    vec1ui indices_;
    std::string remediation_;
  };

  class EmptyResultError : public palmprepException {
   public:
    using palmprepException::palmprepException;
  };

  class NoIntersectingTiles : public EmptyResultError {
   public:
    using EmptyResultError::EmptyResultError;
  };

  struct ReferenceSystem {
    std::string auth_name;
    std::string code;
    std::string wkt;

    bool is_defined() const { return !wkt.empty() || !code.empty(); }
    // "EPSG:25832" style identifier, or the WKT if no authority is known.
    std::string user_input() const {
      if (!auth_name.empty() && !code.empty()) return auth_name + ":" + code;
      return wkt;
    }
    static ReferenceSystem epsg(int code) {
      return ReferenceSystem{"EPSG", std::to_string(code), ""};
    }
  };

  // Ordered feature collection sharing one CRS.
  struct FeatureSet {
    ReferenceSystem crs;
    std::vector<Feature> features;

    size_t size() const { return features.size(); }
    bool empty() const { return features.empty(); }
    // True if at least one feature carries the attribute.
    bool has_attribute(const std::string& name) const;
  };

  // Polygonal area of interest with its CRS.
  struct AreaOfInterest {
    MultiPolygon geometry;
    ReferenceSystem crs;

    Box box() const { return compute_box(geometry); }
  };

}  // namespace palmprep
