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

#include <algorithm>
#include <filesystem>
#include <fmt/format.h>
#include <gdal_priv.h>
#include <map>
#include <ogrsf_frmts.h>
#include <palmprep/io/VectorWriter.hpp>
#include <palmprep/logger/logger.h>

#include "OGRConversion.hpp"

namespace palmprep::io {

  namespace fs = std::filesystem;

  namespace {
    struct FieldTypeVisitor {
      std::optional<OGRFieldType> operator()(std::monostate) const {
        return std::nullopt;
      }
      std::optional<OGRFieldType> operator()(bool) const { return OFTInteger; }
      std::optional<OGRFieldType> operator()(int) const { return OFTInteger; }
      std::optional<OGRFieldType> operator()(double) const { return OFTReal; }
      std::optional<OGRFieldType> operator()(const std::string&) const {
        return OFTString;
      }
    };

    struct FieldSetter {
      OGRFeature& feature;
      int index;

      void operator()(std::monostate) const { feature.SetFieldNull(index); }
      void operator()(bool v) const { feature.SetField(index, v ? 1 : 0); }
      void operator()(int v) const { feature.SetField(index, v); }
      void operator()(double v) const { feature.SetField(index, v); }
      void operator()(const std::string& v) const {
        feature.SetField(index, v.c_str());
      }
    };
  }  // namespace

  struct VectorWriterOGR : public VectorWriterInterface {
    VectorWriterOGR() { GDALAllRegister(); }

    void write(const std::string& destination,
               const FeatureSet& features) override {
      auto& logger = logger::Logger::get_logger();
      auto* driver =
          GetGDALDriverManager()->GetDriverByName(gdaldriver_.c_str());
      if (!driver) {
        throw palmprepException(
            fmt::format("GDAL driver {} not available", gdaldriver_));
      }
      auto parent = fs::path(destination).parent_path();
      if (create_directories_ && !parent.empty()) {
        fs::create_directories(parent);
      }
      if (fs::exists(destination)) {
        if (!overwrite_file_) {
          throw palmprepException(
              fmt::format("File {} already exists", destination));
        }
        driver->Delete(destination.c_str());
      }

      GDALDatasetUniquePtr dataset(driver->Create(
          destination.c_str(), 0, 0, 0, GDT_Unknown, nullptr));
      if (!dataset) {
        throw palmprepException(
            fmt::format("Cannot create {}", destination));
      }
      auto srs = ogr::to_ogr_srs(features.crs);
      OGRLayer* layer =
          dataset->CreateLayer(layername_.c_str(),
                               features.crs.is_defined() ? &srs : nullptr,
                               wkbUnknown, nullptr);
      if (!layer) {
        throw palmprepException(
            fmt::format("Cannot create layer {} in {}", layername_,
                        destination));
      }

      // Field types come from the first non-null value of each attribute.
      std::map<std::string, OGRFieldType> fields;
      for (const auto& f : features.features) {
        for (const auto& [name, value] : f.attributes) {
          if (fields.count(name)) continue;
          if (auto type = std::visit(FieldTypeVisitor{}, value))
            fields[name] = *type;
        }
      }
      for (const auto& [name, type] : fields) {
        OGRFieldDefn defn(name.c_str(), type);
        if (layer->CreateField(&defn) != OGRERR_NONE) {
          throw palmprepException(
              fmt::format("Cannot create field {}", name));
        }
      }

      layer->StartTransaction();
      for (const auto& f : features.features) {
        OGRFeatureUniquePtr feature(
            OGRFeature::CreateFeature(layer->GetLayerDefn()));
        for (const auto& [name, value] : f.attributes) {
          int index = feature->GetFieldIndex(name.c_str());
          if (index < 0) continue;
          std::visit(FieldSetter{*feature, index}, value);
        }
        if (auto geometry = ogr::to_ogr(f.geometry)) {
          feature->SetGeometryDirectly(geometry.release());
        }
        if (layer->CreateFeature(feature.get()) != OGRERR_NONE) {
          layer->RollbackTransaction();
          throw palmprepException(
              fmt::format("Failed to write feature to {}", destination));
        }
      }
      layer->CommitTransaction();
      logger.debug("Wrote {} features to {}", features.size(), destination);
    }
  };

  std::unique_ptr<VectorWriterInterface> createVectorWriterOGR() {
    return std::make_unique<VectorWriterOGR>();
  };
}  // namespace palmprep::io
