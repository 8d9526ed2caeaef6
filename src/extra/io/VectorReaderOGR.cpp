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

#include <climits>
#include <fmt/format.h>
#include <gdal_priv.h>
#include <ogrsf_frmts.h>
#include <palmprep/io/VectorReader.hpp>
#include <palmprep/logger/logger.h>

#include "OGRConversion.hpp"

namespace palmprep::io {

  namespace {
    void read_attributes(const OGRFeature& feature, AttributeRow& row) {
      for (int i = 0; i < feature.GetFieldCount(); ++i) {
        auto* defn = feature.GetFieldDefnRef(i);
        std::string name = defn->GetNameRef();
        if (!feature.IsFieldSetAndNotNull(i)) {
          row.set_null(name);
          continue;
        }
        switch (defn->GetType()) {
          case OFTInteger:
            if (defn->GetSubType() == OFSTBoolean)
              row.insert(name, feature.GetFieldAsInteger(i) != 0);
            else
              row.insert(name, feature.GetFieldAsInteger(i));
            break;
          case OFTInteger64: {
            auto v = feature.GetFieldAsInteger64(i);
            if (v >= INT_MIN && v <= INT_MAX)
              row.insert(name, static_cast<int>(v));
            else
              row.insert(name, static_cast<double>(v));
            break;
          }
          case OFTReal:
            row.insert(name, feature.GetFieldAsDouble(i));
            break;
          default:
            row.insert(name, std::string(feature.GetFieldAsString(i)));
            break;
        }
      }
    }
  }  // namespace

  struct VectorReaderOGR : public VectorReaderInterface {
    GDALDatasetUniquePtr dataset_;
    std::string source_;

    VectorReaderOGR() { GDALAllRegister(); }

    void open(const std::string& source) override {
      dataset_.reset(GDALDataset::Open(source.c_str(),
                                       GDAL_OF_VECTOR | GDAL_OF_READONLY));
      if (!dataset_) {
        throw AcquisitionFailure(
            fmt::format("Cannot open vector source {}", source));
      }
      source_ = source;
    }

    std::vector<std::string> layer_names() override {
      require_open();
      std::vector<std::string> names;
      for (auto* layer : dataset_->GetLayers()) {
        names.push_back(layer->GetName());
      }
      return names;
    }

    FeatureSet read_layer(const std::string& layer_name) override {
      require_open();
      OGRLayer* layer = layer_name.empty()
                            ? dataset_->GetLayer(0)
                            : dataset_->GetLayerByName(layer_name.c_str());
      if (!layer) {
        throw ValidationError(fmt::format("No layer '{}' in {}", layer_name,
                                          source_));
      }
      if (!attribute_filter.empty() &&
          layer->SetAttributeFilter(attribute_filter.c_str()) != OGRERR_NONE) {
        throw ValidationError(
            fmt::format("Invalid attribute filter: {}", attribute_filter));
      }
      FeatureSet features;
      features.crs = ogr::to_reference_system(layer->GetSpatialRef());
      layer->ResetReading();
      for (auto& feature : *layer) {
        Feature f;
        f.geometry = ogr::from_ogr(feature->GetGeometryRef());
        read_attributes(*feature, f.attributes);
        features.features.push_back(std::move(f));
      }
      logger::Logger::get_logger().debug("Read {} features from layer {}",
                                         features.size(), layer->GetName());
      return features;
    }

    FeatureSet read_all_layers() override {
      auto& logger = logger::Logger::get_logger();
      FeatureSet all;
      for (const auto& name : layer_names()) {
        FeatureSet layer;
        try {
          layer = read_layer(name);
        } catch (const palmprepException& e) {
          logger.warning("Skipping layer {}. {}", name, e.what());
          continue;
        }
        if (!all.crs.is_defined()) {
          all.crs = layer.crs;
        } else if (layer.crs.is_defined() &&
                   layer.crs.user_input() != all.crs.user_input()) {
          logger.warning("Skipping layer {} with a different CRS", name);
          continue;
        }
        for (auto& f : layer.features) {
          if (f.geometry.type == GeometryType::Unknown) continue;
          all.features.push_back(std::move(f));
        }
      }
      return all;
    }

   private:
    void require_open() const {
      if (!dataset_) throw palmprepException("No vector source opened.");
    }
  };

  std::unique_ptr<VectorReaderInterface> createVectorReaderOGR() {
    return std::make_unique<VectorReaderOGR>();
  };
}  // namespace palmprep::io
