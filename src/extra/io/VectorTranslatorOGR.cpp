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

#include <cpl_spawn.h>
#include <filesystem>
#include <fmt/format.h>
#include <palmprep/io/VectorReader.hpp>
#include <palmprep/io/VectorTranslator.hpp>
#include <palmprep/io/VectorWriter.hpp>
#include <palmprep/logger/logger.h>

namespace palmprep::io {

  namespace fs = std::filesystem;

  struct VectorTranslatorOGR : public VectorTranslatorInterface {
    std::string work_dir_;

    explicit VectorTranslatorOGR(std::string work_dir)
        : work_dir_(std::move(work_dir)) {}

    std::optional<FeatureSet> force_multipolygon(
        const FeatureSet& features) override {
      auto& logger = logger::Logger::get_logger();
      auto input = (fs::path(work_dir_) / "normalize_input.gpkg").string();
      auto output =
          (fs::path(work_dir_) / "normalize_multipolygon.gpkg").string();

      try {
        auto writer = createVectorWriterOGR();
        writer->write(input, features);
      } catch (const palmprepException& e) {
        logger.warning("Cannot prepare input for ogr2ogr. {}", e.what());
        return std::nullopt;
      }

      const char* const args[] = {"ogr2ogr", "-f", "GPKG",
                                  output.c_str(), input.c_str(),
                                  "-nlt", "MULTIPOLYGON", "-overwrite",
                                  nullptr};
      logger.info("Running ogr2ogr -nlt MULTIPOLYGON on {} features",
                  features.size());
      int status = CPLSpawn(args, nullptr, nullptr, TRUE);
      if (status != 0) {
        logger.warning("ogr2ogr exited with status {}", status);
        return std::nullopt;
      }

      try {
        auto reader = createVectorReaderOGR();
        reader->open(output);
        auto result = reader->read_layer();
        if (!result.crs.is_defined()) result.crs = features.crs;
        return result;
      } catch (const palmprepException& e) {
        logger.warning("Cannot read ogr2ogr output. {}", e.what());
        return std::nullopt;
      }
    }

    std::string remediation_command() const override {
      return "ogr2ogr -f GPKG lod2_multipolygon.gpkg lod2.gpkg -nlt "
             "MULTIPOLYGON";
    }
  };

  std::unique_ptr<VectorTranslatorInterface> createVectorTranslatorOGR(
      std::string work_dir) {
    return std::make_unique<VectorTranslatorOGR>(std::move(work_dir));
  };
}  // namespace palmprep::io
