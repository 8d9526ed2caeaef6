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

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <palmprep/common/Raster.hpp>
#include <palmprep/common/datastructures.hpp>
#include <palmprep/io/RasterReader.hpp>
#include <palmprep/io/RasterWriter.hpp>
#include <palmprep/io/TileFetcher.hpp>
#include <palmprep/io/VectorReader.hpp>
#include <palmprep/io/VectorTranslator.hpp>
#include <palmprep/io/VectorWriter.hpp>
#include <palmprep/misc/RasterWarper.hpp>
#include <palmprep/misc/Vector2DOps.hpp>
#include <palmprep/misc/projHelper.hpp>
#include <set>
#include <string>
#include <vector>

// In-memory collaborators for the unit tests.
namespace palmprep::testing {

  inline Polygon rect(double x0, double y0, double x1, double y1) {
    Polygon p;
    p.exterior = {{x0, y0, 0}, {x1, y0, 0}, {x1, y1, 0}, {x0, y1, 0}};
    return p;
  }

  inline Geometry rect_geometry(double x0, double y0, double x1, double y1) {
    return Geometry::from_multipolygon({rect(x0, y0, x1, y1)});
  }

  inline Feature make_feature(Geometry geometry,
                              const std::string& function = "31001_1000") {
    Feature f;
    f.geometry = std::move(geometry);
    f.attributes.insert("function", function);
    return f;
  }

  inline GridSpec make_grid(double x0, double y_top, double res, size_t nx,
                            size_t ny, int epsg = 25832) {
    GridSpec g;
    g.origin_x = x0;
    g.origin_y = y_top;
    g.res_x = res;
    g.res_y = res;
    g.nx = nx;
    g.ny = ny;
    g.crs = ReferenceSystem::epsg(epsg);
    return g;
  }

  inline RasterLayer filled(const GridSpec& grid, double value,
                            double nodata = -9999) {
    RasterLayer r(grid, nodata);
    std::fill(r.values.begin(), r.values.end(), value);
    return r;
  }

  // Coordinates are left untouched, only the CRS label changes.
  struct IdentityProjHelper : public misc::projHelperInterface {
    size_t transforms = 0;

    using misc::projHelperInterface::transform;

    Geometry transform(const Geometry& geometry, const ReferenceSystem&,
                       const ReferenceSystem&) override {
      ++transforms;
      return geometry;
    }
    bool is_same(const ReferenceSystem& a, const ReferenceSystem& b) override {
      return a.user_input() == b.user_input();
    }
    bool is_geographic(const ReferenceSystem& crs) override {
      return crs.code == "4326";
    }
  };

  // Treats the second operand of intersection as its bounding box.
  struct BoxVector2DOps : public misc::Vector2DOpsInterface {
    bool fail_union = false;
    size_t unions = 0;

    bool intersects(const MultiPolygon& a, const MultiPolygon& b) override {
      return compute_box(a).intersects(compute_box(b));
    }

    MultiPolygon intersection(const MultiPolygon& a,
                              const MultiPolygon& b) override {
      auto clip = compute_box(b);
      MultiPolygon result;
      for (const auto& poly : a) {
        auto box = poly.box().intersect(clip);
        if (!box || box->size_x() <= 0 || box->size_y() <= 0) continue;
        result.push_back(
            rect(box->pmin[0], box->pmin[1], box->pmax[0], box->pmax[1]));
      }
      return result;
    }

    std::optional<MultiPolygon> union_polygons(
        const MultiPolygon& polygons) override {
      ++unions;
      if (fail_union) return std::nullopt;
      auto box = compute_box(polygons);
      return MultiPolygon{
          rect(box.pmin[0], box.pmin[1], box.pmax[0], box.pmax[1])};
    }
  };

  // Writes a small file for every fetched url. Urls in `failing` raise.
  struct FakeTileFetcher : public io::TileFetcherInterface {
    std::vector<std::string> urls;
    std::set<std::string> failing;
    // urls whose transfer breaks off after some bytes were written
    std::set<std::string> partial;

    FakeTileFetcher() : io::TileFetcherInterface(io::TileFetchConfig{}) {}

    void fetch(const std::string& url,
               const std::string& destination) override {
      urls.push_back(url);
      if (failing.count(url)) {
        throw AcquisitionFailure("HTTP 404 for " + url, 404);
      }
      std::ofstream ofs(destination);
      ofs << url;
      if (partial.count(url)) {
        throw AcquisitionFailure("Connection reset while fetching " + url);
      }
    }
  };

  // Returns the raster registered for the file name of the source.
  struct FakeRasterReader : public io::RasterReaderInterface {
    std::map<std::string, RasterLayer> rasters;

    RasterLayer read(const std::string& source) override {
      auto name = std::filesystem::path(source).filename().string();
      auto it = rasters.find(name);
      if (it == rasters.end()) {
        throw ValidationError("Cannot read raster " + source);
      }
      return it->second;
    }
  };

  struct FakeRasterWriter : public io::RasterWriterInterface {
    std::vector<std::string> destinations;

    void write(const std::string& destination, const RasterLayer&) override {
      destinations.push_back(destination);
    }
  };

  // Serves feature sets keyed by file stem.
  struct FakeVectorReader : public io::VectorReaderInterface {
    std::map<std::string, FeatureSet> sources;
    std::vector<std::string> opened;
    std::string current;

    void open(const std::string& source) override {
      opened.push_back(source);
      current = source;
    }
    std::vector<std::string> layer_names() override { return {"features"}; }
    // Looks the source up by file name first, then by stem.
    FeatureSet read_layer(const std::string& = "") override {
      std::filesystem::path p(current);
      auto it = sources.find(p.filename().string());
      if (it == sources.end()) it = sources.find(p.stem().string());
      if (it == sources.end()) {
        throw ValidationError("Cannot open " + current);
      }
      return it->second;
    }
    FeatureSet read_all_layers() override { return read_layer(); }
  };

  // Creates the destination file and remembers the written set under its
  // stem. With `fail` set the file is created but the write then throws.
  struct FakeVectorWriter : public io::VectorWriterInterface {
    std::map<std::string, FeatureSet> written;
    bool fail = false;

    void write(const std::string& destination,
               const FeatureSet& features) override {
      std::ofstream ofs(destination);
      if (fail) {
        throw palmprepException("Failed to create feature in " + destination);
      }
      ofs << features.size();
      written[std::filesystem::path(destination).stem().string()] = features;
    }
  };

  struct FakeVectorTranslator : public io::VectorTranslatorInterface {
    std::optional<FeatureSet> result;
    size_t calls = 0;

    std::optional<FeatureSet> force_multipolygon(const FeatureSet&) override {
      ++calls;
      return result;
    }
    std::string remediation_command() const override {
      return "ogr2ogr -nlt MULTIPOLYGON";
    }
  };

  // Nearest neighbour sampling of the source at target cell centres. CRS
  // differences are ignored.
  struct SamplingWarper : public misc::RasterWarperInterface {
    std::vector<misc::ResamplingKernel> kernels;

    RasterLayer warp(const RasterLayer& source, const GridSpec& target,
                     misc::ResamplingKernel kernel) override {
      kernels.push_back(kernel);
      RasterLayer result(target, source.nodata);
      const auto& g = source.grid;
      for (size_t row = 0; row < target.ny; ++row) {
        for (size_t col = 0; col < target.nx; ++col) {
          auto c = target.cell_center(col, row);
          double fx = (c[0] - g.origin_x) / g.res_x;
          double fy = (g.origin_y - c[1]) / g.res_y;
          if (fx < 0 || fy < 0 || fx >= g.nx || fy >= g.ny) continue;
          result.at(col, row) =
              source.at(static_cast<size_t>(fx), static_cast<size_t>(fy));
        }
      }
      return result;
    }
  };

  // Temporary directory removed at scope exit.
  struct TempDir {
    std::filesystem::path path;

    explicit TempDir(const std::string& name)
        : path(std::filesystem::temp_directory_path() / ("palmprep_" + name)) {
      std::filesystem::remove_all(path);
      std::filesystem::create_directories(path);
    }
    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
    }
    std::string str() const { return path.string(); }
    void touch(const std::string& name) const {
      std::ofstream ofs(path / name);
    }
  };

}  // namespace palmprep::testing
