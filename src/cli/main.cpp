#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "sk/core/model_info.h"
#include "sk/core/point_cloud.h"
#include "sk/core/sh.h"
#include "sk/core/version.h"
#include "sk/io/reader.h"
#include "sk/io/registry.h"

namespace {

using json = nlohmann::json;

struct CliOptions {
  std::string inPath;
  std::string format; // overrides the suffix heuristic
  sk::ReadOptions read;
  bool haveView = false;
  sk::Vec3f view = sk::kForwardDirection;
  bool asJson = false;
};

void PrintUsage() {
  std::cerr << "Usage: skinfo <input> [--format ply|spz|splat] "
               "[--origin x y z] [--scale s]\n"
               "              [--crs token] [--name name] [--view x y z] "
               "[--json] [--strict] [--verbose]\n";
  std::cerr << "       skinfo --version\n";
}

bool ParseDouble(const char *text, double *out) {
  char *end = nullptr;
  *out = std::strtod(text, &end);
  return end != text && *end == '\0';
}

bool ParseArgs(int argc, char **argv, CliOptions *opts) {
  opts->inPath = argv[1];
  for (int i = 2; i < argc; ++i) {
    const std::string flag = argv[i];
    const auto need = [&](int n) {
      if (i + n >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return false;
      }
      return true;
    };
    if (flag == "--json") {
      opts->asJson = true;
    } else if (flag == "--strict") {
      opts->read.strict = true;
    } else if (flag == "--verbose") {
      spdlog::set_level(spdlog::level::debug);
    } else if (flag == "--format") {
      if (!need(1))
        return false;
      opts->format = argv[++i];
    } else if (flag == "--crs") {
      if (!need(1))
        return false;
      opts->read.crs = argv[++i];
    } else if (flag == "--name") {
      if (!need(1))
        return false;
      opts->read.name = argv[++i];
    } else if (flag == "--scale") {
      if (!need(1) || !ParseDouble(argv[++i], &opts->read.transform.scale)) {
        std::cerr << "Invalid --scale value\n";
        return false;
      }
    } else if (flag == "--origin" || flag == "--view") {
      if (!need(3))
        return false;
      double v[3];
      for (double &c : v) {
        if (!ParseDouble(argv[++i], &c)) {
          std::cerr << "Invalid " << flag << " value\n";
          return false;
        }
      }
      if (flag == "--origin") {
        opts->read.transform.origin = {v[0], v[1], v[2]};
      } else {
        opts->haveView = true;
        opts->view = {static_cast<float>(v[0]), static_cast<float>(v[1]),
                      static_cast<float>(v[2])};
      }
    } else {
      std::cerr << "Unknown parameter: " << flag << "\n";
      return false;
    }
  }
  return true;
}

json FloatStatsToJson(const sk::FloatStats &s) {
  return {{"min", s.min}, {"max", s.max}, {"avg", s.avg}, {"count", s.count}};
}

json ModelInfoToJson(const sk::ModelInfo &info) {
  json j;
  j["name"] = info.name;
  j["crs"] = info.crs;
  j["format"] = info.sourceFormat;
  j["formatVersion"] = info.formatVersion;
  j["numPoints"] = info.numPoints;
  j["fileSize"] = info.fileSize;
  j["shDegree"] = info.shDegree;
  j["hasSh"] = info.hasSh;
  j["antialiased"] = info.antialiased;
  j["bounds"] = {{"min", {info.bounds.minX, info.bounds.minY, info.bounds.minZ}},
                 {"max", {info.bounds.maxX, info.bounds.maxY, info.bounds.maxZ}}};
  j["scale"] = FloatStatsToJson(info.scaleStats);
  j["alpha"] = FloatStatsToJson(info.alphaStats);
  j["sizes"] = {{"positions", info.positionsSize},
                {"colors", info.colorsSize},
                {"scales", info.scalesSize},
                {"rotations", info.rotationsSize},
                {"sh", info.shSize},
                {"total", info.totalSize}};
  return j;
}

void PrintModelInfo(const sk::ModelInfo &info) {
  std::cout << "Name:        " << info.name << "\n"
            << "Format:      " << info.sourceFormat;
  if (info.formatVersion != 0)
    std::cout << " v" << info.formatVersion;
  std::cout << "\n"
            << "CRS:         " << (info.crs.empty() ? "-" : info.crs) << "\n"
            << "File size:   " << sk::FormatBytes(info.fileSize) << "\n"
            << "Points:      " << info.numPoints << "\n"
            << "SH degree:   " << info.shDegree
            << (info.hasSh ? "" : " (no coefficients)") << "\n"
            << "Bounds min:  " << info.bounds.minX << " " << info.bounds.minY
            << " " << info.bounds.minZ << "\n"
            << "Bounds max:  " << info.bounds.maxX << " " << info.bounds.maxY
            << " " << info.bounds.maxZ << "\n"
            << "Scale:       min " << info.scaleStats.min << ", max "
            << info.scaleStats.max << ", avg " << info.scaleStats.avg << "\n"
            << "Alpha:       min " << info.alphaStats.min << ", max "
            << info.alphaStats.max << ", avg " << info.alphaStats.avg << "\n"
            << "Memory:      " << sk::FormatBytes(info.totalSize) << "\n";
}

} // namespace

int main(int argc, char **argv) {
  // Handle --version flag
  if (argc >= 2 && std::string(argv[1]) == "--version") {
    std::cout << "skinfo version " << SPLATKIT_VERSION_STRING << "\n";
    return 0;
  }

  if (argc < 2) {
    PrintUsage();
    return 1;
  }

  CliOptions opts;
  if (!ParseArgs(argc, argv, &opts)) {
    PrintUsage();
    return 1;
  }

  // Read input file into memory
  std::ifstream in_file(opts.inPath, std::ios::binary | std::ios::ate);
  if (!in_file.good()) {
    std::cerr << "Failed to open input file: " << opts.inPath << "\n";
    return 1;
  }

  const size_t in_size = static_cast<size_t>(in_file.tellg());
  in_file.seekg(0, std::ios::beg);

  std::vector<uint8_t> in_data(in_size);
  in_file.read(reinterpret_cast<char *>(in_data.data()), in_size);
  in_file.close();

  if (!in_file.good()) {
    std::cerr << "Failed to read input file: " << opts.inPath << "\n";
    return 1;
  }

  if (opts.read.name.empty())
    opts.read.name = sk::SourceNameFromPath(opts.inPath);

  sk::IORegistry registry; // Automatically registers built-in formats

  auto *reader = opts.format.empty() ? registry.ReaderForPath(opts.inPath)
                                     : registry.ReaderForExt(opts.format);
  if (!reader) {
    std::cerr << "Reader not found for input format: " << opts.format << "\n";
    return 1;
  }

  const auto result = reader->Read(in_data.data(), in_data.size(), opts.read);
  if (result.aborted()) {
    std::cerr << "Read cancelled\n";
    return 1;
  }
  if (!result.ok()) {
    std::cerr << "Read failed (" << sk::ErrorCodeToString(result.error().code)
              << "): " << result.error().message << "\n";
    return 1;
  }

  const sk::PointCloud &pc = result.value();
  const sk::ModelInfo info = sk::GetModelInfo(pc, in_size);
  spdlog::info("loaded {} points from {}", pc.numPoints, opts.inPath);

  if (opts.asJson) {
    json j = ModelInfoToJson(info);
    if (opts.haveView) {
      const std::vector<uint8_t> rgba = sk::EvalShColors(pc, opts.view);
      json first = json::array();
      for (size_t i = 0; i < std::min<size_t>(pc.numPoints, 8); ++i) {
        first.push_back({rgba[i * 4], rgba[i * 4 + 1], rgba[i * 4 + 2],
                         rgba[i * 4 + 3]});
      }
      j["view"] = {{"direction", opts.view}, {"firstColors", first}};
    }
    std::cout << j.dump(2) << "\n";
    return 0;
  }

  PrintModelInfo(info);
  if (opts.haveView) {
    const std::vector<uint8_t> rgba = sk::EvalShColors(pc, opts.view);
    double sum[3] = {0.0, 0.0, 0.0};
    for (size_t i = 0; i < pc.numPoints; ++i) {
      for (int c = 0; c < 3; ++c)
        sum[c] += rgba[i * 4 + c];
    }
    const double n = static_cast<double>(pc.numPoints);
    std::cout << "View colour: mean RGB " << sum[0] / n << " " << sum[1] / n
              << " " << sum[2] / n << " toward (" << opts.view[0] << ", "
              << opts.view[1] << ", " << opts.view[2] << ")\n";
  }
  return 0;
}
