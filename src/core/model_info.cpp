#include "sk/core/model_info.h"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace sk {

std::string FormatBytes(size_t bytes) {
  const char *suffix[] = {"B", "KB", "MB", "GB"};
  int exp = 0;
  double value = static_cast<double>(bytes);
  while (value >= 1024.0 && exp < 3) {
    value /= 1024.0;
    exp++;
  }
  char buf[32];
  snprintf(buf, sizeof(buf), "%.2f %s", value, suffix[exp]);
  return std::string(buf);
}

namespace {

FloatStats ComputeFloatStats(const std::vector<float> &data) {
  FloatStats stats;
  if (data.empty()) {
    return stats;
  }

  stats.count = data.size();
  stats.min = data[0];
  stats.max = data[0];
  double sum = 0.0;

  for (float v : data) {
    stats.min = std::min(stats.min, v);
    stats.max = std::max(stats.max, v);
    sum += v;
  }

  stats.avg = static_cast<float>(sum / data.size());
  return stats;
}

// Alpha lives in every fourth byte of the RGBA array.
FloatStats ComputeAlphaStats(const std::vector<uint8_t> &rgba) {
  FloatStats stats;
  if (rgba.size() < 4) {
    return stats;
  }

  stats.count = rgba.size() / 4;
  stats.min = stats.max = rgba[3];
  double sum = 0.0;
  for (size_t i = 3; i < rgba.size(); i += 4) {
    const float a = rgba[i];
    stats.min = std::min(stats.min, a);
    stats.max = std::max(stats.max, a);
    sum += a;
  }
  stats.avg = static_cast<float>(sum / stats.count);
  return stats;
}

BoundingBox ComputeBounds(const std::vector<double> &positions) {
  BoundingBox bounds;
  if (positions.size() < 3) {
    return bounds;
  }

  bounds.minX = bounds.maxX = positions[0];
  bounds.minY = bounds.maxY = positions[1];
  bounds.minZ = bounds.maxZ = positions[2];

  for (size_t i = 3; i + 2 < positions.size(); i += 3) {
    bounds.minX = std::min(bounds.minX, positions[i]);
    bounds.maxX = std::max(bounds.maxX, positions[i]);
    bounds.minY = std::min(bounds.minY, positions[i + 1]);
    bounds.maxY = std::max(bounds.maxY, positions[i + 1]);
    bounds.minZ = std::min(bounds.minZ, positions[i + 2]);
    bounds.maxZ = std::max(bounds.maxZ, positions[i + 2]);
  }

  return bounds;
}

} // namespace

ModelInfo GetModelInfo(const PointCloud &pc, size_t file_size) {
  ModelInfo info;

  // Basic info
  info.numPoints = pc.numPoints;
  info.fileSize = file_size;
  info.name = pc.meta.name;
  info.crs = pc.meta.crs;
  info.sourceFormat = pc.meta.sourceFormat;
  info.formatVersion = pc.meta.formatVersion;
  info.shDegree = pc.shDegree;
  info.hasSh = pc.HasSh();
  info.antialiased = pc.meta.antialiased;

  // Statistics
  info.bounds = ComputeBounds(pc.positions);
  info.scaleStats = ComputeFloatStats(pc.scales);
  info.alphaStats = ComputeAlphaStats(pc.colors);

  // Data size breakdown
  info.positionsSize = pc.positions.size() * sizeof(double);
  info.colorsSize = pc.colors.size() * sizeof(uint8_t);
  info.scalesSize = pc.scales.size() * sizeof(float);
  info.rotationsSize = pc.rotations.size() * sizeof(float);
  info.shSize = pc.shCoeffs.size() * sizeof(float);

  info.totalSize = info.positionsSize + info.colorsSize + info.scalesSize +
                   info.rotationsSize + info.shSize;

  return info;
}

} // namespace sk
