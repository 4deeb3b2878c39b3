#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sk/core/point_cloud.h"

namespace sk {

// Statistics for a single float attribute
struct FloatStats {
  float min = 0.0f;
  float max = 0.0f;
  float avg = 0.0f;
  size_t count = 0;
};

// Bounding box for world positions
struct BoundingBox {
  double minX = 0.0, maxX = 0.0;
  double minY = 0.0, maxY = 0.0;
  double minZ = 0.0, maxZ = 0.0;
};

// Model information summary
struct ModelInfo {
  // Basic info
  uint64_t numPoints = 0;
  size_t fileSize = 0;
  std::string name;
  std::string crs;
  std::string sourceFormat;
  uint32_t formatVersion = 0;
  int shDegree = 0;
  bool hasSh = false;
  bool antialiased = false;

  // Geometry statistics
  BoundingBox bounds;
  FloatStats scaleStats;
  FloatStats alphaStats; // alpha channel, 0..255

  // Data size breakdown (in bytes)
  size_t positionsSize = 0;
  size_t colorsSize = 0;
  size_t scalesSize = 0;
  size_t rotationsSize = 0;
  size_t shSize = 0;
  size_t totalSize = 0;
};

// Calculate model information from a PointCloud
ModelInfo GetModelInfo(const PointCloud &pc, size_t file_size = 0);

std::string FormatBytes(size_t bytes);

} // namespace sk
