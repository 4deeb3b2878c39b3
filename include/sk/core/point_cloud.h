#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "sk/core/metadata.h"

namespace sk {

// World placement applied by every reader: world = raw * scale + origin.
struct Transform {
  std::array<double, 3> origin = {0.0, 0.0, 0.0};
  double scale = 1.0;

  double Apply(double raw, int axis) const { return raw * scale + origin[axis]; }
};

// Floats per point for a given degree, DC term included: 3 * (degree + 1)^2.
inline int ShCoeffCount(int degree) {
  if (degree < 0)
    return 0;
  return 3 * (degree + 1) * (degree + 1);
}

struct PointCloud {
  uint64_t numPoints = 0;

  // Structure-of-arrays layout, one entry group per point.
  std::vector<double> positions; // world space [x0, y0, z0, x1, ...]  (3 * N)
  std::vector<uint8_t> colors;   // display RGBA [r0, g0, b0, a0, ...]  (4 * N)
  std::vector<float> scales;     // linear extents, always positive  (3 * N)
  std::vector<float> rotations;  // quaternions [w, x, y, z] per point  (4 * N)

  // View-dependent colour, empty when the source has none. Per point
  // ShCoeffCount(shDegree) floats: [0, 3) is the DC RGB term, then the
  // higher bands in ascending order with the RGB triple of each basis
  // function contiguous.
  std::vector<float> shCoeffs;
  int shDegree = 0;

  CloudMetadata meta;

  bool HasSh() const { return !shCoeffs.empty(); }
  const float *ShForPoint(size_t i) const {
    if (shCoeffs.empty())
      return nullptr;
    return shCoeffs.data() + i * static_cast<size_t>(ShCoeffCount(shDegree));
  }
};

} // namespace sk
