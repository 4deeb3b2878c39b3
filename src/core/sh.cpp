#include "sk/core/sh.h"

#include <algorithm>
#include <cmath>

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>

namespace sk {

namespace {

constexpr size_t kGrainSize = 4096;

inline void Madd(Rgb &acc, float w, const float *c) {
  acc[0] += w * c[0];
  acc[1] += w * c[1];
  acc[2] += w * c[2];
}

// NaN maps to 0.
inline uint8_t ToByte(float v) {
  if (!(v > 0.0f))
    return 0;
  return static_cast<uint8_t>(std::min(v * 255.0f, 255.0f));
}

} // namespace

int DegreeForCoeffCount(size_t count) {
  if (count <= 3)
    return 0;
  if (count <= 12)
    return 1;
  if (count <= 27)
    return 2;
  return 3;
}

Vec3f NormalizeDirection(const Vec3f &dir) {
  const float norm =
      std::sqrt(dir[0] * dir[0] + dir[1] * dir[1] + dir[2] * dir[2]);
  if (!(norm > 0.0f) || !std::isfinite(norm))
    return kForwardDirection;
  return {dir[0] / norm, dir[1] / norm, dir[2] / norm};
}

void AccumulateShBand1(const float *coeffs, const Vec3f &d, Rgb &acc) {
  const float x = d[0], y = d[1], z = d[2];
  Madd(acc, kShC1 * -x, coeffs + 3);
  Madd(acc, kShC1 * y, coeffs + 6);
  Madd(acc, kShC1 * -z, coeffs + 9);
}

void AccumulateShBand2(const float *coeffs, const Vec3f &d, Rgb &acc) {
  const float x = d[0], y = d[1], z = d[2];
  const float xx = x * x, yy = y * y, zz = z * z;
  Madd(acc, kShC2[0] * x * y, coeffs + 12);
  Madd(acc, kShC2[1] * y * z, coeffs + 15);
  Madd(acc, kShC2[2] * (2.0f * zz - xx - yy), coeffs + 18);
  Madd(acc, kShC2[3] * x * z, coeffs + 21);
  Madd(acc, kShC2[4] * (xx - yy), coeffs + 24);
}

void AccumulateShBand3(const float *coeffs, const Vec3f &d, Rgb &acc) {
  const float x = d[0], y = d[1], z = d[2];
  const float xx = x * x, yy = y * y, zz = z * z;
  Madd(acc, kShC3[0] * y * (3.0f * xx - yy), coeffs + 27);
  Madd(acc, kShC3[1] * x * y * z, coeffs + 30);
  Madd(acc, kShC3[2] * y * (4.0f * zz - xx - yy), coeffs + 33);
  Madd(acc, kShC3[3] * z * (2.0f * zz - 3.0f * xx - 3.0f * yy), coeffs + 36);
  Madd(acc, kShC3[4] * x * (4.0f * zz - xx - yy), coeffs + 39);
  Madd(acc, kShC3[5] * z * (xx - yy), coeffs + 42);
  Madd(acc, kShC3[6] * x * (xx - 3.0f * yy), coeffs + 45);
}

Rgb EvalSh(const float *coeffs, size_t count, const Vec3f &dir, int degree) {
  if (coeffs == nullptr || count < 3)
    return {0.5f, 0.5f, 0.5f};

  if (degree < 0 || degree > 3)
    degree = DegreeForCoeffCount(count);
  while (degree > 0 && count < static_cast<size_t>(ShCoeffCount(degree)))
    --degree;

  const Vec3f d = NormalizeDirection(dir);
  Rgb acc = {kShC0 * coeffs[0], kShC0 * coeffs[1], kShC0 * coeffs[2]};
  if (degree >= 1)
    AccumulateShBand1(coeffs, d, acc);
  if (degree >= 2)
    AccumulateShBand2(coeffs, d, acc);
  if (degree >= 3)
    AccumulateShBand3(coeffs, d, acc);

  for (float &c : acc)
    c = std::clamp(0.5f + c, 0.0f, 1.0f);
  return acc;
}

Rgb EvalSh(const std::vector<float> &coeffs, const Vec3f &dir, int degree) {
  return EvalSh(coeffs.data(), coeffs.size(), dir, degree);
}

std::array<uint8_t, 3> ShToRgb8(const float *coeffs, size_t count,
                                int degree) {
  const Rgb rgb = EvalSh(coeffs, count, kForwardDirection, degree);
  return {ToByte(rgb[0]), ToByte(rgb[1]), ToByte(rgb[2])};
}

std::vector<uint8_t> EvalShColors(const PointCloud &pc, const Vec3f &dir) {
  if (!pc.HasSh())
    return pc.colors;

  std::vector<uint8_t> out(pc.colors.size());
  const size_t stride = static_cast<size_t>(ShCoeffCount(pc.shDegree));

  tbb::parallel_for(
      tbb::blocked_range<size_t>(0, static_cast<size_t>(pc.numPoints),
                                 kGrainSize),
      [&](const tbb::blocked_range<size_t> &r) {
        for (size_t i = r.begin(); i != r.end(); ++i) {
          const Rgb rgb = EvalSh(pc.shCoeffs.data() + i * stride, stride, dir,
                                 pc.shDegree);
          uint8_t *dst = out.data() + i * 4;
          dst[0] = ToByte(rgb[0]);
          dst[1] = ToByte(rgb[1]);
          dst[2] = ToByte(rgb[2]);
          dst[3] = pc.colors[i * 4 + 3];
        }
      });
  return out;
}

} // namespace sk
