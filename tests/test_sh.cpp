#include <cmath>
#include <random>
#include <vector>

#include <gtest/gtest.h>

#include "sk/core/point_cloud.h"
#include "sk/core/sh.h"

namespace sk {
namespace {

std::vector<float> RandomCoeffs(size_t n, unsigned seed, float sigma = 0.5f) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, sigma);
  std::vector<float> c(n);
  for (float &v : c)
    v = dist(gen);
  return c;
}

// Degree-3 real SH written out in one expression, independent of the
// per-band accumulators.
Rgb DirectDegree3(const std::vector<float> &c, Vec3f dir) {
  const float n =
      std::sqrt(dir[0] * dir[0] + dir[1] * dir[1] + dir[2] * dir[2]);
  const float x = dir[0] / n, y = dir[1] / n, z = dir[2] / n;
  const float xx = x * x, yy = y * y, zz = z * z;
  const float basis[16] = {
      0.28209479177387814f,
      -0.4886025119029199f * x,
      0.4886025119029199f * y,
      -0.4886025119029199f * z,
      1.0925484305920792f * x * y,
      -1.0925484305920792f * y * z,
      0.31539156525252005f * (2.0f * zz - xx - yy),
      -1.0925484305920792f * x * z,
      0.5462742152960396f * (xx - yy),
      -0.5900435899266435f * y * (3.0f * xx - yy),
      2.890611442640554f * x * y * z,
      -0.4570457994644658f * y * (4.0f * zz - xx - yy),
      0.3731763325901154f * z * (2.0f * zz - 3.0f * xx - 3.0f * yy),
      -0.4570457994644658f * x * (4.0f * zz - xx - yy),
      1.445305721320277f * z * (xx - yy),
      -0.5900435899266435f * x * (xx - 3.0f * yy),
  };
  Rgb out{};
  for (int ch = 0; ch < 3; ++ch) {
    float acc = 0.0f;
    for (int k = 0; k < 16; ++k)
      acc += basis[k] * c[k * 3 + ch];
    out[ch] = std::fmin(1.0f, std::fmax(0.0f, 0.5f + acc));
  }
  return out;
}

TEST(ShTest, CoeffCounts) {
  EXPECT_EQ(ShCoeffCount(0), 3);
  EXPECT_EQ(ShCoeffCount(1), 12);
  EXPECT_EQ(ShCoeffCount(2), 27);
  EXPECT_EQ(ShCoeffCount(3), 48);
}

TEST(ShTest, DegreeZeroIsSHC0TimesDcPlusHalf) {
  const std::vector<float> c = {1.0f, 0.5f, 0.0f};
  const Rgb rgb = EvalSh(c, kForwardDirection, 0);
  EXPECT_NEAR(rgb[0], 0.5f + kShC0 * 1.0f, 1e-6f);
  EXPECT_NEAR(rgb[1], 0.5f + kShC0 * 0.5f, 1e-6f);
  EXPECT_NEAR(rgb[2], 0.5f, 1e-6f);
}

TEST(ShTest, DegreeZeroIgnoresDirection) {
  const std::vector<float> c = RandomCoeffs(48, 7);
  const Rgb ref = EvalSh(c, kForwardDirection, 0);
  const Vec3f dirs[] = {{1.0f, 0.0f, 0.0f},
                        {-3.0f, 2.0f, 0.5f},
                        {2.0f, 2.0f, 2.0f},
                        {0.0f, -1e-3f, 0.0f}};
  for (const auto &d : dirs) {
    const Rgb rgb = EvalSh(c, d, 0);
    EXPECT_FLOAT_EQ(rgb[0], ref[0]);
    EXPECT_FLOAT_EQ(rgb[1], ref[1]);
    EXPECT_FLOAT_EQ(rgb[2], ref[2]);
  }
}

TEST(ShTest, BandCompositionMatchesDirectDegree3) {
  const Vec3f dirs[] = {{1.0f, 0.0f, 0.0f},
                        {0.0f, 1.0f, 0.0f},
                        {0.0f, 0.0f, 1.0f},
                        {-1.0f, 0.0f, 0.0f},
                        {0.3f, -0.7f, 2.0f}};
  for (unsigned seed = 0; seed < 8; ++seed) {
    const std::vector<float> c = RandomCoeffs(48, seed, 0.3f);
    for (const auto &d : dirs) {
      const Rgb got = EvalSh(c, d, 3);
      const Rgb want = DirectDegree3(c, d);
      for (int ch = 0; ch < 3; ++ch)
        EXPECT_NEAR(got[ch], want[ch], 1e-5f);
    }
  }
}

TEST(ShTest, DegreeOneSignConvention) {
  // Only the -x basis function carries weight.
  std::vector<float> c(12, 0.0f);
  c[3] = c[4] = c[5] = 1.0f;
  const Rgb px = EvalSh(c, {1.0f, 0.0f, 0.0f}, 1);
  const Rgb nx = EvalSh(c, {-1.0f, 0.0f, 0.0f}, 1);
  EXPECT_NEAR(px[0], 0.5f - kShC1, 1e-6f);
  EXPECT_NEAR(nx[0], 0.5f + kShC1, 1e-6f);
}

TEST(ShTest, OutputIsClipped) {
  const std::vector<float> c = {10.0f, -10.0f, 5.0f};
  const Rgb rgb = EvalSh(c, kForwardDirection, 0);
  EXPECT_FLOAT_EQ(rgb[0], 1.0f);
  EXPECT_FLOAT_EQ(rgb[1], 0.0f);
  EXPECT_FLOAT_EQ(rgb[2], 1.0f);

  const std::vector<float> big = RandomCoeffs(48, 3, 1e6f);
  for (int degree = 0; degree <= 3; ++degree) {
    const Rgb r = EvalSh(big, {0.2f, 0.4f, -0.9f}, degree);
    for (float v : r) {
      EXPECT_GE(v, 0.0f);
      EXPECT_LE(v, 1.0f);
    }
  }
}

TEST(ShTest, ZeroDirectionFallsBackToForward) {
  const std::vector<float> c = RandomCoeffs(48, 11);
  const Rgb zero = EvalSh(c, {0.0f, 0.0f, 0.0f}, 3);
  const Rgb fwd = EvalSh(c, kForwardDirection, 3);
  for (int ch = 0; ch < 3; ++ch) {
    EXPECT_FALSE(std::isnan(zero[ch]));
    EXPECT_FLOAT_EQ(zero[ch], fwd[ch]);
  }
}

TEST(ShTest, OutOfRangeDegreeInfersFromLength) {
  const std::vector<float> c = RandomCoeffs(27, 5);
  const Vec3f d = {0.6f, 0.0f, 0.8f};
  const Rgb inferred = EvalSh(c, d, 7);
  const Rgb explicit2 = EvalSh(c, d, 2);
  for (int ch = 0; ch < 3; ++ch)
    EXPECT_FLOAT_EQ(inferred[ch], explicit2[ch]);

  EXPECT_EQ(DegreeForCoeffCount(3), 0);
  EXPECT_EQ(DegreeForCoeffCount(12), 1);
  EXPECT_EQ(DegreeForCoeffCount(13), 2);
  EXPECT_EQ(DegreeForCoeffCount(48), 3);
}

TEST(ShTest, ShortArrayLowersDegree) {
  const std::vector<float> c = RandomCoeffs(12, 9);
  const Vec3f d = {0.0f, 1.0f, 0.0f};
  const Rgb asked3 = EvalSh(c, d, 3);
  const Rgb deg1 = EvalSh(c, d, 1);
  for (int ch = 0; ch < 3; ++ch)
    EXPECT_FLOAT_EQ(asked3[ch], deg1[ch]);
}

TEST(ShTest, Rgb8Wrapper) {
  const std::vector<float> c = {1.0f, 0.5f, 0.0f};
  const auto rgb = ShToRgb8(c.data(), c.size(), 0);
  EXPECT_EQ(rgb[0], static_cast<uint8_t>((0.5f + kShC0) * 255.0f));
  EXPECT_EQ(rgb[1], static_cast<uint8_t>((0.5f + kShC0 * 0.5f) * 255.0f));
  EXPECT_EQ(rgb[2], 127);
}

TEST(ShTest, EvalShColorsMatchesPerPointEvaluation) {
  PointCloud pc;
  const size_t n = 10000;
  pc.numPoints = n;
  pc.shDegree = 2;
  pc.shCoeffs = RandomCoeffs(n * 27, 21);
  pc.colors.assign(n * 4, 0);
  for (size_t i = 0; i < n; ++i)
    pc.colors[i * 4 + 3] = static_cast<uint8_t>(i % 256);

  const Vec3f dir = {1.0f, 1.0f, 0.0f};
  const std::vector<uint8_t> rgba = EvalShColors(pc, dir);
  ASSERT_EQ(rgba.size(), n * 4);
  for (size_t i = 0; i < n; i += 997) {
    const Rgb rgb = EvalSh(pc.ShForPoint(i), 27, dir, 2);
    EXPECT_EQ(rgba[i * 4 + 0], static_cast<uint8_t>(rgb[0] * 255.0f));
    EXPECT_EQ(rgba[i * 4 + 1], static_cast<uint8_t>(rgb[1] * 255.0f));
    EXPECT_EQ(rgba[i * 4 + 2], static_cast<uint8_t>(rgb[2] * 255.0f));
    EXPECT_EQ(rgba[i * 4 + 3], pc.colors[i * 4 + 3]);
  }
}

TEST(ShTest, EvalShColorsWithoutShReturnsStoredColors) {
  PointCloud pc;
  pc.numPoints = 2;
  pc.colors = {1, 2, 3, 4, 5, 6, 7, 8};
  EXPECT_EQ(EvalShColors(pc, kForwardDirection), pc.colors);
}

TEST(ShTest, NonFiniteCoefficientsGiveZeroChannel) {
  PointCloud pc;
  pc.numPoints = 1;
  pc.shDegree = 0;
  pc.shCoeffs = {std::nanf(""), 0.0f, std::nanf("")};
  pc.colors = {9, 9, 9, 77};
  const std::vector<uint8_t> rgba = EvalShColors(pc, kForwardDirection);
  EXPECT_EQ(rgba, (std::vector<uint8_t>{0, 127, 0, 77}));

  const auto rgb = ShToRgb8(pc.shCoeffs.data(), pc.shCoeffs.size(), 0);
  EXPECT_EQ(rgb[0], 0);
  EXPECT_EQ(rgb[2], 0);
}

} // namespace
} // namespace sk
