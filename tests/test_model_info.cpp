#include <gtest/gtest.h>

#include "sk/core/model_info.h"
#include "sk/core/validate.h"

namespace sk {
namespace {

PointCloud TwoPoints() {
  PointCloud pc;
  pc.numPoints = 2;
  pc.positions = {-1.0, 2.0, 3.0, 4.0, -5.0, 6.0};
  pc.colors = {0, 0, 0, 100, 0, 0, 0, 200};
  pc.scales = {1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6.0f};
  pc.rotations = {1, 0, 0, 0, 1, 0, 0, 0};
  pc.meta.sourceFormat = "ply";
  return pc;
}

TEST(ModelInfoTest, BoundsAndStats) {
  const ModelInfo info = GetModelInfo(TwoPoints(), 1234);
  EXPECT_EQ(info.numPoints, 2u);
  EXPECT_EQ(info.fileSize, 1234u);
  EXPECT_EQ(info.sourceFormat, "ply");
  EXPECT_DOUBLE_EQ(info.bounds.minX, -1.0);
  EXPECT_DOUBLE_EQ(info.bounds.maxX, 4.0);
  EXPECT_DOUBLE_EQ(info.bounds.minY, -5.0);
  EXPECT_DOUBLE_EQ(info.bounds.maxZ, 6.0);
  EXPECT_FLOAT_EQ(info.scaleStats.avg, 3.5f);
  EXPECT_FLOAT_EQ(info.alphaStats.min, 100.0f);
  EXPECT_FLOAT_EQ(info.alphaStats.max, 200.0f);
  EXPECT_EQ(info.alphaStats.count, 2u);
  EXPECT_EQ(info.totalSize, 6 * sizeof(double) + 8 + 6 * sizeof(float) +
                                8 * sizeof(float));
}

TEST(ModelInfoTest, FormatBytes) {
  EXPECT_EQ(FormatBytes(512), "512.00 B");
  EXPECT_EQ(FormatBytes(2048), "2.00 KB");
}

TEST(ValidateTest, LengthMismatchIsReported) {
  PointCloud pc = TwoPoints();
  EXPECT_TRUE(ValidateBasic(pc).message.empty());

  pc.scales.pop_back();
  const Error err = ValidateBasic(pc);
  EXPECT_EQ(err.code, ErrorCode::kInternal);
  EXPECT_NE(err.message.find("scales"), std::string::npos);
}

TEST(ValidateTest, ShLengthFollowsDegree) {
  PointCloud pc = TwoPoints();
  pc.shDegree = 1;
  EXPECT_FALSE(ValidateBasic(pc).message.empty());
  pc.shCoeffs.assign(2 * 12, 0.0f);
  EXPECT_TRUE(ValidateBasic(pc).message.empty());
}

TEST(ValidateTest, StrictRejectsNonPositiveScale) {
  PointCloud pc = TwoPoints();
  pc.scales[0] = 0.0f;
  EXPECT_TRUE(ValidateBasic(pc, false).message.empty());
  EXPECT_EQ(ValidateBasic(pc, true).code, ErrorCode::kFormat);
}

} // namespace
} // namespace sk
