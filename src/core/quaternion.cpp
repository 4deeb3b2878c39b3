#include "sk/core/quaternion.h"

#include <algorithm>
#include <cmath>

#include "sk/core/byte_reader.h"

namespace sk {

namespace {

constexpr float kInv128 = 1.0f / 128.0f;
constexpr float kInv127 = 1.0f / 127.0f;
constexpr float kInv511 = 1.0f / 511.0f;

float RebuildComponent(float a, float b, float c) {
  return std::sqrt(std::max(0.0f, 1.0f - a * a - b * b - c * c));
}

} // namespace

Quat4f DecodeQuatU8(const uint8_t bytes[4]) {
  return {(static_cast<float>(bytes[0]) - 128.0f) * kInv128,
          (static_cast<float>(bytes[1]) - 128.0f) * kInv128,
          (static_cast<float>(bytes[2]) - 128.0f) * kInv128,
          (static_cast<float>(bytes[3]) - 128.0f) * kInv128};
}

Quat4f DecodeQuatXyzI8(int8_t x, int8_t y, int8_t z) {
  const float qx = static_cast<float>(x) * kInv127;
  const float qy = static_cast<float>(y) * kInv127;
  const float qz = static_cast<float>(z) * kInv127;
  return {RebuildComponent(qx, qy, qz), qx, qy, qz};
}

Quat4f DecodeQuatSmallestThree(uint32_t packed) {
  const uint32_t largest = packed & 0x3u;
  const float c0 =
      static_cast<float>(SignExtend((packed >> 2) & 0x3FFu, 10)) * kInv511;
  const float c1 =
      static_cast<float>(SignExtend((packed >> 12) & 0x3FFu, 10)) * kInv511;
  const float c2 =
      static_cast<float>(SignExtend((packed >> 22) & 0x3FFu, 10)) * kInv511;

  const float rebuilt = RebuildComponent(c0, c1, c2);
  const float small[3] = {c0, c1, c2};

  Quat4f q{};
  int next = 0;
  for (uint32_t slot = 0; slot < 4; ++slot) {
    q[slot] = (slot == largest) ? rebuilt : small[next++];
  }
  return q;
}

float QuatNorm(const Quat4f &q) {
  return std::sqrt(q[0] * q[0] + q[1] * q[1] + q[2] * q[2] + q[3] * q[3]);
}

Quat4f NormalizeQuat(const Quat4f &q) {
  const float lenSq = q[0] * q[0] + q[1] * q[1] + q[2] * q[2] + q[3] * q[3];
  if (!(lenSq > 0.0f) || !std::isfinite(lenSq))
    return kIdentityQuat;
  const float invLength = 1.0f / std::sqrt(lenSq);
  return {q[0] * invLength, q[1] * invLength, q[2] * invLength,
          q[3] * invLength};
}

} // namespace sk
