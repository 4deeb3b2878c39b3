#pragma once

#include <array>
#include <cstdint>

namespace sk {

// Quaternion in [w, x, y, z] order.
using Quat4f = std::array<float, 4>;

constexpr Quat4f kIdentityQuat = {1.0f, 0.0f, 0.0f, 0.0f};

// Four centred bytes, (b - 128) / 128 each, in [w, x, y, z] order.
// The result is not renormalised.
Quat4f DecodeQuatU8(const uint8_t bytes[4]);

// Three signed bytes scaled by 1/127 as x, y, z; w is rebuilt from the unit
// norm constraint and is never negative.
Quat4f DecodeQuatXyzI8(int8_t x, int8_t y, int8_t z);

// "Smallest three" packing of a unit quaternion into 32 bits:
//
//   bits  0..1   index of the omitted component (0=w, 1=x, 2=y, 3=z)
//   bits  2..11  c0, 10-bit two's complement, scaled by 1/511
//   bits 12..21  c1
//   bits 22..31  c2
//
// The omitted slot receives sqrt(max(0, 1 - c0^2 - c1^2 - c2^2)); c0, c1, c2
// fill the remaining slots in order.
Quat4f DecodeQuatSmallestThree(uint32_t packed);

// Unit-length copy of q; a zero quaternion yields the identity.
Quat4f NormalizeQuat(const Quat4f &q);

float QuatNorm(const Quat4f &q);

} // namespace sk
