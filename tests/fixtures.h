#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <zlib.h>

#include "sk/core/errors.h"

namespace sk {
namespace testing {

using Bytes = std::vector<uint8_t>;

// Failure detail for assertion messages; safe on every result state.
template <typename T> std::string Describe(const Expected<T> &result) {
  if (result.failed()) {
    return std::string(ErrorCodeToString(result.error().code)) + ": " +
           result.error().message;
  }
  return result.aborted() ? "aborted" : "ok";
}

inline void AppendU8(Bytes &b, uint8_t v) { b.push_back(v); }

inline void AppendU32LE(Bytes &b, uint32_t v) {
  for (int i = 0; i < 4; ++i)
    b.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

inline void AppendF32LE(Bytes &b, float v) {
  uint32_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  AppendU32LE(b, bits);
}

inline void AppendF32BE(Bytes &b, float v) {
  uint32_t bits;
  std::memcpy(&bits, &v, sizeof(bits));
  for (int i = 3; i >= 0; --i)
    b.push_back(static_cast<uint8_t>(bits >> (8 * i)));
}

inline void AppendI24LE(Bytes &b, int32_t v) {
  const uint32_t u = static_cast<uint32_t>(v) & 0xFFFFFFu;
  b.push_back(static_cast<uint8_t>(u));
  b.push_back(static_cast<uint8_t>(u >> 8));
  b.push_back(static_cast<uint8_t>(u >> 16));
}

// One 32-byte flat record.
inline void AppendSplat(Bytes &b, std::array<float, 3> pos,
                        std::array<float, 3> scale,
                        std::array<uint8_t, 4> rgba,
                        std::array<uint8_t, 4> rot) {
  for (float v : pos)
    AppendF32LE(b, v);
  for (float v : scale)
    AppendF32LE(b, v);
  b.insert(b.end(), rgba.begin(), rgba.end());
  b.insert(b.end(), rot.begin(), rot.end());
}

// Binary PLY with one float property per name. `values` holds
// count * names.size() floats, record-major.
inline Bytes MakeFloatPly(const std::vector<std::string> &names,
                          const std::vector<float> &values,
                          bool bigEndian = false,
                          const std::string &format = "") {
  std::string header = "ply\n";
  header += format.empty() ? (bigEndian ? "format binary_big_endian 1.0\n"
                                        : "format binary_little_endian 1.0\n")
                           : format;
  header += "comment generated by test\n";
  header += "element vertex " +
            std::to_string(names.empty() ? 0 : values.size() / names.size()) +
            "\n";
  for (const auto &n : names)
    header += "property float " + n + "\n";
  header += "end_header\n";

  Bytes b(header.begin(), header.end());
  for (float v : values) {
    if (bigEndian)
      AppendF32BE(b, v);
    else
      AppendF32LE(b, v);
  }
  return b;
}

inline Bytes Gzip(const Bytes &raw) {
  z_stream stream = {};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 | MAX_WBITS,
                   8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  Bytes out(deflateBound(&stream, static_cast<uLong>(raw.size())) + 32);
  stream.next_in = const_cast<Bytef *>(raw.data());
  stream.avail_in = static_cast<uInt>(raw.size());
  stream.next_out = out.data();
  stream.avail_out = static_cast<uInt>(out.size());
  const int res = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (res != Z_STREAM_END)
    throw std::runtime_error("deflate failed");
  out.resize(stream.total_out);
  return out;
}

struct SpzPoint {
  std::array<int32_t, 3> fixedPos{};
  uint8_t alpha = 255;
  std::array<uint8_t, 3> rgb{};
  std::array<int8_t, 3> logScale{};
  uint32_t packedRot = 0;            // version 3
  std::array<int8_t, 3> rotXyz{};    // version 2
  std::vector<int8_t> sh;            // coeffsPerPoint bytes
};

// Uncompressed SPZ payload: 16-byte header followed by the sections.
inline Bytes MakeSpzPayload(const std::vector<SpzPoint> &points,
                            uint32_t version = 3, uint8_t shDegree = 0,
                            uint8_t fractionalBits = 12, uint8_t flags = 0,
                            uint32_t magic = 0x5053474E) {
  Bytes b;
  AppendU32LE(b, magic);
  AppendU32LE(b, version);
  AppendU32LE(b, static_cast<uint32_t>(points.size()));
  AppendU8(b, shDegree);
  AppendU8(b, fractionalBits);
  AppendU8(b, flags);
  AppendU8(b, 0);
  for (const auto &p : points)
    for (int32_t v : p.fixedPos)
      AppendI24LE(b, v);
  for (const auto &p : points)
    AppendU8(b, p.alpha);
  for (const auto &p : points)
    b.insert(b.end(), p.rgb.begin(), p.rgb.end());
  for (const auto &p : points)
    for (int8_t v : p.logScale)
      AppendU8(b, static_cast<uint8_t>(v));
  for (const auto &p : points) {
    if (version == 3) {
      AppendU32LE(b, p.packedRot);
    } else {
      for (int8_t v : p.rotXyz)
        AppendU8(b, static_cast<uint8_t>(v));
    }
  }
  for (const auto &p : points)
    for (int8_t v : p.sh)
      AppendU8(b, static_cast<uint8_t>(v));
  return b;
}

// Packs three 10-bit two's-complement components and the omitted index.
inline uint32_t PackSmallestThree(uint32_t largest, int c0, int c1, int c2) {
  const auto f = [](int v) { return static_cast<uint32_t>(v) & 0x3FFu; };
  return (largest & 0x3u) | (f(c0) << 2) | (f(c1) << 12) | (f(c2) << 22);
}

} // namespace testing
} // namespace sk
