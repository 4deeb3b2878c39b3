#include "sk/io/spz.h"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "gzip_internal.h"
#include "read_internal.h"
#include "sk/core/byte_reader.h"
#include "sk/core/errors.h"
#include "sk/core/point_cloud.h"
#include "sk/core/quaternion.h"

namespace sk {

namespace {

constexpr uint32_t kSpzMagic = 0x5053474E; // "NGSP"
constexpr size_t kHeaderSize = 16;
constexpr uint64_t kCancelBatch = 50000;
constexpr uint8_t kFlagAntialiased = 0x1;

struct SpzHeader {
  uint32_t magic = 0;
  uint32_t version = 0;
  uint32_t numPoints = 0;
  uint8_t shDegree = 0;
  uint8_t fractionalBits = 0;
  uint8_t flags = 0;
  uint8_t reserved = 0;
};

// Signed SH bytes stored per point, DC triple included.
int CoeffsPerPoint(int degree) {
  switch (degree) {
  case 1:
    return 9;
  case 2:
    return 24;
  case 3:
    return 45;
  default:
    return 0;
  }
}

std::string Hex32(uint32_t v) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "0x%08X", v);
  return buf;
}

struct SectionSizes {
  uint64_t positions = 0;
  uint64_t alphas = 0;
  uint64_t colors = 0;
  uint64_t scales = 0;
  uint64_t rotations = 0;
  uint64_t sh = 0;

  uint64_t Total() const {
    return kHeaderSize + positions + alphas + colors + scales + rotations + sh;
  }
};

SectionSizes ComputeSections(const SpzHeader &h) {
  const uint64_t n = h.numPoints;
  SectionSizes s;
  s.positions = n * 9; // 3 axes x 24 bits
  s.alphas = n;
  s.colors = n * 3;
  s.scales = n * 3;
  s.rotations = n * (h.version == 3 ? 4 : 3);
  s.sh = n * static_cast<uint64_t>(CoeffsPerPoint(h.shDegree));
  return s;
}

} // namespace

class SpzReader : public IPointCloudReader {
public:
  Expected<PointCloud> Read(const uint8_t *data, size_t size,
                            const ReadOptions &options) override {
    try {
      if (const auto err = detail::CheckTransform(options.transform);
          !err.message.empty()) {
        return Expected<PointCloud>(err);
      }
      if (data == nullptr || size == 0) {
        return Expected<PointCloud>(
            FormatError("spz read failed: empty input"));
      }

      detail::ReadMonitor monitor(options);
      monitor.Progress(0.0f, "Decompressing...");

      std::vector<uint8_t> raw;
      if (auto err = gzip::Decompress(data, size, &raw); !err.message.empty()) {
        err.message = "spz read failed: " + err.message;
        return Expected<PointCloud>(err);
      }
      if (monitor.Cancelled())
        return Expected<PointCloud>(Aborted{});

      if (raw.size() < kHeaderSize) {
        return Expected<PointCloud>(FormatError(
            "spz read failed: too small for header (got " +
            std::to_string(raw.size()) + " bytes, expected " +
            std::to_string(kHeaderSize) + ")"));
      }

      ByteCursor cur(raw.data(), raw.size());
      SpzHeader h;
      h.magic = cur.ReadU32();
      h.version = cur.ReadU32();
      h.numPoints = cur.ReadU32();
      h.shDegree = cur.ReadU8();
      h.fractionalBits = cur.ReadU8();
      h.flags = cur.ReadU8();
      h.reserved = cur.ReadU8();

      if (h.magic != kSpzMagic) {
        return Expected<PointCloud>(FormatError(
            "spz read failed: bad magic number (got " + Hex32(h.magic) +
            ", expected " + Hex32(kSpzMagic) + ")"));
      }
      if (h.version != 2 && h.version != 3) {
        return Expected<PointCloud>(UnsupportedFormatError(
            "spz read failed: unsupported version " +
            std::to_string(h.version) + " (expected 2 or 3)"));
      }
      if (h.numPoints == 0) {
        return Expected<PointCloud>(
            FormatError("spz read failed: file contains no points"));
      }
      if (h.shDegree > 3) {
        return Expected<PointCloud>(UnsupportedFormatError(
            "spz read failed: unsupported SH degree " +
            std::to_string(h.shDegree)));
      }

      const SectionSizes sections = ComputeSections(h);
      if (raw.size() < sections.Total()) {
        return Expected<PointCloud>(FormatError(
            "spz read failed: insufficient data (got " +
            std::to_string(raw.size()) + " bytes, expected " +
            std::to_string(sections.Total()) + ")"));
      }

      spdlog::debug("spz: v{} {} points, sh degree {}, {} fractional bits, "
                    "flags {:#04x}",
                    h.version, h.numPoints, h.shDegree, h.fractionalBits,
                    h.flags);

      const size_t n = h.numPoints;
      PointCloud pc;
      pc.numPoints = n;
      pc.shDegree = h.shDegree;
      pc.meta.formatVersion = h.version;
      pc.meta.antialiased = (h.flags & kFlagAntialiased) != 0;
      pc.positions.resize(n * 3);
      pc.colors.resize(n * 4);
      pc.scales.resize(n * 3);
      pc.rotations.resize(n * 4);

      const auto cancelled = [&monitor](size_t i) {
        return i % kCancelBatch == 0 && monitor.Cancelled();
      };

      // Positions: 24-bit fixed point.
      monitor.Progress(10.0f, "Parsing positions...");
      const double fixedScale = std::ldexp(1.0, -h.fractionalBits);
      const Transform &t = options.transform;
      for (size_t i = 0; i < n; ++i) {
        if (cancelled(i))
          return Expected<PointCloud>(Aborted{});
        monitor.RecordProgress(i, n, 10.0f, 50.0f, "positions", kCancelBatch);
        for (int a = 0; a < 3; ++a) {
          pc.positions[i * 3 + a] = t.Apply(cur.ReadI24LE() * fixedScale, a);
        }
      }

      monitor.Progress(50.0f, "Parsing alphas...");
      for (size_t i = 0; i < n; ++i) {
        if (cancelled(i))
          return Expected<PointCloud>(Aborted{});
        pc.colors[i * 4 + 3] = cur.ReadU8();
      }

      monitor.Progress(60.0f, "Parsing colors...");
      for (size_t i = 0; i < n; ++i) {
        if (cancelled(i))
          return Expected<PointCloud>(Aborted{});
        std::memcpy(&pc.colors[i * 4], cur.current(), 3);
        cur.Skip(3);
      }

      // Scales: signed log values in 1/16 steps.
      monitor.Progress(70.0f, "Parsing scales...");
      for (size_t i = 0; i < n * 3; ++i) {
        if (cancelled(i))
          return Expected<PointCloud>(Aborted{});
        pc.scales[i] = std::exp(static_cast<float>(cur.ReadI8()) / 16.0f);
      }

      monitor.Progress(80.0f, "Parsing rotations...");
      for (size_t i = 0; i < n; ++i) {
        if (cancelled(i))
          return Expected<PointCloud>(Aborted{});
        Quat4f q;
        if (h.version == 3) {
          q = DecodeQuatSmallestThree(cur.ReadU32());
        } else {
          const int8_t x = cur.ReadI8();
          const int8_t y = cur.ReadI8();
          const int8_t z = cur.ReadI8();
          q = DecodeQuatXyzI8(x, y, z);
        }
        std::memcpy(&pc.rotations[i * 4], q.data(), sizeof(float) * 4);
      }

      const int coeffsPerPoint = CoeffsPerPoint(h.shDegree);
      if (coeffsPerPoint > 0) {
        monitor.Progress(90.0f, "Parsing spherical harmonics...");
        const size_t shStride = ShCoeffCount(h.shDegree);
        pc.shCoeffs.assign(n * shStride, 0.0f);
        for (size_t i = 0; i < n; ++i) {
          if (cancelled(i))
            return Expected<PointCloud>(Aborted{});
          float *sh = &pc.shCoeffs[i * shStride];
          for (int c = 0; c < coeffsPerPoint; ++c)
            sh[c] = static_cast<float>(cur.ReadI8()) / 127.0f;
        }
      }

      monitor.Progress(100.0f, "Complete");
      return detail::Finish(std::move(pc), options, "spz");
    } catch (const std::exception &e) {
      return Expected<PointCloud>(
          FormatError(std::string("spz read failed: ") + e.what()));
    }
  }
};

std::unique_ptr<IPointCloudReader> MakeSpzReader() {
  return std::make_unique<SpzReader>();
}

} // namespace sk
