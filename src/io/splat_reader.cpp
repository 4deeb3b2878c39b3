#include "sk/io/splat.h"

#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "read_internal.h"
#include "sk/core/byte_reader.h"
#include "sk/core/errors.h"
#include "sk/core/point_cloud.h"
#include "sk/core/quaternion.h"

namespace sk {

namespace {

constexpr size_t BYTES_PER_SPLAT = 32;

} // namespace

// Flat record layout, 32 bytes per splat:
//   0..11  position  3 x float32 LE
//  12..23  scale     3 x float32 LE (linear)
//  24..27  colour    RGBA uint8
//  28..31  rotation  4 x uint8, (b - 128) / 128 as [w, x, y, z]
class SplatReader : public IPointCloudReader {
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
            FormatError("splat read failed: no splats found (empty input)"));
      }
      if (size % BYTES_PER_SPLAT != 0) {
        return Expected<PointCloud>(FormatError(
            "splat read failed: size " + std::to_string(size) +
            " is not a multiple of " + std::to_string(BYTES_PER_SPLAT) +
            " bytes"));
      }

      const size_t numSplats = size / BYTES_PER_SPLAT;
      detail::ReadMonitor monitor(options);
      monitor.Progress(0.0f, "Parsing " + std::to_string(numSplats) +
                                 " splats...");
      spdlog::debug("splat: {} records", numSplats);

      PointCloud pc;
      pc.numPoints = numSplats;
      pc.shDegree = 0; // .splat carries no spherical harmonics

      // Pre-allocate all vectors to avoid reallocation overhead
      pc.positions.resize(numSplats * 3);
      pc.colors.resize(numSplats * 4);
      pc.scales.resize(numSplats * 3);
      pc.rotations.resize(numSplats * 4);

      double *__restrict__ posPtr = pc.positions.data();
      uint8_t *__restrict__ colorPtr = pc.colors.data();
      float *__restrict__ scalePtr = pc.scales.data();
      float *__restrict__ rotPtr = pc.rotations.data();

      const Transform &t = options.transform;

      for (size_t i = 0; i < numSplats; ++i) {
        if (monitor.Cancelled()) {
          spdlog::debug("splat: cancelled at record {}", i);
          return Expected<PointCloud>(Aborted{});
        }
        monitor.RecordProgress(i, numSplats, 0.0f, 100.0f, "splat");

        const uint8_t *splatBytes = data + i * BYTES_PER_SPLAT;

        posPtr[0] = t.Apply(LoadF32LE(&splatBytes[0]), 0);
        posPtr[1] = t.Apply(LoadF32LE(&splatBytes[4]), 1);
        posPtr[2] = t.Apply(LoadF32LE(&splatBytes[8]), 2);
        posPtr += 3;

        scalePtr[0] = LoadF32LE(&splatBytes[12]);
        scalePtr[1] = LoadF32LE(&splatBytes[16]);
        scalePtr[2] = LoadF32LE(&splatBytes[20]);
        scalePtr += 3;

        std::memcpy(colorPtr, &splatBytes[24], 4);
        colorPtr += 4;

        // Stored as-is: the flat format's rotation is not renormalised.
        const Quat4f q = DecodeQuatU8(&splatBytes[28]);
        std::memcpy(rotPtr, q.data(), sizeof(float) * 4);
        rotPtr += 4;
      }

      monitor.Progress(100.0f, "Complete");
      return detail::Finish(std::move(pc), options, "splat");
    } catch (const std::exception &e) {
      return Expected<PointCloud>(
          FormatError(std::string("splat read failed: ") + e.what()));
    }
  }
};

std::unique_ptr<IPointCloudReader> MakeSplatReader() {
  return std::make_unique<SplatReader>();
}

} // namespace sk
