#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "sk/core/errors.h"
#include "sk/core/point_cloud.h"

namespace sk {

// Polled between records; returning true aborts the read.
using CancelQuery = std::function<bool()>;
// percent in [0, 100] and a short human readable message.
using ProgressCallback = std::function<void(float, const std::string &)>;

struct ReadOptions {
  Transform transform;
  std::string crs;
  std::string name;
  bool strict = false;
  CancelQuery isCancelled;
  ProgressCallback progress;
};

class IPointCloudReader {
public:
  virtual ~IPointCloudReader() = default;
  // Decode a fully resident buffer. The result holds a cloud, an error, or
  // the aborted marker when isCancelled fired; never a partial cloud.
  virtual Expected<PointCloud> Read(const uint8_t *data, size_t size,
                                    const ReadOptions &options) = 0;
};

} // namespace sk
