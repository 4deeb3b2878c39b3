#pragma once

#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

#include "sk/core/errors.h"
#include "sk/core/validate.h"
#include "sk/io/reader.h"

namespace sk {
namespace detail {

// Polls the caller's cancellation query and forwards progress.
class ReadMonitor {
public:
  explicit ReadMonitor(const ReadOptions &options) : options_(options) {}

  bool Cancelled() const {
    return options_.isCancelled && options_.isCancelled();
  }

  void Progress(float percent, const std::string &message) const {
    if (options_.progress)
      options_.progress(percent, message);
  }

  // Reports record-level progress every `every` records, mapped into
  // [from, to] percent.
  void RecordProgress(uint64_t i, uint64_t total, float from, float to,
                      const char *what, uint64_t every = 10000) const {
    if (!options_.progress || i % every != 0 || total == 0)
      return;
    const float pct = from + (to - from) * static_cast<float>(i) /
                                 static_cast<float>(total);
    options_.progress(pct, std::string("Parsing ") + what + " " +
                               std::to_string(i) + "/" +
                               std::to_string(total));
  }

private:
  const ReadOptions &options_;
};

inline Error CheckTransform(const Transform &t) {
  if (!(t.scale > 0.0) || !std::isfinite(t.scale)) {
    return MakeError(ErrorCode::kInvalidArgument,
                     "transform scale must be a positive finite number");
  }
  for (const double o : t.origin) {
    if (!std::isfinite(o))
      return MakeError(ErrorCode::kInvalidArgument,
                       "transform origin must be finite");
  }
  return Error{};
}

// Shared tail of every reader: stamp metadata and enforce the length
// invariant (plus value checks in strict mode).
inline Expected<PointCloud> Finish(PointCloud pc, const ReadOptions &options,
                                   const char *format) {
  pc.meta.name = options.name;
  pc.meta.crs = options.crs;
  pc.meta.sourceFormat = format;

  const auto err = ValidateBasic(pc, options.strict);
  if (!err.message.empty())
    return Expected<PointCloud>(err);
  return Expected<PointCloud>(std::move(pc));
}

} // namespace detail
} // namespace sk
