#include "sk/core/validate.h"

#include <cmath>
#include <string>

namespace sk {

namespace {
template <typename T> bool AllFinite(const std::vector<T> &values) {
  for (const T v : values) {
    if (!std::isfinite(v))
      return false;
  }
  return true;
}
} // namespace

Error ValidateBasic(const PointCloud &pc, bool strict) {
  const size_t n = static_cast<size_t>(pc.numPoints);

  const auto expect_size = [](size_t got, size_t expect,
                              const char *name) -> Error {
    if (got != expect) {
      return MakeError(ErrorCode::kInternal,
                       std::string(name) + " size mismatch, got " +
                           std::to_string(got) + ", expect " +
                           std::to_string(expect));
    }
    return Error{};
  };

  if (pc.shDegree < 0 || pc.shDegree > 3)
    return MakeError(ErrorCode::kInternal,
                     "shDegree out of range: " + std::to_string(pc.shDegree));

  if (auto err = expect_size(pc.positions.size(), n * 3, "positions");
      !err.message.empty())
    return err;
  if (auto err = expect_size(pc.colors.size(), n * 4, "colors");
      !err.message.empty())
    return err;
  if (auto err = expect_size(pc.scales.size(), n * 3, "scales");
      !err.message.empty())
    return err;
  if (auto err = expect_size(pc.rotations.size(), n * 4, "rotations");
      !err.message.empty())
    return err;
  if (pc.HasSh()) {
    if (auto err = expect_size(pc.shCoeffs.size(),
                               n * static_cast<size_t>(
                                       ShCoeffCount(pc.shDegree)),
                               "shCoeffs");
        !err.message.empty())
      return err;
  } else if (pc.shDegree != 0) {
    return MakeError(ErrorCode::kInternal,
                     "shDegree " + std::to_string(pc.shDegree) +
                         " without coefficients");
  }

  if (strict) {
    if (!AllFinite(pc.positions))
      return FormatError("positions contains non-finite value");
    if (!AllFinite(pc.scales))
      return FormatError("scales contains non-finite value");
    for (const float v : pc.scales) {
      if (!(v > 0.0f))
        return FormatError("scales contains non-positive value");
    }
    if (!AllFinite(pc.rotations))
      return FormatError("rotations contains non-finite value");
    if (!AllFinite(pc.shCoeffs))
      return FormatError("shCoeffs contains non-finite value");
  }

  return Error{}; // empty message indicates success.
}

} // namespace sk
