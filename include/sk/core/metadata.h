#pragma once

#include <cstdint>
#include <string>

namespace sk {

struct CloudMetadata {
  std::string name;
  // Coordinate reference token, passed through untouched.
  std::string crs;
  std::string sourceFormat;
  uint32_t formatVersion = 0;
  bool antialiased = false;
};

} // namespace sk
