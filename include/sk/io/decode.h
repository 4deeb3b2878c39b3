#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "sk/io/reader.h"

namespace sk {

// Pick the reader for `path`, default the cloud name from it when
// options.name is empty, and decode `data`.
Expected<PointCloud> Decode(const std::string &path, const uint8_t *data,
                            size_t size, const ReadOptions &options);

} // namespace sk
