#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <zlib.h>

#include "sk/core/errors.h"

namespace sk {
namespace gzip {

// Inflate a complete gzip stream. Returns a kDecompression error for a
// corrupt or truncated payload. Input is handed to zlib at most
// `maxChunk` bytes at a time.
Error Decompress(const uint8_t *compressed, size_t size,
                 std::vector<uint8_t> *out,
                 size_t maxChunk = std::numeric_limits<uInt>::max());

} // namespace gzip
} // namespace sk
