#include "gzip_internal.h"

#include <algorithm>
#include <string>

#include <zlib.h>

namespace sk {
namespace gzip {

Error Decompress(const uint8_t *compressed, size_t size,
                 std::vector<uint8_t> *out, size_t maxChunk) {
  if (maxChunk == 0 || maxChunk > std::numeric_limits<uInt>::max())
    maxChunk = std::numeric_limits<uInt>::max();
  std::vector<uint8_t> buffer(1 << 16);
  z_stream stream = {};
  stream.next_in = const_cast<Bytef *>(compressed);
  stream.avail_in = 0;
  size_t remaining = size;
  // 16 selects gzip framing.
  if (inflateInit2(&stream, 16 | MAX_WBITS) != Z_OK)
    return DecompressionError("inflateInit2 failed");

  out->clear();
  int res = Z_OK;
  while (true) {
    // avail_in is a uInt; inputs past its range are fed in chunks.
    if (stream.avail_in == 0 && remaining > 0) {
      const size_t chunk = std::min(remaining, maxChunk);
      stream.avail_in = static_cast<uInt>(chunk);
      remaining -= chunk;
    }
    stream.next_out = buffer.data();
    stream.avail_out = static_cast<uInt>(buffer.size());
    res = inflate(&stream, Z_NO_FLUSH);
    if (res != Z_OK && res != Z_STREAM_END)
      break;
    out->insert(out->end(), buffer.data(),
                buffer.data() + buffer.size() - stream.avail_out);
    if (res == Z_STREAM_END)
      break;
  }
  const std::string detail = stream.msg != nullptr ? stream.msg : "";
  inflateEnd(&stream);

  if (res != Z_STREAM_END) {
    out->clear();
    if (res == Z_BUF_ERROR)
      return DecompressionError("gzip stream is truncated");
    return DecompressionError("gzip stream is corrupt" +
                              (detail.empty() ? "" : ": " + detail));
  }
  return Error{};
}

} // namespace gzip
} // namespace sk
