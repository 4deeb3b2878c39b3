#include "sk/io/decode.h"

#include <spdlog/spdlog.h>

#include "sk/io/registry.h"

namespace sk {

Expected<PointCloud> Decode(const std::string &path, const uint8_t *data,
                            size_t size, const ReadOptions &options) {
  static const IORegistry registry;

  IPointCloudReader *reader = registry.ReaderForPath(path);
  if (reader == nullptr) {
    return Expected<PointCloud>(MakeError(ErrorCode::kInvalidArgument,
                                          "no reader for " + path));
  }

  ReadOptions opts = options;
  if (opts.name.empty())
    opts.name = SourceNameFromPath(path);

  spdlog::debug("decoding '{}' as {} ({} bytes)", path,
                FormatKeyForPath(path), size);
  return reader->Read(data, size, opts);
}

} // namespace sk
