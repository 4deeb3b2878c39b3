#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "sk/io/reader.h"

namespace sk {

class IORegistry {
public:
  IORegistry();

  void RegisterReader(const std::vector<std::string> &exts,
                      std::unique_ptr<IPointCloudReader> reader);

  IPointCloudReader *ReaderForExt(const std::string &ext) const;
  // Suffix heuristic: ".ply" and ".spz" select their readers, any other
  // path falls back to the flat splat reader. Case-insensitive.
  IPointCloudReader *ReaderForPath(const std::string &path) const;

private:
  std::vector<std::unique_ptr<IPointCloudReader>> reader_store_;
  std::unordered_map<std::string, IPointCloudReader *> readers_;
};

// Extension key ReaderForPath would use: "ply", "spz" or "splat".
std::string FormatKeyForPath(const std::string &path);

// Last path or URL component with a trailing .splat/.ply/.spz removed.
std::string SourceNameFromPath(const std::string &path);

} // namespace sk
