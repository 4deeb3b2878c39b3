#include "sk/io/registry.h"

#include <algorithm>
#include <cctype>

#include "sk/io/ply.h"
#include "sk/io/splat.h"
#include "sk/io/spz.h"

namespace sk {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::string NormalizeExt(const std::string &ext) {
  if (!ext.empty() && ext[0] == '.')
    return ToLower(ext.substr(1));
  return ToLower(ext);
}

bool EndsWith(const std::string &s, const std::string &suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

IORegistry::IORegistry() {
  // Built-in registrations
  RegisterReader({"ply"}, sk::MakePlyReader());
  RegisterReader({"spz"}, sk::MakeSpzReader());
  RegisterReader({"splat"}, sk::MakeSplatReader());
}

void IORegistry::RegisterReader(const std::vector<std::string> &exts,
                                std::unique_ptr<IPointCloudReader> reader) {
  reader_store_.push_back(std::move(reader));
  IPointCloudReader *ptr = reader_store_.back().get();
  for (const auto &e : exts) {
    readers_[NormalizeExt(e)] = ptr;
  }
}

IPointCloudReader *IORegistry::ReaderForExt(const std::string &ext) const {
  const auto it = readers_.find(NormalizeExt(ext));
  return it == readers_.end() ? nullptr : it->second;
}

IPointCloudReader *IORegistry::ReaderForPath(const std::string &path) const {
  return ReaderForExt(FormatKeyForPath(path));
}

std::string FormatKeyForPath(const std::string &path) {
  const std::string lower = ToLower(path);
  if (EndsWith(lower, ".ply"))
    return "ply";
  if (EndsWith(lower, ".spz"))
    return "spz";
  return "splat";
}

std::string SourceNameFromPath(const std::string &path) {
  const auto slash = path.find_last_of("/\\");
  std::string name =
      slash == std::string::npos ? path : path.substr(slash + 1);
  const std::string lower = ToLower(name);
  for (const char *suffix : {".splat", ".ply", ".spz"}) {
    if (EndsWith(lower, suffix)) {
      name.resize(name.size() - std::char_traits<char>::length(suffix));
      break;
    }
  }
  return name;
}

} // namespace sk
