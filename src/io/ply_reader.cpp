#include "sk/io/ply.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "read_internal.h"
#include "sk/core/byte_reader.h"
#include "sk/core/errors.h"
#include "sk/core/point_cloud.h"
#include "sk/core/quaternion.h"
#include "sk/core/sh.h"

namespace sk {

namespace {

constexpr char kEndHeader[] = "end_header\n";
constexpr int kMaxRestIndex = 44;

enum class PlyType { kFloat32, kFloat64, kInt32, kUInt32, kInt16, kUInt16,
                     kInt8, kUInt8 };

bool ParsePlyType(const std::string &name, PlyType *type) {
  static const std::unordered_map<std::string, PlyType> kTypes = {
      {"float", PlyType::kFloat32},  {"float32", PlyType::kFloat32},
      {"double", PlyType::kFloat64}, {"float64", PlyType::kFloat64},
      {"int", PlyType::kInt32},      {"int32", PlyType::kInt32},
      {"uint", PlyType::kUInt32},    {"uint32", PlyType::kUInt32},
      {"short", PlyType::kInt16},    {"int16", PlyType::kInt16},
      {"ushort", PlyType::kUInt16},  {"uint16", PlyType::kUInt16},
      {"char", PlyType::kInt8},      {"int8", PlyType::kInt8},
      {"uchar", PlyType::kUInt8},    {"uint8", PlyType::kUInt8},
  };
  const auto it = kTypes.find(name);
  if (it == kTypes.end())
    return false;
  *type = it->second;
  return true;
}

size_t PlyTypeSize(PlyType type) {
  switch (type) {
  case PlyType::kFloat64:
    return 8;
  case PlyType::kFloat32:
  case PlyType::kInt32:
  case PlyType::kUInt32:
    return 4;
  case PlyType::kInt16:
  case PlyType::kUInt16:
    return 2;
  case PlyType::kInt8:
  case PlyType::kUInt8:
    return 1;
  }
  return 0;
}

struct PlyProperty {
  std::string name;
  PlyType type = PlyType::kFloat32;
  size_t offset = 0;
};

struct PlyElement {
  std::string name;
  uint64_t count = 0;
  std::vector<PlyProperty> properties;
  size_t stride = 0;
  bool hasList = false;
};

struct PlyHeader {
  bool hasFormat = false;
  bool ascii = false;
  Endian endian = Endian::kLittle;
  std::vector<PlyElement> elements;
  size_t dataOffset = 0;
};

bool ParseCount(const std::string &text, uint64_t *out) {
  if (text.empty() || text[0] == '-')
    return false;
  char *end = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0')
    return false;
  *out = static_cast<uint64_t>(v);
  return true;
}

Error ParseHeader(const uint8_t *data, size_t size, PlyHeader *header) {
  const char *begin = reinterpret_cast<const char *>(data);
  const char *end = begin + size;
  const size_t tokenLen = sizeof(kEndHeader) - 1;
  const char *term = std::search(begin, end, kEndHeader, kEndHeader + tokenLen);
  if (term == end)
    return FormatError("ply read failed: no end_header found");
  header->dataOffset = static_cast<size_t>(term - begin) + tokenLen;

  std::istringstream lines(std::string(begin, term));
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    std::istringstream tokens(line);
    std::string keyword;
    if (!(tokens >> keyword))
      continue;

    if (first && keyword != "ply")
      spdlog::warn("ply: header does not start with 'ply'");
    first = false;

    if (keyword == "ply" || keyword == "comment" || keyword == "obj_info") {
      continue;
    } else if (keyword == "format") {
      std::string kind;
      tokens >> kind;
      header->hasFormat = true;
      if (kind == "ascii") {
        header->ascii = true;
      } else if (kind == "binary_little_endian") {
        header->endian = Endian::kLittle;
      } else if (kind == "binary_big_endian") {
        header->endian = Endian::kBig;
      } else {
        return FormatError("ply read failed: unknown format '" + kind + "'");
      }
    } else if (keyword == "element") {
      PlyElement element;
      std::string count;
      if (!(tokens >> element.name >> count) ||
          !ParseCount(count, &element.count)) {
        return FormatError("ply read failed: malformed element line '" +
                           line + "'");
      }
      header->elements.push_back(std::move(element));
    } else if (keyword == "property") {
      if (header->elements.empty()) {
        return FormatError("ply read failed: property before any element");
      }
      PlyElement &element = header->elements.back();
      std::string typeName, name;
      if (!(tokens >> typeName)) {
        return FormatError("ply read failed: malformed property line");
      }
      if (typeName == "list") {
        element.hasList = true;
        continue;
      }
      PlyProperty prop;
      if (!ParsePlyType(typeName, &prop.type)) {
        return FormatError("ply read failed: unknown property type '" +
                           typeName + "'");
      }
      if (!(tokens >> prop.name)) {
        return FormatError("ply read failed: property without a name");
      }
      prop.offset = element.stride;
      element.stride += PlyTypeSize(prop.type);
      element.properties.push_back(std::move(prop));
    } else {
      spdlog::debug("ply: ignoring header line '{}'", line);
    }
  }
  return Error{};
}

double LoadScalar(const uint8_t *p, PlyType type, Endian endian) {
  ByteCursor cur(p, PlyTypeSize(type));
  switch (type) {
  case PlyType::kFloat32:
    return cur.ReadF32(endian);
  case PlyType::kFloat64:
    return cur.ReadF64(endian);
  case PlyType::kInt32:
    return cur.ReadI32(endian);
  case PlyType::kUInt32:
    return cur.ReadU32(endian);
  case PlyType::kInt16:
    return cur.ReadI16(endian);
  case PlyType::kUInt16:
    return cur.ReadU16(endian);
  case PlyType::kInt8:
    return cur.ReadI8();
  case PlyType::kUInt8:
    return cur.ReadU8();
  }
  return 0.0;
}

// NaN maps to 0.
uint8_t ToByte(double v) {
  if (!(v > 0.0))
    return 0;
  return static_cast<uint8_t>(std::min(v, 255.0));
}

// Name -> property lookup built once per read.
class Schema {
public:
  explicit Schema(const PlyElement &vertex) {
    for (const auto &p : vertex.properties)
      byName_.emplace(p.name, &p);
  }

  const PlyProperty *Find(const std::string &name) const {
    const auto it = byName_.find(name);
    return it == byName_.end() ? nullptr : it->second;
  }

  // All-or-nothing lookup of a property group such as scale_0..scale_2.
  // Returns false only for a partially present group.
  bool Group(const std::vector<std::string> &names,
             std::vector<const PlyProperty *> *out) const {
    out->clear();
    for (const auto &n : names)
      out->push_back(Find(n));
    const auto present = std::count_if(out->begin(), out->end(),
                                       [](const PlyProperty *p) { return p; });
    if (present == 0)
      out->clear();
    return present == 0 ||
           present == static_cast<std::ptrdiff_t>(names.size());
  }

  // (k, property) for every f_rest_<k>.
  std::vector<std::pair<int, const PlyProperty *>> RestFields() const {
    std::vector<std::pair<int, const PlyProperty *>> rest;
    const std::string prefix = "f_rest_";
    for (const auto &[name, prop] : byName_) {
      if (name.compare(0, prefix.size(), prefix) != 0)
        continue;
      const std::string digits = name.substr(prefix.size());
      uint64_t k = 0;
      if (!ParseCount(digits, &k))
        continue;
      rest.emplace_back(static_cast<int>(std::min<uint64_t>(k, 1u << 20)),
                        prop);
    }
    std::sort(rest.begin(), rest.end());
    return rest;
  }

private:
  std::unordered_map<std::string, const PlyProperty *> byName_;
};

int DegreeForMaxRestIndex(int maxK) {
  if (maxK >= 44)
    return 3;
  if (maxK >= 23)
    return 2;
  if (maxK >= 8)
    return 1;
  return 0;
}

} // namespace

class PlyReader : public IPointCloudReader {
public:
  Expected<PointCloud> Read(const uint8_t *data, size_t size,
                            const ReadOptions &options) override {
    try {
      if (const auto err = detail::CheckTransform(options.transform);
          !err.message.empty()) {
        return Expected<PointCloud>(err);
      }
      if (data == nullptr || size == 0) {
        return Expected<PointCloud>(
            FormatError("ply read failed: empty input"));
      }

      PlyHeader header;
      if (auto err = ParseHeader(data, size, &header); !err.message.empty())
        return Expected<PointCloud>(err);

      if (!header.hasFormat) {
        return Expected<PointCloud>(
            FormatError("ply read failed: missing format line"));
      }
      if (header.ascii) {
        return Expected<PointCloud>(UnsupportedFormatError(
            "ply read failed: ASCII PLY is not supported"));
      }

      // Elements ahead of the vertex block are skipped by their stride.
      size_t vertexOffset = header.dataOffset;
      const PlyElement *vertex = nullptr;
      for (const auto &element : header.elements) {
        if (element.name == "vertex") {
          vertex = &element;
          break;
        }
        if (element.hasList) {
          return Expected<PointCloud>(UnsupportedFormatError(
              "ply read failed: list properties in element '" +
              element.name + "' before vertex data"));
        }
        if (element.stride > 0 && element.count > size / element.stride) {
          return Expected<PointCloud>(FormatError(
              "ply read failed: element '" + element.name +
              "' exceeds the buffer"));
        }
        vertexOffset += static_cast<size_t>(element.count) * element.stride;
      }
      if (vertex == nullptr || vertex->count == 0) {
        return Expected<PointCloud>(
            FormatError("ply read failed: no vertices found"));
      }
      if (vertex->hasList) {
        return Expected<PointCloud>(UnsupportedFormatError(
            "ply read failed: list properties in vertex element"));
      }
      if (vertex->stride == 0) {
        return Expected<PointCloud>(
            FormatError("ply read failed: vertex element has no properties"));
      }

      const uint64_t numPoints = vertex->count;
      const size_t stride = vertex->stride;
      const size_t available = size > vertexOffset ? size - vertexOffset : 0;
      if (numPoints > available / stride) {
        return Expected<PointCloud>(FormatError(
            "ply read failed: insufficient data (got " +
            std::to_string(available) + " bytes, expected " +
            std::to_string(numPoints) + " x " + std::to_string(stride) +
            ")"));
      }

      const Schema schema(*vertex);

      std::vector<const PlyProperty *> pos, dc, rgb, scale, rot;
      if (!schema.Group({"x", "y", "z"}, &pos) || pos.empty()) {
        return Expected<PointCloud>(
            FormatError("ply read failed: missing position fields x, y, z"));
      }
      const std::pair<const char *, bool> groups[] = {
          {"f_dc_0..2", schema.Group({"f_dc_0", "f_dc_1", "f_dc_2"}, &dc)},
          {"red/green/blue", schema.Group({"red", "green", "blue"}, &rgb)},
          {"scale_0..2", schema.Group({"scale_0", "scale_1", "scale_2"}, &scale)},
          {"rot_0..3",
           schema.Group({"rot_0", "rot_1", "rot_2", "rot_3"}, &rot)},
      };
      for (const auto &[label, complete] : groups) {
        if (!complete) {
          return Expected<PointCloud>(FormatError(
              std::string("ply read failed: incomplete property group ") +
              label));
        }
      }
      const PlyProperty *opacity = schema.Find("opacity");

      const bool hasSh = !dc.empty();
      std::vector<std::pair<int, const PlyProperty *>> rest;
      int shDegree = 0;
      if (hasSh) {
        rest = schema.RestFields();
        const int maxK = rest.empty() ? -1 : rest.back().first;
        shDegree = DegreeForMaxRestIndex(maxK);
        const int slots = ShCoeffCount(shDegree) - 3;
        const auto inRange = std::partition_point(
            rest.begin(), rest.end(),
            [slots](const auto &r) { return r.first < slots; });
        if (inRange != rest.end()) {
          spdlog::warn("ply: ignoring {} f_rest fields beyond degree {} "
                       "(max index {})",
                       std::distance(inRange, rest.end()), shDegree, maxK);
          rest.erase(inRange, rest.end());
        }
      } else if (!schema.RestFields().empty()) {
        spdlog::warn("ply: f_rest fields without f_dc_0..2 are ignored");
      }
      const size_t shStride = hasSh ? ShCoeffCount(shDegree) : 0;

      spdlog::debug("ply: {} vertices, stride {} bytes, {} endian, sh {} "
                    "(degree {}, {} rest fields)",
                    numPoints, stride,
                    header.endian == Endian::kLittle ? "little" : "big",
                    hasSh, shDegree, rest.size());

      detail::ReadMonitor monitor(options);
      monitor.Progress(0.0f, "Parsing " + std::to_string(numPoints) +
                                 " vertices...");

      const size_t n = static_cast<size_t>(numPoints);
      PointCloud pc;
      pc.numPoints = numPoints;
      pc.shDegree = shDegree;
      pc.positions.resize(n * 3);
      pc.colors.resize(n * 4);
      pc.scales.resize(n * 3);
      pc.rotations.resize(n * 4);
      if (hasSh)
        pc.shCoeffs.assign(n * shStride, 0.0f);

      const Endian endian = header.endian;
      const Transform &t = options.transform;
      const uint8_t *records = data + vertexOffset;
      const auto value = [endian](const uint8_t *base, const PlyProperty *p) {
        return LoadScalar(base + p->offset, p->type, endian);
      };

      for (size_t i = 0; i < n; ++i) {
        if (monitor.Cancelled()) {
          spdlog::debug("ply: cancelled at vertex {}", i);
          return Expected<PointCloud>(Aborted{});
        }
        monitor.RecordProgress(i, n, 0.0f, 100.0f, "vertex");

        const uint8_t *base = records + i * stride;

        double *posPtr = &pc.positions[i * 3];
        for (int a = 0; a < 3; ++a)
          posPtr[a] = t.Apply(value(base, pos[a]), a);

        uint8_t *colorPtr = &pc.colors[i * 4];
        if (hasSh) {
          float *sh = &pc.shCoeffs[i * shStride];
          for (int c = 0; c < 3; ++c) {
            const double v = value(base, dc[c]);
            sh[c] = static_cast<float>(v);
            colorPtr[c] = ToByte(std::clamp(0.5 + kShC0 * v, 0.0, 1.0) * 255.0);
          }
          for (const auto &[k, prop] : rest)
            sh[3 + k] = static_cast<float>(value(base, prop));
        } else if (!rgb.empty()) {
          for (int c = 0; c < 3; ++c)
            colorPtr[c] = ToByte(value(base, rgb[c]));
        } else {
          colorPtr[0] = colorPtr[1] = colorPtr[2] = 128;
        }

        if (opacity != nullptr) {
          const double sigmoid = 1.0 / (1.0 + std::exp(-value(base, opacity)));
          colorPtr[3] = ToByte(sigmoid * 255.0);
        } else {
          colorPtr[3] = 255;
        }

        float *scalePtr = &pc.scales[i * 3];
        for (int a = 0; a < 3; ++a) {
          scalePtr[a] = scale.empty()
                            ? 1.0f
                            : static_cast<float>(std::exp(value(base, scale[a])));
        }

        Quat4f q = kIdentityQuat;
        if (!rot.empty()) {
          q = NormalizeQuat({static_cast<float>(value(base, rot[0])),
                             static_cast<float>(value(base, rot[1])),
                             static_cast<float>(value(base, rot[2])),
                             static_cast<float>(value(base, rot[3]))});
        }
        std::memcpy(&pc.rotations[i * 4], q.data(), sizeof(float) * 4);
      }

      monitor.Progress(100.0f, "Complete");
      return detail::Finish(std::move(pc), options, "ply");
    } catch (const std::exception &e) {
      return Expected<PointCloud>(
          FormatError(std::string("ply read failed: ") + e.what()));
    }
  }
};

std::unique_ptr<IPointCloudReader> MakePlyReader() {
  return std::make_unique<PlyReader>();
}

} // namespace sk
