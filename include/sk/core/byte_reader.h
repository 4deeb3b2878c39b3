#pragma once

#include <cstddef>
#include <cstdint>

namespace sk {

enum class Endian { kLittle, kBig };

// Two's-complement sign extension of the low `bits` bits of `value`.
inline int32_t SignExtend(uint32_t value, int bits) {
  const uint32_t mask = (bits >= 32) ? 0xFFFFFFFFu : ((1u << bits) - 1u);
  value &= mask;
  const uint32_t sign = 1u << (bits - 1);
  return static_cast<int32_t>((value ^ sign) - sign);
}

uint32_t LoadU32LE(const uint8_t *data);
float LoadF32LE(const uint8_t *data);
// 24-bit little-endian two's-complement integer.
int32_t LoadI24LE(const uint8_t *data);

// Sequential reader over a borrowed byte buffer. Every read advances the
// offset; reading past the end throws std::out_of_range.
class ByteCursor {
public:
  ByteCursor(const uint8_t *data, size_t size, size_t offset = 0)
      : data_(data), size_(size), offset_(offset) {}

  uint8_t ReadU8();
  int8_t ReadI8();
  uint16_t ReadU16(Endian e = Endian::kLittle);
  int16_t ReadI16(Endian e = Endian::kLittle);
  uint32_t ReadU32(Endian e = Endian::kLittle);
  int32_t ReadI32(Endian e = Endian::kLittle);
  float ReadF32(Endian e = Endian::kLittle);
  double ReadF64(Endian e = Endian::kLittle);
  int32_t ReadI24LE();

  void Skip(size_t n);
  void Seek(size_t offset);

  size_t offset() const { return offset_; }
  size_t size() const { return size_; }
  size_t Remaining() const { return size_ - offset_; }
  const uint8_t *current() const { return data_ + offset_; }

private:
  const uint8_t *Take(size_t n);
  uint64_t ReadUnsigned(size_t n, Endian e);

  const uint8_t *data_;
  size_t size_;
  size_t offset_;
};

} // namespace sk
