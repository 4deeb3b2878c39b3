#include "sk/core/byte_reader.h"

#include <cstring>
#include <stdexcept>
#include <string>

namespace sk {

uint32_t LoadU32LE(const uint8_t *data) {
  return static_cast<uint32_t>(data[0]) |
         (static_cast<uint32_t>(data[1]) << 8) |
         (static_cast<uint32_t>(data[2]) << 16) |
         (static_cast<uint32_t>(data[3]) << 24);
}

float LoadF32LE(const uint8_t *data) {
  const uint32_t bits = LoadU32LE(data);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

int32_t LoadI24LE(const uint8_t *data) {
  const uint32_t raw = static_cast<uint32_t>(data[0]) |
                       (static_cast<uint32_t>(data[1]) << 8) |
                       (static_cast<uint32_t>(data[2]) << 16);
  return SignExtend(raw, 24);
}

const uint8_t *ByteCursor::Take(size_t n) {
  if (n > size_ - offset_) {
    throw std::out_of_range("read of " + std::to_string(n) +
                            " bytes at offset " + std::to_string(offset_) +
                            " exceeds buffer of " + std::to_string(size_));
  }
  const uint8_t *p = data_ + offset_;
  offset_ += n;
  return p;
}

uint64_t ByteCursor::ReadUnsigned(size_t n, Endian e) {
  const uint8_t *p = Take(n);
  uint64_t v = 0;
  if (e == Endian::kLittle) {
    for (size_t i = 0; i < n; ++i)
      v |= static_cast<uint64_t>(p[i]) << (8 * i);
  } else {
    for (size_t i = 0; i < n; ++i)
      v = (v << 8) | p[i];
  }
  return v;
}

uint8_t ByteCursor::ReadU8() { return *Take(1); }

int8_t ByteCursor::ReadI8() { return static_cast<int8_t>(*Take(1)); }

uint16_t ByteCursor::ReadU16(Endian e) {
  return static_cast<uint16_t>(ReadUnsigned(2, e));
}

int16_t ByteCursor::ReadI16(Endian e) {
  return static_cast<int16_t>(ReadU16(e));
}

uint32_t ByteCursor::ReadU32(Endian e) {
  return static_cast<uint32_t>(ReadUnsigned(4, e));
}

int32_t ByteCursor::ReadI32(Endian e) {
  return static_cast<int32_t>(ReadU32(e));
}

float ByteCursor::ReadF32(Endian e) {
  const uint32_t bits = ReadU32(e);
  float value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

double ByteCursor::ReadF64(Endian e) {
  const uint64_t bits = ReadUnsigned(8, e);
  double value;
  std::memcpy(&value, &bits, sizeof(value));
  return value;
}

int32_t ByteCursor::ReadI24LE() { return LoadI24LE(Take(3)); }

void ByteCursor::Skip(size_t n) { Take(n); }

void ByteCursor::Seek(size_t offset) {
  if (offset > size_)
    throw std::out_of_range("seek past end of buffer");
  offset_ = offset;
}

} // namespace sk
