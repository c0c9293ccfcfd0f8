#include "ByteOrder.h"

#include <cstring>
#include <utility>

namespace hc {

namespace {
inline bool isLittleEndian() {
  static const bool cached = []() {
    const uint16_t test = 0x0102;
    return reinterpret_cast<const uint8_t *>(&test)[0] == 0x02;
  }();
  return cached;
}

template <typename T> T swapBytes(T value) {
  uint8_t *bytes = reinterpret_cast<uint8_t *>(&value);
  constexpr size_t size = sizeof(T);
  for (size_t i = 0; i < size / 2; ++i) {
    std::swap(bytes[i], bytes[size - 1 - i]);
  }
  return value;
}

template <typename T> void appendRaw(std::string &out, T bigEndianValue) {
  out.append(reinterpret_cast<const char *>(&bigEndianValue), sizeof(T));
}

template <typename T> T readRaw(const char *data) {
  T value;
  std::memcpy(&value, data, sizeof(T));
  return value;
}
} // namespace

uint32_t ByteOrder::toBigEndian(uint32_t value) {
  return isLittleEndian() ? swapBytes(value) : value;
}

uint64_t ByteOrder::toBigEndian(uint64_t value) {
  return isLittleEndian() ? swapBytes(value) : value;
}

// Same operation as toBigEndian; named separately for readability at call sites
uint32_t ByteOrder::fromBigEndian(uint32_t value) {
  return isLittleEndian() ? swapBytes(value) : value;
}

uint64_t ByteOrder::fromBigEndian(uint64_t value) {
  return isLittleEndian() ? swapBytes(value) : value;
}

void ByteOrder::appendUint32(std::string &out, uint32_t value) {
  appendRaw(out, toBigEndian(value));
}

void ByteOrder::appendUint64(std::string &out, uint64_t value) {
  appendRaw(out, toBigEndian(value));
}

void ByteOrder::appendInt64(std::string &out, int64_t value) {
  appendUint64(out, static_cast<uint64_t>(value));
}

uint32_t ByteOrder::readUint32(const char *data) {
  return fromBigEndian(readRaw<uint32_t>(data));
}

uint64_t ByteOrder::readUint64(const char *data) {
  return fromBigEndian(readRaw<uint64_t>(data));
}

int64_t ByteOrder::readInt64(const char *data) {
  return static_cast<int64_t>(readUint64(data));
}

} // namespace hc
