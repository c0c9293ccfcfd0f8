#ifndef HC_CHAIN_BYTE_ORDER_H
#define HC_CHAIN_BYTE_ORDER_H

#include <cstdint>
#include <string>

namespace hc {

/**
 * Fixed-width big endian (network byte order) integer helpers.
 * Values are byte swapped only when the host is little endian.
 */
class ByteOrder {
public:
  static uint32_t toBigEndian(uint32_t value);
  static uint64_t toBigEndian(uint64_t value);
  static uint32_t fromBigEndian(uint32_t value);
  static uint64_t fromBigEndian(uint64_t value);

  // Append the big endian bytes of value to out
  static void appendUint32(std::string &out, uint32_t value);
  static void appendUint64(std::string &out, uint64_t value);
  static void appendInt64(std::string &out, int64_t value);

  // Read big endian bytes; caller guarantees enough input
  static uint32_t readUint32(const char *data);
  static uint64_t readUint64(const char *data);
  static int64_t readInt64(const char *data);
};

} // namespace hc

#endif // HC_CHAIN_BYTE_ORDER_H
