#ifndef HC_CHAIN_UTILITIES_H
#define HC_CHAIN_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hc {

// Error type for utility functions
struct Error : public RoeErrorBase {
  Error() : RoeErrorBase() {}
  Error(int32_t c, const std::string &msg) : RoeErrorBase(c, msg) {}
  Error(int32_t c, std::string &&msg) : RoeErrorBase(c, std::move(msg)) {}
  explicit Error(const std::string &msg) : RoeErrorBase(msg) {}
  explicit Error(std::string &&msg) : RoeErrorBase(std::move(msg)) {}
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Current wall-clock time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

/**
 * Lowercase hex, two chars per byte
 */
std::string hexEncode(const std::string &data);
std::string hexEncode(const uint8_t *data, size_t size);

/**
 * Decode hex (0-9a-fA-F, even length)
 * @return Decoded bytes, or empty string if input is invalid
 */
std::string hexDecode(const std::string &hex);

/**
 * Return a string safe for JSON. Input with non-printable bytes, or input
 * starting with "0x", becomes "0x" + hexEncode(input).
 */
std::string toJsonSafeString(const std::string &s);

/**
 * Reverse of toJsonSafeString
 */
std::string fromJsonSafeString(const std::string &s);

/**
 * Load and parse a JSON file
 * Error codes: 1 not found, 2 cannot open, 3 parse error
 */
hc::Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Write a string to a file that must not exist yet.
 * Creates parent directories if needed.
 */
hc::Roe<void> writeToNewFile(const std::string &filePath,
                             const std::string &content);

} // namespace utl
} // namespace hc

#endif // HC_CHAIN_UTILITIES_H
