#ifndef HC_CHAIN_BLOCK_H
#define HC_CHAIN_BLOCK_H

#include "../lib/Utilities.h"

#include <array>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hc {

// Raw SHA-256 digest
using Digest = std::array<uint8_t, 32>;

/**
 * One record of the chain. Never modified once persisted.
 */
struct Block {
  uint64_t index{ 0 };
  int64_t timestamp{ 0 };  // milliseconds since epoch
  Digest previousHash{};   // all zero for the genesis block
  Digest hash{};
  std::string data;        // opaque application payload

  bool isGenesis() const { return index == 0; }

  /**
   * Hashes as lowercase hex, payload JSON-safe ("0x" + hex when binary)
   */
  nlohmann::json toJson() const;

  /**
   * Inverse of toJson
   * Error code 1: missing field, wrong type or malformed hash
   */
  static hc::Roe<Block> fromJson(const nlohmann::json &json);

  bool operator==(const Block &other) const;
  bool operator!=(const Block &other) const { return !(*this == other); }
};

std::string toHex(const Digest &digest);

} // namespace hc

#endif // HC_CHAIN_BLOCK_H
