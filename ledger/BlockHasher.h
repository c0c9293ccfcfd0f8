#ifndef HC_CHAIN_BLOCK_HASHER_H
#define HC_CHAIN_BLOCK_HASHER_H

#include "Block.h"

#include <string>

namespace hc {

/**
 * SHA-256 content hash of a block.
 *
 * Preimage: index (8 bytes BE) || timestamp (8 bytes BE)
 *           || previousHash (32 raw bytes) || data
 * The hash field itself is never part of the preimage.
 */
class BlockHasher {
public:
  /**
   * @throws std::runtime_error if the OpenSSL digest context fails
   */
  static Digest hash(const Block &block);

  // Recompute and store the hash field
  static void seal(Block &block);

  // Stored hash equals the recomputed one
  static bool verify(const Block &block);

  static Digest sha256(const std::string &input);

  static std::string preimage(const Block &block);
};

} // namespace hc

#endif // HC_CHAIN_BLOCK_HASHER_H
