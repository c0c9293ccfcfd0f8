#ifndef HC_CHAIN_BLOCK_CODEC_H
#define HC_CHAIN_BLOCK_CODEC_H

#include "Block.h"
#include "../lib/ResultOrError.hpp"

#include <cstddef>
#include <string>

namespace hc {

/**
 * Fixed-layout binary encoding of a Block, used as the stored value.
 *
 * Layout (all integers big endian):
 *   [index (8)][timestamp (8)][hash (32)][previousHash (32)]
 *   [data size (8)][data (data size bytes)]
 */
class BlockCodec {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CORRUPT_RECORD = 1;

  constexpr static size_t DIGEST_SIZE = sizeof(Digest);
  constexpr static size_t HEADER_SIZE = 8 + 8 + DIGEST_SIZE + DIGEST_SIZE + 8;

  static std::string encode(const Block &block);

  /**
   * Fails with E_CORRUPT_RECORD when the buffer is shorter than the header,
   * the declared data size overruns the buffer, or bytes trail the payload
   */
  static Roe<Block> decode(const std::string &bytes);
};

} // namespace hc

#endif // HC_CHAIN_BLOCK_CODEC_H
