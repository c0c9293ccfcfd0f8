#ifndef HC_CHAIN_BLOCK_STORE_H
#define HC_CHAIN_BLOCK_STORE_H

#include "KvStore.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace hc {

/**
 * BlockStore - block-index addressed view of a KvStore
 *
 * Keys are the 8-byte big endian encoding of the block index, so the
 * store's lexicographic key order is the numeric index order. Values are
 * opaque encoded blocks.
 */
class BlockStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_IO = 2;
  constexpr static int32_t E_KEY = 3;
  constexpr static int32_t E_CLOSED = 4;

  constexpr static size_t KEY_SIZE = 8;

  // Return false to stop the scan
  using Visitor = std::function<bool(uint64_t index, const std::string &bytes)>;

  explicit BlockStore(std::unique_ptr<KvStore> kv);
  ~BlockStore() override;

  static std::string encodeKey(uint64_t index);
  static Roe<uint64_t> decodeKey(const std::string &key);

  Roe<std::string> get(uint64_t index) const;
  Roe<void> put(uint64_t index, const std::string &bytes);

  /**
   * Write all (index, bytes) pairs atomically
   */
  Roe<void> putBatch(const std::vector<std::pair<uint64_t, std::string>> &items);

  /**
   * Ascending scan from index; limit 0 means unbounded.
   * Each call starts a fresh pass over the store.
   */
  Roe<void> scanFrom(uint64_t index, uint64_t limit, const Visitor &visit) const;

  /**
   * Number of stored indices >= index
   */
  Roe<uint64_t> countFrom(uint64_t index) const;

  // Idempotent
  void close();
  bool isOpen() const;

private:
  Error fromKvError(const KvStore::Error &error) const;

  std::unique_ptr<KvStore> upKv_;
};

} // namespace hc

#endif // HC_CHAIN_BLOCK_STORE_H
