#ifndef HC_CHAIN_KV_STORE_HPP
#define HC_CHAIN_KV_STORE_HPP

#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace hc {

/**
 * Ordered key-value store (keys compare as raw byte strings)
 *
 * Engines implement point access, atomic batches and a chunked range read.
 * scan() is built on top of readRange() so the visitor always runs without
 * any engine lock held and may call back into the store.
 */
class KvStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_NOT_FOUND = 1;
  constexpr static int32_t E_IO = 2;
  constexpr static int32_t E_CLOSED = 3;
  constexpr static int32_t E_CORRUPT = 4;
  constexpr static int32_t E_STATE = 5;

  using Entry = std::pair<std::string, std::string>;

  // Return false to stop the scan
  using Visitor =
      std::function<bool(const std::string &key, const std::string &value)>;

  explicit KvStore(const std::string &name) : Module(name) {}
  ~KvStore() override = default;

  virtual Roe<std::string> get(const std::string &key) const = 0;
  virtual Roe<void> put(const std::string &key, const std::string &value) = 0;

  /**
   * Apply all entries or none of them
   */
  virtual Roe<void> writeBatch(const std::vector<Entry> &entries) = 0;

  /**
   * Number of keys >= fromKey
   */
  virtual Roe<uint64_t> countFrom(const std::string &fromKey) const = 0;

  // Idempotent
  virtual void close() = 0;
  virtual bool isOpen() const = 0;

  /**
   * Visit entries with key >= fromKey in ascending order
   * @param limit Maximum number of entries to visit, 0 for no limit
   */
  Roe<void> scan(const std::string &fromKey, uint64_t limit,
                 const Visitor &visit) const {
    std::string cursor = fromKey;
    bool inclusive = true;
    uint64_t visited = 0;
    std::vector<Entry> chunk;

    while (limit == 0 || visited < limit) {
      size_t want = SCAN_CHUNK_SIZE;
      if (limit != 0 && limit - visited < want) {
        want = static_cast<size_t>(limit - visited);
      }

      chunk.clear();
      auto result = readRange(cursor, inclusive, want, chunk);
      if (!result) {
        return result;
      }

      for (const auto &entry : chunk) {
        ++visited;
        if (!visit(entry.first, entry.second)) {
          return {};
        }
      }

      if (chunk.size() < want) {
        break;
      }
      cursor = chunk.back().first;
      inclusive = false;
    }
    return {};
  }

protected:
  constexpr static size_t SCAN_CHUNK_SIZE = 256;

  /**
   * Append up to maxCount entries starting at fromKey (or just after it
   * when inclusive is false) to out, in ascending key order
   */
  virtual Roe<void> readRange(const std::string &fromKey, bool inclusive,
                              size_t maxCount,
                              std::vector<Entry> &out) const = 0;
};

} // namespace hc

#endif // HC_CHAIN_KV_STORE_HPP
