#ifndef HC_CHAIN_MEMORY_KV_STORE_H
#define HC_CHAIN_MEMORY_KV_STORE_H

#include "KvStore.hpp"

#include <map>
#include <mutex>

namespace hc {

/**
 * Sorted in-memory KvStore. Contents are lost on close.
 */
class MemoryKvStore : public KvStore {
public:
  MemoryKvStore();
  ~MemoryKvStore() override = default;

  Roe<std::string> get(const std::string &key) const override;
  Roe<void> put(const std::string &key, const std::string &value) override;
  Roe<void> writeBatch(const std::vector<Entry> &entries) override;
  Roe<uint64_t> countFrom(const std::string &fromKey) const override;
  void close() override;
  bool isOpen() const override;

protected:
  Roe<void> readRange(const std::string &fromKey, bool inclusive,
                      size_t maxCount,
                      std::vector<Entry> &out) const override;

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
  bool open_{ true };
};

} // namespace hc

#endif // HC_CHAIN_MEMORY_KV_STORE_H
