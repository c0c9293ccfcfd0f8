#include "MemoryKvStore.h"

#include <iterator>

namespace hc {

MemoryKvStore::MemoryKvStore() : KvStore("hc.kv.memory") {}

MemoryKvStore::Roe<std::string> MemoryKvStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return Error(E_NOT_FOUND, "Key not found");
  }
  return it->second;
}

MemoryKvStore::Roe<void> MemoryKvStore::put(const std::string &key,
                                            const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return Error(E_CLOSED, "Store is closed");
  }
  entries_[key] = value;
  return {};
}

MemoryKvStore::Roe<void>
MemoryKvStore::writeBatch(const std::vector<Entry> &entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return Error(E_CLOSED, "Store is closed");
  }
  for (const auto &entry : entries) {
    entries_[entry.first] = entry.second;
  }
  return {};
}

MemoryKvStore::Roe<uint64_t>
MemoryKvStore::countFrom(const std::string &fromKey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = entries_.lower_bound(fromKey);
  return static_cast<uint64_t>(std::distance(it, entries_.end()));
}

void MemoryKvStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (open_) {
    entries_.clear();
    open_ = false;
    log().debug << "Closed";
  }
}

bool MemoryKvStore::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

MemoryKvStore::Roe<void>
MemoryKvStore::readRange(const std::string &fromKey, bool inclusive,
                         size_t maxCount, std::vector<Entry> &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = inclusive ? entries_.lower_bound(fromKey)
                      : entries_.upper_bound(fromKey);
  for (; it != entries_.end() && out.size() < maxCount; ++it) {
    out.emplace_back(it->first, it->second);
  }
  return {};
}

} // namespace hc
