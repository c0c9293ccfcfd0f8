#include "BlockStore.h"
#include "../lib/ByteOrder.h"

#include <stdexcept>

namespace hc {

BlockStore::BlockStore(std::unique_ptr<KvStore> kv)
    : Module("hc.store"), upKv_(std::move(kv)) {
  if (!upKv_) {
    throw std::invalid_argument("BlockStore requires a KvStore");
  }
}

BlockStore::~BlockStore() { close(); }

std::string BlockStore::encodeKey(uint64_t index) {
  std::string key;
  key.reserve(KEY_SIZE);
  ByteOrder::appendUint64(key, index);
  return key;
}

BlockStore::Roe<uint64_t> BlockStore::decodeKey(const std::string &key) {
  if (key.size() != KEY_SIZE) {
    return Error(E_KEY, "Invalid block key size: " + std::to_string(key.size()));
  }
  return ByteOrder::readUint64(key.data());
}

BlockStore::Error BlockStore::fromKvError(const KvStore::Error &error) const {
  if (error.code == KvStore::E_NOT_FOUND) {
    return Error(E_NOT_FOUND, error.message);
  }
  if (error.code == KvStore::E_CLOSED) {
    return Error(E_CLOSED, error.message);
  }
  return Error(E_IO, error.message);
}

BlockStore::Roe<std::string> BlockStore::get(uint64_t index) const {
  auto result = upKv_->get(encodeKey(index));
  if (!result) {
    if (result.error().code != KvStore::E_NOT_FOUND) {
      log().error << "Failed to read block " << index << ": "
                  << result.error().message;
    }
    return fromKvError(result.error());
  }
  return std::move(result.value());
}

BlockStore::Roe<void> BlockStore::put(uint64_t index, const std::string &bytes) {
  auto result = upKv_->put(encodeKey(index), bytes);
  if (!result) {
    log().error << "Failed to write block " << index << ": "
                << result.error().message;
    return fromKvError(result.error());
  }
  return {};
}

BlockStore::Roe<void>
BlockStore::putBatch(const std::vector<std::pair<uint64_t, std::string>> &items) {
  std::vector<KvStore::Entry> entries;
  entries.reserve(items.size());
  for (const auto &item : items) {
    entries.emplace_back(encodeKey(item.first), item.second);
  }
  auto result = upKv_->writeBatch(entries);
  if (!result) {
    log().error << "Failed to write batch of " << items.size()
                << " blocks: " << result.error().message;
    return fromKvError(result.error());
  }
  return {};
}

BlockStore::Roe<void> BlockStore::scanFrom(uint64_t index, uint64_t limit,
                                           const Visitor &visit) const {
  bool badKey = false;
  std::string badKeyMessage;
  auto result = upKv_->scan(
      encodeKey(index), limit,
      [&](const std::string &key, const std::string &value) {
        auto decoded = decodeKey(key);
        if (!decoded) {
          badKey = true;
          badKeyMessage = decoded.error().message;
          return false;
        }
        return visit(decoded.value(), value);
      });
  if (!result) {
    log().error << "Scan from " << index << " failed: " << result.error().message;
    return fromKvError(result.error());
  }
  if (badKey) {
    return Error(E_KEY, badKeyMessage);
  }
  return {};
}

BlockStore::Roe<uint64_t> BlockStore::countFrom(uint64_t index) const {
  auto result = upKv_->countFrom(encodeKey(index));
  if (!result) {
    return fromKvError(result.error());
  }
  return result.value();
}

void BlockStore::close() { upKv_->close(); }

bool BlockStore::isOpen() const { return upKv_->isOpen(); }

} // namespace hc
