#include "Chain.h"
#include "BlockCodec.h"
#include "BlockHasher.h"
#include "FileKvStore.h"
#include "MemoryKvStore.h"
#include "../lib/Utilities.h"

#include <algorithm>
#include <filesystem>

namespace hc {

namespace {

// Raises the replacing flag for the lifetime of a replace call
class ReplacingScope {
public:
  explicit ReplacingScope(std::atomic<bool> &flag) : flag_(flag) {
    flag_.store(true);
  }
  ~ReplacingScope() { flag_.store(false); }

private:
  std::atomic<bool> &flag_;
};

} // namespace

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

Chain::Roe<Chain::Config> Chain::Config::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(E_CONFIG, "Chain config must be a JSON object");
  }

  Config config;
  if (json.contains("engine")) {
    if (!json["engine"].is_string()) {
      return Error(E_CONFIG, "engine must be a string");
    }
    config.engine = json["engine"].get<std::string>();
  }
  if (config.engine != ENGINE_MEMORY && config.engine != ENGINE_FILE) {
    return Error(E_CONFIG, "Unknown engine: " + config.engine);
  }

  if (json.contains("path")) {
    if (!json["path"].is_string()) {
      return Error(E_CONFIG, "path must be a string");
    }
    config.path = json["path"].get<std::string>();
  }
  if (config.engine == ENGINE_FILE && config.path.empty()) {
    return Error(E_CONFIG, "path is required for the file engine");
  }

  if (json.contains("lockTimeoutMs")) {
    const auto &timeout = json["lockTimeoutMs"];
    if (!timeout.is_number_integer() || timeout.get<int64_t>() < 0) {
      return Error(E_CONFIG, "lockTimeoutMs must be a non-negative integer");
    }
    config.lockTimeoutMs = timeout.get<uint64_t>();
  }

  if (json.contains("genesisData")) {
    if (!json["genesisData"].is_string()) {
      return Error(E_CONFIG, "genesisData must be a string");
    }
    config.genesisData = json["genesisData"].get<std::string>();
  }
  return config;
}

nlohmann::json Chain::Config::toJson() const {
  nlohmann::json json;
  json["engine"] = engine;
  json["path"] = path;
  json["lockTimeoutMs"] = lockTimeoutMs;
  json["genesisData"] = genesisData;
  return json;
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

Chain::Chain()
    : Module("hc.chain"), clock_(utl::getCurrentTimeMs),
      hasher_(&BlockHasher::hash) {}

Chain::~Chain() { close(); }

Chain::Roe<void> Chain::open(const Config &config) {
  if (config.engine == Config::ENGINE_MEMORY) {
    return attach(std::make_unique<MemoryKvStore>(), config);
  }
  if (config.engine != Config::ENGINE_FILE) {
    return Error(E_CONFIG, "Unknown engine: " + config.engine);
  }
  if (config.path.empty()) {
    return Error(E_CONFIG, "path is required for the file engine");
  }
  if (isOpen()) {
    return Error(E_STATE, "Chain is already open");
  }

  auto upKv = std::make_unique<FileKvStore>();
  if (std::filesystem::exists(config.path)) {
    auto result = upKv->mount(config.path);
    if (!result) {
      return Error(E_IO, "Failed to mount " + config.path + ": " +
                             result.error().message);
    }
  } else {
    FileKvStore::InitConfig initConfig;
    initConfig.filepath = config.path;
    auto result = upKv->init(initConfig);
    if (!result) {
      return Error(E_IO, "Failed to create " + config.path + ": " +
                             result.error().message);
    }
  }
  return attach(std::move(upKv), config);
}

Chain::Roe<void> Chain::attach(std::unique_ptr<KvStore> kv) {
  return attach(std::move(kv), Config());
}

Chain::Roe<void> Chain::attach(std::unique_ptr<KvStore> kv,
                               const Config &config) {
  if (!kv || !kv->isOpen()) {
    return Error(E_IO, "Store is not open");
  }

  auto spStore = std::make_shared<BlockStore>(std::move(kv));
  {
    std::lock_guard<std::mutex> lock(storeMutex_);
    if (spStore_ && spStore_->isOpen()) {
      return Error(E_STATE, "Chain is already open");
    }
    spStore_ = spStore;
    config_ = config;
  }

  auto length = spStore->countFrom(0);
  if (!length) {
    {
      std::lock_guard<std::mutex> lock(storeMutex_);
      if (spStore_ == spStore) {
        spStore_.reset();
      }
    }
    return toChainError(length.error());
  }
  log().info << "Chain ready with " << length.value() << " blocks";
  notifyReady();
  return {};
}

void Chain::close() {
  {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.clear();
  }

  // No writer may be inside the store while it closes
  WriteLock::Guard guard(writeLock_);
  std::shared_ptr<BlockStore> spStore;
  {
    std::lock_guard<std::mutex> lock(storeMutex_);
    spStore.swap(spStore_);
  }
  if (spStore) {
    spStore->close();
    log().info << "Chain closed";
  }
}

bool Chain::isOpen() const {
  std::lock_guard<std::mutex> lock(storeMutex_);
  return spStore_ && spStore_->isOpen();
}

Chain::Roe<std::shared_ptr<BlockStore>> Chain::openStore() const {
  std::lock_guard<std::mutex> lock(storeMutex_);
  if (!spStore_ || !spStore_->isOpen()) {
    return Error(E_CLOSED, "Chain is not open");
  }
  return spStore_;
}

void Chain::setClock(Clock clock) {
  clock_ = clock ? std::move(clock) : Clock(utl::getCurrentTimeMs);
}

void Chain::setHasher(Hasher hasher) {
  hasher_ = hasher ? std::move(hasher) : Hasher(&BlockHasher::hash);
}

int64_t Chain::now() const { return clock_(); }

void Chain::seal(Block &block) const { block.hash = hasher_(block); }

// ----------------------------------------------------------------------------
// Observers
// ----------------------------------------------------------------------------

void Chain::addObserver(std::shared_ptr<Observer> spObserver) {
  if (!spObserver) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers_.push_back(spObserver);
  }
  if (isOpen()) {
    spObserver->onReady();
  }
}

void Chain::removeObserver(const std::shared_ptr<Observer> &spObserver) {
  std::lock_guard<std::mutex> lock(observersMutex_);
  observers_.erase(
      std::remove(observers_.begin(), observers_.end(), spObserver),
      observers_.end());
}

void Chain::notifyReady() {
  std::vector<std::shared_ptr<Observer>> observers;
  {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers = observers_;
  }
  for (const auto &spObserver : observers) {
    spObserver->onReady();
  }
}

void Chain::notifyBlockAdded(const Block &block) {
  std::vector<std::shared_ptr<Observer>> observers;
  {
    std::lock_guard<std::mutex> lock(observersMutex_);
    observers = observers_;
  }
  for (const auto &spObserver : observers) {
    spObserver->onBlockAdded(block);
  }
}

// ----------------------------------------------------------------------------
// Reads
// ----------------------------------------------------------------------------

Chain::Error Chain::toChainError(const BlockStore::Error &error) const {
  if (error.code == BlockStore::E_CLOSED) {
    return Error(E_CLOSED, "Chain is not open");
  }
  return Error(E_IO, error.message);
}

Chain::Roe<Block> Chain::readBlock(const BlockStore &store,
                                   uint64_t index) const {
  auto bytes = store.get(index);
  if (!bytes) {
    if (bytes.error().code == BlockStore::E_NOT_FOUND) {
      return Error(E_CORRUPT_RECORD,
                   "Block " + std::to_string(index) + " is missing");
    }
    return toChainError(bytes.error());
  }
  auto block = BlockCodec::decode(bytes.value());
  if (!block) {
    return Error(E_CORRUPT_RECORD, "Block " + std::to_string(index) + ": " +
                                       block.error().message);
  }
  return std::move(block.value());
}

Chain::Roe<std::optional<Block>>
Chain::readLastBlock(const BlockStore &store) const {
  auto length = store.countFrom(0);
  if (!length) {
    return toChainError(length.error());
  }
  if (length.value() == 0) {
    return std::optional<Block>();
  }
  auto block = readBlock(store, length.value() - 1);
  if (!block) {
    return block.error();
  }
  return std::optional<Block>(std::move(block.value()));
}

Chain::Roe<uint64_t> Chain::getLength() const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  auto length = store.value()->countFrom(0);
  if (!length) {
    return toChainError(length.error());
  }
  return length.value();
}

Chain::Roe<std::optional<Block>> Chain::getLastBlock() const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  return readLastBlock(*store.value());
}

std::optional<Block> Chain::getBlock(int64_t index) const {
  if (index < 0) {
    return std::nullopt;
  }
  auto store = openStore();
  if (!store) {
    return std::nullopt;
  }
  auto bytes = store.value()->get(static_cast<uint64_t>(index));
  if (!bytes) {
    if (bytes.error().code != BlockStore::E_NOT_FOUND) {
      log().warning << "Cannot read block " << index << ": "
                    << bytes.error().message;
    }
    return std::nullopt;
  }
  auto block = BlockCodec::decode(bytes.value());
  if (!block) {
    log().warning << "Block " << index << " is corrupt: "
                  << block.error().message;
    return std::nullopt;
  }
  return std::move(block.value());
}

Chain::Roe<std::optional<Block>> Chain::find(const Predicate &predicate) const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }

  std::optional<Block> found;
  std::optional<Error> failure;
  auto scan = store.value()->scanFrom(
      1, 0, [&](uint64_t index, const std::string &bytes) {
        auto block = BlockCodec::decode(bytes);
        if (!block) {
          failure = Error(E_CORRUPT_RECORD, "Block " + std::to_string(index) +
                                                ": " + block.error().message);
          return false;
        }
        if (predicate(block.value(), index)) {
          found = std::move(block.value());
          return false;
        }
        return true;
      });
  if (!scan) {
    return toChainError(scan.error());
  }
  if (failure) {
    return *failure;
  }
  return found;
}

Chain::Roe<void> Chain::forEach(const Callback &callback) const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  auto length = store.value()->countFrom(0);
  if (!length) {
    return toChainError(length.error());
  }
  uint64_t count = length.value();
  if (count == 0) {
    return {};
  }

  std::optional<Error> failure;
  uint64_t expected = 0;
  auto scan = store.value()->scanFrom(
      0, count, [&](uint64_t index, const std::string &bytes) {
        if (index != expected) {
          failure = Error(E_CORRUPT_RECORD,
                          "Block " + std::to_string(expected) + " is missing");
          return false;
        }
        auto block = BlockCodec::decode(bytes);
        if (!block) {
          failure = Error(E_CORRUPT_RECORD, "Block " + std::to_string(index) +
                                                ": " + block.error().message);
          return false;
        }
        callback(block.value(), index, count);
        ++expected;
        return true;
      });
  if (!scan) {
    return toChainError(scan.error());
  }
  if (failure) {
    return *failure;
  }
  return {};
}

Chain::Roe<std::vector<Block>> Chain::getRange(uint64_t fromIndex,
                                               uint64_t limit) const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }

  std::vector<Block> blocks;
  std::optional<Error> failure;
  uint64_t expected = fromIndex;
  auto scan = store.value()->scanFrom(
      fromIndex, limit, [&](uint64_t index, const std::string &bytes) {
        if (index != expected) {
          failure = Error(E_CORRUPT_RECORD,
                          "Block " + std::to_string(expected) + " is missing");
          return false;
        }
        auto block = BlockCodec::decode(bytes);
        if (!block) {
          failure = Error(E_CORRUPT_RECORD, "Block " + std::to_string(index) +
                                                ": " + block.error().message);
          return false;
        }
        blocks.push_back(std::move(block.value()));
        ++expected;
        return true;
      });
  if (!scan) {
    return toChainError(scan.error());
  }
  if (failure) {
    return *failure;
  }
  return blocks;
}

// ----------------------------------------------------------------------------
// Validation
// ----------------------------------------------------------------------------

bool Chain::checkBlock(const Block &block, uint64_t expectedIndex,
                       const Block *lastGood, std::string &reason) const {
  if (block.index != expectedIndex) {
    reason = "index " + std::to_string(block.index) + " stored at position " +
             std::to_string(expectedIndex);
    return false;
  }
  if (block.hash != hasher_(block)) {
    reason = "hash mismatch";
    return false;
  }
  if (block.isGenesis()) {
    if (block.previousHash != Digest{}) {
      reason = "genesis previous hash is not zero";
      return false;
    }
    return true;
  }
  if (!lastGood) {
    reason = "no predecessor";
    return false;
  }
  if (block.previousHash != lastGood->hash) {
    reason = "previous hash does not match block " +
             std::to_string(lastGood->index);
    return false;
  }
  if (block.timestamp <= lastGood->timestamp) {
    reason = "timestamp " + std::to_string(block.timestamp) +
             " not after " + std::to_string(lastGood->timestamp);
    return false;
  }
  return true;
}

Chain::Roe<bool> Chain::validate(uint64_t fromIndex,
                                 const ProgressFn &onProgress) const {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  const BlockStore &blockStore = *store.value();
  auto length = blockStore.countFrom(0);
  if (!length) {
    return toChainError(length.error());
  }
  uint64_t count = length.value();
  if (fromIndex >= count) {
    return true;
  }

  std::optional<Block> lastGood;
  if (fromIndex > 0) {
    auto seed = readBlock(blockStore, fromIndex - 1);
    if (!seed) {
      if (seed.error().code != E_CORRUPT_RECORD) {
        return seed.error();
      }
      log().warning << "Validation failed: " << seed.error().message;
      return false;
    }
    lastGood = std::move(seed.value());
  }

  bool valid = true;
  uint64_t expected = fromIndex;
  const uint64_t total = count - fromIndex;
  auto scan = blockStore.scanFrom(
      fromIndex, total, [&](uint64_t index, const std::string &bytes) {
        if (index != expected) {
          log().warning << "Validation failed: block " << expected
                        << " is missing";
          valid = false;
          return false;
        }
        auto block = BlockCodec::decode(bytes);
        if (!block) {
          log().warning << "Validation failed at block " << index << ": "
                        << block.error().message;
          valid = false;
          return false;
        }
        std::string reason;
        if (!checkBlock(block.value(), index,
                        lastGood ? &*lastGood : nullptr, reason)) {
          log().warning << "Validation failed at block " << index << ": "
                        << reason;
          valid = false;
          return false;
        }
        lastGood = std::move(block.value());
        ++expected;
        if (onProgress) {
          onProgress(100.0 * static_cast<double>(expected - fromIndex) /
                     static_cast<double>(total));
        }
        return true;
      });
  if (!scan) {
    return toChainError(scan.error());
  }
  if (valid && expected != count) {
    log().warning << "Validation failed: block " << expected << " is missing";
    valid = false;
  }
  return valid;
}

// ----------------------------------------------------------------------------
// Writes
// ----------------------------------------------------------------------------

Chain::Roe<std::optional<Block>> Chain::createGenesis() {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  BlockStore &blockStore = *store.value();

  std::optional<Block> created;
  {
    WriteLock::Guard guard(writeLock_, config_.lockTimeoutMs);
    if (!guard.owns()) {
      return Error(E_LOCK_TIMEOUT, "Timed out waiting for the write lock");
    }

    auto length = blockStore.countFrom(0);
    if (!length) {
      return toChainError(length.error());
    }
    if (length.value() > 0) {
      log().debug << "Genesis already present";
      return created;
    }

    Block genesis;
    genesis.index = 0;
    genesis.timestamp = now();
    genesis.data = config_.genesisData;
    seal(genesis);

    auto result = blockStore.put(genesis.index, BlockCodec::encode(genesis));
    if (!result) {
      return toChainError(result.error());
    }
    log().info << "Created genesis block " << toHex(genesis.hash);
    created = std::move(genesis);
  }
  notifyBlockAdded(*created);
  return created;
}

Chain::Roe<Block> Chain::append(const std::string &payload) {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  BlockStore &blockStore = *store.value();

  Block block;
  {
    WriteLock::Guard guard(writeLock_, config_.lockTimeoutMs);
    if (!guard.owns()) {
      return Error(E_LOCK_TIMEOUT, "Timed out waiting for the write lock");
    }

    auto last = readLastBlock(blockStore);
    if (!last) {
      return last.error();
    }
    if (!last.value()) {
      return Error(E_MISSING_GENESIS, "No genesis block found");
    }
    const Block &previous = *last.value();

    block.index = previous.index + 1;
    block.timestamp = std::max(now(), previous.timestamp + 1);
    block.previousHash = previous.hash;
    block.data = payload;
    seal(block);

    auto result = blockStore.put(block.index, BlockCodec::encode(block));
    if (!result) {
      return toChainError(result.error());
    }
    log().debug << "Appended block " << block.index;
  }
  notifyBlockAdded(block);
  return block;
}

Chain::Roe<void> Chain::replace(const std::vector<Block> &candidate,
                                const BlockCheck &check) {
  auto store = openStore();
  if (!store) {
    return store.error();
  }
  BlockStore &blockStore = *store.value();

  WriteLock::Guard guard(writeLock_, config_.lockTimeoutMs);
  if (!guard.owns()) {
    return Error(E_LOCK_TIMEOUT, "Timed out waiting for the write lock");
  }

  auto length = blockStore.countFrom(0);
  if (!length) {
    return toChainError(length.error());
  }
  if (candidate.size() < length.value()) {
    log().warning << "Rejected replacement of " << candidate.size()
                  << " blocks, chain has " << length.value();
    return Error(E_CHAIN_TOO_SHORT,
                 "Candidate has " + std::to_string(candidate.size()) +
                     " blocks, chain has " + std::to_string(length.value()));
  }
  if (candidate.empty()) {
    return Error(E_INVALID_CHAIN, "Candidate chain is empty");
  }

  ReplacingScope replacing(replacing_);

  const Block *lastGood = nullptr;
  for (uint64_t i = 0; i < candidate.size(); ++i) {
    const Block &block = candidate[i];
    std::string reason;
    if (!checkBlock(block, i, lastGood, reason)) {
      log().warning << "Rejected replacement at block " << i << ": " << reason;
      return Error(E_INVALID_CHAIN,
                   "Block " + std::to_string(i) + ": " + reason);
    }
    if (check && !check(block)) {
      log().warning << "Rejected replacement at block " << i
                    << ": secondary check failed";
      return Error(E_INVALID_CHAIN,
                   "Block " + std::to_string(i) + ": secondary check failed");
    }
    lastGood = &block;
  }

  std::vector<std::pair<uint64_t, std::string>> items;
  items.reserve(candidate.size());
  for (const auto &block : candidate) {
    items.emplace_back(block.index, BlockCodec::encode(block));
  }
  auto result = blockStore.putBatch(items);
  if (!result) {
    return toChainError(result.error());
  }
  log().info << "Replaced chain of " << length.value() << " blocks with "
             << candidate.size() << " blocks";
  return {};
}

} // namespace hc
