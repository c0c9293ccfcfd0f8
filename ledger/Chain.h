#ifndef HC_CHAIN_CHAIN_H
#define HC_CHAIN_CHAIN_H

#include "Block.h"
#include "BlockStore.h"
#include "KvStore.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../lib/WriteLock.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hc {

/**
 * Chain - append-only hash-linked block sequence over a BlockStore
 *
 * Mutating operations (createGenesis, append, replace) are serialized by a
 * FIFO WriteLock, so concurrent callers are applied in lock acquisition
 * order. Reads take no lock.
 *
 * Validation rules for a block at position i:
 * - the stored index equals i
 * - the stored hash equals the recomputed hash
 * - genesis (index 0) carries the all-zero previous hash
 * - otherwise previousHash equals the hash of the last block that passed in
 *   the same pass and the timestamp is strictly greater than its timestamp
 */
class Chain : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  constexpr static int32_t E_IO = 1;              // Backing store failure
  constexpr static int32_t E_CORRUPT_RECORD = 2;  // Stored block fails to decode
  constexpr static int32_t E_MISSING_GENESIS = 3; // Append before genesis
  constexpr static int32_t E_CHAIN_TOO_SHORT = 4; // Replacement shorter than chain
  constexpr static int32_t E_INVALID_CHAIN = 5;   // Replacement fails validation
  constexpr static int32_t E_LOCK_TIMEOUT = 6;    // Write lock not obtained in time
  constexpr static int32_t E_CLOSED = 7;          // Chain not open
  constexpr static int32_t E_CONFIG = 8;          // Invalid configuration
  constexpr static int32_t E_STATE = 9;           // Already open

  struct Config {
    constexpr static const char *ENGINE_MEMORY = "memory";
    constexpr static const char *ENGINE_FILE = "file";

    std::string engine{ ENGINE_MEMORY };
    std::string path;              // store file, engine "file" only
    uint64_t lockTimeoutMs{ 0 };   // 0 waits without limit
    std::string genesisData{ R"({"genesis":true})" };

    static Roe<Config> fromJson(const nlohmann::json &json);
    nlohmann::json toJson() const;
  };

  /**
   * Notified in registration order, never while the write lock is held.
   * Observers are dropped when the chain closes.
   */
  class Observer {
  public:
    virtual ~Observer() = default;
    virtual void onReady() {}
    virtual void onBlockAdded(const Block &block) {}
  };

  using Predicate = std::function<bool(const Block &block, uint64_t index)>;
  using Callback =
      std::function<void(const Block &block, uint64_t index, uint64_t count)>;
  using ProgressFn = std::function<void(double percent)>;
  using BlockCheck = std::function<bool(const Block &block)>;
  using Clock = std::function<int64_t()>;
  using Hasher = std::function<Digest(const Block &block)>;

  Chain();
  ~Chain() override;

  /**
   * Open the configured engine ("memory", or "file" which is created when
   * missing and mounted otherwise)
   */
  Roe<void> open(const Config &config);

  /**
   * Take ownership of an already open KvStore
   */
  Roe<void> attach(std::unique_ptr<KvStore> kv);
  Roe<void> attach(std::unique_ptr<KvStore> kv, const Config &config);

  /**
   * Waits for an in-flight write to finish, then closes the engine.
   * Readers still inside a scan see E_CLOSED. Idempotent; drops observers.
   */
  void close();
  bool isOpen() const;

  /**
   * Observers registered on an open chain get onReady immediately
   */
  void addObserver(std::shared_ptr<Observer> spObserver);
  void removeObserver(const std::shared_ptr<Observer> &spObserver);

  // Milliseconds source for new blocks, defaults to the system clock
  void setClock(Clock clock);

  /**
   * Content hash used to seal new blocks and to verify stored and candidate
   * blocks. Defaults to BlockHasher::hash. Set before the chain is shared
   * between threads.
   */
  void setHasher(Hasher hasher);

  Roe<uint64_t> getLength() const;
  Roe<std::optional<Block>> getLastBlock() const;

  /**
   * Empty when index is negative, absent or undecodable
   */
  std::optional<Block> getBlock(int64_t index) const;

  /**
   * Write the genesis block
   * @return The new block, or empty if the chain already has one
   */
  Roe<std::optional<Block>> createGenesis();

  /**
   * Append a block holding payload after the current last block
   */
  Roe<Block> append(const std::string &payload);

  /**
   * First block after genesis, lowest index first, matching predicate
   */
  Roe<std::optional<Block>> find(const Predicate &predicate) const;

  /**
   * Visit blocks 0..count-1 where count is taken once at the start
   */
  Roe<void> forEach(const Callback &callback) const;

  /**
   * Decoded blocks from fromIndex upwards; limit 0 means all
   */
  Roe<std::vector<Block>> getRange(uint64_t fromIndex, uint64_t limit = 0) const;
  Roe<std::vector<Block>> toVector() const { return getRange(0); }

  /**
   * @return false on the first rule violation or corrupt record, error only
   *         if the store could not be read
   */
  Roe<bool> validate(uint64_t fromIndex = 0,
                     const ProgressFn &onProgress = ProgressFn()) const;

  /**
   * Adopt candidate in place of the current chain. The candidate must be
   * at least as long as the chain and valid from genesis; blocks are written
   * at their own indices in one atomic batch. Nothing is written on failure.
   * @param check Optional extra per-block acceptance test. It runs while
   *        the write lock is held, so it must not call createGenesis, append,
   *        replace or close on this chain (the lock is not reentrant).
   */
  Roe<void> replace(const std::vector<Block> &candidate,
                    const BlockCheck &check = BlockCheck());

  bool isReplacing() const { return replacing_.load(); }

  const Config &getConfig() const { return config_; }

private:
  Roe<std::shared_ptr<BlockStore>> openStore() const;
  Roe<Block> readBlock(const BlockStore &store, uint64_t index) const;
  Roe<std::optional<Block>> readLastBlock(const BlockStore &store) const;
  Error toChainError(const BlockStore::Error &error) const;
  bool checkBlock(const Block &block, uint64_t expectedIndex,
                  const Block *lastGood, std::string &reason) const;
  int64_t now() const;
  void seal(Block &block) const;
  void notifyReady();
  void notifyBlockAdded(const Block &block);

  Config config_;
  // Swapped only under storeMutex_; operations work on their own reference
  mutable std::mutex storeMutex_;
  std::shared_ptr<BlockStore> spStore_;
  WriteLock writeLock_;
  std::atomic<bool> replacing_{ false };
  Clock clock_;
  Hasher hasher_;

  mutable std::mutex observersMutex_;
  std::vector<std::shared_ptr<Observer>> observers_;
};

} // namespace hc

#endif // HC_CHAIN_CHAIN_H
