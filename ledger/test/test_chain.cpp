#include "Chain.h"
#include "BlockCodec.h"
#include "BlockHasher.h"
#include "BlockStore.h"
#include "MemoryKvStore.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace {

// MemoryKvStore whose puts can be made to fail or to block until released
class ControlledKvStore : public hc::MemoryKvStore {
public:
  Roe<void> put(const std::string &key, const std::string &value) override {
    {
      std::unique_lock<std::mutex> lock(gateMutex_);
      if (blockPuts_) {
        ++blockedPuts_;
        gateCv_.notify_all();
        gateCv_.wait(lock, [this] { return !blockPuts_; });
      }
    }
    if (failPuts) {
      return Error(E_IO, "injected write failure");
    }
    return hc::MemoryKvStore::put(key, value);
  }

  Roe<void> writeBatch(const std::vector<Entry> &entries) override {
    if (failPuts) {
      return Error(E_IO, "injected write failure");
    }
    return hc::MemoryKvStore::writeBatch(entries);
  }

  Roe<uint64_t> countFrom(const std::string &fromKey) const override {
    if (onCount) {
      onCount();
    }
    return hc::MemoryKvStore::countFrom(fromKey);
  }

  void setBlockPuts(bool block) {
    std::lock_guard<std::mutex> lock(gateMutex_);
    blockPuts_ = block;
    gateCv_.notify_all();
  }

  void waitUntilBlocked() {
    std::unique_lock<std::mutex> lock(gateMutex_);
    gateCv_.wait(lock, [this] { return blockedPuts_ > 0; });
  }

  std::atomic<bool> failPuts{ false };
  std::function<void()> onCount;

private:
  std::mutex gateMutex_;
  std::condition_variable gateCv_;
  bool blockPuts_{ false };
  int blockedPuts_{ 0 };
};

class RecordingObserver : public hc::Chain::Observer {
public:
  void onReady() override { ++readyCount; }
  void onBlockAdded(const hc::Block &block) override {
    added.push_back(block.index);
  }

  int readyCount{ 0 };
  std::vector<uint64_t> added;
};

} // namespace

class ChainTest : public ::testing::Test {
protected:
  hc::Chain chain;
  ControlledKvStore *kv = nullptr;

  void SetUp() override {
    auto upKv = std::make_unique<ControlledKvStore>();
    kv = upKv.get();
    auto result = chain.attach(std::move(upKv));
    ASSERT_TRUE(result.isOk()) << result.error().message;
  }

  void buildChain(size_t appends) {
    ASSERT_TRUE(chain.createGenesis().isOk());
    for (size_t i = 1; i <= appends; ++i) {
      ASSERT_TRUE(chain.append("Block " + std::to_string(i)).isOk());
    }
  }

  // Overwrite a stored block behind the chain's back
  void storeRaw(uint64_t index, const std::string &bytes) {
    ASSERT_TRUE(kv->hc::MemoryKvStore::put(hc::BlockStore::encodeKey(index), bytes)
                    .isOk());
  }
};

// ---------------------------------------------------------------------------
// Genesis and append
// ---------------------------------------------------------------------------

TEST_F(ChainTest, EmptyChain) {
  EXPECT_EQ(chain.getLength().value(), 0u);
  auto last = chain.getLastBlock();
  ASSERT_TRUE(last.isOk());
  EXPECT_FALSE(last.value().has_value());
  EXPECT_TRUE(chain.validate().value());
}

TEST_F(ChainTest, CreateGenesis) {
  auto genesis = chain.createGenesis();
  ASSERT_TRUE(genesis.isOk()) << genesis.error().message;
  ASSERT_TRUE(genesis.value().has_value());

  const hc::Block &block = *genesis.value();
  EXPECT_EQ(block.index, 0u);
  EXPECT_TRUE(block.isGenesis());
  EXPECT_EQ(block.previousHash, hc::Digest{});
  EXPECT_EQ(block.data, R"({"genesis":true})");
  EXPECT_TRUE(hc::BlockHasher::verify(block));
  EXPECT_EQ(chain.getLength().value(), 1u);
}

TEST_F(ChainTest, GenesisIsIdempotent) {
  auto first = chain.createGenesis();
  ASSERT_TRUE(first.isOk());
  EXPECT_TRUE(first.value().has_value());

  auto second = chain.createGenesis();
  ASSERT_TRUE(second.isOk());
  EXPECT_FALSE(second.value().has_value());
  EXPECT_EQ(chain.getLength().value(), 1u);
}

TEST_F(ChainTest, AppendBeforeGenesisFails) {
  auto result = chain.append("too early");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_MISSING_GENESIS);
  EXPECT_EQ(chain.getLength().value(), 0u);
}

TEST_F(ChainTest, SequentialAppendLinksBlocks) {
  const size_t n = 20;
  buildChain(n);

  ASSERT_EQ(chain.getLength().value(), n + 1);
  for (uint64_t i = 1; i <= n; ++i) {
    auto block = chain.getBlock(static_cast<int64_t>(i));
    auto prev = chain.getBlock(static_cast<int64_t>(i - 1));
    ASSERT_TRUE(block.has_value());
    ASSERT_TRUE(prev.has_value());
    EXPECT_EQ(block->index, i);
    EXPECT_EQ(block->previousHash, prev->hash);
    EXPECT_GT(block->timestamp, prev->timestamp);
  }
}

TEST_F(ChainTest, ExampleScenario) {
  ASSERT_TRUE(chain.createGenesis().isOk());
  ASSERT_TRUE(chain.append("Block 1").isOk());
  ASSERT_TRUE(chain.append("Block 2").isOk());
  ASSERT_TRUE(chain.append("Block 3").isOk());

  EXPECT_EQ(chain.getLength().value(), 4u);
  auto block = chain.getBlock(2);
  ASSERT_TRUE(block.has_value());
  EXPECT_EQ(block->data, "Block 2");
  EXPECT_TRUE(chain.validate().value());
  EXPECT_EQ(chain.getRange(0).value().size(), 4u);
}

TEST_F(ChainTest, AppendReturnsStoredBlock) {
  buildChain(0);
  auto appended = chain.append(std::string("bin\0ary", 7));
  ASSERT_TRUE(appended.isOk());

  auto stored = chain.getBlock(1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, appended.value());
  EXPECT_EQ(stored->data.size(), 7u);

  auto last = chain.getLastBlock();
  ASSERT_TRUE(last.isOk());
  ASSERT_TRUE(last.value().has_value());
  EXPECT_EQ(*last.value(), appended.value());
}

TEST_F(ChainTest, TimestampsStayStrictlyIncreasingWithStalledClock) {
  chain.setClock([] { return int64_t(1000); });
  buildChain(3);

  std::vector<int64_t> stamps;
  ASSERT_TRUE(chain
                  .forEach([&](const hc::Block &block, uint64_t, uint64_t) {
                    stamps.push_back(block.timestamp);
                  })
                  .isOk());
  EXPECT_EQ(stamps, (std::vector<int64_t>{ 1000, 1001, 1002, 1003 }));
  EXPECT_TRUE(chain.validate().value());
}

TEST_F(ChainTest, TimestampsSurviveClockGoingBackwards) {
  int64_t now = 5000;
  chain.setClock([&now] { return now; });
  ASSERT_TRUE(chain.createGenesis().isOk());
  now = 100;
  auto block = chain.append("after rewind");
  ASSERT_TRUE(block.isOk());
  EXPECT_EQ(block.value().timestamp, 5001);
  EXPECT_TRUE(chain.validate().value());
}

TEST_F(ChainTest, ConcurrentAppendsGetUniqueSequentialIndices) {
  ASSERT_TRUE(chain.createGenesis().isOk());

  const int threads = 8;
  const int perThread = 25;
  std::mutex indicesMutex;
  std::vector<uint64_t> indices;
  std::vector<std::thread> workers;

  for (int t = 0; t < threads; ++t) {
    workers.emplace_back([&, t]() {
      for (int i = 0; i < perThread; ++i) {
        auto result = chain.append("t" + std::to_string(t) + "-" +
                                   std::to_string(i));
        ASSERT_TRUE(result.isOk());
        std::lock_guard<std::mutex> lock(indicesMutex);
        indices.push_back(result.value().index);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  const uint64_t k = threads * perThread;
  ASSERT_EQ(indices.size(), k);
  std::set<uint64_t> unique(indices.begin(), indices.end());
  EXPECT_EQ(unique.size(), k);
  EXPECT_EQ(*unique.begin(), 1u);
  EXPECT_EQ(*unique.rbegin(), k);
  EXPECT_EQ(chain.getLength().value(), k + 1);
  EXPECT_TRUE(chain.validate().value());
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------

TEST_F(ChainTest, GetBlockOutOfRangeIsEmpty) {
  buildChain(2);
  EXPECT_FALSE(chain.getBlock(-1).has_value());
  EXPECT_FALSE(chain.getBlock(3).has_value());
  EXPECT_FALSE(chain.getBlock(1000000).has_value());
  EXPECT_TRUE(chain.getBlock(2).has_value());
}

TEST_F(ChainTest, FindSkipsGenesisAndShortCircuits) {
  buildChain(5);

  int calls = 0;
  auto found = chain.find([&](const hc::Block &block, uint64_t index) {
    ++calls;
    EXPECT_GE(index, 1u);
    return block.data == "Block 3";
  });
  ASSERT_TRUE(found.isOk());
  ASSERT_TRUE(found.value().has_value());
  EXPECT_EQ(found.value()->index, 3u);
  EXPECT_EQ(calls, 3);

  auto genesisOnly = chain.find([](const hc::Block &block, uint64_t) {
    return block.isGenesis();
  });
  ASSERT_TRUE(genesisOnly.isOk());
  EXPECT_FALSE(genesisOnly.value().has_value());
}

TEST_F(ChainTest, ForEachVisitsInOrderWithSnapshotCount) {
  buildChain(4);

  std::vector<uint64_t> seen;
  auto result = chain.forEach(
      [&](const hc::Block &block, uint64_t index, uint64_t count) {
        EXPECT_EQ(block.index, index);
        EXPECT_EQ(count, 5u);
        seen.push_back(index);
        if (index == 0) {
          // Appends during iteration do not extend it
          EXPECT_TRUE(chain.append("late").isOk());
        }
      });
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(seen, (std::vector<uint64_t>{ 0, 1, 2, 3, 4 }));
  EXPECT_EQ(chain.getLength().value(), 6u);
}

TEST_F(ChainTest, GetRangeWithLimit) {
  buildChain(9);

  auto range = chain.getRange(3, 4);
  ASSERT_TRUE(range.isOk());
  ASSERT_EQ(range.value().size(), 4u);
  EXPECT_EQ(range.value().front().index, 3u);
  EXPECT_EQ(range.value().back().index, 6u);

  auto tail = chain.getRange(8);
  ASSERT_TRUE(tail.isOk());
  EXPECT_EQ(tail.value().size(), 2u);

  EXPECT_TRUE(chain.getRange(50).value().empty());
  EXPECT_EQ(chain.toVector().value().size(), 10u);
}

// ---------------------------------------------------------------------------
// Validation
// ---------------------------------------------------------------------------

TEST_F(ChainTest, ValidateReportsProgress) {
  buildChain(3);
  std::vector<double> progress;
  auto result = chain.validate(0, [&](double p) { progress.push_back(p); });
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result.value());
  ASSERT_EQ(progress.size(), 4u);
  EXPECT_DOUBLE_EQ(progress.front(), 25.0);
  EXPECT_DOUBLE_EQ(progress.back(), 100.0);
}

TEST_F(ChainTest, ValidateFromIndex) {
  buildChain(5);
  EXPECT_TRUE(chain.validate(3).value());
  EXPECT_TRUE(chain.validate(6).value());
}

TEST_F(ChainTest, TamperedDataFailsValidation) {
  buildChain(5);
  auto block = chain.getBlock(3);
  ASSERT_TRUE(block.has_value());
  block->data = "forged";
  storeRaw(3, hc::BlockCodec::encode(*block));

  EXPECT_FALSE(chain.validate().value());
  EXPECT_TRUE(chain.validate(4).value());
}

TEST_F(ChainTest, TamperedHashFailsValidation) {
  buildChain(5);
  auto block = chain.getBlock(2);
  ASSERT_TRUE(block.has_value());
  block->hash[0] ^= 0xff;
  storeRaw(2, hc::BlockCodec::encode(*block));

  EXPECT_FALSE(chain.validate().value());
}

TEST_F(ChainTest, ResealedForgeryBreaksLinkage) {
  buildChain(5);
  auto block = chain.getBlock(2);
  ASSERT_TRUE(block.has_value());
  block->data = "forged";
  hc::BlockHasher::seal(*block);
  storeRaw(2, hc::BlockCodec::encode(*block));

  // Block 2 is self-consistent, block 3 no longer links to it
  EXPECT_FALSE(chain.validate().value());
  EXPECT_FALSE(chain.validate(3).value());
}

TEST_F(ChainTest, TimestampRegressionFailsValidation) {
  buildChain(3);
  auto prev = chain.getBlock(1);
  auto block = chain.getBlock(2);
  ASSERT_TRUE(prev.has_value() && block.has_value());
  block->timestamp = prev->timestamp;
  hc::BlockHasher::seal(*block);
  storeRaw(2, hc::BlockCodec::encode(*block));

  EXPECT_FALSE(chain.validate().value());
}

TEST_F(ChainTest, CorruptRecordIsEmptyAndInvalid) {
  buildChain(3);
  storeRaw(2, "garbage");

  EXPECT_FALSE(chain.getBlock(2).has_value());
  EXPECT_FALSE(chain.validate().value());

  auto range = chain.getRange(0);
  ASSERT_TRUE(range.isError());
  EXPECT_EQ(range.error().code, hc::Chain::E_CORRUPT_RECORD);
}

TEST_F(ChainTest, AppendAfterCorruptLastBlockFails) {
  buildChain(2);
  storeRaw(2, "garbage");

  auto result = chain.append("next");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_CORRUPT_RECORD);
  EXPECT_EQ(chain.getLength().value(), 3u);
}

// ---------------------------------------------------------------------------
// Replacement
// ---------------------------------------------------------------------------

class ChainReplaceTest : public ChainTest {
protected:
  hc::Chain other;

  void SetUp() override {
    ChainTest::SetUp();
    ASSERT_TRUE(other.open(hc::Chain::Config()).isOk());
  }

  std::vector<hc::Block> otherBlocks(size_t appends) {
    EXPECT_TRUE(other.createGenesis().isOk());
    for (size_t i = 1; i <= appends; ++i) {
      EXPECT_TRUE(other.append("other " + std::to_string(i)).isOk());
    }
    return other.toVector().value();
  }
};

TEST_F(ChainReplaceTest, LongerValidChainIsAdopted) {
  buildChain(3);
  auto candidate = otherBlocks(6);

  auto result = chain.replace(candidate);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(chain.toVector().value(), candidate);
  EXPECT_TRUE(chain.validate().value());
  EXPECT_FALSE(chain.isReplacing());

  // Appends continue from the adopted tip
  auto next = chain.append("after replace");
  ASSERT_TRUE(next.isOk());
  EXPECT_EQ(next.value().index, 7u);
  EXPECT_EQ(next.value().previousHash, candidate.back().hash);
}

TEST_F(ChainReplaceTest, EqualLengthChainIsAdopted) {
  buildChain(4);
  auto candidate = otherBlocks(4);
  ASSERT_TRUE(chain.replace(candidate).isOk());
  EXPECT_EQ(chain.toVector().value(), candidate);
}

TEST_F(ChainReplaceTest, ReplaceIntoEmptyChain) {
  auto candidate = otherBlocks(2);
  ASSERT_TRUE(chain.replace(candidate).isOk());
  EXPECT_EQ(chain.getLength().value(), 3u);
}

TEST_F(ChainReplaceTest, ShorterChainIsRejected) {
  buildChain(5);
  auto before = chain.toVector().value();
  auto candidate = otherBlocks(2);

  auto result = chain.replace(candidate);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_CHAIN_TOO_SHORT);
  EXPECT_EQ(chain.toVector().value(), before);
  EXPECT_FALSE(chain.isReplacing());
}

TEST_F(ChainReplaceTest, ShortCandidateNeverRaisesReplacingFlag) {
  buildChain(5);
  auto candidate = otherBlocks(2);

  bool sawReplacing = false;
  kv->onCount = [&]() { sawReplacing = sawReplacing || chain.isReplacing(); };
  auto result = chain.replace(candidate);
  kv->onCount = nullptr;

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_CHAIN_TOO_SHORT);
  EXPECT_FALSE(sawReplacing);
}

TEST_F(ChainReplaceTest, EmptyCandidateIsInvalid) {
  auto result = chain.replace({});
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_INVALID_CHAIN);
}

TEST_F(ChainReplaceTest, InvalidCandidateWritesNothing) {
  buildChain(2);
  auto before = chain.toVector().value();
  auto candidate = otherBlocks(5);
  candidate[4].data = "tampered";

  auto result = chain.replace(candidate);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_INVALID_CHAIN);
  EXPECT_EQ(chain.toVector().value(), before);
  EXPECT_FALSE(chain.isReplacing());
}

TEST_F(ChainReplaceTest, CandidateMustStartAtGenesis) {
  auto candidate = otherBlocks(3);
  candidate.erase(candidate.begin());

  auto result = chain.replace(candidate);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_INVALID_CHAIN);
}

TEST_F(ChainReplaceTest, SecondaryCheckRunsWhileReplacing) {
  buildChain(1);
  auto candidate = otherBlocks(3);

  bool sawReplacing = false;
  auto rejected = chain.replace(candidate, [&](const hc::Block &block) {
    sawReplacing = chain.isReplacing();
    return block.index != 2;
  });
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, hc::Chain::E_INVALID_CHAIN);
  EXPECT_TRUE(sawReplacing);
  EXPECT_FALSE(chain.isReplacing());
  EXPECT_EQ(chain.getLength().value(), 2u);

  auto accepted = chain.replace(candidate, [](const hc::Block &) { return true; });
  ASSERT_TRUE(accepted.isOk());
  EXPECT_EQ(chain.getLength().value(), 4u);
}

// ---------------------------------------------------------------------------
// Custom hash function
// ---------------------------------------------------------------------------

namespace {

hc::Digest saltedHash(const hc::Block &block) {
  return hc::BlockHasher::sha256("salt:" + hc::BlockHasher::preimage(block));
}

} // namespace

TEST_F(ChainTest, CustomHasherSealsAndVerifiesBlocks) {
  chain.setHasher(saltedHash);
  buildChain(3);

  auto blocks = chain.toVector().value();
  for (const auto &block : blocks) {
    EXPECT_EQ(block.hash, saltedHash(block));
    EXPECT_NE(block.hash, hc::BlockHasher::hash(block));
  }
  EXPECT_TRUE(chain.validate().value());

  // The same blocks do not verify under the default hash
  chain.setHasher(nullptr);
  EXPECT_FALSE(chain.validate().value());
  chain.setHasher(saltedHash);
  EXPECT_TRUE(chain.validate().value());
}

TEST_F(ChainReplaceTest, CandidateMustMatchChainHasher) {
  chain.setHasher(saltedHash);
  auto defaultHashed = otherBlocks(2);

  auto rejected = chain.replace(defaultHashed);
  ASSERT_TRUE(rejected.isError());
  EXPECT_EQ(rejected.error().code, hc::Chain::E_INVALID_CHAIN);
  EXPECT_EQ(chain.getLength().value(), 0u);

  hc::Chain salted;
  salted.setHasher(saltedHash);
  ASSERT_TRUE(salted.open(hc::Chain::Config()).isOk());
  ASSERT_TRUE(salted.createGenesis().isOk());
  ASSERT_TRUE(salted.append("one").isOk());
  ASSERT_TRUE(chain.replace(salted.toVector().value()).isOk());
  EXPECT_EQ(chain.getLength().value(), 2u);
}

// ---------------------------------------------------------------------------
// Failures, locking and lifecycle
// ---------------------------------------------------------------------------

TEST_F(ChainTest, WriteFailureIsReportedAndReleasesLock) {
  buildChain(1);
  kv->failPuts = true;

  auto failed = chain.append("lost");
  ASSERT_TRUE(failed.isError());
  EXPECT_EQ(failed.error().code, hc::Chain::E_IO);
  EXPECT_EQ(chain.getLength().value(), 2u);

  kv->failPuts = false;
  auto next = chain.append("kept");
  ASSERT_TRUE(next.isOk());
  EXPECT_EQ(next.value().index, 2u);
}

TEST_F(ChainTest, ReplaceWriteFailureLeavesChainUnchanged) {
  buildChain(1);
  auto before = chain.toVector().value();

  hc::Chain other;
  ASSERT_TRUE(other.open(hc::Chain::Config()).isOk());
  ASSERT_TRUE(other.createGenesis().isOk());
  ASSERT_TRUE(other.append("x").isOk());
  ASSERT_TRUE(other.append("y").isOk());

  kv->failPuts = true;
  auto result = chain.replace(other.toVector().value());
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_IO);
  kv->failPuts = false;
  EXPECT_EQ(chain.toVector().value(), before);
}

TEST(ChainLockTest, WriterTimesOutWhileLockIsHeld) {
  auto upKv = std::make_unique<ControlledKvStore>();
  ControlledKvStore *kv = upKv.get();
  hc::Chain chain;
  hc::Chain::Config config;
  config.lockTimeoutMs = 50;
  ASSERT_TRUE(chain.attach(std::move(upKv), config).isOk());
  ASSERT_TRUE(chain.createGenesis().isOk());

  kv->setBlockPuts(true);
  std::thread holder([&]() { EXPECT_TRUE(chain.append("slow").isOk()); });
  kv->waitUntilBlocked();

  auto result = chain.append("impatient");
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, hc::Chain::E_LOCK_TIMEOUT);

  auto genesis = chain.createGenesis();
  ASSERT_TRUE(genesis.isError());
  EXPECT_EQ(genesis.error().code, hc::Chain::E_LOCK_TIMEOUT);

  // Reads do not wait for the lock
  EXPECT_EQ(chain.getLength().value(), 1u);

  kv->setBlockPuts(false);
  holder.join();
  EXPECT_EQ(chain.getLength().value(), 2u);

  auto after = chain.append("now fine");
  ASSERT_TRUE(after.isOk());
  EXPECT_EQ(after.value().index, 2u);
}

TEST(ChainLifecycleTest, ObserversSeeReadyAndBlocks) {
  hc::Chain chain;
  auto observer = std::make_shared<RecordingObserver>();
  chain.addObserver(observer);
  EXPECT_EQ(observer->readyCount, 0);

  ASSERT_TRUE(chain.open(hc::Chain::Config()).isOk());
  EXPECT_EQ(observer->readyCount, 1);

  ASSERT_TRUE(chain.createGenesis().isOk());
  ASSERT_TRUE(chain.append("a").isOk());
  ASSERT_TRUE(chain.append("b").isOk());
  EXPECT_EQ(observer->added, (std::vector<uint64_t>{ 0, 1, 2 }));

  // Late observers get ready immediately
  auto late = std::make_shared<RecordingObserver>();
  chain.addObserver(late);
  EXPECT_EQ(late->readyCount, 1);

  chain.removeObserver(observer);
  ASSERT_TRUE(chain.append("c").isOk());
  EXPECT_EQ(observer->added.size(), 3u);
  EXPECT_EQ(late->added, (std::vector<uint64_t>{ 3 }));
}

TEST(ChainLifecycleTest, ObserverRunsOutsideWriteLock) {
  class ReentrantObserver : public hc::Chain::Observer {
  public:
    explicit ReentrantObserver(hc::Chain &chain) : chain_(chain) {}
    void onBlockAdded(const hc::Block &) override {
      auto result = chain_.createGenesis();
      ok = ok && result.isOk();
    }
    bool ok{ true };

  private:
    hc::Chain &chain_;
  };

  hc::Chain chain;
  hc::Chain::Config config;
  config.lockTimeoutMs = 200;
  ASSERT_TRUE(chain.open(config).isOk());
  auto observer = std::make_shared<ReentrantObserver>(chain);
  chain.addObserver(observer);

  ASSERT_TRUE(chain.createGenesis().isOk());
  ASSERT_TRUE(chain.append("x").isOk());
  EXPECT_TRUE(observer->ok);
}

TEST(ChainLifecycleTest, CloseDropsObserversAndRejectsCalls) {
  hc::Chain chain;
  ASSERT_TRUE(chain.open(hc::Chain::Config()).isOk());
  auto observer = std::make_shared<RecordingObserver>();
  chain.addObserver(observer);
  ASSERT_TRUE(chain.createGenesis().isOk());

  chain.close();
  chain.close();
  EXPECT_FALSE(chain.isOpen());

  auto append = chain.append("x");
  ASSERT_TRUE(append.isError());
  EXPECT_EQ(append.error().code, hc::Chain::E_CLOSED);
  auto length = chain.getLength();
  ASSERT_TRUE(length.isError());
  EXPECT_EQ(length.error().code, hc::Chain::E_CLOSED);
  EXPECT_FALSE(chain.getBlock(0).has_value());
  EXPECT_TRUE(chain.validate().isError());

  // Reopening starts fresh without the old observer
  ASSERT_TRUE(chain.open(hc::Chain::Config()).isOk());
  ASSERT_TRUE(chain.createGenesis().isOk());
  EXPECT_EQ(observer->readyCount, 1);
  EXPECT_EQ(observer->added, (std::vector<uint64_t>{ 0 }));
}

TEST(ChainLifecycleTest, CloseWaitsForInFlightAppend) {
  auto upKv = std::make_unique<ControlledKvStore>();
  ControlledKvStore *kv = upKv.get();
  hc::Chain chain;
  ASSERT_TRUE(chain.attach(std::move(upKv)).isOk());
  ASSERT_TRUE(chain.createGenesis().isOk());

  kv->setBlockPuts(true);
  hc::Chain::Roe<hc::Block> appended =
      hc::Chain::Error(hc::Chain::E_IO, "not run");
  std::thread writer([&]() { appended = chain.append("in flight"); });
  kv->waitUntilBlocked();

  std::atomic<bool> closed{ false };
  std::thread closer([&]() {
    chain.close();
    closed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(closed.load());

  kv->setBlockPuts(false);
  writer.join();
  closer.join();

  ASSERT_TRUE(appended.isOk()) << appended.error().message;
  EXPECT_EQ(appended.value().index, 1u);
  EXPECT_TRUE(closed.load());
  EXPECT_FALSE(chain.isOpen());

  auto late = chain.append("too late");
  ASSERT_TRUE(late.isError());
  EXPECT_EQ(late.error().code, hc::Chain::E_CLOSED);
}

TEST(ChainLifecycleTest, OpenTwiceFails) {
  hc::Chain chain;
  ASSERT_TRUE(chain.open(hc::Chain::Config()).isOk());
  auto again = chain.open(hc::Chain::Config());
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, hc::Chain::E_STATE);
}

TEST(ChainLifecycleTest, FileEnginePersistsAcrossReopen) {
  std::string testDir = "/tmp/hashchain-chain-test";
  std::filesystem::remove_all(testDir);

  hc::Chain::Config config;
  config.engine = hc::Chain::Config::ENGINE_FILE;
  config.path = testDir + "/chain.hckv";
  config.genesisData = "root";

  std::vector<hc::Block> written;
  {
    hc::Chain chain;
    auto opened = chain.open(config);
    ASSERT_TRUE(opened.isOk()) << opened.error().message;
    ASSERT_TRUE(chain.createGenesis().isOk());
    for (int i = 1; i <= 10; ++i) {
      ASSERT_TRUE(chain.append("entry " + std::to_string(i)).isOk());
    }
    written = chain.toVector().value();
  }

  {
    hc::Chain chain;
    auto opened = chain.open(config);
    ASSERT_TRUE(opened.isOk()) << opened.error().message;
    EXPECT_EQ(chain.getLength().value(), 11u);
    EXPECT_EQ(chain.toVector().value(), written);
    EXPECT_EQ(chain.getBlock(0)->data, "root");
    EXPECT_TRUE(chain.validate().value());

    auto genesis = chain.createGenesis();
    ASSERT_TRUE(genesis.isOk());
    EXPECT_FALSE(genesis.value().has_value());
  }

  std::filesystem::remove_all(testDir);
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

TEST(ChainConfigTest, DefaultsWhenFieldsMissing) {
  auto config = hc::Chain::Config::fromJson(nlohmann::json::object());
  ASSERT_TRUE(config.isOk());
  EXPECT_EQ(config.value().engine, "memory");
  EXPECT_EQ(config.value().lockTimeoutMs, 0u);
  EXPECT_EQ(config.value().genesisData, R"({"genesis":true})");
}

TEST(ChainConfigTest, ParsesAllFields) {
  nlohmann::json json = { { "engine", "file" },
                          { "path", "/tmp/x.hckv" },
                          { "lockTimeoutMs", 250 },
                          { "genesisData", "hello" } };
  auto config = hc::Chain::Config::fromJson(json);
  ASSERT_TRUE(config.isOk()) << config.error().message;
  EXPECT_EQ(config.value().engine, "file");
  EXPECT_EQ(config.value().path, "/tmp/x.hckv");
  EXPECT_EQ(config.value().lockTimeoutMs, 250u);
  EXPECT_EQ(config.value().genesisData, "hello");

  auto again = hc::Chain::Config::fromJson(config.value().toJson());
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again.value().path, "/tmp/x.hckv");
}

TEST(ChainConfigTest, RejectsInvalidValues) {
  auto expectConfigError = [](const nlohmann::json &json) {
    auto config = hc::Chain::Config::fromJson(json);
    ASSERT_TRUE(config.isError()) << json.dump();
    EXPECT_EQ(config.error().code, hc::Chain::E_CONFIG);
  };
  expectConfigError(nlohmann::json::array());
  expectConfigError({ { "engine", "rocks" } });
  expectConfigError({ { "engine", "file" } });
  expectConfigError({ { "engine", 3 } });
  expectConfigError({ { "lockTimeoutMs", -1 } });
  expectConfigError({ { "lockTimeoutMs", "soon" } });
  expectConfigError({ { "genesisData", false } });
}
