#ifndef HC_CHAIN_FILE_KV_STORE_H
#define HC_CHAIN_FILE_KV_STORE_H

#include "KvStore.hpp"

#include <cstdint>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace hc {

/**
 * FileKvStore keeps all writes in a single append-only record file.
 *
 * File format:
 * - Header: magic (4), version (4)
 * - Records: [type (1)][payload size (8)][payload][checksum (4)]
 *   - PUT payload:   [key size (4)][key][value]
 *   - BATCH payload: [entry count (4)] then per entry
 *                    [key size (4)][key][value size (8)][value]
 *   - checksum: first 4 bytes of SHA-256 over type, size and payload
 * All integers are big endian.
 *
 * The last record for a key wins. On mount the file is scanned once to
 * build a sorted key index of value offsets. An incomplete record at the
 * tail (crash during append) is cut off, so a put or a batch either lands
 * completely or not at all. A record that fails its checksum, or an
 * incomplete one followed by an intact record, fails the mount with
 * E_CORRUPT and the file is left untouched.
 */
class FileKvStore : public KvStore {
public:
  struct InitConfig {
    std::string filepath;
  };

  FileKvStore();
  ~FileKvStore() override;

  FileKvStore(const FileKvStore &) = delete;
  FileKvStore &operator=(const FileKvStore &) = delete;

  /**
   * Create a new store file; fails if the file exists
   */
  Roe<void> init(const InitConfig &config);

  /**
   * Open an existing store file and rebuild the key index
   */
  Roe<void> mount(const std::string &filepath);

  Roe<std::string> get(const std::string &key) const override;
  Roe<void> put(const std::string &key, const std::string &value) override;
  Roe<void> writeBatch(const std::vector<Entry> &entries) override;
  Roe<uint64_t> countFrom(const std::string &fromKey) const override;
  void close() override;
  bool isOpen() const override;

  const std::string &getFilePath() const { return filepath_; }
  uint64_t getFileSize() const;
  uint64_t getKeyCount() const;

protected:
  Roe<void> readRange(const std::string &fromKey, bool inclusive,
                      size_t maxCount,
                      std::vector<Entry> &out) const override;

private:
  struct FileHeader {
    static constexpr uint32_t MAGIC = 0x48434B56; // "HCKV"
    static constexpr uint16_t CURRENT_VERSION = 2;
    static constexpr size_t SIZE = 8;
  };

  static constexpr uint8_t R_PUT = 1;
  static constexpr uint8_t R_BATCH = 2;
  static constexpr size_t RECORD_HEADER_SIZE = 1 + 8;
  static constexpr size_t RECORD_CHECKSUM_SIZE = 4;

  enum class RecordState { INTACT, INCOMPLETE, BAD_CHECKSUM };

  // Location of a value inside the file
  struct ValueEntry {
    uint64_t offset{ 0 };
    uint64_t size{ 0 };
  };

  Roe<void> openFile();
  Roe<void> writeHeader();
  Roe<void> readHeader();
  Roe<void> buildIndex();
  Roe<RecordState> readRecord(uint64_t pos, uint8_t &type,
                              std::string &payload);
  // True if an intact record starts anywhere after pos
  Roe<bool> hasIntactRecordAfter(uint64_t pos);
  Roe<void> truncateAt(uint64_t pos);
  static uint32_t checksum(const char *data, size_t size);
  // Returns the file offset of the first payload byte
  Roe<uint64_t> appendRecord(uint8_t type, const std::string &payload);
  Roe<std::string> readValue(const ValueEntry &entry) const;
  void resetState();

  std::string filepath_;
  mutable std::fstream file_;
  mutable std::mutex mutex_;
  uint64_t fileSize_{ 0 };
  std::map<std::string, ValueEntry> index_;
};

} // namespace hc

#endif // HC_CHAIN_FILE_KV_STORE_H
