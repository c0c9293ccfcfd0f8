#include "FileKvStore.h"
#include "../lib/ByteOrder.h"

#include <openssl/evp.h>

#include <filesystem>
#include <iterator>
#include <stdexcept>

namespace hc {

FileKvStore::FileKvStore() : KvStore("hc.kv.file") {}

FileKvStore::~FileKvStore() { close(); }

void FileKvStore::resetState() {
  fileSize_ = 0;
  index_.clear();
}

FileKvStore::Roe<void> FileKvStore::init(const InitConfig &config) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    return Error(E_STATE, "Store already open: " + filepath_);
  }
  filepath_ = config.filepath;
  resetState();

  if (filepath_.empty()) {
    return Error(E_STATE, "Filepath is not set");
  }

  if (std::filesystem::exists(filepath_)) {
    return Error(E_STATE, "File already exists: " + filepath_ +
                              ". Use mount() to load existing file.");
  }

  std::filesystem::path parentDir =
      std::filesystem::path(filepath_).parent_path();
  if (!parentDir.empty() && !std::filesystem::exists(parentDir)) {
    std::error_code ec;
    std::filesystem::create_directories(parentDir, ec);
    if (ec) {
      return Error(E_IO, "Failed to create directory " + parentDir.string() +
                             ": " + ec.message());
    }
  }

  auto result = openFile();
  if (!result) {
    log().error << "Failed to create file: " << filepath_;
    return result;
  }

  auto headerResult = writeHeader();
  if (!headerResult) {
    log().error << "Failed to write header to new file: " << filepath_;
    file_.close();
    return headerResult;
  }
  fileSize_ = FileHeader::SIZE;
  log().debug << "Created new store file: " << filepath_;

  return {};
}

FileKvStore::Roe<void> FileKvStore::mount(const std::string &filepath) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    return Error(E_STATE, "Store already open: " + filepath_);
  }
  filepath_ = filepath;
  resetState();

  if (filepath_.empty()) {
    return Error(E_STATE, "Filepath is not set");
  }

  if (!std::filesystem::exists(filepath_)) {
    return Error(E_STATE, "File does not exist: " + filepath_ +
                              ". Use init() to create new file.");
  }

  auto result = openFile();
  if (!result) {
    log().error << "Failed to open file: " << filepath_;
    return result;
  }

  std::error_code ec;
  fileSize_ = std::filesystem::file_size(filepath_, ec);
  if (ec) {
    file_.close();
    return Error(E_IO, "Failed to stat " + filepath_ + ": " + ec.message());
  }

  auto headerResult = readHeader();
  if (!headerResult) {
    log().error << "Failed to read header from existing file: " << filepath_;
    file_.close();
    return headerResult;
  }

  auto indexResult = buildIndex();
  if (!indexResult) {
    log().error << "Failed to index " << filepath_ << ": "
                << indexResult.error().message;
    file_.close();
    resetState();
    return indexResult;
  }

  log().debug << "Mounted store file: " << filepath_ << " (size: " << fileSize_
              << " bytes, keys: " << index_.size() << ")";
  return {};
}

FileKvStore::Roe<void> FileKvStore::openFile() {
  if (!std::filesystem::exists(filepath_)) {
    file_.open(filepath_, std::ios::binary | std::ios::out);
    if (file_.is_open()) {
      file_.close();
    }
  }

  file_.open(filepath_, std::ios::binary | std::ios::in | std::ios::out);
  if (!file_.is_open()) {
    return Error(E_IO, "Failed to open file: " + filepath_);
  }
  return {};
}

FileKvStore::Roe<void> FileKvStore::writeHeader() {
  std::string header;
  ByteOrder::appendUint32(header, FileHeader::MAGIC);
  ByteOrder::appendUint32(header, FileHeader::CURRENT_VERSION);

  file_.seekp(0, std::ios::beg);
  file_.write(header.data(), header.size());
  file_.flush();
  if (!file_.good()) {
    return Error(E_IO, "Failed to write header: " + filepath_);
  }
  return {};
}

FileKvStore::Roe<void> FileKvStore::readHeader() {
  if (fileSize_ < FileHeader::SIZE) {
    return Error(E_CORRUPT, "File too small for header: " + filepath_);
  }

  std::string header(FileHeader::SIZE, '\0');
  file_.seekg(0, std::ios::beg);
  file_.read(&header[0], header.size());
  if (!file_.good()) {
    return Error(E_IO, "Failed to read header: " + filepath_);
  }

  if (ByteOrder::readUint32(header.data()) != FileHeader::MAGIC) {
    return Error(E_CORRUPT, "Bad magic number in " + filepath_);
  }
  uint32_t version = ByteOrder::readUint32(header.data() + 4);
  if (version != FileHeader::CURRENT_VERSION) {
    return Error(E_CORRUPT, "Unsupported store version " +
                                std::to_string(version) + " in " + filepath_);
  }
  return {};
}

uint32_t FileKvStore::checksum(const char *data, size_t size) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  if (EVP_Digest(data, size, digest, &digestLen, EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_Digest failed");
  }
  return ByteOrder::readUint32(reinterpret_cast<const char *>(digest));
}

FileKvStore::Roe<FileKvStore::RecordState>
FileKvStore::readRecord(uint64_t pos, uint8_t &type, std::string &payload) {
  uint64_t remaining = fileSize_ - pos;
  if (remaining < RECORD_HEADER_SIZE + RECORD_CHECKSUM_SIZE) {
    return RecordState::INCOMPLETE;
  }

  std::string header(RECORD_HEADER_SIZE, '\0');
  file_.clear();
  file_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
  file_.read(&header[0], RECORD_HEADER_SIZE);
  if (!file_.good()) {
    return Error(E_IO, "Failed to read record header at " + std::to_string(pos));
  }
  type = static_cast<uint8_t>(header[0]);
  uint64_t payloadSize = ByteOrder::readUint64(header.data() + 1);
  if (payloadSize > remaining - RECORD_HEADER_SIZE - RECORD_CHECKSUM_SIZE) {
    return RecordState::INCOMPLETE;
  }

  std::string body(payloadSize + RECORD_CHECKSUM_SIZE, '\0');
  file_.read(&body[0], static_cast<std::streamsize>(body.size()));
  if (!file_.good()) {
    return Error(E_IO, "Failed to read record at " + std::to_string(pos));
  }

  std::string covered = header + body.substr(0, payloadSize);
  uint32_t stored = ByteOrder::readUint32(body.data() + payloadSize);
  if (checksum(covered.data(), covered.size()) != stored) {
    return RecordState::BAD_CHECKSUM;
  }
  payload = body.substr(0, payloadSize);
  return RecordState::INTACT;
}

FileKvStore::Roe<bool> FileKvStore::hasIntactRecordAfter(uint64_t pos) {
  const size_t minRecord = RECORD_HEADER_SIZE + RECORD_CHECKSUM_SIZE;
  if (fileSize_ - pos <= minRecord) {
    return false;
  }

  std::string tail(fileSize_ - pos - 1, '\0');
  file_.clear();
  file_.seekg(static_cast<std::streamoff>(pos + 1), std::ios::beg);
  file_.read(&tail[0], static_cast<std::streamsize>(tail.size()));
  if (!file_.good()) {
    return Error(E_IO, "Failed to read file tail at " + std::to_string(pos));
  }

  for (size_t q = 0; q + minRecord <= tail.size(); ++q) {
    uint8_t type = static_cast<uint8_t>(tail[q]);
    if (type != R_PUT && type != R_BATCH) {
      continue;
    }
    uint64_t payloadSize = ByteOrder::readUint64(tail.data() + q + 1);
    if (payloadSize > tail.size() - q - minRecord) {
      continue;
    }
    size_t coveredSize = RECORD_HEADER_SIZE + payloadSize;
    uint32_t stored = ByteOrder::readUint32(tail.data() + q + coveredSize);
    if (checksum(tail.data() + q, coveredSize) == stored) {
      return true;
    }
  }
  return false;
}

FileKvStore::Roe<void> FileKvStore::truncateAt(uint64_t pos) {
  log().warning << "Discarding incomplete record at offset " << pos << " ("
                << (fileSize_ - pos) << " bytes) in " << filepath_;
  file_.close();
  std::error_code ec;
  std::filesystem::resize_file(filepath_, pos, ec);
  if (ec) {
    return Error(E_IO, "Failed to truncate " + filepath_ + ": " + ec.message());
  }
  fileSize_ = pos;
  return openFile();
}

FileKvStore::Roe<void> FileKvStore::buildIndex() {
  index_.clear();
  uint64_t pos = FileHeader::SIZE;
  std::string payload;

  while (pos < fileSize_) {
    uint8_t type = 0;
    auto state = readRecord(pos, type, payload);
    if (!state) {
      return state.error();
    }

    if (state.value() == RecordState::BAD_CHECKSUM) {
      return Error(E_CORRUPT, "Checksum mismatch in record at " +
                                  std::to_string(pos) + " in " + filepath_);
    }
    if (state.value() == RecordState::INCOMPLETE) {
      auto intactAfter = hasIntactRecordAfter(pos);
      if (!intactAfter) {
        return intactAfter.error();
      }
      if (intactAfter.value()) {
        return Error(E_CORRUPT, "Damaged record at " + std::to_string(pos) +
                                    " is followed by intact records in " +
                                    filepath_);
      }
      return truncateAt(pos);
    }

    uint64_t payloadSize = payload.size();
    uint64_t payloadOffset = pos + RECORD_HEADER_SIZE;

    if (type == R_PUT) {
      if (payloadSize < 4) {
        return Error(E_CORRUPT, "Short PUT record at " + std::to_string(pos));
      }
      uint32_t keySize = ByteOrder::readUint32(payload.data());
      if (4 + static_cast<uint64_t>(keySize) > payloadSize) {
        return Error(E_CORRUPT, "Key overruns PUT record at " +
                                    std::to_string(pos));
      }
      ValueEntry entry;
      entry.offset = payloadOffset + 4 + keySize;
      entry.size = payloadSize - 4 - keySize;
      index_[payload.substr(4, keySize)] = entry;
    } else if (type == R_BATCH) {
      if (payloadSize < 4) {
        return Error(E_CORRUPT, "Short BATCH record at " + std::to_string(pos));
      }
      uint32_t count = ByteOrder::readUint32(payload.data());
      uint64_t cursor = 4;
      std::vector<std::pair<std::string, ValueEntry>> staged;
      for (uint32_t i = 0; i < count; ++i) {
        if (payloadSize - cursor < 4) {
          return Error(E_CORRUPT, "Truncated BATCH entry at " +
                                      std::to_string(pos));
        }
        uint32_t keySize = ByteOrder::readUint32(payload.data() + cursor);
        cursor += 4;
        if (payloadSize - cursor < static_cast<uint64_t>(keySize) + 8) {
          return Error(E_CORRUPT, "Truncated BATCH entry at " +
                                      std::to_string(pos));
        }
        std::string key = payload.substr(cursor, keySize);
        cursor += keySize;
        uint64_t valueSize = ByteOrder::readUint64(payload.data() + cursor);
        cursor += 8;
        if (payloadSize - cursor < valueSize) {
          return Error(E_CORRUPT, "Truncated BATCH value at " +
                                      std::to_string(pos));
        }
        ValueEntry entry;
        entry.offset = payloadOffset + cursor;
        entry.size = valueSize;
        staged.emplace_back(std::move(key), entry);
        cursor += valueSize;
      }
      for (auto &item : staged) {
        index_[item.first] = item.second;
      }
    } else {
      return Error(E_CORRUPT, "Unknown record type " + std::to_string(type) +
                                  " at " + std::to_string(pos));
    }

    pos = payloadOffset + payloadSize + RECORD_CHECKSUM_SIZE;
  }

  return {};
}

FileKvStore::Roe<uint64_t> FileKvStore::appendRecord(uint8_t type,
                                                     const std::string &payload) {
  std::string record;
  record.reserve(RECORD_HEADER_SIZE + payload.size() + RECORD_CHECKSUM_SIZE);
  record.push_back(static_cast<char>(type));
  ByteOrder::appendUint64(record, payload.size());
  record.append(payload);
  ByteOrder::appendUint32(record, checksum(record.data(), record.size()));

  file_.clear();
  file_.seekp(static_cast<std::streamoff>(fileSize_), std::ios::beg);
  file_.write(record.data(), static_cast<std::streamsize>(record.size()));
  file_.flush();

  if (!file_.good()) {
    // Cut off whatever part of the record reached the file
    file_.clear();
    std::error_code ec;
    std::filesystem::resize_file(filepath_, fileSize_, ec);
    log().error << "Failed to append record to " << filepath_
                << (ec ? " (rollback failed: " + ec.message() + ")" : "");
    return Error(E_IO, "Failed to append record to " + filepath_);
  }

  uint64_t payloadOffset = fileSize_ + RECORD_HEADER_SIZE;
  fileSize_ += record.size();
  return payloadOffset;
}

FileKvStore::Roe<std::string> FileKvStore::readValue(const ValueEntry &entry) const {
  std::string value(entry.size, '\0');
  if (entry.size == 0) {
    return value;
  }
  file_.clear();
  file_.seekg(static_cast<std::streamoff>(entry.offset), std::ios::beg);
  file_.read(&value[0], static_cast<std::streamsize>(entry.size));
  if (!file_.good()) {
    file_.clear();
    return Error(E_IO, "Failed to read value at offset " +
                           std::to_string(entry.offset) + " in " + filepath_);
  }
  return value;
}

FileKvStore::Roe<std::string> FileKvStore::get(const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = index_.find(key);
  if (it == index_.end()) {
    return Error(E_NOT_FOUND, "Key not found");
  }
  return readValue(it->second);
}

FileKvStore::Roe<void> FileKvStore::put(const std::string &key,
                                        const std::string &value) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return Error(E_CLOSED, "Store is closed");
  }

  std::string payload;
  payload.reserve(4 + key.size() + value.size());
  ByteOrder::appendUint32(payload, static_cast<uint32_t>(key.size()));
  payload.append(key);
  payload.append(value);

  auto result = appendRecord(R_PUT, payload);
  if (!result) {
    return result.error();
  }

  ValueEntry entry;
  entry.offset = result.value() + 4 + key.size();
  entry.size = value.size();
  index_[key] = entry;
  return {};
}

FileKvStore::Roe<void>
FileKvStore::writeBatch(const std::vector<Entry> &entries) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return Error(E_CLOSED, "Store is closed");
  }
  if (entries.empty()) {
    return {};
  }

  std::string payload;
  std::vector<std::pair<std::string, ValueEntry>> located;
  located.reserve(entries.size());
  ByteOrder::appendUint32(payload, static_cast<uint32_t>(entries.size()));
  for (const auto &e : entries) {
    ByteOrder::appendUint32(payload, static_cast<uint32_t>(e.first.size()));
    payload.append(e.first);
    ByteOrder::appendUint64(payload, e.second.size());
    ValueEntry entry;
    entry.offset = payload.size(); // relative until the record lands
    entry.size = e.second.size();
    located.emplace_back(e.first, entry);
    payload.append(e.second);
  }

  auto result = appendRecord(R_BATCH, payload);
  if (!result) {
    return result.error();
  }

  for (auto &item : located) {
    item.second.offset += result.value();
    index_[item.first] = item.second;
  }
  log().debug << "Wrote batch of " << entries.size() << " entries";
  return {};
}

FileKvStore::Roe<uint64_t>
FileKvStore::countFrom(const std::string &fromKey) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = index_.lower_bound(fromKey);
  return static_cast<uint64_t>(std::distance(it, index_.end()));
}

FileKvStore::Roe<void>
FileKvStore::readRange(const std::string &fromKey, bool inclusive,
                       size_t maxCount, std::vector<Entry> &out) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open()) {
    return Error(E_CLOSED, "Store is closed");
  }
  auto it = inclusive ? index_.lower_bound(fromKey)
                      : index_.upper_bound(fromKey);
  for (; it != index_.end() && out.size() < maxCount; ++it) {
    auto value = readValue(it->second);
    if (!value) {
      return value.error();
    }
    out.emplace_back(it->first, std::move(value.value()));
  }
  return {};
}

void FileKvStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
    log().debug << "Closed store file: " << filepath_;
  }
  resetState();
}

bool FileKvStore::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

uint64_t FileKvStore::getFileSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fileSize_;
}

uint64_t FileKvStore::getKeyCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_.size();
}

} // namespace hc
