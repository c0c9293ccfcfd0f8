#include "BlockCodec.h"
#include "../lib/ByteOrder.h"

#include <algorithm>
#include <cstring>

namespace hc {

std::string BlockCodec::encode(const Block &block) {
  std::string out;
  out.reserve(HEADER_SIZE + block.data.size());

  ByteOrder::appendUint64(out, block.index);
  ByteOrder::appendInt64(out, block.timestamp);
  out.append(reinterpret_cast<const char *>(block.hash.data()), DIGEST_SIZE);
  out.append(reinterpret_cast<const char *>(block.previousHash.data()),
             DIGEST_SIZE);
  ByteOrder::appendUint64(out, block.data.size());
  out.append(block.data);

  return out;
}

BlockCodec::Roe<Block> BlockCodec::decode(const std::string &bytes) {
  if (bytes.size() < HEADER_SIZE) {
    return Error(E_CORRUPT_RECORD,
                 "Record too short: " + std::to_string(bytes.size()) +
                     " bytes, header needs " + std::to_string(HEADER_SIZE));
  }

  const char *p = bytes.data();
  Block block;

  block.index = ByteOrder::readUint64(p);
  p += 8;
  block.timestamp = ByteOrder::readInt64(p);
  p += 8;
  std::memcpy(block.hash.data(), p, DIGEST_SIZE);
  p += DIGEST_SIZE;
  std::memcpy(block.previousHash.data(), p, DIGEST_SIZE);
  p += DIGEST_SIZE;
  uint64_t dataSize = ByteOrder::readUint64(p);

  uint64_t remaining = bytes.size() - HEADER_SIZE;
  if (dataSize > remaining) {
    return Error(E_CORRUPT_RECORD,
                 "Declared data size " + std::to_string(dataSize) +
                     " exceeds remaining " + std::to_string(remaining) +
                     " bytes");
  }
  if (dataSize < remaining) {
    return Error(E_CORRUPT_RECORD,
                 std::to_string(remaining - dataSize) +
                     " trailing bytes after payload");
  }

  block.data = bytes.substr(HEADER_SIZE, dataSize);
  return block;
}

} // namespace hc
