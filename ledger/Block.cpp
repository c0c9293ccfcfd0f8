#include "Block.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace hc {

std::string toHex(const Digest &digest) {
  return utl::hexEncode(digest.data(), digest.size());
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  j["previousHash"] = toHex(previousHash);
  j["hash"] = toHex(hash);
  j["data"] = utl::toJsonSafeString(data);
  return j;
}

namespace {

bool digestFromHex(const nlohmann::json &value, Digest &digest) {
  if (!value.is_string()) {
    return false;
  }
  std::string raw = utl::hexDecode(value.get<std::string>());
  if (raw.size() != digest.size()) {
    return false;
  }
  std::copy(raw.begin(), raw.end(), digest.begin());
  return true;
}

} // namespace

hc::Roe<Block> Block::fromJson(const nlohmann::json &json) {
  if (!json.is_object()) {
    return Error(1, "Block must be a JSON object");
  }
  for (const char *field : { "index", "timestamp", "previousHash", "hash", "data" }) {
    if (!json.contains(field)) {
      return Error(1, std::string("Block is missing field: ") + field);
    }
  }
  const auto &index = json["index"];
  if (!index.is_number_integer() ||
      (!index.is_number_unsigned() && index.get<int64_t>() < 0)) {
    return Error(1, "index must be a non-negative integer");
  }
  if (!json["timestamp"].is_number_integer()) {
    return Error(1, "timestamp must be an integer");
  }
  if (!json["data"].is_string()) {
    return Error(1, "data must be a string");
  }

  Block block;
  block.index = index.get<uint64_t>();
  block.timestamp = json["timestamp"].get<int64_t>();
  if (!digestFromHex(json["previousHash"], block.previousHash)) {
    return Error(1, "previousHash must be 64 hex characters");
  }
  if (!digestFromHex(json["hash"], block.hash)) {
    return Error(1, "hash must be 64 hex characters");
  }
  block.data = utl::fromJsonSafeString(json["data"].get<std::string>());
  return block;
}

bool Block::operator==(const Block &other) const {
  return index == other.index && timestamp == other.timestamp &&
         previousHash == other.previousHash && hash == other.hash &&
         data == other.data;
}

} // namespace hc
