#include "BlockHasher.h"
#include "../lib/ByteOrder.h"

#include <openssl/evp.h>
#include <memory>
#include <stdexcept>

namespace hc {

Digest BlockHasher::sha256(const std::string &input) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(
      EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP_MD_CTX");
  }

  if (EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }

  if (EVP_DigestUpdate(mdctx.get(), input.data(), input.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  Digest digest{};
  unsigned int digestLen = 0;
  if (EVP_DigestFinal_ex(mdctx.get(), digest.data(), &digestLen) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (digestLen != digest.size()) {
    throw std::runtime_error("Unexpected SHA-256 digest length");
  }

  return digest;
}

std::string BlockHasher::preimage(const Block &block) {
  std::string buf;
  buf.reserve(8 + 8 + block.previousHash.size() + block.data.size());
  ByteOrder::appendUint64(buf, block.index);
  ByteOrder::appendInt64(buf, block.timestamp);
  buf.append(reinterpret_cast<const char *>(block.previousHash.data()),
             block.previousHash.size());
  buf.append(block.data);
  return buf;
}

Digest BlockHasher::hash(const Block &block) {
  return sha256(preimage(block));
}

void BlockHasher::seal(Block &block) { block.hash = hash(block); }

bool BlockHasher::verify(const Block &block) {
  return block.hash == hash(block);
}

} // namespace hc
