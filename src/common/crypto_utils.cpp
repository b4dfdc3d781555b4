#include "common/crypto_utils.h"
#include <algorithm>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace tally {
namespace common {

Hash CryptoUtils::sha256(const std::vector<uint8_t> &data) {
  return sha256_multi({data});
}

Hash CryptoUtils::sha256_multi(
    const std::vector<std::vector<uint8_t>> &data_chunks) {
  Hash hash(SHA256_DIGEST_LENGTH);

  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return Hash();
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    return Hash();
  }

  for (const auto &chunk : data_chunks) {
    if (!chunk.empty()) {
      if (EVP_DigestUpdate(ctx, chunk.data(), chunk.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return Hash();
      }
    }
  }

  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    return Hash();
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

Result<std::vector<uint8_t>> CryptoUtils::random_bytes(size_t count) {
  std::vector<uint8_t> bytes(count);
  if (count > 0 &&
      RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
    return make_error(std::string("RAND_bytes failed"));
  }
  return Result<std::vector<uint8_t>>(std::move(bytes));
}

Result<PublicKey> CryptoUtils::generate_address() {
  // The all-zero key is reserved for the system program
  for (int attempt = 0; attempt < 4; ++attempt) {
    auto bytes = random_bytes(PUBKEY_SIZE);
    if (bytes.is_err()) {
      return make_error(bytes.error());
    }
    const auto &key = bytes.value();
    if (std::any_of(key.begin(), key.end(), [](uint8_t b) { return b != 0; })) {
      return Result<PublicKey>(key);
    }
  }
  return make_error(std::string("Failed to generate a non-zero address"));
}

PublicKey CryptoUtils::derive_program_id(const std::string &name) {
  static const std::string prefix = "tally-program:";
  return sha256_multi({std::vector<uint8_t>(prefix.begin(), prefix.end()),
                       std::vector<uint8_t>(name.begin(), name.end())});
}

} // namespace common
} // namespace tally
