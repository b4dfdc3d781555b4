#pragma once

#include "common/types.h"
#include <string>
#include <vector>

namespace tally {
namespace common {

/**
 * Hashing and randomness helpers backed by OpenSSL
 */
class CryptoUtils {
public:
  /// SHA-256 of @p data; returns an empty hash if OpenSSL fails
  static Hash sha256(const std::vector<uint8_t> &data);

  /// SHA-256 over the concatenation of @p data_chunks
  static Hash sha256_multi(const std::vector<std::vector<uint8_t>> &data_chunks);

  /// Cryptographically secure random bytes
  static Result<std::vector<uint8_t>> random_bytes(size_t count);

  /// Fresh random 32-byte address, never all zeros
  static Result<PublicKey> generate_address();

  /// Deterministic program identity: sha256("tally-program:" + name)
  static PublicKey derive_program_id(const std::string &name);
};

} // namespace common
} // namespace tally
