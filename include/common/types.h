#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace tally {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout Tally
 *
 * This header defines the address and balance types shared by the host
 * runtime and the counter program, the runtime configuration, and the
 * Result<T, E> wrapper used for every fallible operation.
 */

/// @brief Cryptographic hash representation (SHA-256, 32 bytes)
using Hash = std::vector<uint8_t>;

/// @brief Account address / program identity (32 bytes)
using PublicKey = std::vector<uint8_t>;

/// @brief Slot number representing host time
using Slot = uint64_t;

/// @brief Epoch number used by rent accounting
using Epoch = uint64_t;

/// @brief Native token amount in smallest unit
using Lamports = uint64_t;

/// @brief Size of every address and program identity in bytes
constexpr size_t PUBKEY_SIZE = 32;

/**
 * @brief Configuration for the host runtime and the tally-cli tool
 *
 * Defaults mirror a development cluster; every field can be overridden
 * from a JSON config file or on the command line.
 */
struct RuntimeConfig {
  // Logging
  std::string log_level = "info";           ///< trace/debug/info/warn/error
  bool json_logs = false;                   ///< Emit structured JSON lines

  // Execution budget
  uint64_t max_compute_units = 200000;      ///< Per-transaction compute budget
  uint64_t instruction_base_cost = 150;     ///< Charged before each instruction
  uint64_t invoke_cost = 1000;              ///< Charged per cross-program call

  // Rent parameters
  Lamports lamports_per_byte_year = 3480;   ///< Rent rate
  double exemption_threshold = 2.0;         ///< Years of rent for exemption

  // Tooling
  Lamports payer_funding = 1000000000;      ///< Lamports given to the CLI payer
  uint64_t initial_value = 0;               ///< Counter start value for tally-cli
  uint64_t increments = 1;                  ///< Increment calls issued by tally-cli
  std::string config_file_path;             ///< Path the config was loaded from
};

/**
 * @brief Error payload wrapper used to construct a failed Result
 *
 * Wrapping the error keeps construction unambiguous even when the value
 * and error types are convertible to one another.
 */
template <typename E> struct Err {
  E error;
};

/// @brief Build an Err<E> with type deduction
template <typename E> Err<E> make_error(E error) { return Err<E>{std::move(error)}; }

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Operations on the call path never throw; they return a Result carrying
 * either the success value or a typed error. The error type defaults to a
 * message string for host utilities that only need a description.
 *
 * @tparam T The type of the success value (must be default constructible)
 * @tparam E The type of the error value
 *
 * @note Thread safety: not thread-safe; each instance is used by one thread.
 *
 * Example usage:
 * @code
 * auto state = read_counter_state(data);
 * if (state.is_err()) {
 *     return make_error(state.error());
 * }
 * uint64_t count = state.value().count;
 * @endcode
 */
template <typename T, typename E = std::string>
class Result {
private:
  bool success_;
  T value_;
  E error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value) : success_(true), value_(std::move(value)), error_() {}

  /**
   * @brief Construct a failed result
   * @param err Wrapped error value
   */
  Result(Err<E> err) : success_(false), value_(), error_(std::move(err.error)) {}

  /// Copy constructor
  Result(const Result &other)
      : success_(other.success_), value_(other.value_), error_(other.error_) {}

  /// Move constructor
  Result(Result &&other) noexcept
      : success_(other.success_), value_(std::move(other.value_)),
        error_(std::move(other.error_)) {}

  /// Copy assignment operator
  Result &operator=(const Result &other) {
    if (this != &other) {
      success_ = other.success_;
      value_ = other.value_;
      error_ = other.error_;
    }
    return *this;
  }

  /// Move assignment operator
  Result &operator=(Result &&other) noexcept {
    if (this != &other) {
      success_ = other.success_;
      value_ = std::move(other.value_);
      error_ = std::move(other.error_);
    }
    return *this;
  }

  /// @return true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @return true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /**
   * @brief Get the success value (rvalue reference) for move semantics
   * @warning Only call this if is_ok() returns true
   */
  T &&value() && { return std::move(value_); }

  /**
   * @brief Get the error value
   * @warning Only meaningful if is_err() returns true
   */
  const E &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   * @param default_value Value to return if result is an error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

/// @brief Lowercase hex rendering of a byte vector
std::string to_hex(const std::vector<uint8_t> &bytes);

/// @brief Abbreviated address for log lines ("ab12cd34..")
std::string short_address(const PublicKey &key);

} // namespace common
} // namespace tally

/**
 * @brief Standard library hash specialization for byte vectors
 *
 * Enables PublicKey as a key in std::unordered_map / std::unordered_set.
 */
namespace std {
template <>
struct hash<std::vector<uint8_t>> {
  std::size_t operator()(const std::vector<uint8_t> &v) const noexcept {
    std::size_t seed = v.size();
    for (const auto &byte : v) {
      // Boost-style hash combine
      seed ^= byte + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    }
    return seed;
  }
};
} // namespace std
