#pragma once

#include "common/types.h"
#include "counter/error.h"
#include <vector>

namespace tally {
namespace counter {

using namespace tally::common;

/// Persisted size of a counter account: one little-endian u64, no framing
constexpr size_t COUNTER_ACCOUNT_SIZE = 8;

/**
 * Counter value as stored in the account's data region
 */
struct CounterState {
    uint64_t count = 0;

    bool operator==(const CounterState& other) const { return count == other.count; }
    bool operator!=(const CounterState& other) const { return count != other.count; }
};

/**
 * Decode the counter from the first 8 bytes of @p data. Trailing bytes are
 * ignored; fewer than 8 bytes is DecodeError::TRUNCATED.
 */
Result<CounterState, DecodeError> read_counter_state(const std::vector<uint8_t>& data);

/**
 * Encode @p state into the first 8 bytes of @p data, leaving the rest of
 * the region untouched. Fails with EncodeError::INSUFFICIENT_SPACE when the
 * region is smaller than 8 bytes (nothing is written).
 */
Result<bool, EncodeError> write_counter_state(const CounterState& state,
                                              std::vector<uint8_t>& data);

} // namespace counter
} // namespace tally
