#include "counter/state.h"

namespace tally {
namespace counter {

Result<CounterState, DecodeError> read_counter_state(const std::vector<uint8_t>& data) {
    if (data.size() < COUNTER_ACCOUNT_SIZE) {
        return make_error(DecodeError::TRUNCATED);
    }

    CounterState state;
    for (size_t i = 0; i < COUNTER_ACCOUNT_SIZE; ++i) {
        state.count |= static_cast<uint64_t>(data[i]) << (i * 8);
    }
    return Result<CounterState, DecodeError>(state);
}

Result<bool, EncodeError> write_counter_state(const CounterState& state,
                                              std::vector<uint8_t>& data) {
    if (data.size() < COUNTER_ACCOUNT_SIZE) {
        return make_error(EncodeError::INSUFFICIENT_SPACE);
    }

    for (size_t i = 0; i < COUNTER_ACCOUNT_SIZE; ++i) {
        data[i] = (state.count >> (i * 8)) & 0xFF;
    }
    return Result<bool, EncodeError>(true);
}

} // namespace counter
} // namespace tally
