#pragma once

#include "common/types.h"
#include "counter/error.h"
#include "svm/engine.h"
#include <vector>

namespace tally {
namespace counter {

using namespace tally::common;

/**
 * Decoded counter program instruction.
 *
 * Wire format: byte 0 is the discriminant.
 *   0 InitializeCounter  followed by exactly 8 bytes, little-endian u64
 *   1 IncrementCounter   trailing bytes ignored
 */
struct CounterInstruction {
    enum class Kind : uint8_t {
        InitializeCounter = 0,
        IncrementCounter = 1
    };

    Kind kind = Kind::InitializeCounter;
    uint64_t initial_value = 0;  // InitializeCounter only

    static CounterInstruction initialize(uint64_t initial_value) {
        return CounterInstruction{Kind::InitializeCounter, initial_value};
    }
    static CounterInstruction increment() {
        return CounterInstruction{Kind::IncrementCounter, 0};
    }

    bool operator==(const CounterInstruction& other) const;
};

Result<CounterInstruction, DecodeError> decode_instruction(const std::vector<uint8_t>& data);

/// Canonical wire form: 9 bytes for InitializeCounter, 1 byte for IncrementCounter
std::vector<uint8_t> encode_instruction(const CounterInstruction& instruction);

/**
 * Client-side instruction builders. Account order matches what the
 * processor resolves: counter, payer, system program.
 */
svm::Instruction make_initialize_instruction(const PublicKey& program_id,
                                             const PublicKey& counter,
                                             const PublicKey& payer,
                                             uint64_t initial_value);

svm::Instruction make_increment_instruction(const PublicKey& program_id,
                                            const PublicKey& counter);

} // namespace counter
} // namespace tally
