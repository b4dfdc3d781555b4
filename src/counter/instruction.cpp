#include "counter/instruction.h"
#include "svm/account.h"

namespace tally {
namespace counter {

bool CounterInstruction::operator==(const CounterInstruction& other) const {
    if (kind != other.kind) {
        return false;
    }
    return kind != Kind::InitializeCounter || initial_value == other.initial_value;
}

Result<CounterInstruction, DecodeError> decode_instruction(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return make_error(DecodeError::EMPTY);
    }

    switch (data[0]) {
        case static_cast<uint8_t>(CounterInstruction::Kind::InitializeCounter): {
            if (data.size() != 1 + sizeof(uint64_t)) {
                return make_error(DecodeError::MALFORMED);
            }
            uint64_t initial_value = 0;
            for (int i = 0; i < 8; ++i) {
                initial_value |= static_cast<uint64_t>(data[1 + i]) << (i * 8);
            }
            return Result<CounterInstruction, DecodeError>(
                CounterInstruction::initialize(initial_value));
        }

        case static_cast<uint8_t>(CounterInstruction::Kind::IncrementCounter):
            return Result<CounterInstruction, DecodeError>(CounterInstruction::increment());

        default:
            return make_error(DecodeError::UNKNOWN_OPERATION);
    }
}

std::vector<uint8_t> encode_instruction(const CounterInstruction& instruction) {
    std::vector<uint8_t> data;
    data.push_back(static_cast<uint8_t>(instruction.kind));

    if (instruction.kind == CounterInstruction::Kind::InitializeCounter) {
        for (int i = 0; i < 8; ++i) {
            data.push_back((instruction.initial_value >> (i * 8)) & 0xFF);
        }
    }
    return data;
}

svm::Instruction make_initialize_instruction(const PublicKey& program_id,
                                             const PublicKey& counter,
                                             const PublicKey& payer,
                                             uint64_t initial_value) {
    svm::Instruction instruction;
    instruction.program_id = program_id;
    instruction.accounts = {
        svm::AccountMeta::writable(counter, true),
        svm::AccountMeta::writable(payer, true),
        svm::AccountMeta::readonly(svm::system_program_id(), false),
    };
    instruction.data = encode_instruction(CounterInstruction::initialize(initial_value));
    return instruction;
}

svm::Instruction make_increment_instruction(const PublicKey& program_id,
                                            const PublicKey& counter) {
    svm::Instruction instruction;
    instruction.program_id = program_id;
    instruction.accounts = {svm::AccountMeta::writable(counter, true)};
    instruction.data = encode_instruction(CounterInstruction::increment());
    return instruction;
}

} // namespace counter
} // namespace tally
