#pragma once

#include "common/types.h"
#include "counter/error.h"
#include "counter/instruction.h"
#include "svm/engine.h"
#include "svm/invoke_context.h"
#include <vector>

namespace tally {
namespace counter {

using namespace tally::common;

/**
 * Counter program entry point, invoked by the host once per instruction.
 *
 * Decodes @p data, resolves @p accounts for the operation and applies it to
 * the counter account. Holds no state between calls; on failure the host
 * discards every effect of the call.
 */
Result<bool, ProcessError> process_instruction(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    const std::vector<uint8_t>& data,
    svm::InvokeContext& context);

Result<bool, ProcessError> process_initialize_counter(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    uint64_t initial_value,
    svm::InvokeContext& context);

Result<bool, ProcessError> process_increment_counter(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    svm::InvokeContext& context);

/// Map a program failure onto the host's execution result codes
svm::ExecutionResult to_execution_result(const ProcessError& error);

/**
 * Adapts the counter processor to the engine's builtin program interface
 */
class CounterProgram : public svm::BuiltinProgram {
public:
    static constexpr const char* DEFAULT_PROGRAM_NAME = "counter_program";

    CounterProgram();
    explicit CounterProgram(PublicKey program_id);
    ~CounterProgram() override = default;

    PublicKey get_program_id() const override;

    svm::ExecutionOutcome execute(
        const svm::Instruction& instruction,
        const std::vector<svm::AccountInfo>& accounts,
        svm::InvokeContext& context
    ) const override;

private:
    PublicKey program_id_;
};

} // namespace counter
} // namespace tally
