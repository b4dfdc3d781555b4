#include "counter/processor.h"
#include "common/crypto_utils.h"
#include "common/logging.h"
#include "counter/accounts.h"
#include "counter/state.h"
#include "svm/system_program.h"
#include <limits>

namespace tally {
namespace counter {

Result<bool, ProcessError> process_instruction(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    const std::vector<uint8_t>& data,
    svm::InvokeContext& context) {

    auto decoded = decode_instruction(data);
    if (decoded.is_err()) {
        LOG_DEBUG("counter", "Rejected instruction: ", to_string(decoded.error()));
        return make_error(ProcessError::from(decoded.error()));
    }

    const CounterInstruction& instruction = decoded.value();
    switch (instruction.kind) {
        case CounterInstruction::Kind::InitializeCounter:
            return process_initialize_counter(program_id, accounts,
                                              instruction.initial_value, context);
        case CounterInstruction::Kind::IncrementCounter:
            return process_increment_counter(program_id, accounts, context);
    }
    return make_error(ProcessError::from(DecodeError::UNKNOWN_OPERATION));
}

Result<bool, ProcessError> process_initialize_counter(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    uint64_t initial_value,
    svm::InvokeContext& context) {

    auto resolved = resolve_initialize_accounts(accounts);
    if (resolved.is_err()) {
        return make_error(ProcessError::from(resolved.error()));
    }
    const InitializeAccounts& roles = resolved.value();

    svm::AccountCreationService& creation_service = context.account_creation_service();
    if (roles.system_program->key() != creation_service.program_id()) {
        return make_error(ProcessError::from(svm::CreationError::INCORRECT_PROGRAM_ID));
    }

    Lamports required_lamports = context.rent().minimum_balance(COUNTER_ACCOUNT_SIZE);

    auto created = creation_service.create_account(*roles.payer, *roles.counter,
                                                   required_lamports,
                                                   COUNTER_ACCOUNT_SIZE, program_id);
    if (created.is_err()) {
        return make_error(ProcessError::from(created.error()));
    }

    auto lease = roles.counter->try_borrow_mut_data();
    if (lease.is_err()) {
        return make_error(ProcessError::borrow_failed());
    }
    auto data = std::move(lease).value();

    auto written = write_counter_state(CounterState{initial_value}, *data);
    if (written.is_err()) {
        LOG_PROGRAM_ERROR("Counter account smaller than its fixed layout", "ENCODE_FAILED",
                          {{"account", to_hex(roles.counter->key())},
                           {"data_len", std::to_string(data->size())}});
        return make_error(ProcessError::from(written.error()));
    }

    context.log("Counter initialized with value " + std::to_string(initial_value));
    return Result<bool, ProcessError>(true);
}

Result<bool, ProcessError> process_increment_counter(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts,
    svm::InvokeContext& context) {

    auto resolved = resolve_increment_accounts(program_id, accounts);
    if (resolved.is_err()) {
        return make_error(ProcessError::from(resolved.error()));
    }
    const IncrementAccounts& roles = resolved.value();

    auto lease = roles.counter->try_borrow_mut_data();
    if (lease.is_err()) {
        return make_error(ProcessError::borrow_failed());
    }
    auto data = std::move(lease).value();

    auto current = read_counter_state(*data);
    if (current.is_err()) {
        return make_error(ProcessError::from(current.error()));
    }

    CounterState state = current.value();
    if (state.count == std::numeric_limits<uint64_t>::max()) {
        return make_error(ProcessError::overflow());
    }
    state.count += 1;

    auto written = write_counter_state(state, *data);
    if (written.is_err()) {
        LOG_PROGRAM_ERROR("Counter account smaller than its fixed layout", "ENCODE_FAILED",
                          {{"account", to_hex(roles.counter->key())},
                           {"data_len", std::to_string(data->size())}});
        return make_error(ProcessError::from(written.error()));
    }

    context.log("Counter incremented to " + std::to_string(state.count));
    return Result<bool, ProcessError>(true);
}

svm::ExecutionResult to_execution_result(const ProcessError& error) {
    switch (error.kind) {
        case ProcessError::Kind::DECODE:
            return error.decode == DecodeError::TRUNCATED
                       ? svm::ExecutionResult::INVALID_ACCOUNT_DATA
                       : svm::ExecutionResult::INVALID_INSTRUCTION;
        case ProcessError::Kind::RESOLVE:
            return error.resolve == ResolverError::NOT_OWNER
                       ? svm::ExecutionResult::INCORRECT_PROGRAM_ID
                       : svm::ExecutionResult::NOT_ENOUGH_ACCOUNT_KEYS;
        case ProcessError::Kind::CREATION_FAILED:
            return svm::to_execution_result(error.creation);
        case ProcessError::Kind::ARITHMETIC_OVERFLOW:
            return svm::ExecutionResult::ARITHMETIC_OVERFLOW;
        case ProcessError::Kind::ENCODE:
            return svm::ExecutionResult::ACCOUNT_DATA_TOO_SMALL;
        case ProcessError::Kind::ACCOUNT_BORROW_FAILED:
            return svm::ExecutionResult::ACCOUNT_BORROW_FAILED;
    }
    return svm::ExecutionResult::PROGRAM_ERROR;
}

// CounterProgram implementation
CounterProgram::CounterProgram()
    : program_id_(CryptoUtils::derive_program_id(DEFAULT_PROGRAM_NAME)) {}

CounterProgram::CounterProgram(PublicKey program_id)
    : program_id_(std::move(program_id)) {}

PublicKey CounterProgram::get_program_id() const {
    return program_id_;
}

svm::ExecutionOutcome CounterProgram::execute(
    const svm::Instruction& instruction,
    const std::vector<svm::AccountInfo>& accounts,
    svm::InvokeContext& context) const {

    svm::ExecutionOutcome outcome;
    auto result = process_instruction(program_id_, accounts, instruction.data, context);
    if (result.is_err()) {
        outcome.result = to_execution_result(result.error());
        outcome.error_details = result.error().to_string();
    }
    return outcome;
}

} // namespace counter
} // namespace tally
