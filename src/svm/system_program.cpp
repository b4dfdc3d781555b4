#include "svm/system_program.h"
#include "common/logging.h"
#include <algorithm>
#include <limits>

namespace tally {
namespace svm {

namespace {

void append_u64_le(std::vector<uint8_t>& out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out.push_back((value >> (i * 8)) & 0xFF);
    }
}

uint64_t read_u64_le(const std::vector<uint8_t>& data, size_t offset) {
    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(data[offset + i]) << (i * 8);
    }
    return value;
}

ExecutionOutcome failure(ExecutionResult result, const std::string& details) {
    ExecutionOutcome outcome;
    outcome.result = result;
    outcome.error_details = details;
    return outcome;
}

} // namespace

const char* to_string(CreationError error) {
    switch (error) {
        case CreationError::ACCOUNT_ALREADY_IN_USE:
            return "account already in use";
        case CreationError::INSUFFICIENT_FUNDS:
            return "insufficient funds";
        case CreationError::MISSING_REQUIRED_SIGNATURE:
            return "missing required signature";
        case CreationError::ACCOUNT_NOT_WRITABLE:
            return "account not writable";
        case CreationError::INVALID_ACCOUNT_DATA_LENGTH:
            return "invalid account data length";
        case CreationError::INCORRECT_PROGRAM_ID:
            return "incorrect program id";
        case CreationError::ACCOUNT_BORROW_FAILED:
            return "account borrow failed";
        case CreationError::COMPUTE_BUDGET_EXCEEDED:
            return "compute budget exceeded";
        case CreationError::INVALID_FUNDER:
            return "funder must be a system account without data";
        case CreationError::UNAUTHORIZED_ACCOUNT_CHANGE:
            return "caller modified an account it may not change";
    }
    return "unknown creation error";
}

ExecutionResult to_execution_result(CreationError error) {
    switch (error) {
        case CreationError::ACCOUNT_ALREADY_IN_USE:
            return ExecutionResult::ACCOUNT_ALREADY_IN_USE;
        case CreationError::INSUFFICIENT_FUNDS:
            return ExecutionResult::INSUFFICIENT_FUNDS;
        case CreationError::MISSING_REQUIRED_SIGNATURE:
            return ExecutionResult::MISSING_REQUIRED_SIGNATURE;
        case CreationError::ACCOUNT_NOT_WRITABLE:
            return ExecutionResult::READONLY_DATA_MODIFIED;
        case CreationError::INVALID_ACCOUNT_DATA_LENGTH:
            return ExecutionResult::INVALID_ACCOUNT_DATA;
        case CreationError::INCORRECT_PROGRAM_ID:
            return ExecutionResult::INCORRECT_PROGRAM_ID;
        case CreationError::ACCOUNT_BORROW_FAILED:
            return ExecutionResult::ACCOUNT_BORROW_FAILED;
        case CreationError::COMPUTE_BUDGET_EXCEEDED:
            return ExecutionResult::COMPUTE_BUDGET_EXCEEDED;
        case CreationError::INVALID_FUNDER:
            return ExecutionResult::INVALID_ACCOUNT_DATA;
        case CreationError::UNAUTHORIZED_ACCOUNT_CHANGE:
            return ExecutionResult::EXTERNAL_ACCOUNT_DATA_MODIFIED;
    }
    return ExecutionResult::PROGRAM_ERROR;
}

PublicKey SystemProgram::get_program_id() const {
    return system_program_id();
}

Result<bool, CreationError> SystemProgram::create_account(
    const AccountInfo& funder,
    const AccountInfo& new_account,
    Lamports lamports,
    uint64_t space,
    const PublicKey& owner) {
    return do_create_account(funder, new_account, lamports, space, owner);
}

Result<bool, CreationError> SystemProgram::do_create_account(
    const AccountInfo& funder,
    const AccountInfo& new_account,
    Lamports lamports,
    uint64_t space,
    const PublicKey& owner) const {

    if (new_account.lamports() > 0 || new_account.data_len() > 0 ||
        new_account.owner() != system_program_id()) {
        LOG_DEBUG("svm", "Create account: ", short_address(new_account.key()),
                  " already in use");
        return make_error(CreationError::ACCOUNT_ALREADY_IN_USE);
    }

    if (!funder.is_signer() || !new_account.is_signer()) {
        return make_error(CreationError::MISSING_REQUIRED_SIGNATURE);
    }

    if (!funder.is_writable() || !new_account.is_writable()) {
        return make_error(CreationError::ACCOUNT_NOT_WRITABLE);
    }

    // Only the system program may debit the funder
    if (funder.owner() != system_program_id() || funder.data_len() > 0) {
        LOG_DEBUG("svm", "Create account: funder ", short_address(funder.key()),
                  " is not a system account");
        return make_error(CreationError::INVALID_FUNDER);
    }

    if (space > MAX_PERMITTED_DATA_LENGTH) {
        return make_error(CreationError::INVALID_ACCOUNT_DATA_LENGTH);
    }

    if (funder.lamports() < lamports) {
        LOG_DEBUG("svm", "Create account: funder ", short_address(funder.key()),
                  " has ", funder.lamports(), " lamports, need ", lamports);
        return make_error(CreationError::INSUFFICIENT_FUNDS);
    }

    auto realloc_result = new_account.realloc(static_cast<size_t>(space));
    if (realloc_result.is_err()) {
        return make_error(CreationError::ACCOUNT_BORROW_FAILED);
    }

    funder.set_lamports(funder.lamports() - lamports);
    new_account.set_lamports(new_account.lamports() + lamports);
    new_account.assign(owner);

    return Result<bool, CreationError>(true);
}

ExecutionOutcome SystemProgram::execute(
    const Instruction& instruction,
    const std::vector<AccountInfo>& accounts,
    InvokeContext& context) const {

    if (instruction.data.empty()) {
        return failure(ExecutionResult::INVALID_INSTRUCTION, "Empty instruction data");
    }

    SystemInstruction instr_type = static_cast<SystemInstruction>(instruction.data[0]);

    switch (instr_type) {
        case SystemInstruction::CreateAccount:
            return handle_create_account(instruction, accounts);

        case SystemInstruction::Assign:
            return handle_assign(instruction, accounts);

        case SystemInstruction::Transfer:
            return handle_transfer(instruction, accounts);

        default:
            context.log("Unknown system instruction type " +
                        std::to_string(instruction.data[0]));
            return failure(ExecutionResult::INVALID_INSTRUCTION,
                           "Unknown system program instruction type: " +
                               std::to_string(instruction.data[0]));
    }
}

ExecutionOutcome SystemProgram::handle_create_account(
    const Instruction& instruction,
    const std::vector<AccountInfo>& accounts) const {

    if (instruction.data.size() != 1 + 8 + 8 + PUBKEY_SIZE) {
        return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed CreateAccount data");
    }
    if (accounts.size() < 2) {
        return failure(ExecutionResult::NOT_ENOUGH_ACCOUNT_KEYS,
                       "CreateAccount requires at least 2 accounts");
    }

    Lamports lamports = read_u64_le(instruction.data, 1);
    uint64_t space = read_u64_le(instruction.data, 9);
    PublicKey owner(instruction.data.begin() + 17, instruction.data.end());

    auto result = do_create_account(accounts[0], accounts[1], lamports, space, owner);
    if (result.is_err()) {
        return failure(to_execution_result(result.error()),
                       std::string("CreateAccount failed: ") + to_string(result.error()));
    }
    return ExecutionOutcome();
}

ExecutionOutcome SystemProgram::handle_assign(
    const Instruction& instruction,
    const std::vector<AccountInfo>& accounts) const {

    if (instruction.data.size() != 1 + PUBKEY_SIZE) {
        return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed Assign data");
    }
    if (accounts.empty()) {
        return failure(ExecutionResult::NOT_ENOUGH_ACCOUNT_KEYS,
                       "Assign requires at least 1 account");
    }

    const AccountInfo& account = accounts[0];
    if (!account.is_signer()) {
        return failure(ExecutionResult::MISSING_REQUIRED_SIGNATURE,
                       "Assign requires the account to sign");
    }
    if (account.owner() != system_program_id()) {
        return failure(ExecutionResult::MODIFIED_PROGRAM_ID,
                       "Assign requires a system-owned account");
    }

    account.assign(PublicKey(instruction.data.begin() + 1, instruction.data.end()));
    return ExecutionOutcome();
}

ExecutionOutcome SystemProgram::handle_transfer(
    const Instruction& instruction,
    const std::vector<AccountInfo>& accounts) const {

    if (instruction.data.size() != 1 + 8) {
        return failure(ExecutionResult::INVALID_INSTRUCTION, "Malformed Transfer data");
    }
    if (accounts.size() < 2) {
        return failure(ExecutionResult::NOT_ENOUGH_ACCOUNT_KEYS,
                       "Transfer requires at least 2 accounts");
    }

    const AccountInfo& from = accounts[0];
    const AccountInfo& to = accounts[1];
    Lamports lamports = read_u64_le(instruction.data, 1);

    if (!from.is_signer()) {
        return failure(ExecutionResult::MISSING_REQUIRED_SIGNATURE,
                       "Transfer requires the source to sign");
    }
    if (from.data_len() > 0) {
        return failure(ExecutionResult::INVALID_ACCOUNT_DATA,
                       "Transfer source must not carry data");
    }
    if (from.lamports() < lamports) {
        return failure(ExecutionResult::INSUFFICIENT_FUNDS, "Transfer source has insufficient funds");
    }
    if (to.lamports() > std::numeric_limits<Lamports>::max() - lamports) {
        return failure(ExecutionResult::ARITHMETIC_OVERFLOW,
                       "Transfer would overflow the destination balance");
    }

    from.set_lamports(from.lamports() - lamports);
    to.set_lamports(to.lamports() + lamports);
    return ExecutionOutcome();
}

Instruction SystemProgram::create_account_instruction(
    const PublicKey& funder, const PublicKey& new_account,
    Lamports lamports, uint64_t space, const PublicKey& owner) {

    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(funder, true),
                            AccountMeta::writable(new_account, true)};
    instruction.data.push_back(static_cast<uint8_t>(SystemInstruction::CreateAccount));
    append_u64_le(instruction.data, lamports);
    append_u64_le(instruction.data, space);
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction SystemProgram::assign_instruction(const PublicKey& account, const PublicKey& owner) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(account, true)};
    instruction.data.push_back(static_cast<uint8_t>(SystemInstruction::Assign));
    instruction.data.insert(instruction.data.end(), owner.begin(), owner.end());
    return instruction;
}

Instruction SystemProgram::transfer_instruction(const PublicKey& from, const PublicKey& to,
                                                Lamports lamports) {
    Instruction instruction;
    instruction.program_id = system_program_id();
    instruction.accounts = {AccountMeta::writable(from, true),
                            AccountMeta::writable(to, false)};
    instruction.data.push_back(static_cast<uint8_t>(SystemInstruction::Transfer));
    append_u64_le(instruction.data, lamports);
    return instruction;
}

} // namespace svm
} // namespace tally
