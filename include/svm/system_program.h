#pragma once

#include "svm/engine.h"
#include "svm/invoke_context.h"

namespace tally {
namespace svm {

/**
 * System program: account creation, assignment and lamport transfers.
 *
 * Also serves as the AccountCreationService that other programs reach
 * through their InvokeContext.
 *
 * Instruction data layout (little-endian):
 *   0 CreateAccount  [0][lamports u64][space u64][owner 32]  accounts: funder, new
 *   1 Assign         [1][owner 32]                           accounts: account
 *   2 Transfer       [2][lamports u64]                       accounts: from, to
 */
class SystemProgram : public BuiltinProgram, public AccountCreationService {
public:
    static constexpr uint64_t MAX_PERMITTED_DATA_LENGTH = 10 * 1024 * 1024;

    SystemProgram() = default;
    ~SystemProgram() override = default;

    PublicKey get_program_id() const override;
    PublicKey program_id() const override { return get_program_id(); }

    ExecutionOutcome execute(
        const Instruction& instruction,
        const std::vector<AccountInfo>& accounts,
        InvokeContext& context
    ) const override;

    Result<bool, CreationError> create_account(
        const AccountInfo& funder,
        const AccountInfo& new_account,
        Lamports lamports,
        uint64_t space,
        const PublicKey& owner
    ) override;

    // Instruction builders
    static Instruction create_account_instruction(
        const PublicKey& funder, const PublicKey& new_account,
        Lamports lamports, uint64_t space, const PublicKey& owner);
    static Instruction assign_instruction(const PublicKey& account, const PublicKey& owner);
    static Instruction transfer_instruction(const PublicKey& from, const PublicKey& to,
                                            Lamports lamports);

private:
    enum class SystemInstruction : uint8_t {
        CreateAccount = 0,
        Assign = 1,
        Transfer = 2
    };

    Result<bool, CreationError> do_create_account(
        const AccountInfo& funder, const AccountInfo& new_account,
        Lamports lamports, uint64_t space, const PublicKey& owner) const;

    ExecutionOutcome handle_create_account(
        const Instruction& instruction, const std::vector<AccountInfo>& accounts) const;
    ExecutionOutcome handle_assign(
        const Instruction& instruction, const std::vector<AccountInfo>& accounts) const;
    ExecutionOutcome handle_transfer(
        const Instruction& instruction, const std::vector<AccountInfo>& accounts) const;
};

/// Map a creation failure onto the host's execution result codes
ExecutionResult to_execution_result(CreationError error);

} // namespace svm
} // namespace tally
