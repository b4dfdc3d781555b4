#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/invoke_context.h"
#include "svm/rent_calculator.h"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace tally {
namespace svm {

using namespace tally::common;

/// Account store keyed by address; the engine commits into it
using AccountMap = std::unordered_map<PublicKey, Account>;

/**
 * Account reference inside an instruction
 */
struct AccountMeta {
    PublicKey pubkey;
    bool is_signer = false;
    bool is_writable = false;

    static AccountMeta writable(const PublicKey& key, bool signer) {
        return AccountMeta{key, signer, true};
    }
    static AccountMeta readonly(const PublicKey& key, bool signer) {
        return AccountMeta{key, signer, false};
    }
};

/**
 * Instruction to be executed by the SVM
 */
struct Instruction {
    PublicKey program_id;
    std::vector<AccountMeta> accounts;
    std::vector<uint8_t> data;
};

/**
 * SVM execution result
 */
enum class ExecutionResult {
    SUCCESS,
    COMPUTE_BUDGET_EXCEEDED,
    PROGRAM_ERROR,
    PROGRAM_NOT_FOUND,
    INVALID_INSTRUCTION,
    INVALID_ACCOUNT_DATA,
    ACCOUNT_DATA_TOO_SMALL,
    NOT_ENOUGH_ACCOUNT_KEYS,
    INCORRECT_PROGRAM_ID,
    ACCOUNT_BORROW_FAILED,
    ARITHMETIC_OVERFLOW,
    MISSING_REQUIRED_SIGNATURE,
    ACCOUNT_ALREADY_IN_USE,
    INSUFFICIENT_FUNDS,
    EXTERNAL_ACCOUNT_DATA_MODIFIED,
    READONLY_DATA_MODIFIED,
    MODIFIED_PROGRAM_ID,
    EXTERNAL_ACCOUNT_LAMPORT_SPEND,
    UNBALANCED_INSTRUCTION
};

const char* to_string(ExecutionResult result);

struct ExecutionOutcome {
    ExecutionResult result = ExecutionResult::SUCCESS;
    uint64_t compute_units_consumed = 0;
    std::string error_details;
    std::vector<std::string> logs;  // Program output logs

    bool is_success() const { return result == ExecutionResult::SUCCESS; }
};

/**
 * Built-in program interface
 *
 * @p accounts holds one handle per AccountMeta of the instruction, in order.
 * The returned outcome only needs result and error_details; the engine
 * fills in compute units and logs.
 */
class BuiltinProgram {
public:
    virtual ~BuiltinProgram() = default;
    virtual PublicKey get_program_id() const = 0;
    virtual ExecutionOutcome execute(
        const Instruction& instruction,
        const std::vector<AccountInfo>& accounts,
        InvokeContext& context
    ) const = 0;
};

/**
 * SVM execution engine
 *
 * Runs transactions against an AccountMap with all-or-nothing semantics:
 * accounts are updated only if every instruction succeeds.
 */
class ExecutionEngine {
public:
    ExecutionEngine();
    explicit ExecutionEngine(const RuntimeConfig& config);
    ~ExecutionEngine();

    // Program management
    void register_builtin_program(std::unique_ptr<BuiltinProgram> program);
    bool is_program_loaded(const PublicKey& program_id) const;

    // Transaction execution
    ExecutionOutcome execute_transaction(
        const std::vector<Instruction>& instructions,
        AccountMap& accounts
    );

    // Configuration
    void set_compute_budget(uint64_t max_compute_units);
    const RentCalculator& rent() const;

    // Statistics
    uint64_t get_total_instructions_executed() const;
    uint64_t get_total_compute_units_consumed() const;
    uint64_t get_failed_transaction_count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace svm
} // namespace tally
