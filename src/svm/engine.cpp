#include "svm/engine.h"
#include "common/logging.h"
#include "svm/system_program.h"
#include <algorithm>
#include <optional>

namespace tally {
namespace svm {

const char* to_string(ExecutionResult result) {
    switch (result) {
        case ExecutionResult::SUCCESS: return "SUCCESS";
        case ExecutionResult::COMPUTE_BUDGET_EXCEEDED: return "COMPUTE_BUDGET_EXCEEDED";
        case ExecutionResult::PROGRAM_ERROR: return "PROGRAM_ERROR";
        case ExecutionResult::PROGRAM_NOT_FOUND: return "PROGRAM_NOT_FOUND";
        case ExecutionResult::INVALID_INSTRUCTION: return "INVALID_INSTRUCTION";
        case ExecutionResult::INVALID_ACCOUNT_DATA: return "INVALID_ACCOUNT_DATA";
        case ExecutionResult::ACCOUNT_DATA_TOO_SMALL: return "ACCOUNT_DATA_TOO_SMALL";
        case ExecutionResult::NOT_ENOUGH_ACCOUNT_KEYS: return "NOT_ENOUGH_ACCOUNT_KEYS";
        case ExecutionResult::INCORRECT_PROGRAM_ID: return "INCORRECT_PROGRAM_ID";
        case ExecutionResult::ACCOUNT_BORROW_FAILED: return "ACCOUNT_BORROW_FAILED";
        case ExecutionResult::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case ExecutionResult::MISSING_REQUIRED_SIGNATURE: return "MISSING_REQUIRED_SIGNATURE";
        case ExecutionResult::ACCOUNT_ALREADY_IN_USE: return "ACCOUNT_ALREADY_IN_USE";
        case ExecutionResult::INSUFFICIENT_FUNDS: return "INSUFFICIENT_FUNDS";
        case ExecutionResult::EXTERNAL_ACCOUNT_DATA_MODIFIED: return "EXTERNAL_ACCOUNT_DATA_MODIFIED";
        case ExecutionResult::READONLY_DATA_MODIFIED: return "READONLY_DATA_MODIFIED";
        case ExecutionResult::MODIFIED_PROGRAM_ID: return "MODIFIED_PROGRAM_ID";
        case ExecutionResult::EXTERNAL_ACCOUNT_LAMPORT_SPEND: return "EXTERNAL_ACCOUNT_LAMPORT_SPEND";
        case ExecutionResult::UNBALANCED_INSTRUCTION: return "UNBALANCED_INSTRUCTION";
    }
    return "UNKNOWN";
}

namespace {

struct ComputeMeter {
    uint64_t limit = 0;
    uint64_t consumed = 0;

    bool consume(uint64_t units) {
        if (consumed + units > limit) {
            consumed = limit;
            return false;
        }
        consumed += units;
        return true;
    }
};

ExecutionOutcome failure(ExecutionResult result, const std::string& details) {
    ExecutionOutcome outcome;
    outcome.result = result;
    outcome.error_details = details;
    return outcome;
}

using WritableMap = std::unordered_map<PublicKey, bool>;

/**
 * Compare the accounts an instruction touched against their snapshot.
 * Only the owning program may change data, reassign or debit an account,
 * and the lamport total must be preserved.
 */
ExecutionOutcome verify_account_changes(const PublicKey& program_id,
                                        const AccountMap& working,
                                        const AccountMap& pre_state,
                                        const WritableMap& writable) {
    Lamports lamports_before = 0;
    Lamports lamports_after = 0;

    for (const auto& [key, pre] : pre_state) {
        const Account& post = working.at(key);
        bool owned = pre.owner == program_id;

        if (post.data != pre.data) {
            if (!writable.at(key)) {
                return failure(ExecutionResult::READONLY_DATA_MODIFIED,
                               "Instruction modified data of read-only account " + short_address(key));
            }
            if (!owned) {
                return failure(ExecutionResult::EXTERNAL_ACCOUNT_DATA_MODIFIED,
                               "Instruction modified data of an account it does not own: " +
                                   short_address(key));
            }
        }

        if (post.owner != pre.owner && !owned) {
            return failure(ExecutionResult::MODIFIED_PROGRAM_ID,
                           "Instruction changed the owner of " + short_address(key));
        }

        if (post.lamports < pre.lamports && !owned) {
            return failure(ExecutionResult::EXTERNAL_ACCOUNT_LAMPORT_SPEND,
                           "Instruction spent lamports from " + short_address(key));
        }

        if (lamports_before + pre.lamports < lamports_before ||
            lamports_after + post.lamports < lamports_after) {
            return failure(ExecutionResult::ARITHMETIC_OVERFLOW,
                           "Lamport total exceeds 64 bits");
        }
        lamports_before += pre.lamports;
        lamports_after += post.lamports;
    }

    if (lamports_before != lamports_after) {
        return failure(ExecutionResult::UNBALANCED_INSTRUCTION,
                       "Sum of account balances changed");
    }

    return ExecutionOutcome();
}

/**
 * Per-instruction host context. Owns the account snapshots used to verify
 * that a program only changed what it is allowed to change.
 *
 * A sub-call first verifies the caller's changes so far, then runs the
 * system program and refreshes the snapshots of the accounts it touched,
 * so the caller is checked against the post-sub-call state. A violation
 * found at that boundary is kept and becomes the instruction's result.
 */
class InstructionContext : public InvokeContext, public AccountCreationService {
public:
    InstructionContext(const PublicKey& caller_id, const RentCalculator& rent,
                       SystemProgram& system_program, ComputeMeter& meter,
                       uint64_t invoke_cost, AccountMap& working, AccountMap& pre_state,
                       const WritableMap& writable, std::vector<std::string>& logs)
        : caller_id_(caller_id), rent_(rent), system_program_(system_program),
          meter_(meter), invoke_cost_(invoke_cost), working_(working),
          pre_state_(pre_state), writable_(writable), logs_(logs) {}

    const RentCalculator& rent() const override { return rent_; }

    AccountCreationService& account_creation_service() override { return *this; }

    void log(const std::string& message) override {
        logs_.push_back("Program log: " + message);
        LOG_DEBUG("program", message);
    }

    PublicKey program_id() const override { return system_program_.get_program_id(); }

    Result<bool, CreationError> create_account(
        const AccountInfo& funder,
        const AccountInfo& new_account,
        Lamports lamports,
        uint64_t space,
        const PublicKey& owner) override {

        ExecutionOutcome caller_state =
            verify_account_changes(caller_id_, working_, pre_state_, writable_);
        if (!caller_state.is_success()) {
            LOG_DEBUG("svm", "Sub-call refused: ", caller_state.error_details);
            if (!violation_) {
                violation_ = caller_state;
            }
            return make_error(CreationError::UNAUTHORIZED_ACCOUNT_CHANGE);
        }

        std::string program = short_address(system_program_.get_program_id());
        if (!meter_.consume(invoke_cost_)) {
            logs_.push_back("Program " + program + " failed: compute budget exceeded");
            return make_error(CreationError::COMPUTE_BUDGET_EXCEEDED);
        }

        logs_.push_back("Program " + program + " invoke [2]");
        auto result = system_program_.create_account(funder, new_account, lamports, space, owner);
        if (result.is_err()) {
            logs_.push_back("Program " + program + " failed: " + to_string(result.error()));
            return result;
        }
        logs_.push_back("Program " + program + " success");

        pre_state_[funder.key()] = working_[funder.key()];
        pre_state_[new_account.key()] = working_[new_account.key()];
        return result;
    }

    /// First rule violation found at a sub-call boundary, if any
    const std::optional<ExecutionOutcome>& violation() const { return violation_; }

private:
    const PublicKey& caller_id_;
    const RentCalculator& rent_;
    SystemProgram& system_program_;
    ComputeMeter& meter_;
    uint64_t invoke_cost_;
    AccountMap& working_;
    AccountMap& pre_state_;
    const WritableMap& writable_;
    std::vector<std::string>& logs_;
    std::optional<ExecutionOutcome> violation_;
};

} // namespace

// ExecutionEngine implementation
class ExecutionEngine::Impl {
public:
    std::vector<std::unique_ptr<BuiltinProgram>> builtin_programs_;
    SystemProgram* system_program_ = nullptr;
    RentCalculator rent_;
    uint64_t max_compute_units_ = 200000; // Default compute budget
    uint64_t instruction_base_cost_ = 150;
    uint64_t invoke_cost_ = 1000;

    // Statistics
    uint64_t total_instructions_executed_ = 0;
    uint64_t total_compute_units_consumed_ = 0;
    uint64_t failed_transactions_ = 0;

    BuiltinProgram* find_program(const PublicKey& program_id) const {
        for (const auto& builtin : builtin_programs_) {
            if (builtin->get_program_id() == program_id) {
                return builtin.get();
            }
        }
        return nullptr;
    }

    ExecutionOutcome execute_instruction(const Instruction& instruction,
                                         AccountMap& working,
                                         ComputeMeter& meter,
                                         std::vector<std::string>& logs);

};

ExecutionOutcome ExecutionEngine::Impl::execute_instruction(
    const Instruction& instruction,
    AccountMap& working,
    ComputeMeter& meter,
    std::vector<std::string>& logs) {

    std::string program_name = short_address(instruction.program_id);

    BuiltinProgram* program = find_program(instruction.program_id);
    if (!program) {
        return failure(ExecutionResult::PROGRAM_NOT_FOUND,
                       "Program not found: " + program_name);
    }

    if (!meter.consume(instruction_base_cost_)) {
        return failure(ExecutionResult::COMPUTE_BUDGET_EXCEEDED,
                       "Transaction exceeded compute budget");
    }

    logs.push_back("Program " + program_name + " invoke [1]");

    // Materialize every referenced account; unknown addresses start empty
    std::unordered_map<PublicKey, bool> signer;
    WritableMap writable;
    for (const auto& meta : instruction.accounts) {
        if (working.find(meta.pubkey) == working.end()) {
            Account empty;
            empty.executable = find_program(meta.pubkey) != nullptr;
            working.emplace(meta.pubkey, empty);
        }
        signer[meta.pubkey] = signer[meta.pubkey] || meta.is_signer;
        writable[meta.pubkey] = writable[meta.pubkey] || meta.is_writable;
    }

    AccountMap pre_state;
    std::unordered_map<PublicKey, std::shared_ptr<BorrowState>> borrows;
    for (const auto& meta : instruction.accounts) {
        pre_state[meta.pubkey] = working[meta.pubkey];
        if (!borrows[meta.pubkey]) {
            borrows[meta.pubkey] = std::make_shared<BorrowState>();
        }
    }

    // Handles into the working map stay valid: no insertions until verification
    std::vector<AccountInfo> infos;
    infos.reserve(instruction.accounts.size());
    for (const auto& meta : instruction.accounts) {
        infos.emplace_back(meta.pubkey, &working[meta.pubkey], signer[meta.pubkey],
                           writable[meta.pubkey], borrows[meta.pubkey]);
    }

    LOG_TRACE("svm", "Invoking ", program_name, " with ", instruction.accounts.size(),
              " accounts and ", instruction.data.size(), " data bytes");

    InstructionContext context(instruction.program_id, rent_, *system_program_, meter,
                               invoke_cost_, working, pre_state, writable, logs);
    ExecutionOutcome outcome = program->execute(instruction, infos, context);

    if (context.violation()) {
        outcome = *context.violation();
    } else if (outcome.is_success()) {
        outcome = verify_account_changes(instruction.program_id, working, pre_state, writable);
    }

    if (outcome.is_success()) {
        logs.push_back("Program " + program_name + " success");
    } else {
        logs.push_back("Program " + program_name + " failed: " + outcome.error_details);
    }
    return outcome;
}

ExecutionEngine::ExecutionEngine() : impl_(std::make_unique<Impl>()) {
    register_builtin_program(std::make_unique<SystemProgram>());
}

ExecutionEngine::ExecutionEngine(const RuntimeConfig& config) : ExecutionEngine() {
    impl_->rent_ = RentCalculator::from_config(config);
    impl_->max_compute_units_ = config.max_compute_units;
    impl_->instruction_base_cost_ = config.instruction_base_cost;
    impl_->invoke_cost_ = config.invoke_cost;
}

ExecutionEngine::~ExecutionEngine() = default;

void ExecutionEngine::register_builtin_program(std::unique_ptr<BuiltinProgram> program) {
    LOG_DEBUG("svm", "Registered builtin program ", short_address(program->get_program_id()));
    if (!impl_->system_program_) {
        impl_->system_program_ = dynamic_cast<SystemProgram*>(program.get());
    }
    impl_->builtin_programs_.push_back(std::move(program));
}

bool ExecutionEngine::is_program_loaded(const PublicKey& program_id) const {
    return impl_->find_program(program_id) != nullptr;
}

ExecutionOutcome ExecutionEngine::execute_transaction(
    const std::vector<Instruction>& instructions,
    AccountMap& accounts) {

    ExecutionOutcome final_outcome;
    ComputeMeter meter{impl_->max_compute_units_, 0};

    // All instructions run against a working copy; committed only on success
    AccountMap working = accounts;

    for (const auto& instruction : instructions) {
        auto outcome = impl_->execute_instruction(instruction, working, meter,
                                                  final_outcome.logs);
        if (!outcome.is_success()) {
            final_outcome.result = outcome.result;
            final_outcome.error_details = outcome.error_details;
            break;
        }
        impl_->total_instructions_executed_++;
    }

    final_outcome.compute_units_consumed = meter.consumed;
    final_outcome.logs.push_back("Consumed " + std::to_string(meter.consumed) + " of " +
                                 std::to_string(meter.limit) + " compute units");
    impl_->total_compute_units_consumed_ += meter.consumed;

    if (!final_outcome.is_success()) {
        impl_->failed_transactions_++;
        LOG_DEBUG("svm", "Transaction failed: ", to_string(final_outcome.result),
                  " (", final_outcome.error_details, ")");
        return final_outcome;
    }

    // Zero-lamport accounts are not persisted
    for (auto it = working.begin(); it != working.end();) {
        if (it->second.lamports == 0) {
            it = working.erase(it);
        } else {
            ++it;
        }
    }
    accounts = std::move(working);

    return final_outcome;
}

void ExecutionEngine::set_compute_budget(uint64_t max_compute_units) {
    impl_->max_compute_units_ = max_compute_units;
}

const RentCalculator& ExecutionEngine::rent() const {
    return impl_->rent_;
}

uint64_t ExecutionEngine::get_total_instructions_executed() const {
    return impl_->total_instructions_executed_;
}

uint64_t ExecutionEngine::get_total_compute_units_consumed() const {
    return impl_->total_compute_units_consumed_;
}

uint64_t ExecutionEngine::get_failed_transaction_count() const {
    return impl_->failed_transactions_;
}

} // namespace svm
} // namespace tally
