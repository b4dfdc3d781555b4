#pragma once

#include "common/types.h"
#include "svm/account.h"
#include "svm/rent_calculator.h"
#include <string>

namespace tally {
namespace svm {

using namespace tally::common;

/**
 * Failure reported by the account-creation service
 */
enum class CreationError {
    ACCOUNT_ALREADY_IN_USE,
    INSUFFICIENT_FUNDS,
    MISSING_REQUIRED_SIGNATURE,
    ACCOUNT_NOT_WRITABLE,
    INVALID_ACCOUNT_DATA_LENGTH,
    INCORRECT_PROGRAM_ID,
    ACCOUNT_BORROW_FAILED,
    COMPUTE_BUDGET_EXCEEDED,
    INVALID_FUNDER,              // Funder is not a plain system account
    UNAUTHORIZED_ACCOUNT_CHANGE  // Caller broke an account rule before the call
};

const char* to_string(CreationError error);

/**
 * Account-creation capability (the host's system program).
 *
 * Allocates @p space zeroed bytes for @p new_account, moves @p lamports from
 * @p funder into it and assigns it to @p owner. The call either completes
 * or fails as a whole.
 */
class AccountCreationService {
public:
    virtual ~AccountCreationService() = default;

    /// Identity a caller must supply as the service account
    virtual PublicKey program_id() const = 0;

    virtual Result<bool, CreationError> create_account(
        const AccountInfo& funder,
        const AccountInfo& new_account,
        Lamports lamports,
        uint64_t space,
        const PublicKey& owner
    ) = 0;
};

/**
 * Host capabilities available to a program while it processes one
 * instruction. Only valid for the duration of that call.
 */
class InvokeContext {
public:
    virtual ~InvokeContext() = default;

    /// Rent sysvar
    virtual const RentCalculator& rent() const = 0;

    /// Synchronous sub-call into the account-creation service
    virtual AccountCreationService& account_creation_service() = 0;

    /// Program diagnostic output ("Program log: ...")
    virtual void log(const std::string& message) = 0;
};

} // namespace svm
} // namespace tally
