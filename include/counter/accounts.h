#pragma once

#include "common/types.h"
#include "counter/error.h"
#include "svm/account.h"
#include <vector>

namespace tally {
namespace counter {

using namespace tally::common;

/**
 * Named account roles for InitializeCounter.
 * Pointers refer into the caller's account list and live as long as it does.
 */
struct InitializeAccounts {
    const svm::AccountInfo* counter = nullptr;         // new counter account, signs
    const svm::AccountInfo* payer = nullptr;           // funds creation, signs
    const svm::AccountInfo* system_program = nullptr;  // account-creation service
};

/**
 * Named account roles for IncrementCounter
 */
struct IncrementAccounts {
    const svm::AccountInfo* counter = nullptr;
};

/// Requires at least three accounts: counter, payer, system program
Result<InitializeAccounts, ResolverError> resolve_initialize_accounts(
    const std::vector<svm::AccountInfo>& accounts);

/// Requires the counter account to be owned by @p program_id
Result<IncrementAccounts, ResolverError> resolve_increment_accounts(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts);

} // namespace counter
} // namespace tally
