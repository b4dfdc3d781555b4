#include "counter/accounts.h"
#include "common/logging.h"

namespace tally {
namespace counter {

namespace {

constexpr size_t INITIALIZE_ACCOUNT_COUNT = 3;
constexpr size_t INCREMENT_ACCOUNT_COUNT = 1;

} // namespace

Result<InitializeAccounts, ResolverError> resolve_initialize_accounts(
    const std::vector<svm::AccountInfo>& accounts) {

    if (accounts.size() < INITIALIZE_ACCOUNT_COUNT) {
        LOG_DEBUG("counter", "InitializeCounter needs ", INITIALIZE_ACCOUNT_COUNT,
                  " accounts, got ", accounts.size());
        return make_error(ResolverError::MISSING_ACCOUNT);
    }

    InitializeAccounts roles;
    roles.counter = &accounts[0];
    roles.payer = &accounts[1];
    roles.system_program = &accounts[2];
    return Result<InitializeAccounts, ResolverError>(roles);
}

Result<IncrementAccounts, ResolverError> resolve_increment_accounts(
    const PublicKey& program_id,
    const std::vector<svm::AccountInfo>& accounts) {

    if (accounts.size() < INCREMENT_ACCOUNT_COUNT) {
        return make_error(ResolverError::MISSING_ACCOUNT);
    }

    const svm::AccountInfo& counter = accounts[0];

    // Only accounts this program owns may be incremented
    if (counter.owner() != program_id) {
        LOG_DEBUG("counter", "Counter ", short_address(counter.key()), " is owned by ",
                  short_address(counter.owner()), ", not ", short_address(program_id));
        return make_error(ResolverError::NOT_OWNER);
    }

    IncrementAccounts roles;
    roles.counter = &counter;
    return Result<IncrementAccounts, ResolverError>(roles);
}

} // namespace counter
} // namespace tally
