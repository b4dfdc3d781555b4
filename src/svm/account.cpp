#include "svm/account.h"

namespace tally {
namespace svm {

PublicKey system_program_id() {
    return PublicKey(PUBKEY_SIZE, 0);
}

bool Account::operator==(const Account& other) const {
    return lamports == other.lamports && data == other.data &&
           owner == other.owner && executable == other.executable &&
           rent_epoch == other.rent_epoch;
}

const char* to_string(BorrowError error) {
    switch (error) {
        case BorrowError::ALREADY_BORROWED:
            return "account data already borrowed";
    }
    return "unknown borrow error";
}

// AccountDataRef implementation
AccountDataRef::AccountDataRef(const std::vector<uint8_t>* data,
                               std::shared_ptr<BorrowState> state)
    : data_(data), state_(std::move(state)) {}

AccountDataRef::~AccountDataRef() {
    release();
}

AccountDataRef::AccountDataRef(AccountDataRef&& other) noexcept
    : data_(other.data_), state_(std::move(other.state_)) {
    other.data_ = nullptr;
}

AccountDataRef& AccountDataRef::operator=(AccountDataRef&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        state_ = std::move(other.state_);
        other.data_ = nullptr;
    }
    return *this;
}

void AccountDataRef::release() {
    if (state_) {
        state_->readers--;
        state_.reset();
    }
    data_ = nullptr;
}

// AccountDataRefMut implementation
AccountDataRefMut::AccountDataRefMut(std::vector<uint8_t>* data,
                                     std::shared_ptr<BorrowState> state)
    : data_(data), state_(std::move(state)) {}

AccountDataRefMut::~AccountDataRefMut() {
    release();
}

AccountDataRefMut::AccountDataRefMut(AccountDataRefMut&& other) noexcept
    : data_(other.data_), state_(std::move(other.state_)) {
    other.data_ = nullptr;
}

AccountDataRefMut& AccountDataRefMut::operator=(AccountDataRefMut&& other) noexcept {
    if (this != &other) {
        release();
        data_ = other.data_;
        state_ = std::move(other.state_);
        other.data_ = nullptr;
    }
    return *this;
}

void AccountDataRefMut::release() {
    if (state_) {
        state_->writer = false;
        state_.reset();
    }
    data_ = nullptr;
}

// AccountInfo implementation
AccountInfo::AccountInfo(PublicKey key, Account* account, bool is_signer,
                         bool is_writable, std::shared_ptr<BorrowState> borrow_state)
    : key_(std::move(key)), account_(account), is_signer_(is_signer),
      is_writable_(is_writable),
      borrow_(borrow_state ? std::move(borrow_state) : std::make_shared<BorrowState>()) {}

Result<AccountDataRef, BorrowError> AccountInfo::try_borrow_data() const {
    if (borrow_->writer) {
        return make_error(BorrowError::ALREADY_BORROWED);
    }
    borrow_->readers++;
    return Result<AccountDataRef, BorrowError>(AccountDataRef(&account_->data, borrow_));
}

Result<AccountDataRefMut, BorrowError> AccountInfo::try_borrow_mut_data() const {
    if (borrow_->writer || borrow_->readers > 0) {
        return make_error(BorrowError::ALREADY_BORROWED);
    }
    borrow_->writer = true;
    return Result<AccountDataRefMut, BorrowError>(AccountDataRefMut(&account_->data, borrow_));
}

void AccountInfo::set_lamports(Lamports lamports) const {
    account_->lamports = lamports;
}

void AccountInfo::assign(const PublicKey& owner) const {
    account_->owner = owner;
}

Result<bool, BorrowError> AccountInfo::realloc(size_t new_len) const {
    if (borrow_->writer || borrow_->readers > 0) {
        return make_error(BorrowError::ALREADY_BORROWED);
    }
    account_->data.resize(new_len, 0);
    return Result<bool, BorrowError>(true);
}

} // namespace svm
} // namespace tally
