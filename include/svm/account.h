#pragma once

#include "common/types.h"
#include <memory>
#include <vector>

namespace tally {
namespace svm {

using namespace tally::common;

/// Identity of the host's system program (all zero bytes)
PublicKey system_program_id();

/**
 * Stored form of an account as the host keeps it between calls
 */
struct Account {
    Lamports lamports = 0;
    std::vector<uint8_t> data;
    PublicKey owner = system_program_id();
    bool executable = false;
    Epoch rent_epoch = 0;

    bool operator==(const Account& other) const;
    bool operator!=(const Account& other) const { return !(*this == other); }
};

/**
 * Borrow bookkeeping shared by every handle to the same account within
 * one instruction. Any number of readers or a single writer.
 */
struct BorrowState {
    int readers = 0;
    bool writer = false;
};

enum class BorrowError {
    ALREADY_BORROWED
};

const char* to_string(BorrowError error);

/**
 * Shared (read) lease on an account's data, released on destruction
 */
class AccountDataRef {
public:
    AccountDataRef() = default;
    AccountDataRef(const std::vector<uint8_t>* data, std::shared_ptr<BorrowState> state);
    ~AccountDataRef();

    AccountDataRef(AccountDataRef&& other) noexcept;
    AccountDataRef& operator=(AccountDataRef&& other) noexcept;
    AccountDataRef(const AccountDataRef&) = delete;
    AccountDataRef& operator=(const AccountDataRef&) = delete;

    const std::vector<uint8_t>& operator*() const { return *data_; }
    const std::vector<uint8_t>* operator->() const { return data_; }

private:
    void release();

    const std::vector<uint8_t>* data_ = nullptr;
    std::shared_ptr<BorrowState> state_;
};

/**
 * Exclusive (write) lease on an account's data, released on destruction
 */
class AccountDataRefMut {
public:
    AccountDataRefMut() = default;
    AccountDataRefMut(std::vector<uint8_t>* data, std::shared_ptr<BorrowState> state);
    ~AccountDataRefMut();

    AccountDataRefMut(AccountDataRefMut&& other) noexcept;
    AccountDataRefMut& operator=(AccountDataRefMut&& other) noexcept;
    AccountDataRefMut(const AccountDataRefMut&) = delete;
    AccountDataRefMut& operator=(const AccountDataRefMut&) = delete;

    std::vector<uint8_t>& operator*() const { return *data_; }
    std::vector<uint8_t>* operator->() const { return data_; }

private:
    void release();

    std::vector<uint8_t>* data_ = nullptr;
    std::shared_ptr<BorrowState> state_;
};

/**
 * Account handle passed to a program for the duration of one instruction.
 *
 * The handle does not own the account; it points into the host's working
 * copy. Copies of a handle share the same borrow state, so two handles to
 * the same address cannot both hold a write lease.
 */
class AccountInfo {
public:
    AccountInfo() = default;
    AccountInfo(PublicKey key, Account* account, bool is_signer, bool is_writable,
                std::shared_ptr<BorrowState> borrow_state = nullptr);

    const PublicKey& key() const { return key_; }
    const PublicKey& owner() const { return account_->owner; }
    Lamports lamports() const { return account_->lamports; }
    size_t data_len() const { return account_->data.size(); }
    bool executable() const { return account_->executable; }
    bool is_signer() const { return is_signer_; }
    bool is_writable() const { return is_writable_; }

    Result<AccountDataRef, BorrowError> try_borrow_data() const;
    Result<AccountDataRefMut, BorrowError> try_borrow_mut_data() const;

    // Host-level mutation, used by the system program
    void set_lamports(Lamports lamports) const;
    void assign(const PublicKey& owner) const;
    /// Resize data (new bytes zeroed); fails while a data lease is held
    Result<bool, BorrowError> realloc(size_t new_len) const;

private:
    PublicKey key_;
    Account* account_ = nullptr;
    bool is_signer_ = false;
    bool is_writable_ = false;
    std::shared_ptr<BorrowState> borrow_;
};

} // namespace svm
} // namespace tally
