#pragma once

#include "svm/invoke_context.h"
#include <iosfwd>
#include <string>

namespace tally {
namespace counter {

/**
 * Instruction or account data could not be decoded
 */
enum class DecodeError {
    EMPTY,              ///< Instruction buffer has no discriminant
    UNKNOWN_OPERATION,  ///< Discriminant is not 0 or 1
    MALFORMED,          ///< Initialize payload is not exactly 8 bytes
    TRUNCATED           ///< Account data shorter than the counter layout
};

/**
 * Counter state could not be written into an account
 */
enum class EncodeError {
    INSUFFICIENT_SPACE
};

/**
 * Supplied accounts do not satisfy the operation's requirements
 */
enum class ResolverError {
    MISSING_ACCOUNT,
    NOT_OWNER
};

const char* to_string(DecodeError error);
const char* to_string(EncodeError error);
const char* to_string(ResolverError error);

/**
 * Failure of one counter program call. The kind selects which of the
 * wrapped codes is meaningful.
 */
struct ProcessError {
    enum class Kind {
        DECODE,
        RESOLVE,
        CREATION_FAILED,
        ARITHMETIC_OVERFLOW,
        ENCODE,
        ACCOUNT_BORROW_FAILED
    };

    Kind kind = Kind::DECODE;
    DecodeError decode = DecodeError::EMPTY;
    ResolverError resolve = ResolverError::MISSING_ACCOUNT;
    svm::CreationError creation = svm::CreationError::ACCOUNT_ALREADY_IN_USE;
    EncodeError encode = EncodeError::INSUFFICIENT_SPACE;

    static ProcessError from(DecodeError error);
    static ProcessError from(ResolverError error);
    static ProcessError from(svm::CreationError error);
    static ProcessError from(EncodeError error);
    static ProcessError overflow();
    static ProcessError borrow_failed();

    bool operator==(const ProcessError& other) const;
    bool operator!=(const ProcessError& other) const { return !(*this == other); }

    std::string to_string() const;
};

std::ostream& operator<<(std::ostream& os, const ProcessError& error);

} // namespace counter
} // namespace tally
