#include "counter/error.h"
#include <ostream>

namespace tally {
namespace counter {

const char* to_string(DecodeError error) {
    switch (error) {
        case DecodeError::EMPTY:
            return "empty instruction data";
        case DecodeError::UNKNOWN_OPERATION:
            return "unknown operation";
        case DecodeError::MALFORMED:
            return "malformed instruction data";
        case DecodeError::TRUNCATED:
            return "account data truncated";
    }
    return "unknown decode error";
}

const char* to_string(EncodeError error) {
    switch (error) {
        case EncodeError::INSUFFICIENT_SPACE:
            return "insufficient account space";
    }
    return "unknown encode error";
}

const char* to_string(ResolverError error) {
    switch (error) {
        case ResolverError::MISSING_ACCOUNT:
            return "missing account";
        case ResolverError::NOT_OWNER:
            return "account not owned by program";
    }
    return "unknown resolver error";
}

ProcessError ProcessError::from(DecodeError error) {
    ProcessError result;
    result.kind = Kind::DECODE;
    result.decode = error;
    return result;
}

ProcessError ProcessError::from(ResolverError error) {
    ProcessError result;
    result.kind = Kind::RESOLVE;
    result.resolve = error;
    return result;
}

ProcessError ProcessError::from(svm::CreationError error) {
    ProcessError result;
    result.kind = Kind::CREATION_FAILED;
    result.creation = error;
    return result;
}

ProcessError ProcessError::from(EncodeError error) {
    ProcessError result;
    result.kind = Kind::ENCODE;
    result.encode = error;
    return result;
}

ProcessError ProcessError::overflow() {
    ProcessError result;
    result.kind = Kind::ARITHMETIC_OVERFLOW;
    return result;
}

ProcessError ProcessError::borrow_failed() {
    ProcessError result;
    result.kind = Kind::ACCOUNT_BORROW_FAILED;
    return result;
}

bool ProcessError::operator==(const ProcessError& other) const {
    if (kind != other.kind) {
        return false;
    }
    switch (kind) {
        case Kind::DECODE:
            return decode == other.decode;
        case Kind::RESOLVE:
            return resolve == other.resolve;
        case Kind::CREATION_FAILED:
            return creation == other.creation;
        case Kind::ENCODE:
            return encode == other.encode;
        case Kind::ARITHMETIC_OVERFLOW:
        case Kind::ACCOUNT_BORROW_FAILED:
            return true;
    }
    return false;
}

std::string ProcessError::to_string() const {
    switch (kind) {
        case Kind::DECODE:
            return std::string("decode error: ") + counter::to_string(decode);
        case Kind::RESOLVE:
            return std::string("account error: ") + counter::to_string(resolve);
        case Kind::CREATION_FAILED:
            return std::string("account creation failed: ") + svm::to_string(creation);
        case Kind::ARITHMETIC_OVERFLOW:
            return "counter overflow";
        case Kind::ENCODE:
            return std::string("encode error: ") + counter::to_string(encode);
        case Kind::ACCOUNT_BORROW_FAILED:
            return "account data already borrowed";
    }
    return "unknown process error";
}

std::ostream& operator<<(std::ostream& os, const ProcessError& error) {
    return os << error.to_string();
}

} // namespace counter
} // namespace tally
