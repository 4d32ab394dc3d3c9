#include "errors.hpp"

namespace pcash {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidSignature:      return "InvalidSignature";
        case ErrorCode::SignerMismatch:        return "SignerMismatch";
        case ErrorCode::TokenAlreadyExists:    return "TokenAlreadyExists";
        case ErrorCode::TokenDoesNotExist:     return "TokenDoesNotExist";
        case ErrorCode::NotCurrentOwner:       return "NotCurrentOwner";
        case ErrorCode::DuplicateGenesisToken: return "DuplicateGenesisToken";
        case ErrorCode::MalformedInput:        return "MalformedInput";
        case ErrorCode::InternalError:         return "InternalError";
    }
    return "Unknown";
}

} // namespace pcash
