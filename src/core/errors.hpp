/**
 * PCash: Plasma Cash Core - Error Taxonomy
 * Every rejection is a normal outcome of adversarial or malformed input.
 * None of them is fatal and none of them leaves the token map modified.
 */

#ifndef PCASH_ERRORS_HPP
#define PCASH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace pcash {

enum class ErrorCode {
    InvalidSignature,      // signature does not verify for the embedded sender
    SignerMismatch,        // caller is not the transaction's sender
    TokenAlreadyExists,    // deposit of a token that is already owned
    TokenDoesNotExist,     // transfer/withdraw of an absent token
    NotCurrentOwner,       // not a direct child of the current state, or caller is not the owner
    DuplicateGenesisToken, // seed list names the same token twice
    MalformedInput,        // host input could not be decoded
    InternalError          // host-side failure after the command was applied
};

// Stable name used in logs and JSON replies (e.g. "NotCurrentOwner").
const char* error_code_name(ErrorCode code);

class TokenError : public std::runtime_error {
public:
    TokenError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace pcash

#endif
