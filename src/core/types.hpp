/**
 * PCash: Plasma Cash Core - Identity Types
 * Purpose: Account identity and signature value types shared by the core
 * and the signature schemes.
 */

#ifndef PCASH_TYPES_HPP
#define PCASH_TYPES_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pcash {

typedef std::vector<uint8_t> ByteVector;

// Raw signature bytes. Length is defined by the signature scheme.
typedef std::vector<uint8_t> Signature;

/**
 * @brief Opaque public-key identity of an account.
 * Always 32 bytes; the core only compares and encodes it.
 */
class AccountId {
public:
    static constexpr size_t WIDTH = 32;
    typedef std::array<uint8_t, WIDTH> Bytes;

    AccountId() { key_.fill(0); }
    explicit AccountId(const Bytes& key) : key_(key) {}

    // 64 hex digits, optional "0x" prefix. Throws std::invalid_argument.
    static AccountId from_hex(const std::string& hex);
    std::string to_hex() const;

    const Bytes& bytes() const { return key_; }
    const uint8_t* data() const { return key_.data(); }

    bool operator==(const AccountId& other) const { return key_ == other.key_; }
    bool operator!=(const AccountId& other) const { return key_ != other.key_; }
    bool operator<(const AccountId& other) const { return key_ < other.key_; }

private:
    Bytes key_;
};

} // namespace pcash

#endif
