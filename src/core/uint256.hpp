/**
 * PCash: Plasma Cash Core - 256-bit Unsigned Integer
 * Purpose: Fixed-width value used for token ids, block references and hashes.
 */

#ifndef PCASH_UINT256_HPP
#define PCASH_UINT256_HPP

#include <array>
#include <cstdint>
#include <string>

namespace pcash {

/**
 * @brief 256-bit unsigned integer stored big-endian.
 * Byte 0 is the most significant byte, so lexicographic order on the
 * bytes equals numeric order.
 */
class U256 {
public:
    static constexpr size_t WIDTH = 32;
    typedef std::array<uint8_t, WIDTH> Bytes;

    U256() { data_.fill(0); }
    explicit U256(uint64_t value);
    explicit U256(const Bytes& be_bytes) : data_(be_bytes) {}

    /**
     * from_hex
     * Accepts up to 64 hex digits with an optional "0x" prefix.
     * Throws std::invalid_argument on bad input.
     */
    static U256 from_hex(const std::string& hex);

    /**
     * from_dec
     * Parses a base-10 string. Throws std::invalid_argument on bad
     * digits and std::out_of_range if the value exceeds 2^256 - 1.
     */
    static U256 from_dec(const std::string& dec);

    // "0x" followed by 64 lowercase hex digits
    std::string to_hex() const;
    std::string to_dec() const;

    const Bytes& bytes() const { return data_; }
    const uint8_t* data() const { return data_.data(); }

    bool is_zero() const;

    bool operator==(const U256& other) const { return data_ == other.data_; }
    bool operator!=(const U256& other) const { return data_ != other.data_; }
    bool operator<(const U256& other) const { return data_ < other.data_; }
    bool operator>(const U256& other) const { return other.data_ < data_; }
    bool operator<=(const U256& other) const { return !(other.data_ < data_); }
    bool operator>=(const U256& other) const { return !(data_ < other.data_); }

private:
    Bytes data_;
};

typedef U256 TokenId;
typedef U256 BlockReference;
typedef U256 Hash256;

} // namespace pcash

#endif
