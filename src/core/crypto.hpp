/**
 * PCash: Plasma Cash Core - Cryptographic Module Header
 * Purpose: Defines the SHA-256 hashing interface used for transaction
 * messages, commitment leaves and the effect audit chain.
 */

#ifndef PCASH_CRYPTO_HPP
#define PCASH_CRYPTO_HPP

#include <string>
#include "types.hpp"
#include "uint256.hpp"

namespace pcash {

class PCashCrypto {
public:
    // Message & Leaf Hashing
    static Hash256 sha256(const ByteVector& data);
    static Hash256 sha256(const std::string& str);

    // Hex digest, used for the audit chain
    static std::string generate_sha256(const std::string& str);

    /**
     * bond_hash
     * Links a payload to the previous head of a hash chain.
     * @return hex SHA-256 of (prev_hash || payload)
     */
    static std::string bond_hash(const std::string& prev_hash, const std::string& payload);

    // Hex helpers
    static std::string to_hex(const uint8_t* data, size_t len);
    // Value of one hex digit, or -1.
    static int hex_nibble(char c);
    static ByteVector from_hex(const std::string& hex);

    /**
     * random_bytes
     * Fills a buffer from the OpenSSL CSPRNG. Throws on RNG failure.
     */
    static ByteVector random_bytes(size_t length);
};

} // namespace pcash

#endif
