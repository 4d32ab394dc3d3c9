#include "crypto.hpp"
#include <openssl/evp.h> // Modern OpenSSL API
#include <openssl/rand.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace pcash {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

Hash256 digest_sha256(const void* data, size_t len) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> context(EVP_MD_CTX_new());
    if (!context ||
        EVP_DigestInit_ex(context.get(), EVP_sha256(), NULL) != 1 ||
        EVP_DigestUpdate(context.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(context.get(), hash, &length) != 1 ||
        length != U256::WIDTH) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    U256::Bytes out;
    std::copy(hash, hash + U256::WIDTH, out.begin());
    return U256(out);
}

} // namespace

Hash256 PCashCrypto::sha256(const ByteVector& data) {
    return digest_sha256(data.data(), data.size());
}

Hash256 PCashCrypto::sha256(const std::string& str) {
    return digest_sha256(str.data(), str.size());
}

std::string PCashCrypto::generate_sha256(const std::string& str) {
    const Hash256 h = sha256(str);
    return to_hex(h.data(), U256::WIDTH);
}

std::string PCashCrypto::bond_hash(const std::string& prev_hash, const std::string& payload) {
    return generate_sha256(prev_hash + payload);
}

std::string PCashCrypto::to_hex(const uint8_t* data, size_t len) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0f];
    }
    return out;
}

int PCashCrypto::hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

ByteVector PCashCrypto::from_hex(const std::string& hex) {
    size_t start = 0;
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) start = 2;
    if ((hex.size() - start) % 2 != 0) {
        throw std::invalid_argument("hex string has odd length");
    }

    ByteVector out;
    out.reserve((hex.size() - start) / 2);
    for (size_t i = start; i < hex.size(); i += 2) {
        int hi = hex_nibble(hex[i]);
        int lo = hex_nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("invalid hex digit in '" + hex + "'");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

ByteVector PCashCrypto::random_bytes(size_t length) {
    ByteVector out(length);
    if (length > 0 && RAND_bytes(out.data(), static_cast<int>(length)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

// AccountId hex codec
AccountId AccountId::from_hex(const std::string& hex) {
    const ByteVector raw = PCashCrypto::from_hex(hex);
    if (raw.size() != WIDTH) {
        throw std::invalid_argument("AccountId must be 32 bytes, got " + std::to_string(raw.size()));
    }
    Bytes key;
    std::copy(raw.begin(), raw.end(), key.begin());
    return AccountId(key);
}

std::string AccountId::to_hex() const {
    return "0x" + PCashCrypto::to_hex(key_.data(), WIDTH);
}

} // namespace pcash
