/**
 * PCash: Plasma Cash Core - Ed25519 Signature Scheme
 * Purpose: OpenSSL EVP backed implementation of the signing capability.
 */

#ifndef PCASH_ED25519_HPP
#define PCASH_ED25519_HPP

#include <openssl/evp.h>
#include <memory>
#include <string>
#include "interface/signature_scheme.hpp"

namespace pcash {

class Ed25519Scheme : public ISignatureScheme {
public:
    static constexpr size_t SIGNATURE_SIZE = 64;

    std::string get_scheme_name() const override { return "ed25519"; }

    bool verify(const Hash256& message,
                const Signature& signature,
                const AccountId& identity) const override;
};

class Ed25519Signer : public ISigner {
public:
    static constexpr size_t SEED_SIZE = 32;

    /**
     * from_seed
     * Builds the key pair from a raw 32-byte private seed.
     */
    static Ed25519Signer from_seed(const U256::Bytes& seed);

    /**
     * from_phrase
     * Deterministic development key: the seed is SHA-256(phrase).
     * Used for well-known accounts such as "//Alice".
     */
    static Ed25519Signer from_phrase(const std::string& phrase);

    // Fresh key from the OpenSSL CSPRNG.
    static Ed25519Signer generate();

    AccountId public_identity() const override { return identity_; }
    Signature sign(const Hash256& message) const override;

private:
    // Takes ownership of `key`.
    explicit Ed25519Signer(EVP_PKEY* key);

    std::shared_ptr<EVP_PKEY> key_;
    AccountId identity_;
};

} // namespace pcash

#endif
