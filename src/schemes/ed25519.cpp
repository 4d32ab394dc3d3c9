#include "ed25519.hpp"
#include "../core/crypto.hpp"
#include <algorithm>
#include <stdexcept>

namespace pcash {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

typedef std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> MdCtxPtr;
typedef std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> PkeyPtr;

} // namespace

bool Ed25519Scheme::verify(const Hash256& message,
                           const Signature& signature,
                           const AccountId& identity) const {
    if (signature.size() != SIGNATURE_SIZE) return false;

    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, NULL,
                                            identity.data(), AccountId::WIDTH));
    if (!key) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return false;
    if (EVP_DigestVerifyInit(ctx.get(), NULL, NULL, NULL, key.get()) != 1) return false;

    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), U256::WIDTH) == 1;
}

Ed25519Signer::Ed25519Signer(EVP_PKEY* key) : key_(key, EvpPkeyDeleter()) {
    AccountId::Bytes pub;
    size_t len = pub.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), pub.data(), &len) != 1 || len != AccountId::WIDTH) {
        throw std::runtime_error("Ed25519: failed to export public key");
    }
    identity_ = AccountId(pub);
}

Ed25519Signer Ed25519Signer::from_seed(const U256::Bytes& seed) {
    EVP_PKEY* key = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, NULL, seed.data(), seed.size());
    if (!key) {
        throw std::runtime_error("Ed25519: failed to load private seed");
    }
    return Ed25519Signer(key);
}

Ed25519Signer Ed25519Signer::from_phrase(const std::string& phrase) {
    return from_seed(PCashCrypto::sha256(phrase).bytes());
}

Ed25519Signer Ed25519Signer::generate() {
    const ByteVector raw = PCashCrypto::random_bytes(SEED_SIZE);
    U256::Bytes seed;
    std::copy(raw.begin(), raw.end(), seed.begin());
    return from_seed(seed);
}

Signature Ed25519Signer::sign(const Hash256& message) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), NULL, NULL, NULL, key_.get()) != 1) {
        throw std::runtime_error("Ed25519: sign context init failed");
    }

    Signature sig(Ed25519Scheme::SIGNATURE_SIZE);
    size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len, message.data(), U256::WIDTH) != 1) {
        throw std::runtime_error("Ed25519: signing failed");
    }
    sig.resize(sig_len);
    return sig;
}

} // namespace pcash
