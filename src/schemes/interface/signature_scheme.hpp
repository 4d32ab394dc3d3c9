/**
 * ============================================================================
 * SOFTWARE: PCash: Plasma Cash Token Core
 * MODULE: signature_scheme.hpp
 * ============================================================================
 * * DESCRIPTION:
 * This is the signing capability the core depends on. The transaction
 * model, the relationship classifier and the token ledger only ever see an
 * AccountId, a Signature and these two interfaces, so an alternate scheme
 * can be dropped in by implementing ISigner and ISignatureScheme.
 * * CONTRACT:
 * - A scheme's public identity always fits the 32-byte AccountId.
 * - verify() is total: malformed identities or signatures return false.
 * ============================================================================
 */

#ifndef PCASH_SIGNATURE_SCHEME_HPP
#define PCASH_SIGNATURE_SCHEME_HPP

#include <string>
#include "../../core/types.hpp"
#include "../../core/uint256.hpp"

namespace pcash {

    /**
     * @brief Verification side of a signature scheme.
     * Stateless; one instance can be shared by any number of ledgers.
     */
    class ISignatureScheme {
    public:
        virtual ~ISignatureScheme() {}

        /**
         * @return The display name of the scheme (e.g., "ed25519")
         */
        virtual std::string get_scheme_name() const = 0;

        /**
         * @brief Checks that `signature` was produced by `identity` over `message`.
         * Never throws.
         */
        virtual bool verify(const Hash256& message,
                            const Signature& signature,
                            const AccountId& identity) const = 0;
    };

    /**
     * @brief Holder of a private key.
     */
    class ISigner {
    public:
        virtual ~ISigner() {}

        virtual AccountId public_identity() const = 0;

        /**
         * @brief Signs a 32-byte message hash.
         * Throws std::runtime_error if the backend fails.
         */
        virtual Signature sign(const Hash256& message) const = 0;
    };

} // namespace pcash

#endif // PCASH_SIGNATURE_SCHEME_HPP
