/**
 * PCash: Plasma Cash Core - Token Ledger
 * Focus: Per-token state machine (Absent <-> Owned) with signature and
 * ownership-chain enforcement.
 */

#ifndef PCASH_LEDGER_HPP
#define PCASH_LEDGER_HPP

#include <map>
#include <mutex>
#include <optional>
#include <vector>
#include "transaction.hpp"

namespace pcash {

class ISignatureScheme;

enum class EffectKind {
    Deposited,
    Transferred,
    Withdrawn
};

const char* effect_kind_name(EffectKind kind);

/**
 * @brief What an accepted command changed. Returned to the host, which
 * decides whether and where to publish it.
 */
struct TokenEffect {
    EffectKind kind = EffectKind::Deposited;
    TokenId token_id;
    AccountId from;   // previous owner (depositor for deposits)
    AccountId to;     // new owner (the withdrawing owner for withdrawals)
    Hash256 leaf;     // leaf value after the change
};

class TokenLedger {
public:
    explicit TokenLedger(const ISignatureScheme& scheme) : scheme_(scheme) {}

    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    /**
     * deposit
     * Absent -> Owned(txn). The caller must be the transaction's signer.
     * @throws TokenError TokenAlreadyExists | InvalidSignature | SignerMismatch
     */
    TokenEffect deposit(const AccountId& caller, const Transaction& txn);

    /**
     * transfer
     * Owned(prev) -> Owned(txn), where txn must be a direct Child of prev:
     * the current owner is the one handing the token on.
     * @throws TokenError TokenDoesNotExist | InvalidSignature | SignerMismatch | NotCurrentOwner
     */
    TokenEffect transfer(const AccountId& caller, const Transaction& txn);

    /**
     * withdraw
     * Owned(cur) -> Absent. Only the current receiver may withdraw.
     * @throws TokenError TokenDoesNotExist | NotCurrentOwner
     */
    TokenEffect withdraw(const AccountId& caller, const TokenId& token_id);

    std::optional<Transaction> current_owner_txn(const TokenId& token_id) const;

    // Committed leaf for the token, or the empty leaf if it is absent.
    Hash256 leaf_value_of(const TokenId& token_id) const;

    /**
     * seed
     * Genesis initialisation. Every transaction must verify and every token
     * id must be new; otherwise nothing is applied.
     * @throws TokenError InvalidSignature | DuplicateGenesisToken
     */
    void seed(const std::vector<Transaction>& genesis);

    size_t token_count() const;
    std::vector<TokenId> token_ids() const;

private:
    const ISignatureScheme& scheme_;
    mutable std::mutex mutex_;
    std::map<TokenId, Transaction> tokens_;
};

} // namespace pcash

#endif
