/**
 * PCash: Plasma Cash Core - Transaction Model
 * Purpose: A signed record of one token's ownership change.
 */

#ifndef PCASH_TRANSACTION_HPP
#define PCASH_TRANSACTION_HPP

#include "relationship.hpp"
#include "types.hpp"
#include "uint256.hpp"

namespace pcash {

class ISignatureScheme;
class Transaction;

/**
 * @brief The signable part of a transfer: who receives which token, as of
 * which commitment round the sender's ownership was last confirmed.
 */
class UnsignedTransaction {
public:
    UnsignedTransaction() {}
    UnsignedTransaction(const AccountId& receiver, const TokenId& token_id, const BlockReference& prev_blk_num)
        : receiver_(receiver), token_id_(token_id), prev_blk_num_(prev_blk_num) {}

    const AccountId& receiver() const { return receiver_; }
    const TokenId& token_id() const { return token_id_; }
    const BlockReference& prev_blk_num() const { return prev_blk_num_; }

    // The message a sender signs.
    Hash256 hash() const;

    /**
     * add_signature
     * Binds a sender and signature to these fields.
     * @throws TokenError(InvalidSignature) if the signature is not by
     *         `sender` over hash(). No Transaction is produced in that case.
     */
    Transaction add_signature(const AccountId& sender,
                              const Signature& signature,
                              const ISignatureScheme& scheme) const;

private:
    AccountId receiver_;
    TokenId token_id_;
    BlockReference prev_blk_num_;
};

/**
 * @brief Immutable signed transfer.
 *
 * Locally built transactions come from UnsignedTransaction::add_signature
 * and are valid by construction. Transactions decoded from an untrusted
 * channel come from from_untrusted() and must pass valid() before use.
 */
class Transaction {
public:
    static Transaction from_untrusted(const AccountId& receiver,
                                      const TokenId& token_id,
                                      const BlockReference& prev_blk_num,
                                      const AccountId& sender,
                                      const Signature& signature);

    const AccountId& receiver() const { return receiver_; }
    const TokenId& token_id() const { return token_id_; }
    const BlockReference& prev_blk_num() const { return prev_blk_num_; }
    const AccountId& sender() const { return sender_; }
    const Signature& signature() const { return signature_; }

    UnsignedTransaction unsigned_part() const;

    // Hash of the unsigned fields; the value committed for this token.
    Hash256 leaf_hash() const;

    // Index of this token's leaf in the commitment structure.
    const TokenId& token_index() const { return token_id_; }

    // Signature check against the embedded sender. Never throws.
    bool valid(const ISignatureScheme& scheme) const;

    Relationship compare(const Transaction& other) const { return classify(*this, other); }

    bool operator==(const Transaction& other) const;
    bool operator!=(const Transaction& other) const { return !(*this == other); }

private:
    friend class UnsignedTransaction;

    Transaction(const AccountId& receiver, const TokenId& token_id, const BlockReference& prev_blk_num,
                const AccountId& sender, const Signature& signature);

    AccountId receiver_;
    TokenId token_id_;
    BlockReference prev_blk_num_;
    AccountId sender_;
    Signature signature_;
};

// Hash of the all-zero unsigned transaction: the "nothing here" leaf.
Hash256 empty_leaf_hash();

} // namespace pcash

#endif
