#include "transaction.hpp"
#include "encoder.hpp"
#include "errors.hpp"
#include "../schemes/interface/signature_scheme.hpp"
#include <exception>

namespace pcash {

Hash256 UnsignedTransaction::hash() const {
    return hash_signable(receiver_, token_id_, prev_blk_num_);
}

Transaction UnsignedTransaction::add_signature(const AccountId& sender,
                                               const Signature& signature,
                                               const ISignatureScheme& scheme) const {
    if (!scheme.verify(hash(), signature, sender)) {
        throw TokenError(ErrorCode::InvalidSignature, "signature does not match sender");
    }
    return Transaction(receiver_, token_id_, prev_blk_num_, sender, signature);
}

Transaction::Transaction(const AccountId& receiver, const TokenId& token_id, const BlockReference& prev_blk_num,
                         const AccountId& sender, const Signature& signature)
    : receiver_(receiver), token_id_(token_id), prev_blk_num_(prev_blk_num),
      sender_(sender), signature_(signature) {}

Transaction Transaction::from_untrusted(const AccountId& receiver,
                                        const TokenId& token_id,
                                        const BlockReference& prev_blk_num,
                                        const AccountId& sender,
                                        const Signature& signature) {
    return Transaction(receiver, token_id, prev_blk_num, sender, signature);
}

UnsignedTransaction Transaction::unsigned_part() const {
    return UnsignedTransaction(receiver_, token_id_, prev_blk_num_);
}

Hash256 Transaction::leaf_hash() const {
    return hash_signable(receiver_, token_id_, prev_blk_num_);
}

bool Transaction::valid(const ISignatureScheme& scheme) const {
    try {
        return scheme.verify(leaf_hash(), signature_, sender_);
    } catch (const std::exception&) {
        // digest backend failure reads as "not valid"
        return false;
    }
}

bool Transaction::operator==(const Transaction& other) const {
    return receiver_ == other.receiver_ &&
           token_id_ == other.token_id_ &&
           prev_blk_num_ == other.prev_blk_num_ &&
           sender_ == other.sender_ &&
           signature_ == other.signature_;
}

Hash256 empty_leaf_hash() {
    return UnsignedTransaction().hash();
}

} // namespace pcash
