#include "encoder.hpp"
#include "crypto.hpp"

namespace pcash {

ByteVector encode_signable(const AccountId& receiver,
                           const TokenId& token_id,
                           const BlockReference& prev_blk_num) {
    ByteVector out;
    out.reserve(CANONICAL_ENCODING_SIZE);
    out.insert(out.end(), receiver.bytes().begin(), receiver.bytes().end());
    out.insert(out.end(), token_id.bytes().begin(), token_id.bytes().end());
    out.insert(out.end(), prev_blk_num.bytes().begin(), prev_blk_num.bytes().end());
    return out;
}

Hash256 hash_signable(const AccountId& receiver,
                      const TokenId& token_id,
                      const BlockReference& prev_blk_num) {
    return PCashCrypto::sha256(encode_signable(receiver, token_id, prev_blk_num));
}

} // namespace pcash
