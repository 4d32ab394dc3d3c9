/**
 * PCash: Plasma Cash Core - Canonical Encoder
 * Purpose: Deterministic byte encoding of a transaction's signable fields.
 *
 * Layout (96 bytes, no length prefixes, no padding):
 *   [ 0..32)  receiver      raw 32-byte account identity
 *   [32..64)  token_id      big-endian
 *   [64..96)  prev_blk_num  big-endian
 */

#ifndef PCASH_ENCODER_HPP
#define PCASH_ENCODER_HPP

#include "types.hpp"
#include "uint256.hpp"

namespace pcash {

static const size_t CANONICAL_ENCODING_SIZE = AccountId::WIDTH + 2 * U256::WIDTH;

ByteVector encode_signable(const AccountId& receiver,
                           const TokenId& token_id,
                           const BlockReference& prev_blk_num);

// SHA-256 of encode_signable(...). This is the message that gets signed.
Hash256 hash_signable(const AccountId& receiver,
                      const TokenId& token_id,
                      const BlockReference& prev_blk_num);

} // namespace pcash

#endif
