/**
 * PCash: Plasma Cash Core - Commitment Leaf Contract
 * Purpose: What a sparse, token-indexed commitment structure needs from the
 * core: where each token's leaf lives and what value it holds.
 */

#ifndef PCASH_COMMITMENT_HPP
#define PCASH_COMMITMENT_HPP

#include <bitset>
#include "transaction.hpp"

namespace pcash {

static const size_t LEAF_INDEX_BITS = 256;

/**
 * LeafIndex
 * Bit (LEAF_INDEX_BITS - 1) is the most significant bit of the token id, so
 * to_string() yields the big-endian bit string, root-to-leaf.
 */
typedef std::bitset<LEAF_INDEX_BITS> LeafIndex;

LeafIndex leaf_index(const TokenId& token_id);

// Inverse of leaf_index.
TokenId token_id_from_leaf_index(const LeafIndex& index);

// Branch taken at `depth` (0 = root) when walking down to the leaf.
bool leaf_path_bit(const LeafIndex& index, size_t depth);

Hash256 leaf_value(const Transaction& txn);
Hash256 empty_leaf_value();

} // namespace pcash

#endif
