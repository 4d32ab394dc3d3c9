#include "commitment.hpp"
#include <stdexcept>
#include <string>

namespace pcash {

LeafIndex leaf_index(const TokenId& token_id) {
    LeafIndex index;
    const U256::Bytes& be = token_id.bytes();
    for (size_t byte = 0; byte < U256::WIDTH; ++byte) {
        for (size_t bit = 0; bit < 8; ++bit) {
            if (be[byte] & (0x80 >> bit)) {
                index.set(LEAF_INDEX_BITS - 1 - (byte * 8 + bit));
            }
        }
    }
    return index;
}

TokenId token_id_from_leaf_index(const LeafIndex& index) {
    U256::Bytes be;
    be.fill(0);
    for (size_t pos = 0; pos < LEAF_INDEX_BITS; ++pos) {
        if (index.test(LEAF_INDEX_BITS - 1 - pos)) {
            be[pos / 8] |= static_cast<uint8_t>(0x80 >> (pos % 8));
        }
    }
    return TokenId(be);
}

bool leaf_path_bit(const LeafIndex& index, size_t depth) {
    if (depth >= LEAF_INDEX_BITS) {
        throw std::out_of_range("leaf path depth " + std::to_string(depth) + " beyond tree height");
    }
    return index.test(LEAF_INDEX_BITS - 1 - depth);
}

Hash256 leaf_value(const Transaction& txn) {
    return txn.leaf_hash();
}

Hash256 empty_leaf_value() {
    return empty_leaf_hash();
}

} // namespace pcash
