/**
 * PCash: Plasma Cash Core - Relationship Classifier
 * Purpose: Structural relationship between two transactions for the same token.
 */

#ifndef PCASH_RELATIONSHIP_HPP
#define PCASH_RELATIONSHIP_HPP

namespace pcash {

class Transaction;

enum class Relationship {
    Parent,         // other spends what self produced (self.receiver == other.sender)
    Child,          // self spends what other produced (self.sender == other.receiver)
    EarlierSibling, // same sender, self references an earlier block
    LaterSibling,   // same sender, self references a later block
    DoubleSpend,    // same sender, same block reference, different receivers
    Same,           // same sender, same block reference, same receiver
    Unrelated
};

/**
 * classify
 * Both transactions are assumed to name the same token and to be
 * individually valid; signatures are not re-checked here.
 *
 * Rules are evaluated in a fixed order: Parent, Child, then the sibling
 * family, then Unrelated. A pair where self.receiver == other.sender AND
 * self.sender == other.receiver (a 2-cycle) therefore reports Parent.
 * Use is_two_cycle() to detect that case.
 */
Relationship classify(const Transaction& self, const Transaction& other);

// True when both Parent and Child conditions hold for the pair.
bool is_two_cycle(const Transaction& self, const Transaction& other);

const char* relationship_name(Relationship rel);

} // namespace pcash

#endif
