#include "relationship.hpp"
#include "transaction.hpp"

namespace pcash {

Relationship classify(const Transaction& self, const Transaction& other) {
    if (self.receiver() == other.sender()) {
        return Relationship::Parent;
    }
    if (self.sender() == other.receiver()) {
        return Relationship::Child;
    }

    if (self.sender() == other.sender()) {
        if (self.prev_blk_num() < other.prev_blk_num()) return Relationship::EarlierSibling;
        if (self.prev_blk_num() > other.prev_blk_num()) return Relationship::LaterSibling;
        if (self.receiver() != other.receiver()) return Relationship::DoubleSpend;
        return Relationship::Same;
    }

    return Relationship::Unrelated;
}

bool is_two_cycle(const Transaction& self, const Transaction& other) {
    return self.receiver() == other.sender() && self.sender() == other.receiver();
}

const char* relationship_name(Relationship rel) {
    switch (rel) {
        case Relationship::Parent:         return "Parent";
        case Relationship::Child:          return "Child";
        case Relationship::EarlierSibling: return "EarlierSibling";
        case Relationship::LaterSibling:   return "LaterSibling";
        case Relationship::DoubleSpend:    return "DoubleSpend";
        case Relationship::Same:           return "Same";
        case Relationship::Unrelated:      return "Unrelated";
    }
    return "Unknown";
}

} // namespace pcash
