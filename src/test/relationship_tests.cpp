#include "core/relationship.hpp"
#include "core/transaction.hpp"
#include "test/test_pcash.h"

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace pcash;

BOOST_FIXTURE_TEST_SUITE(relationship_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(parent_and_child)
{
    // alice -> bob, then bob -> carol
    const Transaction first = MakeTxn(alice, bob.public_identity(), 9);
    const Transaction second = MakeTxn(bob, carol.public_identity(), 9, 1);

    BOOST_CHECK(classify(first, second) == Relationship::Parent);
    BOOST_CHECK(classify(second, first) == Relationship::Child);
    BOOST_CHECK(second.compare(first) == Relationship::Child);
    BOOST_CHECK(!is_two_cycle(first, second));
}

BOOST_AUTO_TEST_CASE(siblings_ordered_by_block_reference)
{
    const Transaction early = MakeTxn(alice, bob.public_identity(), 9, 3);
    const Transaction late = MakeTxn(alice, carol.public_identity(), 9, 8);

    BOOST_CHECK(classify(early, late) == Relationship::EarlierSibling);
    BOOST_CHECK(classify(late, early) == Relationship::LaterSibling);
}

BOOST_AUTO_TEST_CASE(double_spend_detected)
{
    const Transaction to_bob = MakeTxn(alice, bob.public_identity(), 9, 5);
    const Transaction to_carol = MakeTxn(alice, carol.public_identity(), 9, 5);

    BOOST_CHECK(classify(to_bob, to_carol) == Relationship::DoubleSpend);
    BOOST_CHECK(classify(to_carol, to_bob) == Relationship::DoubleSpend);
}

BOOST_AUTO_TEST_CASE(same_transaction)
{
    const Transaction txn = MakeTxn(alice, bob.public_identity(), 9, 5);
    BOOST_CHECK(classify(txn, txn) == Relationship::Same);
    BOOST_CHECK(txn.compare(txn) == Relationship::Same);
}

BOOST_AUTO_TEST_CASE(unrelated_transactions)
{
    const Ed25519Signer dave = Ed25519Signer::from_phrase("//Dave");
    const Transaction a = MakeTxn(alice, bob.public_identity(), 9);
    const Transaction b = MakeTxn(carol, dave.public_identity(), 9);

    BOOST_CHECK(classify(a, b) == Relationship::Unrelated);
    BOOST_CHECK(classify(b, a) == Relationship::Unrelated);
}

BOOST_AUTO_TEST_CASE(two_cycle_reports_parent)
{
    // alice -> bob and bob -> alice: both Parent and Child conditions hold.
    const Transaction ab = MakeTxn(alice, bob.public_identity(), 9, 1);
    const Transaction ba = MakeTxn(bob, alice.public_identity(), 9, 2);

    BOOST_CHECK(is_two_cycle(ab, ba));
    BOOST_CHECK(is_two_cycle(ba, ab));
    BOOST_CHECK(classify(ab, ba) == Relationship::Parent);
    BOOST_CHECK(classify(ba, ab) == Relationship::Parent);
}

BOOST_AUTO_TEST_CASE(self_addressed_transaction_is_its_own_parent)
{
    // Rule order puts receiver == sender ahead of the Same check.
    const Transaction deposit = MakeDeposit(alice, 9);
    BOOST_CHECK(classify(deposit, deposit) == Relationship::Parent);
    BOOST_CHECK(is_two_cycle(deposit, deposit));
}

BOOST_AUTO_TEST_CASE(parent_child_symmetry_over_pool)
{
    const std::vector<const Ed25519Signer*> signers = {&alice, &bob, &carol};
    std::vector<Transaction> pool;
    for (const auto* from : signers) {
        for (const auto* to : signers) {
            if (from == to) continue;
            for (uint64_t prev = 0; prev < 2; ++prev) {
                pool.push_back(MakeTxn(*from, to->public_identity(), 42, prev));
            }
        }
    }

    for (const auto& a : pool) {
        for (const auto& b : pool) {
            const Relationship ab = classify(a, b);
            const Relationship ba = classify(b, a);
            if (is_two_cycle(a, b)) {
                BOOST_CHECK(ab == Relationship::Parent && ba == Relationship::Parent);
                continue;
            }
            BOOST_CHECK_EQUAL(ab == Relationship::Parent, ba == Relationship::Child);
            BOOST_CHECK_EQUAL(ab == Relationship::EarlierSibling, ba == Relationship::LaterSibling);
            BOOST_CHECK_EQUAL(ab == Relationship::DoubleSpend, ba == Relationship::DoubleSpend);
        }
        BOOST_CHECK(classify(a, a) == Relationship::Same);
    }
}

BOOST_AUTO_TEST_CASE(relationship_names)
{
    BOOST_CHECK_EQUAL(relationship_name(Relationship::DoubleSpend), "DoubleSpend");
    BOOST_CHECK_EQUAL(relationship_name(Relationship::EarlierSibling), "EarlierSibling");
    BOOST_CHECK_EQUAL(relationship_name(Relationship::Unrelated), "Unrelated");
}

BOOST_AUTO_TEST_SUITE_END()
