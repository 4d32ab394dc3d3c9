#include "core/commitment.hpp"
#include "core/errors.hpp"
#include "core/serialization.hpp"
#include "test/test_pcash.h"

#include <boost/test/unit_test.hpp>

using namespace pcash;

BOOST_FIXTURE_TEST_SUITE(serialization_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(u256_accepts_hex_decimal_and_numbers)
{
    BOOST_CHECK(parse_u256(json("0x7b")) == U256(123));
    BOOST_CHECK(parse_u256(json("123")) == U256(123));
    BOOST_CHECK(parse_u256(json(123)) == U256(123));
    BOOST_CHECK(parse_u256(json("18446744073709551616")) == U256::from_hex("0x10000000000000000"));

    const json out = U256(123);
    BOOST_CHECK_EQUAL(out.get<std::string>(), U256(123).to_hex());
}

BOOST_AUTO_TEST_CASE(u256_rejects_bad_values)
{
    BOOST_CHECK_THROW(parse_u256(json(-1)), TokenError);
    BOOST_CHECK_THROW(parse_u256(json(1.5)), TokenError);
    BOOST_CHECK_THROW(parse_u256(json("0xg1")), TokenError);
    BOOST_CHECK_THROW(parse_u256(json(nullptr)), TokenError);

    try {
        parse_u256(json("twelve"));
        BOOST_FAIL("parse_u256 accepted a word");
    } catch (const TokenError& e) {
        BOOST_CHECK(e.code() == ErrorCode::MalformedInput);
    }
}

BOOST_AUTO_TEST_CASE(account_codec)
{
    const json j = alice.public_identity();
    BOOST_CHECK(parse_account(j) == alice.public_identity());
    BOOST_CHECK_THROW(parse_account(json("0x1234")), TokenError);
    BOOST_CHECK_THROW(parse_account(json(5)), TokenError);
}

BOOST_AUTO_TEST_CASE(transaction_layout)
{
    const Transaction txn = MakeTxn(alice, bob.public_identity(), 123, 4);
    const json j = txn;

    BOOST_CHECK_EQUAL(j.at("receiver").get<std::string>(), bob.public_identity().to_hex());
    BOOST_CHECK_EQUAL(j.at("sender").get<std::string>(), alice.public_identity().to_hex());
    BOOST_CHECK_EQUAL(j.at("token_id").get<std::string>(), TokenId(123).to_hex());
    BOOST_CHECK_EQUAL(j.at("prev_blk_num").get<std::string>(), BlockReference(4).to_hex());
    // "0x" + 64 signature bytes
    BOOST_CHECK_EQUAL(j.at("signature").get<std::string>().size(), 130U);

    const Transaction back = j.get<Transaction>();
    BOOST_CHECK(back == txn);
    BOOST_CHECK(back.valid(scheme));

    const json unsigned_json = txn.unsigned_part();
    BOOST_CHECK(!unsigned_json.contains("signature"));
    BOOST_CHECK_EQUAL(unsigned_json.size(), 3U);
}

BOOST_AUTO_TEST_CASE(parse_transaction_does_not_verify)
{
    json j = MakeTxn(alice, bob.public_identity(), 1);
    j["token_id"] = "2";

    const Transaction parsed = parse_transaction(j);
    BOOST_CHECK(parsed.token_id() == TokenId(2));
    BOOST_CHECK(!parsed.valid(scheme));
}

BOOST_AUTO_TEST_CASE(parse_transaction_rejects_malformed_input)
{
    const json good = MakeTxn(alice, bob.public_identity(), 1);

    BOOST_CHECK_THROW(parse_transaction(json::array()), TokenError);

    json missing = good;
    missing.erase("sender");
    BOOST_CHECK_THROW(parse_transaction(missing), TokenError);

    json bad_sig = good;
    bad_sig["signature"] = "0xabc";
    BOOST_CHECK_THROW(parse_transaction(bad_sig), TokenError);

    json bad_receiver = good;
    bad_receiver["receiver"] = 42;
    BOOST_CHECK_THROW(parse_transaction(bad_receiver), TokenError);
}

BOOST_AUTO_TEST_CASE(effect_and_error_payloads)
{
    TokenEffect effect;
    effect.kind = EffectKind::Withdrawn;
    effect.token_id = TokenId(9);
    effect.from = bob.public_identity();
    effect.to = bob.public_identity();
    effect.leaf = empty_leaf_value();

    const json j = effect;
    BOOST_CHECK_EQUAL(j.at("event").get<std::string>(), "Withdrawn");
    BOOST_CHECK_EQUAL(j.at("token_id").get<std::string>(), TokenId(9).to_hex());
    BOOST_CHECK_EQUAL(j.at("from").get<std::string>(), bob.public_identity().to_hex());
    BOOST_CHECK_EQUAL(j.at("leaf").get<std::string>(), empty_leaf_value().to_hex());

    const json reply = error_reply(TokenError(ErrorCode::NotCurrentOwner, "not yours"));
    BOOST_CHECK_EQUAL(reply.at("status").get<std::string>(), "ERROR");
    BOOST_CHECK_EQUAL(reply.at("code").get<std::string>(), "NotCurrentOwner");
    BOOST_CHECK_EQUAL(reply.at("message").get<std::string>(), "not yours");
}

BOOST_AUTO_TEST_SUITE_END()
