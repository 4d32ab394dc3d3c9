#include "serialization.hpp"
#include "crypto.hpp"
#include <stdexcept>

namespace pcash {

void to_json(json& j, const U256& value) {
    j = value.to_hex();
}

void from_json(const json& j, U256& value) {
    if (j.is_number_unsigned()) {
        value = U256(j.get<uint64_t>());
        return;
    }
    if (j.is_number_integer()) {
        const int64_t signed_value = j.get<int64_t>();
        if (signed_value < 0) {
            throw std::invalid_argument("U256 cannot be negative");
        }
        value = U256(static_cast<uint64_t>(signed_value));
        return;
    }
    if (!j.is_string()) {
        throw std::invalid_argument("U256 must be a string or an unsigned number");
    }

    const std::string text = j.get<std::string>();
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        value = U256::from_hex(text);
    } else {
        value = U256::from_dec(text);
    }
}

void to_json(json& j, const AccountId& account) {
    j = account.to_hex();
}

void from_json(const json& j, AccountId& account) {
    account = AccountId::from_hex(j.get<std::string>());
}

void to_json(json& j, const UnsignedTransaction& txn) {
    j = json{
        {"receiver", txn.receiver()},
        {"token_id", txn.token_id()},
        {"prev_blk_num", txn.prev_blk_num()}
    };
}

void to_json(json& j, const Transaction& txn) {
    j = json{
        {"receiver", txn.receiver()},
        {"token_id", txn.token_id()},
        {"prev_blk_num", txn.prev_blk_num()},
        {"sender", txn.sender()},
        {"signature", "0x" + PCashCrypto::to_hex(txn.signature().data(), txn.signature().size())}
    };
}

void to_json(json& j, const TokenEffect& effect) {
    j = json{
        {"event", effect_kind_name(effect.kind)},
        {"token_id", effect.token_id},
        {"from", effect.from},
        {"to", effect.to},
        {"leaf", effect.leaf}
    };
}

void to_json(json& j, Relationship rel) {
    j = relationship_name(rel);
}

json error_reply(const TokenError& error) {
    return {
        {"status", "ERROR"},
        {"code", error_code_name(error.code())},
        {"message", error.what()}
    };
}

U256 parse_u256(const json& j) {
    try {
        return j.get<U256>();
    } catch (const std::exception& e) {
        throw TokenError(ErrorCode::MalformedInput, std::string("bad 256-bit value: ") + e.what());
    }
}

AccountId parse_account(const json& j) {
    try {
        return j.get<AccountId>();
    } catch (const std::exception& e) {
        throw TokenError(ErrorCode::MalformedInput, std::string("bad account id: ") + e.what());
    }
}

Transaction parse_transaction(const json& j) {
    if (!j.is_object()) {
        throw TokenError(ErrorCode::MalformedInput, "transaction must be a JSON object");
    }
    for (const char* field : {"receiver", "token_id", "prev_blk_num", "sender", "signature"}) {
        if (!j.contains(field)) {
            throw TokenError(ErrorCode::MalformedInput, std::string("transaction is missing '") + field + "'");
        }
    }

    Signature signature;
    try {
        signature = PCashCrypto::from_hex(j.at("signature").get<std::string>());
    } catch (const std::exception& e) {
        throw TokenError(ErrorCode::MalformedInput, std::string("bad signature encoding: ") + e.what());
    }

    return Transaction::from_untrusted(parse_account(j.at("receiver")),
                                       parse_u256(j.at("token_id")),
                                       parse_u256(j.at("prev_blk_num")),
                                       parse_account(j.at("sender")),
                                       signature);
}

} // namespace pcash
