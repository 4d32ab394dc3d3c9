/**
 * PCash: Plasma Cash Core - JSON Codec
 * Purpose: nlohmann::json bindings for the values hosts exchange with the
 * core (genesis files, command lines, effect notifications).
 */

#ifndef PCASH_SERIALIZATION_HPP
#define PCASH_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include "errors.hpp"
#include "ledger.hpp"
#include "relationship.hpp"
#include "transaction.hpp"

using json = nlohmann::json;

namespace pcash {

    // U256 out: "0x" + 64 hex digits. In: "0x..." hex, decimal string, or unsigned number.
    void to_json(json& j, const U256& value);
    void from_json(const json& j, U256& value);

    void to_json(json& j, const AccountId& account);
    void from_json(const json& j, AccountId& account);

    void to_json(json& j, const UnsignedTransaction& txn);
    void to_json(json& j, const Transaction& txn);

    void to_json(json& j, const TokenEffect& effect);

    // Relationship goes out as its name, e.g. "DoubleSpend".
    void to_json(json& j, Relationship rel);

    // {"status":"ERROR","code":"NotCurrentOwner","message":"..."}
    json error_reply(const TokenError& error);

    /**
     * parse_transaction
     * Decodes a transaction from untrusted input. The result is NOT
     * signature-checked; callers must run valid() before trusting it.
     * @throws TokenError(MalformedInput) on missing or ill-typed fields.
     */
    Transaction parse_transaction(const json& j);

    // Same decoding rules as from_json, with failures mapped to MalformedInput.
    U256 parse_u256(const json& j);
    AccountId parse_account(const json& j);

} // namespace pcash

namespace nlohmann {

    template <>
    struct adl_serializer<pcash::Transaction> {
        static pcash::Transaction from_json(const json& j) { return pcash::parse_transaction(j); }
        static void to_json(json& j, const pcash::Transaction& txn) { pcash::to_json(j, txn); }
    };

} // namespace nlohmann

#endif
