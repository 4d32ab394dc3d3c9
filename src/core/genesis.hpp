/**
 * PCash: Plasma Cash Core - Genesis
 * Purpose: Initial token distribution, either from a built-in chain preset
 * or from a genesis JSON file.
 */

#ifndef PCASH_GENESIS_HPP
#define PCASH_GENESIS_HPP

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "transaction.hpp"

using json = nlohmann::json;

namespace pcash {

enum class ChainPreset {
    Development,  // token 1 owned by //Alice
    LocalTestnet, // tokens 1..4 owned by //Charlie, //Dave, //Eve, //Ferdie
    Custom        // read from a genesis file
};

// "dev" -> Development, "" or "local" -> LocalTestnet, "custom" -> Custom.
std::optional<ChainPreset> chain_preset_from(const std::string& name);

/**
 * genesis_txn_for_phrase
 * Self-signed deposit (sender == receiver, prev_blk_num 0) for the account
 * derived from `phrase`.
 */
Transaction genesis_txn_for_phrase(const std::string& phrase, const TokenId& token_id);

std::vector<Transaction> preset_genesis(ChainPreset preset);

/**
 * parse_genesis
 * Accepts {"tokens": [...]} where each entry is either
 *   {"token_id": N, "seed": "//Name"}   (self-signed from a phrase), or
 *   a full signed transaction object.
 * Signatures are checked later, by TokenLedger::seed.
 * @throws TokenError(MalformedInput)
 */
std::vector<Transaction> parse_genesis(const json& doc);

// Reads and parses a genesis file. @throws TokenError(MalformedInput)
std::vector<Transaction> load_genesis_file(const std::string& path);

} // namespace pcash

#endif
