#include "genesis.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "serialization.hpp"
#include "../schemes/ed25519.hpp"
#include <fstream>

namespace pcash {

std::optional<ChainPreset> chain_preset_from(const std::string& name) {
    // Dev config is used for live testing
    if (name == "dev") return ChainPreset::Development;
    // Default chain is local config, used for demos
    if (name.empty() || name == "local") return ChainPreset::LocalTestnet;
    if (name == "custom") return ChainPreset::Custom;
    return std::nullopt;
}

Transaction genesis_txn_for_phrase(const std::string& phrase, const TokenId& token_id) {
    const Ed25519Signer owner = Ed25519Signer::from_phrase(phrase);
    Ed25519Scheme scheme;

    const UnsignedTransaction unsigned_txn(owner.public_identity(), token_id, BlockReference(0));
    const Signature signature = owner.sign(unsigned_txn.hash());
    return unsigned_txn.add_signature(owner.public_identity(), signature, scheme);
}

std::vector<Transaction> preset_genesis(ChainPreset preset) {
    std::vector<Transaction> out;
    switch (preset) {
        case ChainPreset::Development:
            out.push_back(genesis_txn_for_phrase("//Alice", TokenId(1)));
            break;
        case ChainPreset::LocalTestnet:
            out.push_back(genesis_txn_for_phrase("//Charlie", TokenId(1)));
            out.push_back(genesis_txn_for_phrase("//Dave", TokenId(2)));
            out.push_back(genesis_txn_for_phrase("//Eve", TokenId(3)));
            out.push_back(genesis_txn_for_phrase("//Ferdie", TokenId(4)));
            break;
        case ChainPreset::Custom:
            break;
    }
    return out;
}

std::vector<Transaction> parse_genesis(const json& doc) {
    if (!doc.is_object() || !doc.contains("tokens") || !doc.at("tokens").is_array()) {
        throw TokenError(ErrorCode::MalformedInput, "genesis must be an object with a 'tokens' array");
    }

    std::vector<Transaction> out;
    for (const auto& entry : doc.at("tokens")) {
        if (entry.is_object() && entry.contains("seed")) {
            if (!entry.at("seed").is_string() || !entry.contains("token_id")) {
                throw TokenError(ErrorCode::MalformedInput, "seeded genesis entry needs a 'seed' string and a 'token_id'");
            }
            out.push_back(genesis_txn_for_phrase(entry.at("seed").get<std::string>(),
                                                 parse_u256(entry.at("token_id"))));
        } else {
            out.push_back(parse_transaction(entry));
        }
    }
    return out;
}

std::vector<Transaction> load_genesis_file(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        pcash_log("ERROR", "Genesis file missing: " + path);
        throw TokenError(ErrorCode::MalformedInput, "cannot open genesis file " + path);
    }

    json doc;
    try {
        doc = json::parse(ifs);
    } catch (const json::exception& e) {
        pcash_log("ERROR", "Genesis Parse Error: " + std::string(e.what()));
        throw TokenError(ErrorCode::MalformedInput, "genesis file " + path + " is corrupt");
    }
    return parse_genesis(doc);
}

} // namespace pcash
