/**
 * PCash: Plasma Cash Core - Token Ledger Logic
 * Focus: Ownership-chain validation and atomic per-token commits.
 */

#include "ledger.hpp"
#include "commitment.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "../schemes/interface/signature_scheme.hpp"
#include <set>

namespace pcash {

namespace {

std::string token_label(const TokenId& id) {
    return "token " + id.to_dec();
}

[[noreturn]] void reject(ErrorCode code, const std::string& message) {
    pcash_log("WARN", std::string("Rejected (") + error_code_name(code) + "): " + message);
    throw TokenError(code, message);
}

} // namespace

const char* effect_kind_name(EffectKind kind) {
    switch (kind) {
        case EffectKind::Deposited:   return "Deposited";
        case EffectKind::Transferred: return "Transferred";
        case EffectKind::Withdrawn:   return "Withdrawn";
    }
    return "Unknown";
}

TokenEffect TokenLedger::deposit(const AccountId& caller, const Transaction& txn) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (tokens_.find(txn.token_id()) != tokens_.end()) {
        reject(ErrorCode::TokenAlreadyExists, token_label(txn.token_id()) + " is already deposited");
    }
    if (!txn.valid(scheme_)) {
        reject(ErrorCode::InvalidSignature, "deposit of " + token_label(txn.token_id()) + " carries a bad signature");
    }
    if (caller != txn.sender()) {
        reject(ErrorCode::SignerMismatch, "caller " + caller.to_hex() + " did not sign the deposit");
    }

    tokens_.emplace(txn.token_id(), txn);

    TokenEffect effect;
    effect.kind = EffectKind::Deposited;
    effect.token_id = txn.token_id();
    effect.from = txn.sender();
    effect.to = txn.receiver();
    effect.leaf = leaf_value(txn);

    pcash_log("DEBUG", "Deposited " + token_label(txn.token_id()) + " to " + txn.receiver().to_hex());
    return effect;
}

TokenEffect TokenLedger::transfer(const AccountId& caller, const Transaction& txn) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tokens_.find(txn.token_id());
    if (it == tokens_.end()) {
        reject(ErrorCode::TokenDoesNotExist, token_label(txn.token_id()) + " is not deposited");
    }
    if (!txn.valid(scheme_)) {
        reject(ErrorCode::InvalidSignature, "transfer of " + token_label(txn.token_id()) + " carries a bad signature");
    }
    if (caller != txn.sender()) {
        reject(ErrorCode::SignerMismatch, "caller " + caller.to_hex() + " did not sign the transfer");
    }

    // The new transaction must spend exactly what the current one produced.
    const Transaction& prev = it->second;
    if (classify(txn, prev) != Relationship::Child) {
        reject(ErrorCode::NotCurrentOwner, "sender " + txn.sender().to_hex() + " does not own " + token_label(txn.token_id()));
    }

    TokenEffect effect;
    effect.kind = EffectKind::Transferred;
    effect.token_id = txn.token_id();
    effect.from = prev.receiver();
    effect.to = txn.receiver();
    effect.leaf = leaf_value(txn);

    it->second = txn;

    pcash_log("DEBUG", "Transferred " + token_label(txn.token_id()) + " from " +
              effect.from.to_hex() + " to " + effect.to.to_hex());
    return effect;
}

TokenEffect TokenLedger::withdraw(const AccountId& caller, const TokenId& token_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) {
        reject(ErrorCode::TokenDoesNotExist, token_label(token_id) + " is not deposited");
    }
    if (caller != it->second.receiver()) {
        reject(ErrorCode::NotCurrentOwner, "caller " + caller.to_hex() + " does not own " + token_label(token_id));
    }

    TokenEffect effect;
    effect.kind = EffectKind::Withdrawn;
    effect.token_id = token_id;
    effect.from = it->second.receiver();
    effect.to = it->second.receiver();
    effect.leaf = empty_leaf_value();

    tokens_.erase(it);

    pcash_log("DEBUG", "Withdrew " + token_label(token_id) + " by " + caller.to_hex());
    return effect;
}

std::optional<Transaction> TokenLedger::current_owner_txn(const TokenId& token_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return std::nullopt;
    return it->second;
}

Hash256 TokenLedger::leaf_value_of(const TokenId& token_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tokens_.find(token_id);
    if (it == tokens_.end()) return empty_leaf_value();
    return leaf_value(it->second);
}

void TokenLedger::seed(const std::vector<Transaction>& genesis) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Validate the whole list before touching the map.
    std::set<TokenId> seen;
    for (const auto& txn : genesis) {
        if (!txn.valid(scheme_)) {
            reject(ErrorCode::InvalidSignature, "genesis entry for " + token_label(txn.token_id()) + " carries a bad signature");
        }
        if (!seen.insert(txn.token_id()).second || tokens_.count(txn.token_id()) != 0) {
            reject(ErrorCode::DuplicateGenesisToken, "genesis names " + token_label(txn.token_id()) + " more than once");
        }
    }

    for (const auto& txn : genesis) {
        tokens_.emplace(txn.token_id(), txn);
    }
    pcash_log("INFO", "Genesis seeded " + std::to_string(genesis.size()) + " token(s) under " +
              scheme_.get_scheme_name() + ".");
}

size_t TokenLedger::token_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tokens_.size();
}

std::vector<TokenId> TokenLedger::token_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TokenId> ids;
    ids.reserve(tokens_.size());
    for (const auto& pair : tokens_) {
        ids.push_back(pair.first);
    }
    return ids;
}

} // namespace pcash
