/**
 * ============================================================================
 * PCASH: PLASMA CASH NODE HOST
 * MODULE: CommandProcessor.cpp
 * ============================================================================
 */

#include "CommandProcessor.hpp"
#include "../core/commitment.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../core/serialization.hpp"

namespace pcash {
namespace host {

namespace {

const json& required(const json& command, const char* field) {
    if (!command.contains(field)) {
        throw TokenError(ErrorCode::MalformedInput, std::string("command is missing '") + field + "'");
    }
    return command.at(field);
}

} // namespace

json CommandProcessor::Execute(const json& command) {
    try {
        json reply = Dispatch(command);
        ++accepted_;
        return reply;
    } catch (const TokenError& e) {
        ++rejected_;
        return error_reply(e);
    } catch (const json::exception& e) {
        ++rejected_;
        return error_reply(TokenError(ErrorCode::MalformedInput, e.what()));
    } catch (const std::exception& e) {
        // The ledger may already have committed; only publication failed.
        ++rejected_;
        pcash_log("ERROR", "Command failed after dispatch: " + std::string(e.what()));
        return error_reply(TokenError(ErrorCode::InternalError, e.what()));
    }
}

json CommandProcessor::ExecuteLine(const std::string& line) {
    json command;
    try {
        command = json::parse(line);
    } catch (const json::exception& e) {
        ++rejected_;
        pcash_log("WARN", "Unparseable command line: " + std::string(e.what()));
        return error_reply(TokenError(ErrorCode::MalformedInput, "command is not valid JSON"));
    }
    return Execute(command);
}

size_t CommandProcessor::Run(std::istream& in, std::ostream& out) {
    const size_t rejected_before = rejected_;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        out << ExecuteLine(line).dump() << std::endl;
    }
    return rejected_ - rejected_before;
}

// ----------------------------------------------------------------------------
// Dispatch
// Routes a decoded command to the matching ledger operation.
// ----------------------------------------------------------------------------
json CommandProcessor::Dispatch(const json& command) {
    if (!command.is_object()) {
        throw TokenError(ErrorCode::MalformedInput, "command must be a JSON object");
    }
    const std::string op = required(command, "op").get<std::string>();

    if (op == "deposit") {
        const AccountId caller = parse_account(required(command, "caller"));
        const Transaction txn = parse_transaction(required(command, "txn"));
        return Commit(ledger_.deposit(caller, txn));
    }

    if (op == "transfer") {
        const AccountId caller = parse_account(required(command, "caller"));
        const Transaction txn = parse_transaction(required(command, "txn"));
        return Commit(ledger_.transfer(caller, txn));
    }

    if (op == "withdraw") {
        const AccountId caller = parse_account(required(command, "caller"));
        const TokenId token_id = parse_u256(required(command, "token_id"));
        return Commit(ledger_.withdraw(caller, token_id));
    }

    if (op == "query") {
        const TokenId token_id = parse_u256(required(command, "token_id"));
        const auto current = ledger_.current_owner_txn(token_id);
        return {
            {"status", "SUCCESS"},
            {"token_id", token_id},
            {"txn", current ? json(*current) : json(nullptr)},
            {"leaf_index", leaf_index(token_id).to_string()},
            {"leaf", ledger_.leaf_value_of(token_id)}
        };
    }

    if (op == "classify") {
        const Transaction a = parse_transaction(required(command, "a"));
        const Transaction b = parse_transaction(required(command, "b"));
        if (a.token_id() != b.token_id()) {
            throw TokenError(ErrorCode::MalformedInput, "classify needs two transactions for the same token");
        }
        return {
            {"status", "SUCCESS"},
            {"relationship", classify(a, b)},
            {"two_cycle", is_two_cycle(a, b)}
        };
    }

    throw TokenError(ErrorCode::MalformedInput, "unknown op '" + op + "'");
}

json CommandProcessor::Commit(const TokenEffect& effect) {
    json published = dispatcher_.Publish(effect);
    return {
        {"status", "SUCCESS"},
        {"effect", published}
    };
}

} // namespace host
} // namespace pcash
