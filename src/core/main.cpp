/**
 * ============================================================================
 * SOFTWARE: PCash: Plasma Cash Token Core - Node Host
 * MODULE: main.cpp
 * ============================================================================
 * * USAGE:
 *   pcash-node run [commands.jsonl]     apply commands from a file or stdin
 *   pcash-node account <phrase>         print the account id for a phrase
 *   pcash-node sign <phrase> <receiver> <token_id> <prev_blk_num>
 *                                       print a signed transaction
 * ============================================================================
 */

#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "genesis.hpp"
#include "ledger.hpp"
#include "log.hpp"
#include "serialization.hpp"
#include "../host/CommandProcessor.hpp"
#include "../host/EffectDispatcher.hpp"
#include "../schemes/ed25519.hpp"

using json = nlohmann::json;

namespace {

void print_usage() {
    std::cerr << "usage:\n"
              << "  pcash-node run [commands.jsonl]\n"
              << "  pcash-node account <phrase>\n"
              << "  pcash-node sign <phrase> <receiver> <token_id> <prev_blk_num>\n";
}

// Receiver given either as a hex account id or as a "//Name" phrase.
pcash::AccountId resolve_account(const std::string& arg) {
    if (arg.rfind("//", 0) == 0) {
        return pcash::Ed25519Signer::from_phrase(arg).public_identity();
    }
    return pcash::parse_account(json(arg));
}

int run_account(const std::string& phrase) {
    std::cout << pcash::Ed25519Signer::from_phrase(phrase).public_identity().to_hex() << std::endl;
    return 0;
}

int run_sign(const std::vector<std::string>& args) {
    const pcash::Ed25519Signer sender = pcash::Ed25519Signer::from_phrase(args[0]);
    pcash::Ed25519Scheme scheme;

    const pcash::UnsignedTransaction unsigned_txn(resolve_account(args[1]),
                                                  pcash::parse_u256(json(args[2])),
                                                  pcash::parse_u256(json(args[3])));
    const pcash::Transaction txn = unsigned_txn.add_signature(sender.public_identity(),
                                                              sender.sign(unsigned_txn.hash()),
                                                              scheme);
    std::cout << json(txn).dump() << std::endl;
    return 0;
}

int run_node(const std::string& commands_path) {
    const pcash::NodeConfig config = pcash::load_node_config();
    pcash::set_log_level(config.log_level);
    pcash::set_log_capacity(config.log_capacity);

    const auto preset = pcash::chain_preset_from(config.chain);
    if (!preset) {
        pcash::pcash_log("FATAL", "Unknown chain '" + config.chain + "'. System halted.");
        return 1;
    }

    pcash::Ed25519Scheme scheme;
    pcash::TokenLedger ledger(scheme);

    std::vector<pcash::Transaction> genesis;
    if (*preset == pcash::ChainPreset::Custom) {
        if (config.genesis_file.empty()) {
            pcash::pcash_log("FATAL", "Custom chain selected but no genesis file configured. System halted.");
            return 1;
        }
        genesis = pcash::load_genesis_file(config.genesis_file);
    } else {
        genesis = pcash::preset_genesis(*preset);
    }
    ledger.seed(genesis);

    pcash::host::EffectDispatcher dispatcher;
    dispatcher.RegisterSinks(config.sinks);
    pcash::host::CommandProcessor processor(ledger, dispatcher);

    pcash::pcash_log("INFO", "PCash node active on chain '" + config.chain + "' with " +
                     std::to_string(ledger.token_count()) + " token(s), signatures: " +
                     scheme.get_scheme_name() + ".");

    if (commands_path.empty()) {
        processor.Run(std::cin, std::cout);
    } else {
        std::ifstream ifs(commands_path);
        if (!ifs.is_open()) {
            pcash::pcash_log("FATAL", "Command file missing: " + commands_path);
            return 1;
        }
        processor.Run(ifs, std::cout);
    }

    pcash::pcash_log("INFO", "Applied " + std::to_string(processor.AcceptedCount()) + " command(s), rejected " +
                     std::to_string(processor.RejectedCount()) + ". Audit head " + dispatcher.AuditHead());
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty()) {
        print_usage();
        return 2;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    try {
        if (command == "run" && args.size() <= 1) {
            return run_node(args.empty() ? std::string() : args[0]);
        }
        if (command == "account" && args.size() == 1) {
            return run_account(args[0]);
        }
        if (command == "sign" && args.size() == 4) {
            return run_sign(args);
        }
    } catch (const pcash::TokenError& e) {
        pcash::pcash_log("FATAL", std::string(pcash::error_code_name(e.code())) + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        pcash::pcash_log("FATAL", e.what());
        return 1;
    }

    print_usage();
    return 2;
}
