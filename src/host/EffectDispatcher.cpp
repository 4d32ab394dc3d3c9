/**
 * ============================================================================
 * PCASH: PLASMA CASH NODE HOST
 * MODULE: EffectDispatcher.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Implementation of the EffectDispatcher. Acts as the traffic controller
 * between the token ledger's accepted effects and whatever the operator
 * wired up to observe them.
 * ============================================================================
 */

#include "EffectDispatcher.hpp"
#include "../core/crypto.hpp"
#include "../core/log.hpp"
#include "../core/serialization.hpp"
#include <fstream>
#include <iostream>

namespace pcash {
namespace host {

// ----------------------------------------------------------------------------
// Constructor
// Starts the audit chain at its fixed genesis anchor.
// ----------------------------------------------------------------------------
EffectDispatcher::EffectDispatcher()
    : audit_head_(PCashCrypto::generate_sha256("GENESIS")) {
    pcash_log("DEBUG", "Effect dispatcher initialised.");
}

EffectDispatcher::~EffectDispatcher() {
    registry_.clear();
}

// ----------------------------------------------------------------------------
// RegisterSink
// Check if the sink is already registered to prevent overwrites.
// ----------------------------------------------------------------------------
bool EffectDispatcher::RegisterSink(const SinkDefinition& def) {
    if (registry_.find(def.id) != registry_.end()) {
        pcash_log("ERROR", "Sink ID conflict: " + def.id);
        return false;
    }
    if (def.kind != "stdout" && def.kind != "file") {
        pcash_log("ERROR", "Unknown sink kind '" + def.kind + "' for sink " + def.id);
        return false;
    }
    if (def.kind == "file" && def.path.empty()) {
        pcash_log("ERROR", "File sink " + def.id + " has no path.");
        return false;
    }

    registry_[def.id] = def;
    pcash_log("INFO", "Registered Sink: " + def.name + " (" + def.id + ") -> " +
              (def.kind == "file" ? def.path : std::string("stdout")));
    return true;
}

void EffectDispatcher::RegisterSinks(const std::vector<SinkConfig>& sinks) {
    for (const auto& cfg : sinks) {
        SinkDefinition def;
        def.id = cfg.id;
        def.name = cfg.name;
        def.kind = cfg.kind;
        def.path = cfg.path;
        def.is_active = cfg.active;
        RegisterSink(def);
    }
}

bool EffectDispatcher::SetActive(const std::string& sink_id, bool active) {
    auto it = registry_.find(sink_id);
    if (it == registry_.end()) return false;

    if (it->second.is_active != active) {
        it->second.is_active = active;
        pcash_log(active ? "INFO" : "WARN",
                  std::string("Sink ") + (active ? "enabled: " : "disabled: ") + sink_id);
    }
    return true;
}

// ----------------------------------------------------------------------------
// Publish
// 1. Serialise the effect  2. Bond it onto the audit chain  3. Fan out.
// ----------------------------------------------------------------------------
json EffectDispatcher::Publish(const TokenEffect& effect) {
    json payload = effect;
    const std::string body = payload.dump();

    audit_head_ = PCashCrypto::bond_hash(audit_head_, body);
    ++published_;

    payload["sequence"] = published_;
    payload["audit_head"] = audit_head_;
    const std::string line = payload.dump();

    for (const auto& pair : registry_) {
        if (!pair.second.is_active) continue;
        if (!Deliver(pair.second, line)) {
            pcash_log("WARN", "Sink delivery failed: " + pair.first);
        }
    }
    return payload;
}

// ----------------------------------------------------------------------------
// Deliver
// The actual byte-pusher for a single sink.
// ----------------------------------------------------------------------------
bool EffectDispatcher::Deliver(const SinkDefinition& sink, const std::string& line) {
    if (sink.kind == "stdout") {
        std::cout << line << std::endl;
        return static_cast<bool>(std::cout);
    }

    std::ofstream ofs(sink.path, std::ios::app);
    if (!ofs.is_open()) return false;
    ofs << line << '\n';
    return static_cast<bool>(ofs);
}

} // namespace host
} // namespace pcash
