/**
 * ============================================================================
 * PCASH: PLASMA CASH NODE HOST
 * MODULE: EffectDispatcher.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The token ledger never publishes anything itself; it hands a TokenEffect
 * back to the host. This dispatcher is the host side of that contract: it
 * keeps a registry of effect sinks and forwards every accepted effect to
 * the active ones as a JSON line.
 * * AUDIT CHAIN:
 * Every published effect is bonded onto a running SHA-256 head, starting
 * from SHA-256("GENESIS"). Two nodes that applied the same command sequence
 * report the same head.
 * ============================================================================
 */

#ifndef PCASH_EFFECT_DISPATCHER_HPP
#define PCASH_EFFECT_DISPATCHER_HPP

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../core/config.hpp"
#include "../core/ledger.hpp"

using json = nlohmann::json;

namespace pcash {
namespace host {

    /**
     * @brief Registry entry for one effect sink.
     */
    struct SinkDefinition {
        std::string id;             // Unique ID (e.g., "audit-file")
        std::string name;           // Human readable
        std::string kind;           // "stdout" | "file"
        std::string path;           // Target file for "file" sinks
        bool is_active = true;      // Soft-disable switch
    };

    class EffectDispatcher {
    public:
        EffectDispatcher();
        ~EffectDispatcher();

        /**
         * @brief Adds a sink to the routing table.
         * @return false on an ID conflict or an unknown sink kind.
         */
        bool RegisterSink(const SinkDefinition& def);

        // Registers every sink listed in the node configuration.
        void RegisterSinks(const std::vector<SinkConfig>& sinks);

        /**
         * @brief Soft-enable or disable a sink.
         * @return false if no sink has that ID.
         */
        bool SetActive(const std::string& sink_id, bool active);

        /**
         * @brief Bonds the effect onto the audit chain and forwards it.
         * A sink that reports a write failure is logged and skipped. An
         * exception thrown by a sink propagates after the audit head moved.
         * @return The JSON payload that was published.
         */
        json Publish(const TokenEffect& effect);

        const std::string& AuditHead() const { return audit_head_; }
        size_t PublishedCount() const { return published_; }
        size_t SinkCount() const { return registry_.size(); }

    private:
        std::map<std::string, SinkDefinition> registry_;
        std::string audit_head_;
        size_t published_ = 0;

        bool Deliver(const SinkDefinition& sink, const std::string& line);
    };

} // namespace host
} // namespace pcash

#endif // PCASH_EFFECT_DISPATCHER_HPP
