/**
 * PCash: Plasma Cash Core - Node Configuration
 * Purpose: Settings for the node host, read from a JSON config file and
 * overridden by PCASH_* environment variables.
 */

#ifndef PCASH_CONFIG_HPP
#define PCASH_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pcash {

struct SinkConfig {
    std::string id;
    std::string name;
    std::string kind;   // "stdout" or "file"
    std::string path;   // file sinks only
    bool active = true;
};

struct NodeConfig {
    std::string chain = "local";
    std::string genesis_file;
    std::string log_level = "INFO";
    size_t log_capacity = 200;
    std::vector<SinkConfig> sinks;
};

/**
 * parse_node_config
 * Applies the keys present in `doc` on top of the defaults.
 * @throws TokenError(MalformedInput) on ill-typed values.
 */
NodeConfig parse_node_config(const json& doc);

/**
 * load_node_config
 * Reads $PCASH_CONFIG if set (a missing file logs a warning and falls back
 * to defaults), then applies PCASH_CHAIN, PCASH_GENESIS_FILE,
 * PCASH_LOG_LEVEL and PCASH_LOG_CAPACITY.
 */
NodeConfig load_node_config();

} // namespace pcash

#endif
