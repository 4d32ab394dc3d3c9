#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace pcash {

namespace {

// Digits only; no sign, no whitespace.
bool parse_capacity(const std::string& text, size_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

NodeConfig parse_node_config(const json& doc) {
    NodeConfig config;
    if (!doc.is_object()) {
        throw TokenError(ErrorCode::MalformedInput, "config root must be a JSON object");
    }

    try {
        config.chain = doc.value("chain", config.chain);
        config.genesis_file = doc.value("genesis_file", config.genesis_file);
        config.log_level = doc.value("log_level", config.log_level);
        if (doc.contains("log_capacity")) {
            const json& capacity = doc.at("log_capacity");
            if (!capacity.is_number_integer() ||
                (!capacity.is_number_unsigned() && capacity.get<int64_t>() < 0)) {
                throw TokenError(ErrorCode::MalformedInput, "log_capacity must be a non-negative integer");
            }
            config.log_capacity = capacity.get<size_t>();
        }

        if (doc.contains("sinks")) {
            for (const auto& s : doc.at("sinks")) {
                SinkConfig sink;
                sink.id = s.at("id").get<std::string>();
                sink.name = s.value("name", sink.id);
                sink.kind = s.value("kind", std::string("stdout"));
                sink.path = s.value("path", std::string());
                sink.active = s.value("active", true);
                config.sinks.push_back(sink);
            }
        }
    } catch (const json::exception& e) {
        throw TokenError(ErrorCode::MalformedInput, std::string("invalid configuration: ") + e.what());
    }
    return config;
}

NodeConfig load_node_config() {
    NodeConfig config;

    const char* env_config = std::getenv("PCASH_CONFIG");
    if (env_config) {
        std::ifstream ifs(env_config);
        if (ifs.is_open()) {
            try {
                config = parse_node_config(json::parse(ifs));
            } catch (const json::exception& e) {
                pcash_log("ERROR", "Config Parse Error: " + std::string(e.what()));
                throw TokenError(ErrorCode::MalformedInput, "configuration file is corrupt");
            }
        } else {
            pcash_log("WARN", "Config file missing. Using system defaults.");
        }
    }

    if (const char* env_chain = std::getenv("PCASH_CHAIN")) config.chain = env_chain;
    if (const char* env_genesis = std::getenv("PCASH_GENESIS_FILE")) config.genesis_file = env_genesis;
    if (const char* env_level = std::getenv("PCASH_LOG_LEVEL")) config.log_level = env_level;
    if (const char* env_capacity = std::getenv("PCASH_LOG_CAPACITY")) {
        if (!parse_capacity(env_capacity, config.log_capacity)) {
            pcash_log("WARN", "Ignoring invalid PCASH_LOG_CAPACITY: " + std::string(env_capacity));
        }
    }

    return config;
}

} // namespace pcash
