#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "test/test_pcash.h"

#include <boost/test/unit_test.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>

using namespace pcash;

namespace {

const char* const NODE_ENV_VARS[] = {
    "PCASH_CONFIG", "PCASH_CHAIN", "PCASH_GENESIS_FILE", "PCASH_LOG_LEVEL", "PCASH_LOG_CAPACITY"
};

} // namespace

/**
 * Clears the PCASH_* variables for the test and puts the caller's values
 * back afterwards. Config files are written to a scratch path.
 */
struct NodeEnvSetup : public BasicTestingSetup {
    std::map<std::string, std::string> saved;
    const std::string path = "pcash_config_test.json";

    NodeEnvSetup()
    {
        for (const char* name : NODE_ENV_VARS) {
            if (const char* value = std::getenv(name)) saved[name] = value;
            unsetenv(name);
        }
    }

    ~NodeEnvSetup()
    {
        for (const char* name : NODE_ENV_VARS) {
            auto it = saved.find(name);
            if (it != saved.end()) {
                setenv(name, it->second.c_str(), 1);
            } else {
                unsetenv(name);
            }
        }
        std::remove(path.c_str());
    }

    void WriteConfig(const std::string& body) const
    {
        std::ofstream ofs(path);
        ofs << body;
    }
};

BOOST_AUTO_TEST_SUITE(config_tests)

BOOST_AUTO_TEST_CASE(empty_document_keeps_defaults)
{
    const NodeConfig config = parse_node_config(json::object());
    BOOST_CHECK_EQUAL(config.chain, "local");
    BOOST_CHECK(config.genesis_file.empty());
    BOOST_CHECK_EQUAL(config.log_level, "INFO");
    BOOST_CHECK_EQUAL(config.log_capacity, 200U);
    BOOST_CHECK(config.sinks.empty());
}

BOOST_AUTO_TEST_CASE(keys_override_defaults)
{
    const json doc = json::parse(R"({
        "chain": "custom",
        "genesis_file": "genesis.json",
        "log_level": "DEBUG",
        "log_capacity": 50,
        "sinks": [
            {"id": "audit", "name": "Audit Trail", "kind": "file", "path": "effects.log"},
            {"id": "console", "active": false}
        ]
    })");

    const NodeConfig config = parse_node_config(doc);
    BOOST_CHECK_EQUAL(config.chain, "custom");
    BOOST_CHECK_EQUAL(config.genesis_file, "genesis.json");
    BOOST_CHECK_EQUAL(config.log_level, "DEBUG");
    BOOST_CHECK_EQUAL(config.log_capacity, 50U);

    BOOST_REQUIRE_EQUAL(config.sinks.size(), 2U);
    BOOST_CHECK_EQUAL(config.sinks[0].name, "Audit Trail");
    BOOST_CHECK_EQUAL(config.sinks[0].kind, "file");
    BOOST_CHECK_EQUAL(config.sinks[0].path, "effects.log");
    BOOST_CHECK(config.sinks[0].active);

    // Omitted sink fields fall back: name to id, kind to stdout.
    BOOST_CHECK_EQUAL(config.sinks[1].name, "console");
    BOOST_CHECK_EQUAL(config.sinks[1].kind, "stdout");
    BOOST_CHECK(!config.sinks[1].active);
}

BOOST_AUTO_TEST_CASE(ill_typed_values_are_rejected)
{
    BOOST_CHECK_THROW(parse_node_config(json::array()), TokenError);
    BOOST_CHECK_THROW(parse_node_config(json{{"chain", 3}}), TokenError);
    BOOST_CHECK_THROW(parse_node_config(json{{"log_capacity", "lots"}}), TokenError);
    BOOST_CHECK_THROW(parse_node_config(json{{"log_capacity", 2.5}}), TokenError);
    BOOST_CHECK_THROW(parse_node_config(json::parse(R"({"sinks":[{"name":"no id"}]})")), TokenError);

    try {
        parse_node_config(json{{"log_level", false}});
        BOOST_FAIL("a boolean log level was accepted");
    } catch (const TokenError& e) {
        BOOST_CHECK(e.code() == ErrorCode::MalformedInput);
    }
}

BOOST_AUTO_TEST_CASE(negative_log_capacity_is_rejected)
{
    try {
        parse_node_config(json{{"log_capacity", -1}});
        BOOST_FAIL("a negative log capacity was accepted");
    } catch (const TokenError& e) {
        BOOST_CHECK(e.code() == ErrorCode::MalformedInput);
    }
    BOOST_CHECK_THROW(parse_node_config(json::parse(R"({"log_capacity": -200})")), TokenError);
    BOOST_CHECK_EQUAL(parse_node_config(json::parse(R"({"log_capacity": 0})")).log_capacity, 0U);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(node_config_env_tests, NodeEnvSetup)

BOOST_AUTO_TEST_CASE(no_environment_gives_defaults)
{
    const NodeConfig config = load_node_config();
    BOOST_CHECK_EQUAL(config.chain, "local");
    BOOST_CHECK_EQUAL(config.log_level, "INFO");
    BOOST_CHECK_EQUAL(config.log_capacity, 200U);
}

BOOST_AUTO_TEST_CASE(environment_overrides_file)
{
    WriteConfig(R"({"chain": "dev", "genesis_file": "from-file.json", "log_level": "WARN", "log_capacity": 10})");
    setenv("PCASH_CONFIG", path.c_str(), 1);

    const NodeConfig from_file = load_node_config();
    BOOST_CHECK_EQUAL(from_file.chain, "dev");
    BOOST_CHECK_EQUAL(from_file.genesis_file, "from-file.json");
    BOOST_CHECK_EQUAL(from_file.log_level, "WARN");
    BOOST_CHECK_EQUAL(from_file.log_capacity, 10U);

    setenv("PCASH_CHAIN", "custom", 1);
    setenv("PCASH_GENESIS_FILE", "from-env.json", 1);
    setenv("PCASH_LOG_LEVEL", "DEBUG", 1);
    setenv("PCASH_LOG_CAPACITY", "64", 1);

    const NodeConfig config = load_node_config();
    BOOST_CHECK_EQUAL(config.chain, "custom");
    BOOST_CHECK_EQUAL(config.genesis_file, "from-env.json");
    BOOST_CHECK_EQUAL(config.log_level, "DEBUG");
    BOOST_CHECK_EQUAL(config.log_capacity, 64U);
}

BOOST_AUTO_TEST_CASE(missing_file_warns_and_uses_defaults)
{
    setenv("PCASH_CONFIG", "pcash_config_does_not_exist.json", 1);

    const NodeConfig config = load_node_config();
    BOOST_CHECK_EQUAL(config.chain, "local");
    BOOST_CHECK(config.sinks.empty());

    const auto logs = recent_logs();
    BOOST_REQUIRE(!logs.empty());
    BOOST_CHECK(logs.back().find("[WARN] Config file missing. Using system defaults.") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(corrupt_file_is_malformed_input)
{
    WriteConfig("{ \"chain\": ");
    setenv("PCASH_CONFIG", path.c_str(), 1);

    try {
        load_node_config();
        BOOST_FAIL("a corrupt config file was accepted");
    } catch (const TokenError& e) {
        BOOST_CHECK(e.code() == ErrorCode::MalformedInput);
    }

    WriteConfig(R"({"log_capacity": -1})");
    BOOST_CHECK_THROW(load_node_config(), TokenError);
}

BOOST_AUTO_TEST_CASE(invalid_capacity_variable_is_ignored)
{
    const char* bad_values[] = {"lots", "-5", "", " 12", "99999999999999999999999"};
    for (const char* value : bad_values) {
        setenv("PCASH_LOG_CAPACITY", value, 1);
        const NodeConfig config = load_node_config();
        BOOST_CHECK_EQUAL(config.log_capacity, 200U);
        BOOST_CHECK(recent_logs().back().find("Ignoring invalid PCASH_LOG_CAPACITY") != std::string::npos);
    }
}

BOOST_AUTO_TEST_SUITE_END()
