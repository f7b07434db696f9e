#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/configuration.h"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace FleetRunner;
using ::testing::Contains;
using ::testing::ElementsAre;

/**
 * @brief Tests of the YAML configuration layer
 *
 * Each test uses its own Configuration instance so the process-wide
 * singleton stays untouched. Environment overrides are cleared around
 * every test.
 */
class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override { ClearEnv(); }
    void TearDown() override { ClearEnv(); }

    static void ClearEnv() {
        unsetenv("FLEETRUNNER_CONCURRENCY");
        unsetenv("FLEETRUNNER_RERUN");
        unsetenv("FLEETRUNNER_MIN_INTERVAL");
        unsetenv("FLEETRUNNER_POLL_INTERVAL");
        unsetenv("FLEETRUNNER_AGENT_PORT");
        unsetenv("FLEETRUNNER_RPC_TIMEOUT_MS");
    }

    Configuration config_;
};

constexpr const char* kFullConfig = R"(
fleetrunner:
  runner:
    concurrency: 4
    rerun: true
    min_interval: 600
    poll_interval: 2
  puppet:
    force: false
    server: puppet.example.com:8140
    noop: true
    environment: staging
    splay: true
    splaylimit: 30
    tag: [base, ntp]
    ignoreschedules: true
  fleet:
    agent_port: 6000
    rpc_timeout_ms: 250
    nodes:
      - name: web1.example.com
        address: 10.0.0.11
      - name: db1.example.com
        port: 6001
)";

TEST_F(ConfigurationTest, Defaults) {
    EXPECT_EQ(config_.getConcurrency(), 0);
    EXPECT_FALSE(config_.getRerun());
    EXPECT_EQ(config_.getMinInterval(), 1800);
    EXPECT_EQ(config_.getPollInterval(), 1);
    EXPECT_EQ(config_.getAgentPort(), kDefaultAgentPort);
    EXPECT_EQ(config_.getRpcTimeoutMs(), kDefaultRpcTimeoutMs);
    EXPECT_TRUE(config_.getNodes().empty());
}

TEST_F(ConfigurationTest, LoadsFullLayout) {
    ASSERT_TRUE(config_.loadFromString(kFullConfig));

    EXPECT_EQ(config_.getConcurrency(), 4);
    EXPECT_TRUE(config_.getRerun());
    EXPECT_EQ(config_.getMinInterval(), 600);
    EXPECT_EQ(config_.getPollInterval(), 2);
    EXPECT_EQ(config_.getAgentPort(), 6000);
    EXPECT_EQ(config_.getRpcTimeoutMs(), 250);

    const auto& puppet = config_.config().puppet;
    EXPECT_EQ(puppet.force, false);
    EXPECT_EQ(puppet.server, "puppet.example.com:8140");
    EXPECT_EQ(puppet.noop, true);
    EXPECT_EQ(puppet.environment, "staging");
    EXPECT_EQ(puppet.splay, true);
    EXPECT_EQ(puppet.splaylimit, 30);
    EXPECT_THAT(puppet.tag, ElementsAre("base", "ntp"));
    EXPECT_EQ(puppet.ignoreschedules, true);

    EXPECT_TRUE(config_.validate());
}

TEST_F(ConfigurationTest, NodesInheritAgentPortAndName) {
    ASSERT_TRUE(config_.loadFromString(kFullConfig));

    std::vector<NodeEndpoint> nodes = config_.getNodes();
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0].name, "web1.example.com");
    EXPECT_EQ(nodes[0].address, "10.0.0.11");
    EXPECT_EQ(nodes[0].port, 6000);
    EXPECT_EQ(nodes[1].name, "db1.example.com");
    EXPECT_EQ(nodes[1].address, "db1.example.com");
    EXPECT_EQ(nodes[1].port, 6001);

    // The stored inventory keeps port 0 so a later agent_port change applies
    EXPECT_EQ(config_.config().fleet.nodes[0].port, 0);
}

TEST_F(ConfigurationTest, UnsetAgentOptionsStayUnset) {
    ASSERT_TRUE(config_.loadFromString(R"(
fleetrunner:
  runner:
    concurrency: 1
)"));
    RunnerConfiguration runner = config_.toRunnerConfiguration();
    EXPECT_EQ(runner.concurrency, 1);
    EXPECT_FALSE(runner.force.has_value());
    EXPECT_FALSE(runner.server.has_value());
    EXPECT_FALSE(runner.noop.has_value());
    EXPECT_FALSE(runner.environment.has_value());
    EXPECT_FALSE(runner.splay.has_value());
    EXPECT_FALSE(runner.splaylimit.has_value());
    EXPECT_TRUE(runner.tag.empty());
    EXPECT_FALSE(runner.ignoreschedules.has_value());
}

TEST_F(ConfigurationTest, ScalarTagIsASingleTag) {
    ASSERT_TRUE(config_.loadFromString(R"(
fleetrunner:
  puppet:
    tag: ntp
)"));
    EXPECT_THAT(config_.config().puppet.tag, ElementsAre("ntp"));
}

TEST_F(ConfigurationTest, ToRunnerConfigurationCopiesAgentOptions) {
    ASSERT_TRUE(config_.loadFromString(kFullConfig));
    RunnerConfiguration runner = config_.toRunnerConfiguration();
    EXPECT_EQ(runner.concurrency, 4);
    EXPECT_EQ(runner.force, false);
    EXPECT_EQ(runner.environment, "staging");
    EXPECT_EQ(runner.splaylimit, 30);
    EXPECT_THAT(runner.tag, ElementsAre("base", "ntp"));
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString(kFullConfig));
    setenv("FLEETRUNNER_CONCURRENCY", "12", 1);
    setenv("FLEETRUNNER_RERUN", "off", 1);

    EXPECT_EQ(config_.getConcurrency(), 12);
    EXPECT_FALSE(config_.getRerun());
    EXPECT_EQ(config_.toRunnerConfiguration().concurrency, 12);
}

TEST_F(ConfigurationTest, MalformedEnvironmentValueIsIgnored) {
    ASSERT_TRUE(config_.loadFromString(kFullConfig));
    setenv("FLEETRUNNER_CONCURRENCY", "many", 1);
    setenv("FLEETRUNNER_RERUN", "perhaps", 1);

    EXPECT_EQ(config_.getConcurrency(), 4);
    EXPECT_TRUE(config_.getRerun());
}

TEST_F(ConfigurationTest, MissingRootSectionKeepsDefaults) {
    EXPECT_TRUE(config_.loadFromString("other:\n  key: 1\n"));
    EXPECT_EQ(config_.getConcurrency(), 0);
}

TEST_F(ConfigurationTest, MalformedYamlFails) {
    EXPECT_FALSE(config_.loadFromString("fleetrunner: [unclosed"));
    EXPECT_FALSE(config_.loadFromString(R"(
fleetrunner:
  runner:
    concurrency: lots
)"));
}

TEST_F(ConfigurationTest, MissingFileFails) {
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/fleetrunner.yaml"));
}

TEST_F(ConfigurationTest, LoadsFromFile) {
    std::string path = ::testing::TempDir() + "fleetrunner_configuration_test.yaml";
    {
        std::ofstream out(path);
        out << kFullConfig;
    }
    EXPECT_TRUE(config_.loadFromFile(path));
    EXPECT_EQ(config_.getConcurrency(), 4);
    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, ValidationRequiresConcurrency) {
    EXPECT_FALSE(config_.validate());
    EXPECT_THAT(config_.getValidationErrors(), Contains("Concurrency must be at least 1"));
}

TEST_F(ConfigurationTest, ValidationReportsEveryError) {
    ASSERT_TRUE(config_.loadFromString(R"(
fleetrunner:
  runner:
    concurrency: 1
    min_interval: -5
    poll_interval: 0
  puppet:
    splaylimit: -1
  fleet:
    agent_port: 70000
    rpc_timeout_ms: 0
    nodes:
      - name: web1
      - name: web1
      - name: web2
        port: 99999
)"));
    EXPECT_FALSE(config_.validate());

    auto errors = config_.getValidationErrors();
    EXPECT_THAT(errors, Contains("Minimum rerun interval cannot be negative"));
    EXPECT_THAT(errors, Contains("Poll interval must be at least 1 second"));
    EXPECT_THAT(errors, Contains("Splay limit cannot be negative"));
    EXPECT_THAT(errors, Contains("Agent port must be between 1 and 65535"));
    EXPECT_THAT(errors, Contains("RPC timeout must be at least 1ms"));
    EXPECT_THAT(errors, Contains("Fleet node listed twice: web1"));
    EXPECT_THAT(errors, Contains("Port of node web2 must be between 1 and 65535, or 0 to use the agent port"));
    EXPECT_EQ(errors.size(), 7u);
}

TEST_F(ConfigurationTest, ValidationClearsPreviousErrors) {
    EXPECT_FALSE(config_.validate());
    config_.config().runner.concurrency.set(3);
    EXPECT_TRUE(config_.validate());
    EXPECT_TRUE(config_.getValidationErrors().empty());
}

TEST_F(ConfigurationTest, ExplicitNodePortZeroUsesAgentPort) {
    ASSERT_TRUE(config_.loadFromString(R"(
fleetrunner:
  runner:
    concurrency: 1
  fleet:
    agent_port: 6000
    nodes:
      - name: web1
        port: 0
)"));
    EXPECT_TRUE(config_.validate());
    EXPECT_EQ(config_.getNodes()[0].port, 6000);
}

TEST_F(ConfigurationTest, PinnedValueWinsOverEnvironment) {
    setenv("FLEETRUNNER_CONCURRENCY", "12", 1);
    config_.config().runner.concurrency.set(3);
    EXPECT_EQ(config_.getConcurrency(), 12);

    config_.config().runner.concurrency.pin(5);
    EXPECT_EQ(config_.getConcurrency(), 5);
}
