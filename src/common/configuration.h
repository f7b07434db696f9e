#ifndef FLEETRUNNER_CONFIGURATION_H_
#define FLEETRUNNER_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "common/config.h"
#include "runner/run_arguments.h"

namespace YAML {
class Node;
}

namespace FleetRunner {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (pinned_) {
            return value_;
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    // Like set(), but the value also wins over the environment variable
    void pin(T value) { value_ = value; pinned_ = true; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;
    bool pinned_ = false;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * A fleet member reachable over gRPC. port 0 means fleet.agent_port.
 */
struct NodeEndpoint {
    std::string name;
    std::string address;
    int port = 0;
};

/**
 * Main configuration structure
 */
struct FleetRunnerConfig {
    struct Runner {
        ConfigValue<int> concurrency{0, "FLEETRUNNER_CONCURRENCY"};
        ConfigValue<bool> rerun{false, "FLEETRUNNER_RERUN"};
        // Seconds between the starts of two passes when rerunning
        ConfigValue<int> min_interval{1800, "FLEETRUNNER_MIN_INTERVAL"};
        ConfigValue<int> poll_interval{static_cast<int>(kDefaultPollIntervalSec), "FLEETRUNNER_POLL_INTERVAL"};
    } runner;

    // Agent options; unset ones are not sent so the agent's defaults apply
    struct Puppet {
        std::optional<bool> force;
        std::optional<std::string> server;
        std::optional<bool> noop;
        std::optional<std::string> environment;
        std::optional<bool> splay;
        std::optional<int64_t> splaylimit;
        std::vector<std::string> tag;
        std::optional<bool> ignoreschedules;
    } puppet;

    struct Fleet {
        ConfigValue<int> agent_port{kDefaultAgentPort, "FLEETRUNNER_AGENT_PORT"};
        ConfigValue<int> rpc_timeout_ms{static_cast<int>(kDefaultRpcTimeoutMs), "FLEETRUNNER_RPC_TIMEOUT_MS"};
        std::vector<NodeEndpoint> nodes;
    } fleet;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    Configuration() = default;

    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const FleetRunnerConfig& config() const { return config_; }
    FleetRunnerConfig& config() { return config_; }

    // Helper methods for common access patterns
    int getConcurrency() const { return config_.runner.concurrency.get(); }
    bool getRerun() const { return config_.runner.rerun.get(); }
    int getMinInterval() const { return config_.runner.min_interval.get(); }
    int getPollInterval() const { return config_.runner.poll_interval.get(); }
    int getAgentPort() const { return config_.fleet.agent_port.get(); }
    int getRpcTimeoutMs() const { return config_.fleet.rpc_timeout_ms.get(); }

    // Nodes with their port resolved against fleet.agent_port
    std::vector<NodeEndpoint> getNodes() const;

    RunnerConfiguration toRunnerConfiguration() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    FleetRunnerConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& yaml);
};

const Configuration& GetConfig();

} // namespace FleetRunner

#endif // FLEETRUNNER_CONFIGURATION_H_
