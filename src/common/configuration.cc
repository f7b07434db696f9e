#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <set>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace FleetRunner {

// Global function to get configuration instance
const Configuration& GetConfig() {
    return Configuration::getInstance();
}

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        parseRoot(yaml);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        parseRoot(yaml);
        return true;
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::parseRoot(const YAML::Node& yaml) {
    if (!yaml["fleetrunner"]) {
        LOG(WARNING) << "Configuration has no 'fleetrunner' section, keeping defaults";
        return;
    }
    auto root = yaml["fleetrunner"];

    // Runner
    if (root["runner"]) {
        auto runner = root["runner"];
        if (runner["concurrency"]) config_.runner.concurrency.set(runner["concurrency"].as<int>());
        if (runner["rerun"]) config_.runner.rerun.set(runner["rerun"].as<bool>());
        if (runner["min_interval"]) config_.runner.min_interval.set(runner["min_interval"].as<int>());
        if (runner["poll_interval"]) config_.runner.poll_interval.set(runner["poll_interval"].as<int>());
    }

    // Puppet agent options
    if (root["puppet"]) {
        auto puppet = root["puppet"];
        if (puppet["force"]) config_.puppet.force = puppet["force"].as<bool>();
        if (puppet["server"]) config_.puppet.server = puppet["server"].as<std::string>();
        if (puppet["noop"]) config_.puppet.noop = puppet["noop"].as<bool>();
        if (puppet["environment"]) config_.puppet.environment = puppet["environment"].as<std::string>();
        if (puppet["splay"]) config_.puppet.splay = puppet["splay"].as<bool>();
        if (puppet["splaylimit"]) config_.puppet.splaylimit = puppet["splaylimit"].as<int64_t>();
        if (puppet["tag"]) {
            config_.puppet.tag.clear();
            if (puppet["tag"].IsSequence()) {
                for (const auto& tag : puppet["tag"]) {
                    config_.puppet.tag.push_back(tag.as<std::string>());
                }
            } else {
                config_.puppet.tag.push_back(puppet["tag"].as<std::string>());
            }
        }
        if (puppet["ignoreschedules"]) config_.puppet.ignoreschedules = puppet["ignoreschedules"].as<bool>();
    }

    // Fleet
    if (root["fleet"]) {
        auto fleet = root["fleet"];
        if (fleet["agent_port"]) config_.fleet.agent_port.set(fleet["agent_port"].as<int>());
        if (fleet["rpc_timeout_ms"]) config_.fleet.rpc_timeout_ms.set(fleet["rpc_timeout_ms"].as<int>());
        if (fleet["nodes"]) {
            config_.fleet.nodes.clear();
            for (const auto& node : fleet["nodes"]) {
                NodeEndpoint endpoint;
                endpoint.name = node["name"].as<std::string>();
                endpoint.address = node["address"] ? node["address"].as<std::string>() : endpoint.name;
                if (node["port"]) endpoint.port = node["port"].as<int>();
                config_.fleet.nodes.push_back(endpoint);
            }
        }
    }
}

std::vector<NodeEndpoint> Configuration::getNodes() const {
    std::vector<NodeEndpoint> nodes = config_.fleet.nodes;
    for (auto& node : nodes) {
        if (node.port == 0) {
            node.port = getAgentPort();
        }
    }
    return nodes;
}

RunnerConfiguration Configuration::toRunnerConfiguration() const {
    RunnerConfiguration runner;
    runner.concurrency = getConcurrency();
    runner.force = config_.puppet.force;
    runner.server = config_.puppet.server;
    runner.noop = config_.puppet.noop;
    runner.environment = config_.puppet.environment;
    runner.splay = config_.puppet.splay;
    runner.splaylimit = config_.puppet.splaylimit;
    runner.tag = config_.puppet.tag;
    runner.ignoreschedules = config_.puppet.ignoreschedules;
    return runner;
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (getConcurrency() < 1) {
        validation_errors_.push_back("Concurrency must be at least 1");
    }

    if (getMinInterval() < 0) {
        validation_errors_.push_back("Minimum rerun interval cannot be negative");
    }

    if (getPollInterval() < 1) {
        validation_errors_.push_back("Poll interval must be at least 1 second");
    }

    if (config_.puppet.splaylimit && *config_.puppet.splaylimit < 0) {
        validation_errors_.push_back("Splay limit cannot be negative");
    }

    if (getAgentPort() < 1 || getAgentPort() > 65535) {
        validation_errors_.push_back("Agent port must be between 1 and 65535");
    }

    if (getRpcTimeoutMs() < 1) {
        validation_errors_.push_back("RPC timeout must be at least 1ms");
    }

    std::set<std::string> names;
    for (const auto& node : config_.fleet.nodes) {
        if (node.name.empty()) {
            validation_errors_.push_back("Fleet node names cannot be empty");
            continue;
        }
        if (!names.insert(node.name).second) {
            validation_errors_.push_back("Fleet node listed twice: " + node.name);
        }
        if (node.port < 0 || node.port > 65535) {
            validation_errors_.push_back("Port of node " + node.name + " must be between 1 and 65535, or 0 to use the agent port");
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace FleetRunner
