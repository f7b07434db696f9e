#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include "client/command_line.h"
#include "common/configuration.h"
#include "fleet/grpc_fleet_client.h"
#include "runner/puppet_runner.h"

using namespace FleetRunner;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    cxxopts::Options options = MakeCommandLineOptions();

    try {
        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }
        FLAGS_v = result["log_level"].as<int>();

        Configuration& config = Configuration::getInstance();
        if (result.count("config") && !config.loadFromFile(result["config"].as<std::string>())) {
            LOG(ERROR) << "Failed to load configuration file";
            return 1;
        }
        ApplyCommandLine(result, config);

        if (!config.validate()) {
            LOG(ERROR) << "Configuration validation failed";
            for (const auto& error : config.getValidationErrors()) {
                LOG(ERROR) << "Validation error: " << error;
            }
            return 1;
        }

        std::vector<NodeEndpoint> nodes = config.getNodes();
        if (nodes.empty()) {
            LOG(WARNING) << "The fleet inventory is empty, nothing to run";
        }

        GrpcFleetClient client(nodes, config.getRpcTimeoutMs());
        PuppetRunner runner(client, config.toRunnerConfiguration());
        runner.SetPollInterval(IClock::Duration(config.getPollInterval()));
        runner.SetLogger([](const std::string& message) {
            LOG(INFO) << message;
        });

        runner.RunAll(config.getRerun(), IClock::Duration(config.getMinInterval()));
    } catch (const std::exception& e) {
        LOG(ERROR) << e.what();
        return 1;
    }

    return 0;
}
