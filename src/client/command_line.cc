#include "command_line.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace FleetRunner {

namespace {

void CheckExclusive(const cxxopts::ParseResult& result, const std::string& option) {
    if (result.count(option) && result.count("no-" + option)) {
        throw std::invalid_argument("--" + option + " and --no-" + option + " cannot be used together");
    }
}

} // namespace

cxxopts::Options MakeCommandLineOptions() {
    cxxopts::Options options("fleetrunner_runall",
            "Runs the configuration agent on every enabled node with bounded concurrency");

    options.add_options()
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("n,concurrency", "Maximum number of nodes applying at once, overrides FLEETRUNNER_CONCURRENCY",
            cxxopts::value<int>())
        ("rerun", "Repeat the pass forever, starting one no sooner than SECONDS after the previous",
            cxxopts::value<int>())
        ("force", "Bypass the agent's splay settings")
        ("server", "Puppet master to run against (host[:port])", cxxopts::value<std::string>())
        ("noop", "Run in no-op mode")
        ("no-noop", "Do not run in no-op mode")
        ("environment", "Environment to run in", cxxopts::value<std::string>())
        ("splay", "Splay the run")
        ("no-splay", "Do not splay the run")
        ("splaylimit", "Maximum splay time in seconds", cxxopts::value<int64_t>())
        ("tag", "Restrict the run to a tag, may be repeated", cxxopts::value<std::vector<std::string>>())
        ("ignoreschedules", "Ignore schedules on resources")
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");

    return options;
}

void ApplyCommandLine(const cxxopts::ParseResult& result, Configuration& config) {
    CheckExclusive(result, "noop");
    CheckExclusive(result, "splay");

    FleetRunnerConfig& cfg = config.config();

    if (result.count("concurrency")) cfg.runner.concurrency.pin(result["concurrency"].as<int>());
    if (result.count("rerun")) {
        cfg.runner.rerun.pin(true);
        cfg.runner.min_interval.pin(result["rerun"].as<int>());
    }

    if (result.count("force")) cfg.puppet.force = true;
    if (result.count("server")) cfg.puppet.server = result["server"].as<std::string>();
    if (result.count("noop")) cfg.puppet.noop = true;
    if (result.count("no-noop")) cfg.puppet.noop = false;
    if (result.count("environment")) cfg.puppet.environment = result["environment"].as<std::string>();
    if (result.count("splay")) cfg.puppet.splay = true;
    if (result.count("no-splay")) cfg.puppet.splay = false;
    if (result.count("splaylimit")) cfg.puppet.splaylimit = result["splaylimit"].as<int64_t>();
    if (result.count("tag")) cfg.puppet.tag = result["tag"].as<std::vector<std::string>>();
    if (result.count("ignoreschedules")) cfg.puppet.ignoreschedules = true;
}

} // namespace FleetRunner
