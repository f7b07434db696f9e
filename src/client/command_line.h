#ifndef FLEETRUNNER_SRC_CLIENT_COMMAND_LINE_H_
#define FLEETRUNNER_SRC_CLIENT_COMMAND_LINE_H_

#include <cxxopts.hpp>

#include "common/configuration.h"

namespace FleetRunner {

// Options understood by fleetrunner_runall
cxxopts::Options MakeCommandLineOptions();

/**
 * Copies the options present in result into config.
 * Command line values win over both the configuration file and the
 * FLEETRUNNER_* environment variables.
 * Throws std::invalid_argument when an option is given with its negation.
 */
void ApplyCommandLine(const cxxopts::ParseResult& result, Configuration& config);

} // namespace FleetRunner

#endif // FLEETRUNNER_SRC_CLIENT_COMMAND_LINE_H_
