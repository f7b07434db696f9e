#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "fleet/fleet_client.h"

namespace FleetRunner {

/**
 * Settings of a rollout. Only concurrency is required; every unset agent
 * option is left out of the run request so the agent's defaults apply.
 */
struct RunnerConfiguration {
	int concurrency = 0;

	std::optional<bool> force;
	std::optional<std::string> server;
	std::optional<bool> noop;
	std::optional<std::string> environment;
	std::optional<bool> splay;
	std::optional<int64_t> splaylimit;
	std::vector<std::string> tag;
	std::optional<bool> ignoreschedules;
};

/**
 * Maps the agent options of configuration to "run once" arguments.
 * The tag list is sent as a single comma separated "tags" argument.
 */
RunArguments RunonceArguments(const RunnerConfiguration& configuration);

} // namespace FleetRunner
