#include "run_arguments.h"

#include "absl/strings/str_join.h"

namespace FleetRunner {

RunArguments RunonceArguments(const RunnerConfiguration& configuration) {
	RunArguments arguments;

	if (configuration.force) arguments["force"] = *configuration.force;
	if (configuration.server) arguments["server"] = *configuration.server;
	if (configuration.noop) arguments["noop"] = *configuration.noop;
	if (configuration.environment) arguments["environment"] = *configuration.environment;
	if (configuration.splay) arguments["splay"] = *configuration.splay;
	if (configuration.splaylimit) arguments["splaylimit"] = *configuration.splaylimit;
	if (!configuration.tag.empty()) {
		arguments["tags"] = absl::StrJoin(configuration.tag, ",");
	}
	if (configuration.ignoreschedules) arguments["ignoreschedules"] = *configuration.ignoreschedules;

	return arguments;
}

} // namespace FleetRunner
