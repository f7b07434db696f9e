#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace FleetRunner {

/**
 * Value of a single argument passed to the remote "run once" action
 */
using RunArgument = std::variant<bool, int64_t, std::string>;

/**
 * Arguments of the remote "run once" action, keyed by argument name.
 * Keys that are not present are left to the agent's own defaults.
 */
using RunArguments = std::map<std::string, RunArgument>;

/**
 * Node selection state of a fleet client
 */
struct Filter {
	std::vector<std::string> identity;
	std::vector<std::string> compound;

	bool empty() const { return identity.empty() && compound.empty(); }
};

struct DiscoverOptions {
	// Restricts discovery to these node names when non-empty
	std::vector<std::string> nodes;
};

struct RunOnceData {
	std::string summary;
	// Older agents do not report when the run was initiated
	std::optional<int64_t> initiated_at;
};

struct RunOnceReply {
	std::string sender;
	RunOnceData data;
};

struct StatusData {
	bool applying = false;
	bool enabled = true;
	int64_t lastrun = 0;
	int64_t initiated_at = 0;
	std::string message;
};

struct StatusReply {
	std::string sender;
	StatusData data;
};

/**
 * Interface to the remote fleet: discovery, triggering agent runs and
 * collecting per-node status snapshots.
 *
 * Filters accumulate across calls until Reset() is called.
 */
class IFleetClient {
public:
	virtual ~IFleetClient() = default;

	virtual const Filter& GetFilter() const = 0;

	// Restricts subsequent discovery to nodes matching predicate
	virtual void CompoundFilter(const std::string& predicate) = 0;

	// Adds one node identity to the set subsequent calls are restricted to
	virtual void IdentityFilter(const std::string& name) = 0;

	virtual std::vector<std::string> Discover(const DiscoverOptions& options) = 0;

	virtual std::vector<RunOnceReply> RunOnce(const RunArguments& arguments) = 0;

	virtual std::vector<StatusReply> Status() = 0;

	virtual void Reset() = 0;

	virtual void SetProgress(bool enabled) = 0;
};

} // namespace FleetRunner
