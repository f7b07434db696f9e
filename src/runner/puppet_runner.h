#ifndef FLEETRUNNER_SRC_RUNNER_PUPPET_RUNNER_H_
#define FLEETRUNNER_SRC_RUNNER_PUPPET_RUNNER_H_

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/config.h"
#include "fleet/fleet_client.h"
#include "runner/clock.h"
#include "runner/run_arguments.h"

namespace FleetRunner {

/**
 * A node that was told to run and has not been confirmed finished yet.
 * checks counts the consecutive polls in which the node was requested to run
 * but not seen applying.
 */
struct TrackedNode {
	std::string name;
	int64_t initiated_at = 0;
	int checks = 0;

	bool operator==(const TrackedNode& other) const {
		return name == other.name && initiated_at == other.initiated_at && checks == other.checks;
	}
};

/**
 * Drives agent runs across the enabled nodes of a fleet with at most
 * `concurrency` nodes applying at any time.
 *
 * Everything runs on the calling thread: nodes are dispatched while slots are
 * free, then their status is polled until they finish or are evicted for never
 * moving into an applying state.
 */
class PuppetRunner {
public:
	using Logger = std::function<void(const std::string&)>;

	// Throws std::invalid_argument when concurrency < 1 or the client already
	// carries a compound filter.
	PuppetRunner(IFleetClient& client, RunnerConfiguration configuration,
			std::shared_ptr<IClock> clock = std::make_shared<SystemClock>());
	virtual ~PuppetRunner() = default;

	PuppetRunner(const PuppetRunner&) = delete;
	PuppetRunner& operator=(const PuppetRunner&) = delete;

	void RunAll(bool repeat, IClock::Duration min_interval);

	// One pass over every enabled node
	virtual void RunAllOnce();

	// Repeats passes, starting a new one no sooner than min_interval after the
	// previous one started. iterations bounds the number of passes.
	virtual void RunAllForever(IClock::Duration min_interval,
			std::optional<size_t> iterations = std::nullopt);

	// Blocks until every host was dispatched and left the in-flight set.
	// Client errors for one node are logged and never end the pass.
	virtual void RunHosts(const std::vector<std::string>& hosts);

	// Triggers a run on name, returns the agent's initiated_at or 0 for agents
	// that do not report it
	virtual int64_t RunHost(const std::string& name);

	// Returns the subset of tracked that is still in flight after one status poll
	virtual std::vector<TrackedNode> FindApplyingNodes(const std::vector<std::string>& hosts,
			const std::vector<TrackedNode>& tracked = {});

	virtual std::vector<std::string> FindEnabledNodes();

	RunArguments RunonceArguments() const;

	void SetLogger(Logger logger) { logger_ = std::move(logger); }
	void Log(const std::string& message) const;

	void SetPollInterval(IClock::Duration interval) { poll_interval_ = interval; }

	IFleetClient& client() { return client_; }
	RunnerConfiguration& configuration() { return configuration_; }
	const RunnerConfiguration& configuration() const { return configuration_; }
	int concurrency() const { return concurrency_; }

private:
	bool CanDispatch(const std::deque<std::string>& queued, const std::vector<TrackedNode>& running) const;
	std::vector<TrackedNode> CountFailedPoll(const std::vector<TrackedNode>& running) const;

	IFleetClient& client_;
	RunnerConfiguration configuration_;
	std::shared_ptr<IClock> clock_;
	const int concurrency_;
	IClock::Duration poll_interval_{static_cast<double>(kDefaultPollIntervalSec)};
	Logger logger_;
};

} // namespace FleetRunner

#endif // FLEETRUNNER_SRC_RUNNER_PUPPET_RUNNER_H_
