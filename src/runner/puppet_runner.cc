#include "puppet_runner.h"

#include <exception>
#include <stdexcept>
#include <utility>

#include <glog/logging.h>
#include "absl/cleanup/cleanup.h"
#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"

namespace FleetRunner {

namespace {

bool IsTracked(const std::vector<TrackedNode>& running, const std::string& name) {
	for (const auto& node : running) {
		if (node.name == name) {
			return true;
		}
	}
	return false;
}

std::vector<std::string> TrackedNames(const std::vector<TrackedNode>& running) {
	std::vector<std::string> names;
	names.reserve(running.size());
	for (const auto& node : running) {
		names.push_back(node.name);
	}
	return names;
}

} // namespace

PuppetRunner::PuppetRunner(IFleetClient& client, RunnerConfiguration configuration,
		std::shared_ptr<IClock> clock)
	: client_(client),
	configuration_(std::move(configuration)),
	clock_(std::move(clock)),
	concurrency_(configuration_.concurrency) {
		if (concurrency_ < 1) {
			throw std::invalid_argument("Concurrency has to be > 0");
		}
		if (!client_.GetFilter().compound.empty()) {
			throw std::invalid_argument("The compound filter should be empty");
		}
		if (!clock_) {
			clock_ = std::make_shared<SystemClock>();
		}
		client_.SetProgress(false);
	}

void PuppetRunner::RunAll(bool repeat, IClock::Duration min_interval) {
	if (repeat) {
		RunAllForever(min_interval, std::nullopt);
	} else {
		RunAllOnce();
	}
}

void PuppetRunner::RunAllOnce() {
	Log(absl::StrCat("Running all nodes with a concurrency of ", concurrency_));
	std::vector<std::string> nodes = FindEnabledNodes();
	Log(absl::StrCat("Discovered ", nodes.size(), " enabled nodes"));
	RunHosts(nodes);
}

void PuppetRunner::RunAllForever(IClock::Duration min_interval, std::optional<size_t> iterations) {
	Log(absl::StrFormat("Running all nodes forever with a minimum interval of %.1f seconds",
				min_interval.count()));

	size_t passes = 0;
	while (!iterations.has_value() || passes < *iterations) {
		IClock::TimePoint start = clock_->Now();
		RunAllOnce();
		IClock::Duration elapsed = clock_->Now() - start;
		passes++;

		if (elapsed < min_interval) {
			IClock::Duration remaining = min_interval - elapsed;
			Log(absl::StrFormat("Sleeping for %.1f seconds before the next run", remaining.count()));
			clock_->Sleep(remaining);
		} else {
			VLOG(1) << "Pass took " << elapsed.count() << "s, starting the next one immediately";
		}
	}
}

void PuppetRunner::RunHosts(const std::vector<std::string>& hosts) {
	std::deque<std::string> queue(hosts.begin(), hosts.end());
	std::vector<TrackedNode> running;

	while (!queue.empty() || !running.empty()) {
		while (static_cast<int>(running.size()) < concurrency_ && !queue.empty()) {
			std::string host = std::move(queue.front());
			queue.pop_front();

			// Running through some other trigger; revisit once it left the set
			if (IsTracked(running, host)) {
				Log(absl::StrCat("Host ", host, " is already being tracked, moving it to the back of the queue"));
				queue.push_back(std::move(host));
				break;
			}

			try {
				int64_t initiated_at = RunHost(host);
				running.push_back(TrackedNode{host, initiated_at, 0});
			} catch (const std::exception& e) {
				Log(absl::StrCat("Host ", host, " could not be started: ", e.what()));
			}
		}

		try {
			running = FindApplyingNodes(TrackedNames(running), running);
		} catch (const std::exception& e) {
			Log(absl::StrCat("Polling the status of ", running.size(), " nodes failed: ", e.what()));
			running = CountFailedPoll(running);
		}
		VLOG(2) << running.size() << " nodes in flight, " << queue.size() << " queued";

		if (!running.empty() && !CanDispatch(queue, running)) {
			clock_->Sleep(poll_interval_);
		}
	}
}

// A failed poll counts as a check without progress for every tracked node
std::vector<TrackedNode> PuppetRunner::CountFailedPoll(const std::vector<TrackedNode>& running) const {
	std::vector<TrackedNode> remaining;
	for (const auto& node : running) {
		if (node.checks + 1 > kMaxApplyingChecks) {
			Log(absl::StrCat("Host ", node.name, " could not be polled. Skipping."));
			continue;
		}
		remaining.push_back(TrackedNode{node.name, node.initiated_at, node.checks + 1});
	}
	return remaining;
}

bool PuppetRunner::CanDispatch(const std::deque<std::string>& queued,
		const std::vector<TrackedNode>& running) const {
	if (static_cast<int>(running.size()) >= concurrency_) {
		return false;
	}
	for (const auto& host : queued) {
		if (!IsTracked(running, host)) {
			return true;
		}
	}
	return false;
}

int64_t PuppetRunner::RunHost(const std::string& name) {
	absl::Cleanup reset_filter = [this] { client_.Reset(); };

	DiscoverOptions options;
	options.nodes.push_back(name);
	if (client_.Discover(options).empty()) {
		Log(absl::StrCat("Host ", name, " could not be discovered. Skipping."));
		return 0;
	}

	RunArguments arguments = RunonceArguments();
	arguments["force"] = true;

	std::vector<RunOnceReply> replies = client_.RunOnce(arguments);
	if (replies.empty()) {
		Log(absl::StrCat("Host ", name, " did not respond to the run request"));
		return 0;
	}

	const RunOnceData& data = replies.front().data;
	Log(absl::StrCat(name, " schedule status: ", data.summary));
	return data.initiated_at.value_or(0);
}

std::vector<TrackedNode> PuppetRunner::FindApplyingNodes(const std::vector<std::string>& hosts,
		const std::vector<TrackedNode>& tracked) {
	std::vector<TrackedNode> applying;
	// An empty identity filter would select the whole fleet
	if (hosts.empty()) {
		return applying;
	}

	absl::flat_hash_map<std::string, const TrackedNode*> previous;
	for (const auto& node : tracked) {
		previous[node.name] = &node;
	}

	std::vector<StatusReply> replies;
	{
		absl::Cleanup reset_filter = [this] { client_.Reset(); };
		for (const auto& host : hosts) {
			client_.IdentityFilter(host);
		}
		replies = client_.Status();
	}

	// Later replies from the same sender supersede earlier ones
	absl::flat_hash_map<std::string, const StatusData*> latest;
	for (const auto& reply : replies) {
		latest[reply.sender] = &reply.data;
	}

	absl::flat_hash_set<std::string> seen;
	for (const auto& host : hosts) {
		if (!seen.insert(host).second) {
			continue;
		}

		auto status_it = latest.find(host);
		if (status_it == latest.end()) {
			VLOG(1) << "No status from " << host << ", treating it as finished";
			continue;
		}
		const StatusData& status = *status_it->second;

		auto previous_it = previous.find(host);
		const TrackedNode* last = previous_it == previous.end() ? nullptr : previous_it->second;
		int64_t initiated_at = last ? last->initiated_at : status.initiated_at;

		if (status.applying) {
			applying.push_back(TrackedNode{host, initiated_at, 0});
			continue;
		}

		if (status.lastrun >= initiated_at) {
			VLOG(1) << host << " finished its run (lastrun " << status.lastrun << ")";
			continue;
		}

		// Asked to run but not started yet
		int checks = last ? last->checks + 1 : 1;
		if (checks > kMaxApplyingChecks) {
			Log(absl::StrCat("Host ", host, " did not move into an applying state. Skipping."));
			continue;
		}
		applying.push_back(TrackedNode{host, initiated_at, checks});
	}

	return applying;
}

std::vector<std::string> PuppetRunner::FindEnabledNodes() {
	Log("Discovering enabled Puppet nodes to manage");

	absl::Cleanup reset_filter = [this] { client_.Reset(); };
	client_.CompoundFilter(kEnabledNodesPredicate);
	return client_.Discover(DiscoverOptions{});
}

RunArguments PuppetRunner::RunonceArguments() const {
	return FleetRunner::RunonceArguments(configuration_);
}

void PuppetRunner::Log(const std::string& message) const {
	if (logger_) {
		logger_(message);
	}
}

} // namespace FleetRunner
