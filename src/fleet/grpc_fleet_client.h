#ifndef FLEETRUNNER_SRC_FLEET_GRPC_FLEET_CLIENT_H_
#define FLEETRUNNER_SRC_FLEET_GRPC_FLEET_CLIENT_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include <grpcpp/grpcpp.h>
#include <puppet_agent.grpc.pb.h>

#include "common/configuration.h"
#include "fleet/fleet_client.h"

namespace FleetRunner {

/**
 * Fleet client talking to the PuppetAgent gRPC service of every node in a
 * static inventory.
 *
 * RPCs are issued one node at a time from the calling thread, each bounded by
 * the configured deadline. A node whose RPC fails is logged and left out of the
 * replies of that call.
 *
 * Compound predicates understood: puppet().enabled=true and
 * puppet().enabled=false.
 */
class GrpcFleetClient : public IFleetClient {
	public:
		GrpcFleetClient(std::vector<NodeEndpoint> nodes, int rpc_timeout_ms);

		GrpcFleetClient(const GrpcFleetClient&) = delete;
		GrpcFleetClient& operator=(const GrpcFleetClient&) = delete;

		const Filter& GetFilter() const override { return filter_; }

		// Throws std::invalid_argument for predicates it cannot evaluate
		void CompoundFilter(const std::string& predicate) override;
		void IdentityFilter(const std::string& name) override;

		std::vector<std::string> Discover(const DiscoverOptions& options) override;
		std::vector<RunOnceReply> RunOnce(const RunArguments& arguments) override;
		std::vector<StatusReply> Status() override;

		void Reset() override;
		void SetProgress(bool enabled) override { progress_ = enabled; }

		// Parses "puppet().enabled=<bool>", nullopt for anything else
		static std::optional<bool> ParseEnabledPredicate(const std::string& predicate);

	private:
		std::vector<const NodeEndpoint*> IdentityMatches() const;
		std::vector<const NodeEndpoint*> Targets();
		const NodeEndpoint* FindNode(const std::string& name) const;

		puppet_agent::PuppetAgent::Stub* StubFor(const NodeEndpoint& node);
		bool QueryStatus(const NodeEndpoint& node, puppet_agent::StatusResponse* response);
		void ReportProgress(const std::string& action, size_t done, size_t total) const;

		std::vector<NodeEndpoint> nodes_;
		const int rpc_timeout_ms_;
		bool progress_ = true;

		Filter filter_;
		std::vector<bool> enabled_predicates_;
		// Set by Discover(), used as the target list until Reset()
		std::optional<std::vector<std::string>> discovered_;

		absl::flat_hash_map<std::string, std::unique_ptr<puppet_agent::PuppetAgent::Stub>> stubs_;
};

} // namespace FleetRunner

#endif // FLEETRUNNER_SRC_FLEET_GRPC_FLEET_CLIENT_H_
