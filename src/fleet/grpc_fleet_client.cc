#include "grpc_fleet_client.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <type_traits>
#include <variant>

#include <glog/logging.h>
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"

namespace FleetRunner {

using grpc::ClientContext;
using puppet_agent::ArgumentValue;
using puppet_agent::PuppetAgent;
using puppet_agent::RunOnceRequest;
using puppet_agent::RunOnceResponse;
using puppet_agent::StatusRequest;
using puppet_agent::StatusResponse;

namespace {

void SetDeadline(ClientContext* context, int timeout_ms) {
	context->set_deadline(std::chrono::system_clock::now() + std::chrono::milliseconds(timeout_ms));
}

ArgumentValue ToArgumentValue(const RunArgument& argument) {
	ArgumentValue value;
	std::visit([&value](const auto& v) {
			using T = std::decay_t<decltype(v)>;
			if constexpr (std::is_same_v<T, bool>) {
				value.set_bool_value(v);
			} else if constexpr (std::is_same_v<T, int64_t>) {
				value.set_int_value(v);
			} else {
				value.set_string_value(v);
			}
			}, argument);
	return value;
}

} // namespace

GrpcFleetClient::GrpcFleetClient(std::vector<NodeEndpoint> nodes, int rpc_timeout_ms)
	: nodes_(std::move(nodes)), rpc_timeout_ms_(rpc_timeout_ms) {
		VLOG(1) << "Fleet client created for " << nodes_.size() << " nodes";
	}

std::optional<bool> GrpcFleetClient::ParseEnabledPredicate(const std::string& predicate) {
	std::string normalized;
	normalized.reserve(predicate.size());
	for (char c : predicate) {
		if (!absl::ascii_isspace(static_cast<unsigned char>(c))) {
			normalized.push_back(c);
		}
	}

	absl::string_view value(normalized);
	if (!absl::ConsumePrefix(&value, "puppet().enabled=")) {
		return std::nullopt;
	}
	if (value == "true") return true;
	if (value == "false") return false;
	return std::nullopt;
}

void GrpcFleetClient::CompoundFilter(const std::string& predicate) {
	std::optional<bool> enabled = ParseEnabledPredicate(predicate);
	if (!enabled.has_value()) {
		throw std::invalid_argument("Unsupported compound filter: " + predicate);
	}
	filter_.compound.push_back(predicate);
	enabled_predicates_.push_back(*enabled);
	discovered_.reset();
}

void GrpcFleetClient::IdentityFilter(const std::string& name) {
	if (std::find(filter_.identity.begin(), filter_.identity.end(), name) == filter_.identity.end()) {
		filter_.identity.push_back(name);
	}
	discovered_.reset();
}

void GrpcFleetClient::Reset() {
	filter_ = Filter{};
	enabled_predicates_.clear();
	discovered_.reset();
}

const NodeEndpoint* GrpcFleetClient::FindNode(const std::string& name) const {
	for (const auto& node : nodes_) {
		if (node.name == name) {
			return &node;
		}
	}
	return nullptr;
}

std::vector<const NodeEndpoint*> GrpcFleetClient::IdentityMatches() const {
	std::vector<const NodeEndpoint*> matches;
	if (filter_.identity.empty()) {
		for (const auto& node : nodes_) {
			matches.push_back(&node);
		}
		return matches;
	}
	for (const auto& name : filter_.identity) {
		const NodeEndpoint* node = FindNode(name);
		if (node == nullptr) {
			LOG(WARNING) << "Identity filter names unknown node " << name;
			continue;
		}
		matches.push_back(node);
	}
	return matches;
}

std::vector<std::string> GrpcFleetClient::Discover(const DiscoverOptions& options) {
	std::vector<const NodeEndpoint*> candidates = IdentityMatches();

	if (!options.nodes.empty()) {
		std::vector<const NodeEndpoint*> requested;
		for (const auto& name : options.nodes) {
			auto it = std::find_if(candidates.begin(), candidates.end(),
					[&name](const NodeEndpoint* node) { return node->name == name; });
			if (it == candidates.end()) {
				LOG(WARNING) << "Cannot discover " << name << ": not in the inventory or filtered out";
				continue;
			}
			requested.push_back(*it);
		}
		candidates = std::move(requested);
	}

	std::vector<std::string> discovered;
	for (size_t i = 0; i < candidates.size(); ++i) {
		const NodeEndpoint* node = candidates[i];
		bool matches = true;
		if (!enabled_predicates_.empty()) {
			StatusResponse status;
			if (!QueryStatus(*node, &status)) {
				continue;
			}
			for (bool enabled : enabled_predicates_) {
				if (status.enabled() != enabled) {
					matches = false;
					break;
				}
			}
			ReportProgress("discover", i + 1, candidates.size());
		}
		if (matches) {
			discovered.push_back(node->name);
		}
	}

	discovered_ = discovered;
	return discovered;
}

std::vector<const NodeEndpoint*> GrpcFleetClient::Targets() {
	if (!discovered_.has_value()) {
		Discover(DiscoverOptions{});
	}
	std::vector<const NodeEndpoint*> targets;
	for (const auto& name : *discovered_) {
		const NodeEndpoint* node = FindNode(name);
		if (node != nullptr) {
			targets.push_back(node);
		}
	}
	return targets;
}

PuppetAgent::Stub* GrpcFleetClient::StubFor(const NodeEndpoint& node) {
	auto it = stubs_.find(node.name);
	if (it != stubs_.end()) {
		return it->second.get();
	}
	std::string target = absl::StrCat(node.address, ":", node.port);
	VLOG(2) << "Opening channel to " << node.name << " at " << target;
	auto stub = PuppetAgent::NewStub(grpc::CreateChannel(target, grpc::InsecureChannelCredentials()));
	PuppetAgent::Stub* raw = stub.get();
	stubs_[node.name] = std::move(stub);
	return raw;
}

bool GrpcFleetClient::QueryStatus(const NodeEndpoint& node, StatusResponse* response) {
	ClientContext context;
	SetDeadline(&context, rpc_timeout_ms_);

	grpc::Status status = StubFor(node)->Status(&context, StatusRequest(), response);
	if (!status.ok()) {
		LOG(ERROR) << "Status on " << node.name << " failed: " << status.error_code()
			<< ": " << status.error_message();
		return false;
	}
	return true;
}

std::vector<RunOnceReply> GrpcFleetClient::RunOnce(const RunArguments& arguments) {
	RunOnceRequest request;
	for (const auto& [key, argument] : arguments) {
		(*request.mutable_arguments())[key] = ToArgumentValue(argument);
	}

	std::vector<const NodeEndpoint*> targets = Targets();
	std::vector<RunOnceReply> replies;
	for (size_t i = 0; i < targets.size(); ++i) {
		const NodeEndpoint* node = targets[i];
		ClientContext context;
		SetDeadline(&context, rpc_timeout_ms_);

		RunOnceResponse response;
		grpc::Status status = StubFor(*node)->RunOnce(&context, request, &response);
		if (!status.ok()) {
			LOG(ERROR) << "RunOnce on " << node->name << " failed: " << status.error_code()
				<< ": " << status.error_message();
			continue;
		}

		RunOnceReply reply;
		reply.sender = node->name;
		reply.data.summary = response.summary();
		if (response.has_initiated_at()) {
			reply.data.initiated_at = response.initiated_at();
		}
		replies.push_back(std::move(reply));
		ReportProgress("runonce", i + 1, targets.size());
	}
	return replies;
}

std::vector<StatusReply> GrpcFleetClient::Status() {
	std::vector<const NodeEndpoint*> targets = Targets();
	std::vector<StatusReply> replies;
	for (size_t i = 0; i < targets.size(); ++i) {
		const NodeEndpoint* node = targets[i];
		StatusResponse response;
		if (!QueryStatus(*node, &response)) {
			continue;
		}

		StatusReply reply;
		reply.sender = node->name;
		reply.data.applying = response.applying();
		reply.data.enabled = response.enabled();
		reply.data.lastrun = response.lastrun();
		reply.data.initiated_at = response.initiated_at();
		reply.data.message = response.message();
		replies.push_back(std::move(reply));
		ReportProgress("status", i + 1, targets.size());
	}
	return replies;
}

void GrpcFleetClient::ReportProgress(const std::string& action, size_t done, size_t total) const {
	if (!progress_) {
		return;
	}
	LOG(INFO) << action << " [" << done << "/" << total << "]";
}

} // namespace FleetRunner
