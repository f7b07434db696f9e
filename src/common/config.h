#pragma once

#include <cstdint>

namespace FleetRunner {

/// Rollout policy constants
/// Polls a node may stay "requested but not applying" before it is evicted
constexpr int kMaxApplyingChecks = 5;
/// Default seconds between two status polls when the fleet is saturated
constexpr int64_t kDefaultPollIntervalSec = 1;
/// Predicate injected by the runner to select nodes whose agent is not disabled
constexpr const char* kEnabledNodesPredicate = "puppet().enabled=true";

/// Agent transport defaults
constexpr int kDefaultAgentPort = 50061;
constexpr int64_t kDefaultRpcTimeoutMs = 5000;

} // namespace FleetRunner
