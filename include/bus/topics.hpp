#pragma once

namespace agent_coord::bus::topics {

// Published by the coordination core.
inline constexpr const char* kAgentStatus = "agent.status";
inline constexpr const char* kAgentCommand = "agent.command";
inline constexpr const char* kEmergencyRaised = "emergency.raised";
inline constexpr const char* kEmergencyResolved = "emergency.resolved";
inline constexpr const char* kConflictResolved = "conflict.resolved";
inline constexpr const char* kBridgeHealth = "bridge.health";
inline constexpr const char* kDeploymentNotification = "deployment.notification";

// Consumed by the coordination loop.
inline constexpr const char* kAgentMetrics = "agent.metrics";
inline constexpr const char* kAgentActionRequest = "agent.action_request";

}  // namespace agent_coord::bus::topics
