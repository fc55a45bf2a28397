#pragma once

#include <nlohmann/json.hpp>

#include "api/controller.hpp"
#include "model/command.hpp"
#include "model/device.hpp"
#include "model/monitor.hpp"
#include "model/segment.hpp"

// Wire encoding of the controller contract. Absent optionals are omitted from
// objects; unknown enum strings decode to the type's fallback value.
namespace netmon_agent::model {

void to_json(nlohmann::json& j, const SnmpInfo& info);
void to_json(nlohmann::json& j, const UpnpInfo& info);
void to_json(nlohmann::json& j, const DiscoveredDevice& device);
void to_json(nlohmann::json& j, const StatusReport& report);
void to_json(nlohmann::json& j, const CommandAck& ack);

void from_json(const nlohmann::json& j, NetworkSegment& segment);
void from_json(const nlohmann::json& j, DeviceToMonitor& device);
void from_json(const nlohmann::json& j, AgentCommand& command);

}  // namespace netmon_agent::model

namespace netmon_agent::api {

void to_json(nlohmann::json& j, const HeartbeatRequest& request);
void to_json(nlohmann::json& j, const AutoSegmentRequest& request);

void from_json(const nlohmann::json& j, HeartbeatResponse& response);
void from_json(const nlohmann::json& j, DiscoveryUploadResult& result);
void from_json(const nlohmann::json& j, StatusUploadResult& result);

}  // namespace netmon_agent::api
