#pragma once
#include <string>

#include <ArduinoJson.h>

#include "core/telemetry.h"

namespace publishers {

// {"v":1,"client":"...","online":true,"status":"online","model":"...",...}
void status_to_json(const StatusMessage& msg, JsonDocument& doc);

// {"v":1,"timestamp":"...","solar_voltage":12.3,...}
void telemetry_to_json(const TelemetryRecord& record, JsonDocument& doc);

std::string status_payload(const StatusMessage& msg);
std::string telemetry_payload(const TelemetryRecord& record);

} // namespace publishers
