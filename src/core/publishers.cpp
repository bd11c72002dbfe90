#include "core/publishers.h"

#include "app/app_config.h"

using namespace publishers;

void publishers::status_to_json(const StatusMessage& msg, JsonDocument& doc) {
  doc["v"] = RENOGY_BRIDGE_SCHEMA_V;
  doc["client"] = msg.client;
  doc["online"] = msg.online;
  doc["status"] = msg.online ? "online" : "offline";

  for (const IdentityEntry& e : msg.identity.entries) {
    if (e.is_text) {
      doc[e.name] = e.text;
    } else {
      doc[e.name] = e.number;
    }
  }
}

void publishers::telemetry_to_json(const TelemetryRecord& record, JsonDocument& doc) {
  doc["v"] = RENOGY_BRIDGE_SCHEMA_V;
  doc["timestamp"] = record.captured_at();
  for (const TelemetryField& f : record.fields()) {
    doc[f.name] = f.value;
  }
}

std::string publishers::status_payload(const StatusMessage& msg) {
  JsonDocument doc;
  status_to_json(msg, doc);
  std::string out;
  serializeJson(doc, out);
  return out;
}

std::string publishers::telemetry_payload(const TelemetryRecord& record) {
  JsonDocument doc;
  telemetry_to_json(record, doc);
  std::string out;
  serializeJson(doc, out);
  return out;
}
