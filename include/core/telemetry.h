#pragma once
#include <stddef.h>

#include <string>
#include <utility>
#include <vector>

struct TelemetryField {
  const char* name; // points into the static register table
  double value;
  const char* unit;
};

// One sample of every readable field. Immutable once built.
class TelemetryRecord {
public:
  TelemetryRecord() = default;
  TelemetryRecord(std::vector<TelemetryField> fields, std::string captured_at)
    : fields_(std::move(fields)), captured_at_(std::move(captured_at)) {}

  const std::vector<TelemetryField>& fields() const { return fields_; }
  const std::string& captured_at() const { return captured_at_; }
  size_t size() const { return fields_.size(); }
  bool empty() const { return fields_.empty(); }

  // nullptr when the field was omitted from this sample.
  const TelemetryField* find(const char* name) const;

private:
  std::vector<TelemetryField> fields_;
  std::string captured_at_;
};

struct IdentityEntry {
  const char* name;
  bool is_text;
  std::string text;
  double number;
};

// Static facts about the controller; entries that failed to read are absent.
struct DeviceIdentity {
  std::vector<IdentityEntry> entries;

  const IdentityEntry* find(const char* name) const;
};

struct StatusMessage {
  std::string client;
  bool online {false};
  DeviceIdentity identity {};
};

// Local time, ISO-8601 with milliseconds (e.g. 2025-06-01T14:03:22.123).
std::string format_local_timestamp();
