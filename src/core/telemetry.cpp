#include "core/telemetry.h"

#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <time.h>

const TelemetryField* TelemetryRecord::find(const char* name) const {
  if (!name) return nullptr;
  for (const TelemetryField& f : fields_) {
    if (strcmp(f.name, name) == 0) return &f;
  }
  return nullptr;
}

const IdentityEntry* DeviceIdentity::find(const char* name) const {
  if (!name) return nullptr;
  for (const IdentityEntry& e : entries) {
    if (strcmp(e.name, name) == 0) return &e;
  }
  return nullptr;
}

std::string format_local_timestamp() {
  struct timeval tv {};
  gettimeofday(&tv, nullptr);

  struct tm local {};
  const time_t secs = tv.tv_sec;
  localtime_r(&secs, &local);

  char base[32];
  strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &local);

  char out[48];
  snprintf(out, sizeof(out), "%s.%03ld", base, static_cast<long>(tv.tv_usec / 1000));
  return out;
}
