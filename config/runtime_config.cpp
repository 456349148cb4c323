#include "runtime_config.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace {

int clamp_int(int value, int min_v, int max_v) {
  return std::max(min_v, std::min(value, max_v));
}

bool ieq(const std::string& a, const char* b) {
  std::string rhs(b);
  if (a.size() != rhs.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    char ca = static_cast<char>(std::tolower(static_cast<unsigned char>(a[i])));
    char cb = static_cast<char>(std::tolower(static_cast<unsigned char>(rhs[i])));
    if (ca != cb) return false;
  }
  return true;
}

int getenv_int(const char* name, int default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  char* end = nullptr;
  long parsed = std::strtol(v, &end, 10);
  if (end == v || *end != '\0') return default_value;
  return static_cast<int>(parsed);
}

bool getenv_bool(const char* name, bool default_value) {
  const char* v = std::getenv(name);
  if (!v || !*v) return default_value;
  std::string s(v);
  if (ieq(s, "1") || ieq(s, "true") || ieq(s, "yes") || ieq(s, "on")) return true;
  if (ieq(s, "0") || ieq(s, "false") || ieq(s, "no") || ieq(s, "off")) return false;
  return default_value;
}

std::string getenv_string(const char* name, const std::string& default_value) {
  const char* v = std::getenv(name);
  return (v && *v) ? std::string(v) : default_value;
}

}  // namespace

RuntimeConfig RuntimeConfig::FromEnv() {
  RuntimeConfig cfg;

  cfg.tick_hz = clamp_int(getenv_int("TICK_HZ", cfg.tick_hz), 1, 240);
  cfg.max_participants = clamp_int(getenv_int("MAX_PARTICIPANTS", cfg.max_participants), 2, 16);
  cfg.input_delay_ticks = clamp_int(getenv_int("INPUT_DELAY_TICKS", cfg.input_delay_ticks), 0, 30);
  cfg.batch_interval_ms = clamp_int(getenv_int("BATCH_INTERVAL_MS", cfg.batch_interval_ms), 1, 1000);
  cfg.max_batch_size = clamp_int(getenv_int("MAX_BATCH_SIZE", cfg.max_batch_size), 1, 1000);
  cfg.ping_interval_ms = clamp_int(getenv_int("PING_INTERVAL_MS", cfg.ping_interval_ms), 100, 60000);
  cfg.relay_poll_ms = clamp_int(getenv_int("RELAY_POLL_MS", cfg.relay_poll_ms), 1, 1000);
  cfg.ready_grace_ms = clamp_int(getenv_int("READY_GRACE_MS", cfg.ready_grace_ms), 0, 600000);
  cfg.relay_host = getenv_string("RELAY_HOST", cfg.relay_host);
  cfg.relay_port = clamp_int(getenv_int("RELAY_PORT", cfg.relay_port), 1, 65535);
  cfg.debug_sync = getenv_bool("DEBUG_SYNC", cfg.debug_sync);

  return cfg;
}

int RuntimeConfig::TickIntervalMs() const {
  int interval = static_cast<int>(std::lround(1000.0 / static_cast<double>(tick_hz)));
  return std::max(1, interval);
}
