#include <cstdlib>

#include "config/runtime_config.h"
#include "test_support.h"

namespace {

const char* kVars[] = {"TICK_HZ",          "MAX_PARTICIPANTS", "INPUT_DELAY_TICKS", "BATCH_INTERVAL_MS",
                       "MAX_BATCH_SIZE",   "PING_INTERVAL_MS", "RELAY_POLL_MS",     "READY_GRACE_MS",
                       "RELAY_HOST",       "RELAY_PORT",       "DEBUG_SYNC"};

void clear_env() {
  for (const char* v : kVars) unsetenv(v);
}

}  // namespace

static int test_defaults() {
  clear_env();
  RuntimeConfig cfg = RuntimeConfig::FromEnv();
  EXPECT(cfg.tick_hz == 30, "tick_hz");
  EXPECT(cfg.max_participants == 2, "max_participants");
  EXPECT(cfg.input_delay_ticks == 2, "input delay");
  EXPECT(cfg.batch_interval_ms == 16 && cfg.max_batch_size == 50, "batching");
  EXPECT(cfg.relay_host == "127.0.0.1" && cfg.relay_port == 8090, "relay address");
  EXPECT(!cfg.debug_sync, "debug off");
  EXPECT(cfg.TickIntervalMs() == 33, "30 Hz is 33 ms");
  return 0;
}

static int test_overrides_and_clamping() {
  clear_env();
  setenv("TICK_HZ", "60", 1);
  setenv("MAX_PARTICIPANTS", "1", 1);
  setenv("INPUT_DELAY_TICKS", "99", 1);
  setenv("RELAY_PORT", "0", 1);
  setenv("RELAY_HOST", "relay.internal", 1);
  RuntimeConfig cfg = RuntimeConfig::FromEnv();
  EXPECT(cfg.tick_hz == 60, "override taken");
  EXPECT(cfg.TickIntervalMs() == 17, "60 Hz is 17 ms");
  EXPECT(cfg.max_participants == 2, "clamped up to 2");
  EXPECT(cfg.input_delay_ticks == 30, "clamped down to 30");
  EXPECT(cfg.relay_port == 1, "port clamped");
  EXPECT(cfg.relay_host == "relay.internal", "host string");

  setenv("TICK_HZ", "fast", 1);
  EXPECT(RuntimeConfig::FromEnv().tick_hz == 30, "garbage falls back to default");
  setenv("TICK_HZ", "1000", 1);
  EXPECT(RuntimeConfig::FromEnv().tick_hz == 240, "tick rate ceiling");
  clear_env();
  return 0;
}

static int test_bools() {
  clear_env();
  setenv("DEBUG_SYNC", "TRUE", 1);
  EXPECT(RuntimeConfig::FromEnv().debug_sync, "TRUE");
  setenv("DEBUG_SYNC", "on", 1);
  EXPECT(RuntimeConfig::FromEnv().debug_sync, "on");
  setenv("DEBUG_SYNC", "0", 1);
  EXPECT(!RuntimeConfig::FromEnv().debug_sync, "0");
  setenv("DEBUG_SYNC", "maybe", 1);
  EXPECT(!RuntimeConfig::FromEnv().debug_sync, "unknown keeps default");
  clear_env();
  return 0;
}

int main() {
  RUN_TEST(test_defaults);
  RUN_TEST(test_overrides_and_clamping);
  RUN_TEST(test_bools);
  return 0;
}
