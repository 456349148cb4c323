#pragma once

#include <cstdint>
#include <string>

struct RuntimeConfig {
  int tick_hz = 30;
  int max_participants = 2;
  int input_delay_ticks = 2;
  int batch_interval_ms = 16;
  int max_batch_size = 50;
  int ping_interval_ms = 2000;
  int relay_poll_ms = 10;
  int ready_grace_ms = 15000;
  std::string relay_host = "127.0.0.1";
  int relay_port = 8090;
  bool debug_sync = false;

  static RuntimeConfig FromEnv();
  int TickIntervalMs() const;
};
