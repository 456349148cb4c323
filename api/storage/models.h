#pragma once

#include <cstdint>
#include <string>

namespace storage {

struct Match {
  std::string match_id;
  int64_t created_at = 0;
  std::string status = "open";  // open, connecting, active, ended
  std::string host_participant_id;
  uint32_t seed = 0;
  int tick_rate = 30;
  int max_participants = 2;
  std::string name;
  std::string settings_json = "{}";
  bool lockstep_enabled = true;
};

struct Participant {
  std::string match_id;
  std::string participant_id;
  std::string role = "peer";  // host, peer
  bool connected = false;
  std::string display_name;
  std::string faction;
  int64_t joined_at = 0;
};

}  // namespace storage
