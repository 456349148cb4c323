#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "command.h"

namespace lockstep {

struct ReplayPlayer {
  std::string participant_id;
  std::string display_name;
  std::string faction;
  bool is_local = false;
  std::optional<int> mmr;

  bool operator==(const ReplayPlayer& o) const {
    return participant_id == o.participant_id && display_name == o.display_name && faction == o.faction &&
           is_local == o.is_local && mmr == o.mmr;
  }
};

struct ReplayResult {
  std::string winner_id;
  std::string winner_name;
  std::optional<std::string> loser_id;
  std::optional<std::string> loser_name;
  bool was_forfeit = false;

  bool operator==(const ReplayResult& o) const {
    return winner_id == o.winner_id && winner_name == o.winner_name && loser_id == o.loser_id &&
           loser_name == o.loser_name && was_forfeit == o.was_forfeit;
  }
};

struct ReplayMetadata {
  std::string version = "1.0";
  int64_t timestamp_ms = 0;  // wall clock at Start
  uint32_t seed = 0;
  double duration_s = 0.0;
  std::vector<ReplayPlayer> players;
  std::string game_mode = "online";
  std::optional<std::string> map_name;
  std::optional<ReplayResult> result;
};

struct ReplayData {
  ReplayMetadata metadata;
  std::vector<Command> commands;
};

// Collects released commands for a match so it can be played back against the
// same seed. Commands are only kept between Start and Stop.
class ReplayRecorder {
 public:
  ReplayRecorder(uint32_t seed, std::vector<ReplayPlayer> players, std::string game_mode = "online",
                 std::optional<std::string> map_name = std::nullopt);

  void Start();
  // Finalizes duration and returns a copy; recording stops.
  ReplayData Stop();

  void RecordCommand(const Command& command);
  // Records a released tick batch in order.
  void RecordBatch(const std::vector<Command>& batch);
  void SetResult(ReplayResult result);

  bool IsActive() const { return recording_; }
  size_t CommandCount() const { return commands_.size(); }

 private:
  ReplayMetadata metadata_;
  std::vector<Command> commands_;
  int64_t started_ms_ = 0;
  bool recording_ = false;
};

std::string SerializeReplay(const ReplayData& replay);
// Nullopt when the text is not a replay or any command fails to decode.
std::optional<ReplayData> DeserializeReplay(const std::string& text);

}  // namespace lockstep
