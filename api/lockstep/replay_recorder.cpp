#include "replay_recorder.h"

#include <chrono>
#include <iostream>
#include <limits>
#include <utility>

#include "../protocol/command_codec.h"
#include "../protocol/json.h"

namespace lockstep {
namespace {

using protocol::JsonValue;

int64_t NowMs() {
  using namespace std::chrono;
  return static_cast<int64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

JsonValue EncodePlayer(const ReplayPlayer& p) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("playerId", JsonValue::MakeString(p.participant_id));
  o.Set("playerName", JsonValue::MakeString(p.display_name));
  o.Set("faction", JsonValue::MakeString(p.faction));
  o.Set("isLocal", JsonValue::MakeBool(p.is_local));
  if (p.mmr) o.Set("mmr", JsonValue::MakeNumber(*p.mmr));
  return o;
}

std::optional<ReplayPlayer> DecodePlayer(const JsonValue& v) {
  if (!v.IsObject()) return std::nullopt;
  ReplayPlayer p;
  auto id = v.GetString("playerId");
  auto name = v.GetString("playerName");
  if (!id || id->empty() || !name) return std::nullopt;
  p.participant_id = *id;
  p.display_name = *name;
  p.faction = v.GetString("faction").value_or("");
  p.is_local = v.GetBool("isLocal").value_or(false);
  if (v.Find("mmr")) {
    auto mmr = v.GetInt("mmr");
    if (!mmr || *mmr < std::numeric_limits<int>::min() || *mmr > std::numeric_limits<int>::max()) {
      return std::nullopt;
    }
    p.mmr = static_cast<int>(*mmr);
  }
  return p;
}

JsonValue EncodeResult(const ReplayResult& r) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("winnerId", JsonValue::MakeString(r.winner_id));
  o.Set("winnerName", JsonValue::MakeString(r.winner_name));
  if (r.loser_id) o.Set("loserId", JsonValue::MakeString(*r.loser_id));
  if (r.loser_name) o.Set("loserName", JsonValue::MakeString(*r.loser_name));
  o.Set("wasForfeit", JsonValue::MakeBool(r.was_forfeit));
  return o;
}

std::optional<ReplayResult> DecodeResult(const JsonValue& v) {
  if (!v.IsObject()) return std::nullopt;
  auto winner = v.GetString("winnerId");
  auto winner_name = v.GetString("winnerName");
  if (!winner || !winner_name) return std::nullopt;
  ReplayResult r;
  r.winner_id = *winner;
  r.winner_name = *winner_name;
  r.loser_id = v.GetString("loserId");
  r.loser_name = v.GetString("loserName");
  r.was_forfeit = v.GetBool("wasForfeit").value_or(false);
  return r;
}

}  // namespace

ReplayRecorder::ReplayRecorder(uint32_t seed, std::vector<ReplayPlayer> players, std::string game_mode,
                               std::optional<std::string> map_name) {
  metadata_.seed = seed;
  metadata_.players = std::move(players);
  metadata_.game_mode = std::move(game_mode);
  metadata_.map_name = std::move(map_name);
  started_ms_ = NowMs();
  metadata_.timestamp_ms = started_ms_;
}

void ReplayRecorder::Start() {
  recording_ = true;
  started_ms_ = NowMs();
  metadata_.timestamp_ms = started_ms_;
}

ReplayData ReplayRecorder::Stop() {
  if (recording_) {
    metadata_.duration_s = static_cast<double>(NowMs() - started_ms_) / 1000.0;
  }
  recording_ = false;
  return ReplayData{metadata_, commands_};
}

void ReplayRecorder::RecordCommand(const Command& command) {
  if (recording_) commands_.push_back(command);
}

void ReplayRecorder::RecordBatch(const std::vector<Command>& batch) {
  for (const auto& c : batch) RecordCommand(c);
}

void ReplayRecorder::SetResult(ReplayResult result) {
  metadata_.result = std::move(result);
}

std::string SerializeReplay(const ReplayData& replay) {
  const ReplayMetadata& md = replay.metadata;
  JsonValue meta = JsonValue::MakeObject();
  meta.Set("version", JsonValue::MakeString(md.version));
  meta.Set("timestamp", JsonValue::MakeNumber(static_cast<double>(md.timestamp_ms)));
  meta.Set("seed", JsonValue::MakeNumber(md.seed));
  meta.Set("duration", JsonValue::MakeNumber(md.duration_s));
  JsonValue players = JsonValue::MakeArray();
  for (const auto& p : md.players) players.Push(EncodePlayer(p));
  meta.Set("players", std::move(players));
  meta.Set("gameMode", JsonValue::MakeString(md.game_mode));
  if (md.map_name) meta.Set("mapName", JsonValue::MakeString(*md.map_name));
  if (md.result) meta.Set("matchResult", EncodeResult(*md.result));

  JsonValue commands = JsonValue::MakeArray();
  for (const auto& c : replay.commands) commands.Push(protocol::encode_command(c));

  JsonValue root = JsonValue::MakeObject();
  root.Set("metadata", std::move(meta));
  root.Set("commands", std::move(commands));
  return protocol::json_stringify(root);
}

std::optional<ReplayData> DeserializeReplay(const std::string& text) {
  JsonValue root;
  if (!protocol::json_parse(text, root) || !root.IsObject()) return std::nullopt;
  const JsonValue* meta = root.Find("metadata");
  const JsonValue* commands = root.Find("commands");
  if (!meta || !meta->IsObject() || !commands || !commands->IsArray()) return std::nullopt;

  ReplayData out;
  ReplayMetadata& md = out.metadata;
  auto version = meta->GetString("version");
  auto seed = meta->GetInt("seed");
  if (!version || !seed || *seed < 0 || *seed > std::numeric_limits<uint32_t>::max()) return std::nullopt;
  md.version = *version;
  md.seed = static_cast<uint32_t>(*seed);
  md.timestamp_ms = meta->GetInt("timestamp").value_or(0);
  md.duration_s = meta->GetNumber("duration").value_or(0.0);
  md.game_mode = meta->GetString("gameMode").value_or("online");
  md.map_name = meta->GetString("mapName");

  const JsonValue* players = meta->Find("players");
  if (!players || !players->IsArray()) return std::nullopt;
  for (const auto& p : players->array_values) {
    auto player = DecodePlayer(p);
    if (!player) return std::nullopt;
    md.players.push_back(std::move(*player));
  }
  if (const JsonValue* result = meta->Find("matchResult")) {
    md.result = DecodeResult(*result);
    if (!md.result) return std::nullopt;
  }

  for (size_t i = 0; i < commands->array_values.size(); ++i) {
    auto c = protocol::decode_command(commands->array_values[i]);
    if (!c) {
      std::cerr << "[Replay] command " << i << " does not decode\n";
      return std::nullopt;
    }
    out.commands.push_back(std::move(*c));
  }
  return out;
}

}  // namespace lockstep
