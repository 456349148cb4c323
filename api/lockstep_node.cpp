// lockstep_node.cpp
#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <thread>

#include <aws/core/Aws.h>

#include "httplib.h"
#include "lockstep/replay_recorder.h"
#include "match/match_coordinator.h"
#include "net/relay_transport.h"
#include "protocol/command_codec.h"
#include "protocol/encode_json.h"
#include "relay/relay_service.h"
#include "storage/storage_factory.h"
#include "../config/runtime_config.h"

using namespace std;

static volatile sig_atomic_t g_stop_requested = 0;

static void on_stop_signal(int) {
  g_stop_requested = 1;
}

static string env_or(const char* name, const string& def) {
  const char* v = getenv(name);
  return (v && *v) ? string(v) : def;
}

static string rand_participant_id() {
  static const char* chars = "abcdefghijklmnopqrstuvwxyz0123456789";
  mt19937 rng(static_cast<uint32_t>(random_device{}()));
  uniform_int_distribution<int> dist(0, 35);
  string id = "p-";
  for (int i = 0; i < 10; ++i) id.push_back(chars[dist(rng)]);
  return id;
}

static uint64_t fnv1a(uint64_t h, const string& s) {
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}

static int run_relay(const RuntimeConfig& cfg) {
  relay::RelayService relay;
  httplib::Server srv;
  relay.Mount(srv);

  signal(SIGINT, on_stop_signal);
  signal(SIGTERM, on_stop_signal);
  thread watcher([&] {
    while (!g_stop_requested) this_thread::sleep_for(chrono::milliseconds(100));
    srv.stop();
  });

  cout << "Relay on http://" << cfg.relay_host << ":" << cfg.relay_port << "\n";
  cout << "Hello: POST /relay/<match>/hello {peer}\n";
  cout << "Send:  POST /relay/<match>/send {from,to?,body}\n";
  cout << "Inbox: GET  /relay/<match>/inbox?peer=..&after=..\n";
  const bool ok = srv.listen(cfg.relay_host, cfg.relay_port);
  g_stop_requested = 1;
  watcher.join();
  if (!ok) {
    cerr << "Relay could not bind " << cfg.relay_host << ":" << cfg.relay_port << "\n";
    return 1;
  }
  return 0;
}

static unique_ptr<lockstep::ReplayRecorder> make_recorder(match::MatchCoordinator& coord) {
  vector<lockstep::ReplayPlayer> players;
  for (const auto& id : coord.Roster()) {
    lockstep::ReplayPlayer p;
    p.participant_id = id;
    p.display_name = id == coord.LocalParticipantId() ? env_or("DISPLAY_NAME", id) : id;
    p.is_local = id == coord.LocalParticipantId();
    players.push_back(p);
  }
  auto rec = make_unique<lockstep::ReplayRecorder>(coord.GetGameSeed().value_or(0), players, "online");
  rec->Start();
  return rec;
}

static void write_replay(lockstep::ReplayRecorder& rec, const string& path) {
  const lockstep::ReplayData data = rec.Stop();
  ofstream out(path, ios::binary | ios::trunc);
  out << lockstep::SerializeReplay(data);
  if (!out) {
    cerr << "[Node] could not write replay to " << path << "\n";
    return;
  }
  cout << "[Node] replay with " << data.commands.size() << " commands written to " << path << "\n";
}

// Drives an active match at TICK_HZ until DEMO_TICKS ticks are released or a
// stop signal arrives. Local input is a random unit_move now and then; every
// released batch is folded into a checksum that must match on every peer.
// With REPLAY_OUT set, released batches are also saved as a replay file.
static void run_demo_loop(match::MatchCoordinator& coord, const RuntimeConfig& cfg, int64_t demo_ticks) {
  using clock = chrono::steady_clock;
  using ms = chrono::milliseconds;

  const ms tick_dt(cfg.TickIntervalMs());
  auto next_tick = clock::now() + tick_dt;
  const int max_catch_up_ticks = 3;
  const auto max_lag = tick_dt * 5;

  mt19937 input_rng(static_cast<uint32_t>(random_device{}()));
  uniform_int_distribution<int> input_roll(0, 9);
  uniform_real_distribution<double> coord_roll(0.0, 100.0);

  uint64_t checksum = 1469598103934665603ull;
  uint64_t stalled_since_log = 0;
  auto next_log_at = clock::now() + chrono::seconds(5);

  const string replay_path = env_or("REPLAY_OUT", "");
  unique_ptr<lockstep::ReplayRecorder> recorder;
  if (!replay_path.empty()) recorder = make_recorder(coord);

  while (!g_stop_requested && coord.GetStatus() == match::MatchStatus::Active &&
         coord.GetCurrentTick() < demo_ticks) {
    auto now = clock::now();

    int catch_up_ticks = 0;
    while (now >= next_tick && catch_up_ticks < max_catch_up_ticks) {
      if (coord.NextSubmitTick() <= coord.GetCurrentTick() + cfg.input_delay_ticks) {
        if (input_roll(input_rng) == 0) {
          lockstep::UnitMove move;
          move.unit_ids = {coord.LocalParticipantId() + "-u1"};
          move.target_x = coord_roll(input_rng);
          move.target_y = coord_roll(input_rng);
          auto st = coord.SendCommand(move);
          if (!st.ok()) cerr << "[Node] send failed: " << st.detail << "\n";
        }
        auto st = coord.CommitLocalTick();
        if (!st.ok()) cerr << "[Node] commit failed: " << st.detail << "\n";
      }

      auto batch = coord.GetNextTickCommands();
      if (!batch) {
        ++stalled_since_log;
        break;
      }
      if (recorder) recorder->RecordBatch(*batch);
      shared_ptr<lockstep::DeterministicRNG> rng = coord.Rng();
      for (const auto& c : *batch) {
        checksum = fnv1a(checksum, protocol::encode_command_json(c));
        if (rng) checksum ^= static_cast<uint64_t>(rng->NextInt(0, 1 << 30));
      }
      const int64_t tick = coord.GetCurrentTick();
      coord.AdvanceTick();
      if (tick % cfg.tick_hz == 0) {
        cout << "[Node] tick " << tick << " checksum " << hex << checksum << dec << "\n";
      }
      ++catch_up_ticks;
      next_tick += tick_dt;
      now = clock::now();
    }

    if ((now - next_tick) > max_lag) {
      next_tick = now + tick_dt;
    }

    if (cfg.debug_sync && now >= next_log_at) {
      cout << "[rate] stalled/5s=" << stalled_since_log << " queue=" << protocol::encode_queue_stats_json(coord.GetQueueStats())
           << " net=" << protocol::encode_transport_stats_json(coord.GetNetworkStats()) << "\n";
      stalled_since_log = 0;
      next_log_at += chrono::seconds(5);
    }

    this_thread::sleep_until(min(next_tick, clock::now() + ms(5)));
  }

  if (recorder) write_replay(*recorder, replay_path);
}

static bool wait_until_active(match::MatchCoordinator& coord, const RuntimeConfig& cfg) {
  const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(cfg.ready_grace_ms * 2);
  while (!g_stop_requested && chrono::steady_clock::now() < deadline) {
    if (coord.GetStatus() == match::MatchStatus::Active) return true;
    if (coord.GetStatus() == match::MatchStatus::Ended) return false;
    this_thread::sleep_for(chrono::milliseconds(50));
  }
  return coord.GetStatus() == match::MatchStatus::Active;
}

static int run_host(storage::IStorage& storage, const RuntimeConfig& cfg, const string& participant_id,
                    const string& name, int64_t demo_ticks) {
  match::MatchCoordinator coord(storage, participant_id, [cfg] { return make_unique<net::RelayTransport>(cfg); },
                                cfg);
  size_t roster_size = 1;
  coord.Events().On<match::ParticipantJoinedEvent>([&](const match::ParticipantJoinedEvent& e) {
    ++roster_size;
    cout << "[Node] " << e.participant.participant_id << " joined (" << e.participant.display_name << ")\n";
  });
  coord.Events().On<match::ParticipantLeftEvent>([&](const match::ParticipantLeftEvent& e) {
    if (roster_size > 1) --roster_size;
    cout << "[Node] " << e.participant.participant_id << " left\n";
  });

  match::CreateMatchOptions opts;
  opts.name = name;
  opts.display_name = env_or("DISPLAY_NAME", participant_id);
  auto created = coord.CreateMatch(opts);
  if (!created.ok()) {
    cerr << "Create failed: " << match::ErrorKindName(created.status.kind) << " " << created.status.detail << "\n";
    return 1;
  }
  cout << protocol::encode_match_json(*created.value) << "\n";
  cout << "Waiting for " << created.value->max_participants - 1 << " participant(s)...\n";

  while (!g_stop_requested && roster_size < static_cast<size_t>(created.value->max_participants)) {
    auto st = coord.PollParticipants();
    if (!st.ok()) cerr << "[Node] poll failed: " << st.detail << "\n";
    this_thread::sleep_for(chrono::milliseconds(500));
  }
  if (g_stop_requested) {
    coord.EndMatch("host_cancelled");
    return 0;
  }

  auto st = coord.StartMatch();
  if (!st.ok()) {
    cerr << "Start failed: " << match::ErrorKindName(st.kind) << " " << st.detail << "\n";
    coord.EndMatch("start_failed");
    return 1;
  }
  if (!wait_until_active(coord, cfg)) {
    coord.EndMatch("connect_timeout");
    return 1;
  }
  run_demo_loop(coord, cfg, demo_ticks);
  coord.EndMatch(g_stop_requested ? "host_left" : "demo_complete");
  return 0;
}

static int run_join(storage::IStorage& storage, const RuntimeConfig& cfg, const string& participant_id,
                    const string& match_id, int64_t demo_ticks) {
  match::MatchCoordinator coord(storage, participant_id, [cfg] { return make_unique<net::RelayTransport>(cfg); },
                                cfg);
  auto st = coord.JoinMatch(match_id, env_or("DISPLAY_NAME", participant_id));
  if (!st.ok()) {
    cerr << "Join failed: " << match::ErrorKindName(st.kind) << " " << st.detail << "\n";
    return 1;
  }
  cout << "Joined " << match_id << ", waiting for the host to start...\n";

  while (!g_stop_requested) {
    optional<storage::Match> m;
    try {
      m = storage.GetMatchById(match_id);
    } catch (const storage::StorageError& e) {
      cerr << "[Node] match lookup failed: " << e.what() << "\n";
    }
    if (m && m->status != "open") break;
    this_thread::sleep_for(chrono::milliseconds(500));
  }
  if (g_stop_requested) {
    coord.Disconnect();
    return 0;
  }

  st = coord.StartMatch();
  if (!st.ok()) {
    cerr << "Start failed: " << match::ErrorKindName(st.kind) << " " << st.detail << "\n";
    coord.Disconnect();
    return 1;
  }
  if (!wait_until_active(coord, cfg)) {
    coord.Disconnect();
    return 1;
  }
  run_demo_loop(coord, cfg, demo_ticks);
  coord.Disconnect();
  return 0;
}

static int run_with_storage(const string& mode, int argc, char** argv, const RuntimeConfig& cfg) {
  unique_ptr<storage::IStorage> storage;
  try {
    storage = storage::CreateStorageFromEnv();
  } catch (const exception& e) {
    cerr << "Storage config error: " << e.what() << "\n";
    return 1;
  }

  if (!storage->HealthCheck()) {
    cerr << "Storage health check failed\n";
    return 1;
  }

  if (mode == "reset") {
    if (!storage->ResetForDev()) {
      cerr << "Dynamo reset failed\n";
      return 1;
    }
    cout << "DynamoDB reset complete.\n";
    return 0;
  }

  const string participant_id = env_or("PARTICIPANT_ID", rand_participant_id());
  const int64_t demo_ticks = max<int64_t>(1, atoll(env_or("DEMO_TICKS", "300").c_str()));

  if (mode == "list") {
    match::MatchCoordinator coord(*storage, participant_id, nullptr, cfg);
    cout << protocol::encode_match_list_json(coord.ListOpenMatches()) << "\n";
    return 0;
  }
  if (mode == "host") {
    return run_host(*storage, cfg, participant_id, argc >= 3 ? argv[2] : "lockstep match", demo_ticks);
  }
  if (mode == "join" && argc >= 3) {
    return run_join(*storage, cfg, participant_id, argv[2], demo_ticks);
  }
  cerr << "Usage: ./lockstep_node [relay|list|host <name>|join <match_id>|reset]\n";
  return 1;
}

int main(int argc, char** argv) {
  const string mode = (argc >= 2) ? argv[1] : "relay";

  RuntimeConfig runtime_cfg = RuntimeConfig::FromEnv();
  cout << "RuntimeConfig: "
       << "TICK_HZ=" << runtime_cfg.tick_hz
       << ", MAX_PARTICIPANTS=" << runtime_cfg.max_participants
       << ", INPUT_DELAY_TICKS=" << runtime_cfg.input_delay_ticks
       << ", RELAY=" << runtime_cfg.relay_host << ":" << runtime_cfg.relay_port
       << ", DEBUG_SYNC=" << (runtime_cfg.debug_sync ? "true" : "false")
       << "\n";

  if (mode == "relay") return run_relay(runtime_cfg);

  signal(SIGINT, on_stop_signal);
  signal(SIGTERM, on_stop_signal);

  Aws::SDKOptions aws_options;
  Aws::InitAPI(aws_options);
  int rc = run_with_storage(mode, argc, argv, runtime_cfg);
  Aws::ShutdownAPI(aws_options);
  return rc;
}
