#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../../config/runtime_config.h"
#include "../lockstep/command.h"
#include "../lockstep/command_queue.h"
#include "../lockstep/command_validator.h"
#include "../lockstep/deterministic_rng.h"
#include "../net/transport.h"
#include "../storage/storage.h"
#include "network_event_bus.h"

namespace match {

// Local view of the match lifecycle. Only moves forward:
// None -> Open -> Connecting -> Active -> Ended, or Open -> Ended.
enum class MatchStatus {
  None,
  Open,
  Connecting,
  Active,
  Ended,
};

const char* MatchStatusName(MatchStatus s);

struct Status {
  ErrorKind kind = ErrorKind::None;
  std::string detail;

  bool ok() const { return kind == ErrorKind::None; }
  static Status Ok() { return Status{}; }
  static Status Error(ErrorKind k, std::string d) { return Status{k, std::move(d)}; }
};

template <typename T>
struct Result {
  Status status;
  std::optional<T> value;

  bool ok() const { return status.ok() && value.has_value(); }
};

struct CreateMatchOptions {
  std::string name;
  std::string display_name;
  int max_participants = 0;  // 0 = RuntimeConfig::max_participants
  int tick_rate_hz = 0;      // 0 = RuntimeConfig::tick_hz
  std::optional<uint32_t> seed;
  std::string settings_json = "{}";
};

// Owns one match at a time: its rows (through IStorage), transport, command
// queue and RNG. Setup calls are made from the driver thread and report
// failures both as a returned Status and as an Error event. Transport
// callbacks may arrive on an I/O thread.
class MatchCoordinator {
 public:
  MatchCoordinator(storage::IStorage& storage, std::string local_participant_id, net::TransportFactory transports,
                   const RuntimeConfig& cfg);
  ~MatchCoordinator();

  MatchCoordinator(const MatchCoordinator&) = delete;
  MatchCoordinator& operator=(const MatchCoordinator&) = delete;

  Result<storage::Match> CreateMatch(const CreateMatchOptions& options);
  // Newest first, at most kListLimit. Empty on backend failure (plus an Error event).
  std::vector<storage::Match> ListOpenMatches();
  Status JoinMatch(const std::string& match_id, const std::string& display_name);
  // Re-reads the roster and emits ParticipantJoined/ParticipantLeft for changes.
  Status PollParticipants();
  // Host: moves the match to connecting. Peer: follows once the host has done so.
  Status StartMatch();

  // Stages a command for NextSubmitTick(). Nothing leaves until CommitLocalTick.
  Status SendCommand(const lockstep::Payload& payload);
  // Closes the local contribution for NextSubmitTick(): staged commands plus a
  // trailing noop marker go to the local queue and to every peer.
  Status CommitLocalTick();

  std::optional<std::vector<lockstep::Command>> GetNextTickCommands() const;
  bool AdvanceTick();
  int64_t GetCurrentTick() const;
  int64_t NextSubmitTick() const;
  std::optional<uint32_t> GetGameSeed() const;
  // Null outside a match. EndMatch drops the coordinator's reference only; a
  // caller still holding the pointer keeps a valid (but finished) generator.
  std::shared_ptr<lockstep::DeterministicRNG> Rng();

  // Idempotent; the second call does nothing.
  void EndMatch(const std::string& reason);
  void Disconnect();

  MatchStatus GetStatus() const;
  std::optional<storage::Match> CurrentMatch() const;
  bool IsHost() const;
  const std::string& LocalParticipantId() const { return local_id_; }
  std::vector<std::string> Roster() const;
  lockstep::QueueStats GetQueueStats() const;
  net::TransportStats GetNetworkStats() const;
  uint64_t DroppedRemoteCommands() const { return dropped_remote_.load(); }

  NetworkEventBus& Events() { return events_; }

  static constexpr int kListLimit = 20;

 private:
  bool InMatchLocked() const;
  Status Fail(ErrorKind kind, const std::string& detail);
  void ResetMatchStateLocked();
  Status CloseTickLocked();
  void HandleTransportReady();
  void HandleRemoteCommand(const lockstep::Command& command);

  storage::IStorage& storage_;
  const std::string local_id_;
  net::TransportFactory transport_factory_;
  const RuntimeConfig cfg_;
  NetworkEventBus events_;
  const lockstep::CommandValidator validator_{};

  mutable std::recursive_mutex mu_;
  MatchStatus status_ = MatchStatus::None;
  std::optional<storage::Match> match_;
  bool is_host_ = false;
  std::vector<std::string> roster_;
  std::map<std::string, storage::Participant> known_participants_;
  std::unique_ptr<lockstep::CommandQueue> queue_;
  std::unique_ptr<net::ITransport> transport_;
  std::shared_ptr<lockstep::DeterministicRNG> rng_;
  int64_t next_submit_tick_ = 0;
  std::vector<lockstep::Command> local_staged_;
  // Remote commands wait here until the sender's noop marker closes the tick,
  // so a contribution is queued whole or not at all.
  std::map<std::pair<std::string, int64_t>, std::vector<lockstep::Command>> remote_staged_;
  // Last tick each remote participant closed. Anything at or below it is a
  // repeat and must not reach the queue a second time.
  std::map<std::string, int64_t> remote_closed_;
  std::atomic<uint64_t> dropped_remote_{0};
};

}  // namespace match
