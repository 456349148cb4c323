#include "match_coordinator.h"

#include <algorithm>
#include <ctime>
#include <iostream>
#include <random>
#include <set>

#include "../protocol/command_codec.h"
#include "../protocol/json.h"

namespace match {
namespace {

std::string generate_match_id() {
  static const char* chars = "0123456789abcdef";
  static thread_local std::mt19937 rng(static_cast<uint32_t>(std::random_device{}()));
  std::uniform_int_distribution<int> dist(0, 15);
  std::string id = "m-";
  for (int i = 0; i < 16; ++i) id.push_back(chars[dist(rng)]);
  return id;
}

int64_t now_unix() {
  return static_cast<int64_t>(std::time(nullptr));
}

bool status_can_move(MatchStatus from, MatchStatus to) {
  if (from == MatchStatus::Ended) return false;
  return static_cast<int>(to) > static_cast<int>(from);
}

}  // namespace

const char* MatchStatusName(MatchStatus s) {
  switch (s) {
    case MatchStatus::None: return "none";
    case MatchStatus::Open: return "open";
    case MatchStatus::Connecting: return "connecting";
    case MatchStatus::Active: return "active";
    case MatchStatus::Ended: return "ended";
  }
  return "unknown";
}

MatchCoordinator::MatchCoordinator(storage::IStorage& storage, std::string local_participant_id,
                                   net::TransportFactory transports, const RuntimeConfig& cfg)
    : storage_(storage),
      local_id_(std::move(local_participant_id)),
      transport_factory_(std::move(transports)),
      cfg_(cfg) {}

MatchCoordinator::~MatchCoordinator() {
  std::unique_ptr<net::ITransport> transport;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    transport = std::move(transport_);
    queue_.reset();
  }
  if (transport) transport->Disconnect();
}

bool MatchCoordinator::InMatchLocked() const {
  return status_ == MatchStatus::Open || status_ == MatchStatus::Connecting || status_ == MatchStatus::Active;
}

Status MatchCoordinator::Fail(ErrorKind kind, const std::string& detail) {
  std::cerr << "[MatchCoordinator] " << ErrorKindName(kind) << ": " << detail << "\n";
  events_.Emit(ErrorEvent{kind, detail});
  return Status::Error(kind, detail);
}

void MatchCoordinator::ResetMatchStateLocked() {
  match_.reset();
  is_host_ = false;
  roster_.clear();
  known_participants_.clear();
  queue_.reset();
  transport_.reset();
  rng_.reset();
  next_submit_tick_ = 0;
  local_staged_.clear();
  remote_staged_.clear();
  remote_closed_.clear();
}

Result<storage::Match> MatchCoordinator::CreateMatch(const CreateMatchOptions& options) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  Result<storage::Match> out;
  if (InMatchLocked()) {
    out.status = Fail(ErrorKind::InvalidParameters, "already in match " + match_->match_id);
    return out;
  }

  const int max_participants = options.max_participants > 0 ? options.max_participants : cfg_.max_participants;
  const int tick_rate = options.tick_rate_hz > 0 ? options.tick_rate_hz : cfg_.tick_hz;
  if (max_participants < 2) {
    out.status = Fail(ErrorKind::InvalidParameters, "max_participants must be at least 2");
    return out;
  }
  if (options.tick_rate_hz < 0 || tick_rate < 1 || tick_rate > 240) {
    out.status = Fail(ErrorKind::InvalidParameters, "tick_rate_hz must be within 1..240");
    return out;
  }
  const std::string settings = options.settings_json.empty() ? "{}" : options.settings_json;
  protocol::JsonValue parsed;
  if (!protocol::json_parse(settings, parsed) || !parsed.IsObject()) {
    out.status = Fail(ErrorKind::InvalidParameters, "settings must be a JSON object");
    return out;
  }

  storage::Match m;
  m.match_id = generate_match_id();
  m.created_at = now_unix();
  m.status = "open";
  m.host_participant_id = local_id_;
  m.seed = options.seed.has_value() ? *options.seed : lockstep::GenerateMatchSeed();
  m.tick_rate = tick_rate;
  m.max_participants = max_participants;
  m.name = options.name;
  m.settings_json = settings;

  if (!storage_.PutMatch(m)) {
    out.status = Fail(ErrorKind::BackendUnavailable, "could not persist match");
    return out;
  }

  storage::Participant host;
  host.match_id = m.match_id;
  host.participant_id = local_id_;
  host.role = "host";
  host.display_name = options.display_name;
  host.joined_at = m.created_at;
  if (!storage_.PutParticipant(host)) {
    if (!storage_.UpdateMatchStatus(m.match_id, "ended")) {
      std::cerr << "[MatchCoordinator] could not close orphaned match " << m.match_id << "\n";
    }
    out.status = Fail(ErrorKind::BackendUnavailable, "could not persist host participant");
    return out;
  }

  ResetMatchStateLocked();
  match_ = m;
  is_host_ = true;
  status_ = MatchStatus::Open;
  known_participants_[local_id_] = host;
  rng_ = std::make_shared<lockstep::DeterministicRNG>(m.seed);

  std::cout << "[MatchCoordinator] created match " << m.match_id << " (seed " << m.seed << ", " << m.tick_rate
            << " Hz, max " << m.max_participants << ")\n";
  events_.Emit(MatchCreatedEvent{m});
  out.value = m;
  return out;
}

std::vector<storage::Match> MatchCoordinator::ListOpenMatches() {
  try {
    return storage_.ListMatchesByStatus("open", kListLimit);
  } catch (const storage::StorageError& e) {
    Fail(ErrorKind::BackendUnavailable, std::string("list open matches: ") + e.what());
    return {};
  }
}

Status MatchCoordinator::JoinMatch(const std::string& match_id, const std::string& display_name) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (InMatchLocked()) return Fail(ErrorKind::InvalidParameters, "already in match " + match_->match_id);

  std::optional<storage::Match> m;
  std::vector<storage::Participant> rows;
  try {
    m = storage_.GetMatchById(match_id);
    if (!m) return Fail(ErrorKind::MatchNotFound, match_id);
    if (m->status != "open") return Fail(ErrorKind::MatchNotJoinable, match_id + " is " + m->status);
    rows = storage_.ListParticipants(match_id);
  } catch (const storage::StorageError& e) {
    return Fail(ErrorKind::BackendUnavailable, std::string("join: ") + e.what());
  }

  const bool rejoin = std::any_of(rows.begin(), rows.end(),
                                  [&](const storage::Participant& p) { return p.participant_id == local_id_; });
  if (!rejoin && static_cast<int>(rows.size()) >= m->max_participants) {
    return Fail(ErrorKind::MatchFull, match_id);
  }

  storage::Participant self;
  self.match_id = match_id;
  self.participant_id = local_id_;
  self.role = "peer";
  self.display_name = display_name;
  self.joined_at = now_unix();
  if (!storage_.PutParticipant(self)) return Fail(ErrorKind::BackendUnavailable, "could not persist participant");

  ResetMatchStateLocked();
  match_ = *m;
  is_host_ = false;
  status_ = MatchStatus::Open;
  for (const auto& p : rows) known_participants_[p.participant_id] = p;
  known_participants_[local_id_] = self;
  // The host's seed, never our own.
  rng_ = std::make_shared<lockstep::DeterministicRNG>(m->seed);

  std::cout << "[MatchCoordinator] joined match " << match_id << " as " << local_id_ << "\n";
  events_.Emit(ParticipantJoinedEvent{self});
  return Status::Ok();
}

Status MatchCoordinator::PollParticipants() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (!InMatchLocked()) return Status::Error(ErrorKind::NoActiveMatch, "no match");

  std::vector<storage::Participant> rows;
  try {
    rows = storage_.ListParticipants(match_->match_id);
  } catch (const storage::StorageError& e) {
    return Fail(ErrorKind::BackendUnavailable, std::string("poll participants: ") + e.what());
  }

  std::map<std::string, storage::Participant> current;
  for (const auto& p : rows) current[p.participant_id] = p;

  std::vector<storage::Participant> joined;
  std::vector<storage::Participant> left;
  for (const auto& kv : current) {
    if (!known_participants_.count(kv.first)) joined.push_back(kv.second);
  }
  for (const auto& kv : known_participants_) {
    if (!current.count(kv.first)) left.push_back(kv.second);
  }
  known_participants_ = std::move(current);

  for (const auto& p : joined) events_.Emit(ParticipantJoinedEvent{p});
  for (const auto& p : left) events_.Emit(ParticipantLeftEvent{p});
  return Status::Ok();
}

Status MatchCoordinator::StartMatch() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (!InMatchLocked()) return Fail(ErrorKind::NoActiveMatch, "start without a match");
  if (status_ != MatchStatus::Open) return Fail(ErrorKind::InvalidParameters, "match already started");
  const std::string match_id = match_->match_id;

  std::vector<storage::Participant> rows;
  try {
    if (is_host_) {
      rows = storage_.ListParticipants(match_id);
      if (rows.size() < 2) return Fail(ErrorKind::InvalidParameters, "need at least 2 participants to start");
      if (!storage_.UpdateMatchStatus(match_id, "connecting")) {
        return Fail(ErrorKind::BackendUnavailable, "could not move match to connecting");
      }
      // Joins are refused from here on; this read is the roster.
      rows = storage_.ListParticipants(match_id);
    } else {
      auto m = storage_.GetMatchById(match_id);
      if (!m) return Fail(ErrorKind::MatchNotFound, match_id);
      if (m->status == "open") return Fail(ErrorKind::InvalidParameters, "host has not started " + match_id);
      if (m->status == "ended") return Fail(ErrorKind::MatchNotJoinable, match_id + " already ended");
      rows = storage_.ListParticipants(match_id);
    }
  } catch (const storage::StorageError& e) {
    return Fail(ErrorKind::BackendUnavailable, std::string("start: ") + e.what());
  }

  std::vector<std::string> roster;
  for (const auto& p : rows) roster.push_back(p.participant_id);
  std::sort(roster.begin(), roster.end());
  roster.erase(std::unique(roster.begin(), roster.end()), roster.end());
  if (!std::binary_search(roster.begin(), roster.end(), local_id_)) {
    return Fail(ErrorKind::InvalidParameters, local_id_ + " is not in the roster of " + match_id);
  }
  std::vector<std::string> peers;
  for (const auto& id : roster) {
    if (id != local_id_) peers.push_back(id);
  }

  roster_ = roster;
  queue_ = std::make_unique<lockstep::CommandQueue>(roster_);
  transport_ = transport_factory_ ? transport_factory_() : nullptr;
  if (!transport_) {
    Status st = Fail(ErrorKind::BackendUnavailable, "no transport available");
    EndMatch("transport_failed");
    return st;
  }
  transport_->OnCommandReceived([this](const lockstep::Command& c) { HandleRemoteCommand(c); });
  transport_->OnReady([this] { HandleTransportReady(); });
  try {
    transport_->Initialize(match_id, local_id_, is_host_, peers);
  } catch (const net::TransportError& e) {
    Status st = Fail(ErrorKind::BackendUnavailable, std::string("transport: ") + e.what());
    EndMatch("transport_failed");
    return st;
  }

  status_ = MatchStatus::Connecting;
  std::cout << "[MatchCoordinator] connecting " << roster_.size() << " participants for " << match_id << "\n";
  events_.Emit(ConnectingEvent{match_id});

  if (transport_->IsReady()) HandleTransportReady();
  return Status::Ok();
}

void MatchCoordinator::HandleTransportReady() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (status_ != MatchStatus::Connecting || !status_can_move(status_, MatchStatus::Active)) return;
  const std::string match_id = match_->match_id;

  if (is_host_ && !storage_.UpdateMatchStatus(match_id, "active")) {
    std::cerr << "[MatchCoordinator] could not persist active status for " << match_id << "\n";
  }
  if (!storage_.UpdateParticipantConnected(match_id, local_id_, true)) {
    std::cerr << "[MatchCoordinator] could not mark " << local_id_ << " connected\n";
  }

  status_ = MatchStatus::Active;
  match_->status = "active";
  next_submit_tick_ = 0;
  local_staged_.clear();
  for (int i = 0; i < cfg_.input_delay_ticks; ++i) {
    Status st = CloseTickLocked();
    if (!st.ok()) std::cerr << "[MatchCoordinator] lead-in tick failed: " << st.detail << "\n";
  }

  std::cout << "[MatchCoordinator] match " << match_id << " active, seed " << match_->seed << "\n";
  events_.Emit(ConnectedEvent{match_id});
  events_.Emit(MatchStartedEvent{match_id, match_->seed, roster_});
}

void MatchCoordinator::HandleRemoteCommand(const lockstep::Command& command) {
  std::vector<lockstep::Command> accepted;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (!queue_) return;

    if (command.participant_id == local_id_) {
      ++dropped_remote_;
      std::cerr << "[MatchCoordinator] remote command claims local id " << local_id_ << " at tick " << command.tick
                << ", dropped\n";
      return;
    }
    auto closed = remote_closed_.find(command.participant_id);
    if (closed != remote_closed_.end() && command.tick <= closed->second) {
      ++dropped_remote_;
      std::cerr << "[MatchCoordinator] repeat from " << command.participant_id << " for closed tick " << command.tick
                << ", dropped\n";
      return;
    }

    std::string reason;
    if (!validator_.Validate(command, &reason)) {
      ++dropped_remote_;
      std::cerr << "[MatchCoordinator] " << ErrorKindName(ErrorKind::ValidationFailed) << " from "
                << command.participant_id << " at tick " << command.tick << ": " << reason << "\n";
      return;
    }
    if (command.tick < queue_->CurrentTick() || !queue_->Participants().count(command.participant_id)) {
      // The queue logs and counts the rejection.
      queue_->AddCommand(command);
      ++dropped_remote_;
      return;
    }

    auto key = std::make_pair(command.participant_id, command.tick);
    if (!lockstep::IsNoOp(command)) {
      remote_staged_[key].push_back(command);
      return;
    }

    std::vector<lockstep::Command> contribution;
    auto it = remote_staged_.find(key);
    if (it != remote_staged_.end()) {
      contribution = std::move(it->second);
      remote_staged_.erase(it);
    }
    contribution.push_back(command);
    remote_closed_[command.participant_id] = command.tick;
    for (const auto& c : contribution) {
      if (queue_->AddCommand(c) != lockstep::AddResult::Accepted) {
        ++dropped_remote_;
        continue;
      }
      if (!lockstep::IsNoOp(c)) accepted.push_back(c);
    }
  }
  for (const auto& c : accepted) events_.Emit(CommandReceivedEvent{c});
}

Status MatchCoordinator::CloseTickLocked() {
  std::vector<lockstep::Command> contribution;
  contribution.swap(local_staged_);
  const int64_t tick = next_submit_tick_++;
  if (tick < queue_->CurrentTick()) {
    return Status::Error(ErrorKind::StaleCommand, "tick " + std::to_string(tick) + " already released");
  }
  contribution.push_back(lockstep::MakeCommand(tick, local_id_, lockstep::NoOp{}));
  for (const auto& c : contribution) {
    const lockstep::AddResult r = queue_->AddCommand(c);
    if (r != lockstep::AddResult::Accepted) {
      return Status::Error(ErrorKind::InvalidParameters, lockstep::AddResultName(r));
    }
  }
  for (const auto& c : contribution) transport_->SendCommand(c);
  return Status::Ok();
}

Status MatchCoordinator::SendCommand(const lockstep::Payload& payload) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (status_ != MatchStatus::Active || !queue_ || !transport_) {
    return Status::Error(ErrorKind::NoActiveMatch, "match is not active");
  }
  if (!transport_->IsReady()) return Status::Error(ErrorKind::TransportDegraded, "transport not ready");

  lockstep::Command c = lockstep::MakeCommand(next_submit_tick_, local_id_, payload);
  protocol::quantize_coordinates(c.payload);
  std::string reason;
  if (!validator_.Validate(c, &reason)) {
    std::cerr << "[MatchCoordinator] local command rejected: " << reason << "\n";
    return Status::Error(ErrorKind::ValidationFailed, reason);
  }
  // A bare noop would close the tick early on every peer; the marker is ours to send.
  if (lockstep::IsNoOp(c)) return Status::Ok();
  local_staged_.push_back(std::move(c));
  return Status::Ok();
}

Status MatchCoordinator::CommitLocalTick() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (status_ != MatchStatus::Active || !queue_ || !transport_) {
    return Status::Error(ErrorKind::NoActiveMatch, "match is not active");
  }
  return CloseTickLocked();
}

std::optional<std::vector<lockstep::Command>> MatchCoordinator::GetNextTickCommands() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (!queue_) return std::nullopt;
  return queue_->GetNextTickCommands();
}

bool MatchCoordinator::AdvanceTick() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (!queue_) return false;
  const int64_t tick = queue_->CurrentTick();
  if (!queue_->AdvanceTick()) return false;
  if (cfg_.debug_sync && tick % cfg_.tick_hz == 0) {
    std::cout << "[MatchCoordinator] released tick " << tick << " (submitting " << next_submit_tick_ << ")\n";
  }
  return true;
}

int64_t MatchCoordinator::GetCurrentTick() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return queue_ ? queue_->CurrentTick() : 0;
}

int64_t MatchCoordinator::NextSubmitTick() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return next_submit_tick_;
}

std::optional<uint32_t> MatchCoordinator::GetGameSeed() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (!match_ || status_ == MatchStatus::Ended) return std::nullopt;
  return match_->seed;
}

std::shared_ptr<lockstep::DeterministicRNG> MatchCoordinator::Rng() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return rng_;
}

void MatchCoordinator::EndMatch(const std::string& reason) {
  std::unique_ptr<net::ITransport> transport;
  MatchStatus previous = MatchStatus::None;
  std::string match_id;
  bool was_host = false;
  {
    std::lock_guard<std::recursive_mutex> lock(mu_);
    if (!InMatchLocked()) return;
    previous = status_;
    status_ = MatchStatus::Ended;
    match_id = match_->match_id;
    match_->status = "ended";
    was_host = is_host_;
    transport = std::move(transport_);
    if (queue_) queue_->Clear();
    queue_.reset();
    rng_.reset();
  }

  if (transport) transport->Disconnect();

  if (was_host) {
    if (!storage_.UpdateMatchStatus(match_id, "ended")) {
      std::cerr << "[MatchCoordinator] could not persist end of " << match_id << "\n";
    }
  } else if (previous == MatchStatus::Open) {
    if (!storage_.DeleteParticipant(match_id, local_id_)) {
      std::cerr << "[MatchCoordinator] could not remove " << local_id_ << " from " << match_id << "\n";
    }
  } else if (!storage_.UpdateParticipantConnected(match_id, local_id_, false)) {
    std::cerr << "[MatchCoordinator] could not mark " << local_id_ << " disconnected\n";
  }

  std::cout << "[MatchCoordinator] match " << match_id << " ended: " << reason << "\n";
  events_.Emit(MatchEndedEvent{match_id, reason});
}

void MatchCoordinator::Disconnect() {
  EndMatch("player_disconnect");
}

MatchStatus MatchCoordinator::GetStatus() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return status_;
}

std::optional<storage::Match> MatchCoordinator::CurrentMatch() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return match_;
}

bool MatchCoordinator::IsHost() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return is_host_;
}

std::vector<std::string> MatchCoordinator::Roster() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return roster_;
}

lockstep::QueueStats MatchCoordinator::GetQueueStats() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return queue_ ? queue_->GetStats() : lockstep::QueueStats{};
}

net::TransportStats MatchCoordinator::GetNetworkStats() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return transport_ ? transport_->GetStats() : net::TransportStats{};
}

}  // namespace match
