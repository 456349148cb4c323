#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include "match/match_coordinator.h"
#include "memory_storage.h"
#include "net/loopback_transport.h"
#include "protocol/command_codec.h"
#include "test_support.h"

using lockstep::Command;
using match::ErrorKind;
using match::EventKind;
using match::MatchCoordinator;
using match::MatchStatus;

namespace {

RuntimeConfig test_config() {
  RuntimeConfig cfg;
  cfg.tick_hz = 30;
  cfg.max_participants = 2;
  cfg.input_delay_ticks = 2;
  return cfg;
}

net::TransportFactory loopback(const std::shared_ptr<net::LoopbackHub>& hub) {
  return [hub] { return std::make_unique<net::LoopbackTransport>(hub); };
}

// Records every event kind a coordinator emits, in order.
struct EventLog {
  std::vector<EventKind> kinds;
  std::vector<match::MatchStartedEvent> started;
  std::vector<match::MatchEndedEvent> ended;
  std::vector<match::ErrorEvent> errors;
  std::vector<Command> received;
  std::vector<std::string> joined;
  std::vector<std::string> left;

  explicit EventLog(match::NetworkEventBus& bus) {
    for (int k = 0; k <= static_cast<int>(EventKind::Error); ++k) {
      bus.Subscribe(static_cast<EventKind>(k), [this](const match::NetworkEvent& e) { kinds.push_back(match::KindOf(e)); });
    }
    bus.On<match::MatchStartedEvent>([this](const match::MatchStartedEvent& e) { started.push_back(e); });
    bus.On<match::MatchEndedEvent>([this](const match::MatchEndedEvent& e) { ended.push_back(e); });
    bus.On<match::ErrorEvent>([this](const match::ErrorEvent& e) { errors.push_back(e); });
    bus.On<match::CommandReceivedEvent>([this](const match::CommandReceivedEvent& e) { received.push_back(e.command); });
    bus.On<match::ParticipantJoinedEvent>(
        [this](const match::ParticipantJoinedEvent& e) { joined.push_back(e.participant.participant_id); });
    bus.On<match::ParticipantLeftEvent>(
        [this](const match::ParticipantLeftEvent& e) { left.push_back(e.participant.participant_id); });
  }

  size_t Count(EventKind k) const {
    size_t n = 0;
    for (auto x : kinds) n += (x == k) ? 1 : 0;
    return n;
  }
};

match::CreateMatchOptions options(std::optional<uint32_t> seed = std::nullopt) {
  match::CreateMatchOptions o;
  o.name = "duel";
  o.display_name = "Alice";
  o.seed = seed;
  return o;
}

// Host creates, guest joins, both start. Leaves both coordinators active.
int start_pair(MatchCoordinator& host, MatchCoordinator& guest, uint32_t seed) {
  auto created = host.CreateMatch(options(seed));
  EXPECT(created.ok(), "create");
  EXPECT(guest.JoinMatch(created.value->match_id, "Bob").ok(), "join");
  EXPECT(host.PollParticipants().ok(), "poll");
  EXPECT(host.StartMatch().ok(), "host start");
  EXPECT(host.GetStatus() == MatchStatus::Connecting, "host waits for peers");
  EXPECT(guest.StartMatch().ok(), "guest start");
  EXPECT(host.GetStatus() == MatchStatus::Active, "host active");
  EXPECT(guest.GetStatus() == MatchStatus::Active, "guest active");
  return 0;
}

// Commits local ticks up to cursor + input delay, with some input on the way.
void commit_ahead(MatchCoordinator& c, int delay, int salt) {
  while (c.NextSubmitTick() <= c.GetCurrentTick() + delay) {
    const int64_t t = c.NextSubmitTick();
    if ((t + salt) % 3 == 0) {
      lockstep::UnitMove move;
      move.unit_ids = {c.LocalParticipantId() + "-u" + std::to_string(t % 4)};
      move.target_x = static_cast<double>(t) * 1.26;
      move.target_y = static_cast<double>(salt) + 0.33;
      c.SendCommand(move);
    }
    if ((t + salt) % 5 == 0) {
      c.SendCommand(lockstep::ChatMessage{"tick " + std::to_string(t), "all", std::nullopt});
    }
    c.CommitLocalTick();
  }
}

void drain(MatchCoordinator& c, std::vector<std::vector<Command>>& out) {
  while (auto batch = c.GetNextTickCommands()) {
    out.push_back(*batch);
    c.AdvanceTick();
  }
}

}  // namespace

static int test_create_and_list() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  EventLog log(host.Events());

  EXPECT(host.ListOpenMatches().empty(), "nothing open yet, and not an error");
  EXPECT(log.errors.empty(), "empty list is not an error");

  auto created = host.CreateMatch(options(0u));
  EXPECT(created.ok(), "created");
  EXPECT(created.value->seed == 0u, "explicit seed 0 honored");
  EXPECT(created.value->status == "open", "starts open");
  EXPECT(created.value->tick_rate == 30 && created.value->max_participants == 2, "defaults from config");
  EXPECT(host.GetStatus() == MatchStatus::Open, "local status open");
  EXPECT(host.IsHost(), "creator is host");
  EXPECT(host.GetGameSeed() == std::optional<uint32_t>(0u), "seed available");
  EXPECT(host.Rng() != nullptr, "rng exists once the seed is known");
  EXPECT(log.Count(EventKind::MatchCreated) == 1, "MatchCreated emitted");

  auto open = host.ListOpenMatches();
  EXPECT(open.size() == 1 && open[0].match_id == created.value->match_id, "listed");

  auto participants = storage.ListParticipants(created.value->match_id);
  EXPECT(participants.size() == 1 && participants[0].role == "host", "host row persisted");

  auto again = host.CreateMatch(options());
  EXPECT(again.status.kind == ErrorKind::InvalidParameters, "one match at a time");
  return 0;
}

static int test_create_rejects_bad_parameters() {
  MemoryStorage storage;
  MatchCoordinator host(storage, "alice", nullptr, test_config());
  EventLog log(host.Events());

  auto o = options();
  o.max_participants = 1;
  EXPECT(host.CreateMatch(o).status.kind == ErrorKind::InvalidParameters, "max_participants < 2");

  o = options();
  o.tick_rate_hz = 500;
  EXPECT(host.CreateMatch(o).status.kind == ErrorKind::InvalidParameters, "tick rate too high");

  o = options();
  o.settings_json = "[1,2]";
  EXPECT(host.CreateMatch(o).status.kind == ErrorKind::InvalidParameters, "settings must be an object");

  EXPECT(log.errors.size() == 3, "every failure is also an event");
  EXPECT(host.GetStatus() == MatchStatus::None, "no partial state");
  EXPECT(storage.ListMatchesByStatus("open", 20).empty(), "nothing persisted");
  return 0;
}

static int test_backend_unavailable() {
  MemoryStorage storage;
  MatchCoordinator host(storage, "alice", nullptr, test_config());
  EventLog log(host.Events());
  storage.SetAvailable(false);

  EXPECT(host.CreateMatch(options()).status.kind == ErrorKind::BackendUnavailable, "create fails cleanly");
  EXPECT(host.GetStatus() == MatchStatus::None, "no match after failure");
  EXPECT(host.ListOpenMatches().empty(), "list is empty");
  EXPECT(!log.errors.empty() && log.errors.back().kind == ErrorKind::BackendUnavailable, "list failure reported");
  EXPECT(host.JoinMatch("m-x", "Alice").kind == ErrorKind::BackendUnavailable, "join fails cleanly");
  return 0;
}

static int test_join_errors() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  MatchCoordinator third(storage, "carol", loopback(hub), test_config());

  EXPECT(guest.JoinMatch("m-missing", "Bob").kind == ErrorKind::MatchNotFound, "unknown match");

  auto created = host.CreateMatch(options(7u));
  const std::string id = created.value->match_id;
  EXPECT(guest.JoinMatch(id, "Bob").ok(), "guest joins");
  EXPECT(guest.GetGameSeed() == std::optional<uint32_t>(7u), "guest adopts the host's seed");
  EXPECT(guest.JoinMatch(id, "Bob").kind == ErrorKind::InvalidParameters, "already in a match");
  EXPECT(third.JoinMatch(id, "Carol").kind == ErrorKind::MatchFull, "two of two");

  storage::Match active = *storage.GetMatchById(id);
  active.match_id = "m-active";
  active.status = "active";
  storage.PutMatch(active);
  EXPECT(third.JoinMatch("m-active", "Carol").kind == ErrorKind::MatchNotJoinable, "active match not joinable");
  EXPECT(third.GetStatus() == MatchStatus::None, "failed join leaves no state");
  return 0;
}

static int test_full_lifecycle() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EventLog host_log(host.Events());
  EventLog guest_log(guest.Events());

  EXPECT(start_pair(host, guest, 12345u) == 0, "pair started");
  const std::string id = host.CurrentMatch()->match_id;

  EXPECT(host_log.joined == std::vector<std::string>{"bob"}, "host saw bob join");
  const std::vector<EventKind> expected_tail = {EventKind::Connecting, EventKind::Connected, EventKind::MatchStarted};
  EXPECT(host_log.kinds.size() >= 3, "host events");
  EXPECT(std::vector<EventKind>(host_log.kinds.end() - 3, host_log.kinds.end()) == expected_tail,
         "connecting, connected, started");

  EXPECT(host_log.started.size() == 1 && guest_log.started.size() == 1, "one start each");
  EXPECT(host_log.started[0].seed == 12345u && guest_log.started[0].seed == 12345u, "same seed everywhere");
  EXPECT((guest_log.started[0].participant_ids == std::vector<std::string>{"alice", "bob"}), "sorted roster");

  const auto writes = storage.StatusWrites();
  EXPECT(writes.size() == 2 && writes[0].second == "connecting" && writes[1].second == "active",
         "open -> connecting -> active, host only");
  for (const auto& p : storage.ListParticipants(id)) EXPECT(p.connected, "every participant marked connected");

  for (int i = 0; i < 5; ++i) EXPECT(host.Rng()->NextInt(1, 6) == guest.Rng()->NextInt(1, 6), "same dice");
  return 0;
}

static int test_lockstep_batches_identical_under_reordering() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  const RuntimeConfig cfg = test_config();
  MatchCoordinator host(storage, "alice", loopback(hub), cfg);
  MatchCoordinator guest(storage, "bob", loopback(hub), cfg);
  EventLog guest_log(guest.Events());
  EXPECT(start_pair(host, guest, 99u) == 0, "pair started");

  hub->SetHoldMessages(true);
  std::vector<std::vector<Command>> host_batches;
  std::vector<std::vector<Command>> guest_batches;
  for (uint32_t round = 0; round < 40; ++round) {
    commit_ahead(host, cfg.input_delay_ticks, 1);
    commit_ahead(guest, cfg.input_delay_ticks, 2);
    // Nothing moves until delivery; the tick cannot release with half the input.
    hub->DeliverAll(round + 1);
    drain(host, host_batches);
    drain(guest, guest_batches);
  }

  EXPECT(host_batches.size() >= 40, "ticks kept flowing");
  const size_t n = std::min(host_batches.size(), guest_batches.size());
  for (size_t i = 0; i < n; ++i) EXPECT(host_batches[i] == guest_batches[i], "identical batch per tick");

  bool saw_rounded = false;
  for (const auto& c : guest_log.received) {
    if (const auto* m = std::get_if<lockstep::UnitMove>(&c.payload)) {
      EXPECT(m->target_x == protocol::round_coordinate(m->target_x), "remote coordinates already quantized");
      saw_rounded = true;
    }
  }
  EXPECT(saw_rounded, "guest received host moves");

  auto stats = host.GetNetworkStats();
  EXPECT(stats.ready && !stats.degraded, "healthy mesh");
  EXPECT(stats.peers.size() == 1 && stats.peers[0].peer_id == "bob", "one peer");
  EXPECT(stats.peers[0].last_seen_tick >= 0, "last seen tick tracked");
  return 0;
}

static int test_unreachable_peer_stalls() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  const RuntimeConfig cfg = test_config();
  MatchCoordinator host(storage, "alice", loopback(hub), cfg);
  MatchCoordinator guest(storage, "bob", loopback(hub), cfg);
  EXPECT(start_pair(host, guest, 5u) == 0, "pair started");

  hub->SetLinkDown("alice", "bob", true);
  std::vector<std::vector<Command>> released;
  for (int round = 0; round < 10; ++round) {
    commit_ahead(host, cfg.input_delay_ticks, 0);
    commit_ahead(guest, cfg.input_delay_ticks, 0);
    drain(host, released);
  }
  // Lead-in ticks were exchanged before the link went down.
  EXPECT(host.GetCurrentTick() == cfg.input_delay_ticks, "stalls on the first tick that needs bob");
  EXPECT(!host.AdvanceTick(), "cannot skip the missing input");
  EXPECT(host.GetQueueStats().per_participant_backlog["bob"] == 0, "nothing from bob queued");

  hub->SetLinkDown("alice", "bob", false);
  commit_ahead(guest, cfg.input_delay_ticks + 5, 0);
  drain(host, released);
  EXPECT(host.GetCurrentTick() == cfg.input_delay_ticks, "no replay of lost commands");
  return 0;
}

static int test_end_match_is_idempotent() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EventLog log(host.Events());
  EXPECT(start_pair(host, guest, 1u) == 0, "pair started");
  const std::string id = host.CurrentMatch()->match_id;

  host.EndMatch("host_left");
  host.EndMatch("host_left");
  EXPECT(log.ended.size() == 1, "exactly one MatchEnded");
  EXPECT(log.ended[0].reason == "host_left", "reason kept");
  EXPECT(host.GetStatus() == MatchStatus::Ended, "ended");
  EXPECT(storage.GetMatchById(id)->status == "ended", "persisted ended");
  EXPECT(host.SendCommand(lockstep::ForgeMove{1, 1}).kind == ErrorKind::NoActiveMatch, "no sends after end");
  EXPECT(!host.GetNextTickCommands().has_value(), "queue torn down");
  EXPECT(host.Rng() == nullptr, "rng torn down");
  EXPECT(host.GetQueueStats().expected_participants == 0, "empty stats without a match");

  guest.Disconnect();
  EXPECT(guest.GetStatus() == MatchStatus::Ended, "guest ended");
  return 0;
}

static int test_end_survives_backend_failure() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EventLog log(host.Events());
  EXPECT(start_pair(host, guest, 1u) == 0, "pair started");

  storage.SetAvailable(false);
  host.EndMatch("network_lost");
  EXPECT(host.GetStatus() == MatchStatus::Ended, "local teardown despite failed write");
  EXPECT(log.ended.size() == 1, "terminal event still emitted");
  return 0;
}

static int test_peer_waits_for_host_and_can_leave() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EventLog host_log(host.Events());

  EXPECT(host.StartMatch().kind == ErrorKind::NoActiveMatch, "start without a match");
  auto created = host.CreateMatch(options());
  EXPECT(host.StartMatch().kind == ErrorKind::InvalidParameters, "host alone cannot start");

  EXPECT(guest.JoinMatch(created.value->match_id, "Bob").ok(), "join");
  EXPECT(guest.StartMatch().kind == ErrorKind::InvalidParameters, "peer cannot start before the host");
  EXPECT(guest.GetStatus() == MatchStatus::Open, "still open");

  EXPECT(host.PollParticipants().ok(), "poll");
  guest.EndMatch("changed_mind");
  EXPECT(storage.ListParticipants(created.value->match_id).size() == 1, "guest row removed");
  EXPECT(host.PollParticipants().ok(), "poll again");
  EXPECT(host_log.joined == std::vector<std::string>{"bob"}, "joined once");
  EXPECT(host_log.left == std::vector<std::string>{"bob"}, "left once");
  EXPECT(storage.GetMatchById(created.value->match_id)->status == "open", "peer never writes match status");
  return 0;
}

static int test_transport_failure_ends_match() {
  MemoryStorage storage;
  net::TransportFactory broken = [] { return std::make_unique<net::LoopbackTransport>(nullptr); };
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", broken, test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EventLog log(host.Events());

  auto created = host.CreateMatch(options());
  EXPECT(guest.JoinMatch(created.value->match_id, "Bob").ok(), "join");
  EXPECT(host.StartMatch().kind == ErrorKind::BackendUnavailable, "transport error surfaced");
  EXPECT(host.GetStatus() == MatchStatus::Ended, "never moves backwards");
  EXPECT(log.ended.size() == 1 && log.ended[0].reason == "transport_failed", "ended with reason");
  return 0;
}

static int test_commands_rejected_when_not_active() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  EXPECT(host.SendCommand(lockstep::NoOp{}).kind == ErrorKind::NoActiveMatch, "no match");
  host.CreateMatch(options());
  EXPECT(host.SendCommand(lockstep::NoOp{}).kind == ErrorKind::NoActiveMatch, "open is not active");
  EXPECT(host.CommitLocalTick().kind == ErrorKind::NoActiveMatch, "commit needs an active match");
  EXPECT(!host.AdvanceTick(), "no queue yet");
  return 0;
}

static int test_invalid_local_command() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  EXPECT(start_pair(host, guest, 3u) == 0, "pair started");
  EXPECT(host.SendCommand(lockstep::Surrender{false}).kind == ErrorKind::ValidationFailed, "invalid rejected");
  EXPECT(host.SendCommand(lockstep::Surrender{true}).ok(), "valid accepted");
  return 0;
}

static int test_host_cancels_open_match() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  MatchCoordinator host(storage, "alice", loopback(hub), test_config());
  MatchCoordinator guest(storage, "bob", loopback(hub), test_config());
  MatchCoordinator late(storage, "carol", loopback(hub), test_config());
  EventLog log(host.Events());

  auto created = host.CreateMatch(options(21u));
  const std::string id = created.value->match_id;
  EXPECT(guest.JoinMatch(id, "Bob").ok(), "guest joined before the cancel");

  host.EndMatch("host_cancelled");
  EXPECT(host.GetStatus() == MatchStatus::Ended, "host ended locally");
  EXPECT(storage.GetMatchById(id)->status == "ended", "stored status is ended");
  EXPECT(log.ended.size() == 1 && log.ended[0].reason == "host_cancelled", "one MatchEnded with the reason");
  EXPECT(log.Count(EventKind::MatchEnded) == 1, "no second terminal event");
  EXPECT(host.ListOpenMatches().empty(), "no longer listed");

  EXPECT(late.JoinMatch(id, "Carol").kind == ErrorKind::MatchNotJoinable, "cancelled match refuses joins");
  EXPECT(late.GetStatus() == MatchStatus::None, "refused join leaves no state");
  EXPECT(guest.StartMatch().kind == ErrorKind::MatchNotJoinable, "waiting guest learns the match is gone");
  return 0;
}

static int test_duplicate_delivery_keeps_batches_identical() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  const RuntimeConfig cfg = test_config();
  MatchCoordinator host(storage, "alice", loopback(hub), cfg);
  MatchCoordinator guest(storage, "bob", loopback(hub), cfg);
  EXPECT(start_pair(host, guest, 4242u) == 0, "pair started");

  hub->SetDuplicateDelivery(true);
  hub->SetHoldMessages(true);
  std::vector<std::vector<Command>> host_batches;
  std::vector<std::vector<Command>> guest_batches;
  for (uint32_t round = 0; round < 30; ++round) {
    commit_ahead(host, cfg.input_delay_ticks, 1);
    commit_ahead(guest, cfg.input_delay_ticks, 2);
    hub->DeliverAll(round + 7);
    drain(host, host_batches);
    drain(guest, guest_batches);
  }

  EXPECT(host_batches.size() >= 30 && guest_batches.size() == host_batches.size(), "both sides kept up");
  for (size_t i = 0; i < host_batches.size(); ++i) EXPECT(host_batches[i] == guest_batches[i], "identical batch per tick");

  size_t bob_moves = 0;
  for (const auto& batch : host_batches) {
    for (size_t i = 0; i < batch.size(); ++i) {
      for (size_t j = i + 1; j < batch.size(); ++j) EXPECT(!(batch[i] == batch[j]), "no command applied twice");
      if (batch[i].participant_id == "bob" && std::holds_alternative<lockstep::UnitMove>(batch[i].payload)) ++bob_moves;
    }
  }
  EXPECT(bob_moves > 0, "remote moves arrived");

  EXPECT(host.GetNetworkStats().duplicates_dropped > 0, "host saw and dropped copies");
  EXPECT(guest.GetNetworkStats().duplicates_dropped > 0, "guest saw and dropped copies");
  EXPECT(host.DroppedRemoteCommands() == 0, "copies never reach the coordinator");
  return 0;
}

static int test_remote_boundary_rejections() {
  MemoryStorage storage;
  auto hub = std::make_shared<net::LoopbackHub>();
  const RuntimeConfig cfg = test_config();
  MatchCoordinator host(storage, "alice", loopback(hub), cfg);
  MatchCoordinator guest(storage, "bob", loopback(hub), cfg);
  EventLog host_log(host.Events());
  EXPECT(start_pair(host, guest, 808u) == 0, "pair started");
  const std::string id = host.CurrentMatch()->match_id;

  std::vector<std::vector<Command>> host_batches;
  std::vector<std::vector<Command>> guest_batches;
  drain(host, host_batches);
  drain(guest, guest_batches);
  EXPECT(host.GetCurrentTick() == cfg.input_delay_ticks, "lead-in released");

  // A stray endpoint on the same mesh that only the host can hear.
  net::LoopbackTransport stray(hub);
  stray.Initialize(id, "mallory", false, {});
  hub->SetLinkDown("mallory", "bob", true);

  const auto before = host.GetQueueStats();
  const uint64_t dropped_before = host.DroppedRemoteCommands();
  const size_t received_before = host_log.received.size();

  const int64_t ahead = host.GetCurrentTick() + 40;
  // Closed contribution re-sent with extra input: must not reopen tick 1.
  stray.SendCommand(lockstep::MakeCommand(1, "bob", lockstep::ChatMessage{"late", "all", std::nullopt}));
  stray.SendCommand(lockstep::MakeCommand(1, "bob", lockstep::NoOp{}));
  // Already released.
  stray.SendCommand(lockstep::MakeCommand(0, "bob", lockstep::NoOp{}));
  // Fails validation.
  stray.SendCommand(lockstep::MakeCommand(ahead, "bob", lockstep::Surrender{false}));
  // Not in the roster.
  stray.SendCommand(lockstep::MakeCommand(ahead, "mallory", lockstep::ForgeMove{3, 4}));
  // Claims to be the receiving participant.
  stray.SendCommand(lockstep::MakeCommand(ahead, "alice", lockstep::NoOp{}));

  EXPECT(host.DroppedRemoteCommands() == dropped_before + 6, "every stray command counted");
  const auto after = host.GetQueueStats();
  EXPECT(after.current_tick == before.current_tick, "cursor untouched");
  EXPECT(after.queued_ticks == before.queued_ticks, "no tick opened");
  EXPECT(after.per_participant_backlog == before.per_participant_backlog, "no backlog added");
  EXPECT(host_log.received.size() == received_before, "nothing surfaced as received");
  stray.Disconnect();

  for (int round = 0; round < 10; ++round) {
    commit_ahead(host, cfg.input_delay_ticks, 0);
    commit_ahead(guest, cfg.input_delay_ticks, 1);
    drain(host, host_batches);
    drain(guest, guest_batches);
  }
  EXPECT(host_batches.size() == guest_batches.size(), "both sides at the same tick");
  for (size_t i = 0; i < host_batches.size(); ++i) EXPECT(host_batches[i] == guest_batches[i], "still in lockstep");
  return 0;
}

int main() {
  RUN_TEST(test_create_and_list);
  RUN_TEST(test_create_rejects_bad_parameters);
  RUN_TEST(test_backend_unavailable);
  RUN_TEST(test_join_errors);
  RUN_TEST(test_full_lifecycle);
  RUN_TEST(test_lockstep_batches_identical_under_reordering);
  RUN_TEST(test_unreachable_peer_stalls);
  RUN_TEST(test_end_match_is_idempotent);
  RUN_TEST(test_end_survives_backend_failure);
  RUN_TEST(test_peer_waits_for_host_and_can_leave);
  RUN_TEST(test_transport_failure_ends_match);
  RUN_TEST(test_commands_rejected_when_not_active);
  RUN_TEST(test_invalid_local_command);
  RUN_TEST(test_host_cancels_open_match);
  RUN_TEST(test_duplicate_delivery_keeps_batches_identical);
  RUN_TEST(test_remote_boundary_rejections);
  return 0;
}
