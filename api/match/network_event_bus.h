#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "../lockstep/command.h"
#include "../storage/models.h"

namespace match {

enum class ErrorKind {
  None,
  BackendUnavailable,
  MatchNotFound,
  MatchNotJoinable,
  MatchFull,
  InvalidParameters,
  StaleCommand,
  ValidationFailed,
  TransportDegraded,
  NoActiveMatch,
};

const char* ErrorKindName(ErrorKind k);

struct MatchCreatedEvent {
  storage::Match match;
};
struct ParticipantJoinedEvent {
  storage::Participant participant;
};
struct ParticipantLeftEvent {
  storage::Participant participant;
};
struct ConnectingEvent {
  std::string match_id;
};
struct ConnectedEvent {
  std::string match_id;
};
struct MatchStartedEvent {
  std::string match_id;
  uint32_t seed = 0;
  std::vector<std::string> participant_ids;
};
struct CommandReceivedEvent {
  lockstep::Command command;
};
struct MatchEndedEvent {
  std::string match_id;
  std::string reason;
};
struct ErrorEvent {
  ErrorKind kind = ErrorKind::None;
  std::string detail;
};

using NetworkEvent = std::variant<MatchCreatedEvent, ParticipantJoinedEvent, ParticipantLeftEvent, ConnectingEvent,
                                  ConnectedEvent, MatchStartedEvent, CommandReceivedEvent, MatchEndedEvent,
                                  ErrorEvent>;

// Same order as the NetworkEvent alternatives.
enum class EventKind {
  MatchCreated,
  ParticipantJoined,
  ParticipantLeft,
  Connecting,
  Connected,
  MatchStarted,
  CommandReceived,
  MatchEnded,
  Error,
};

const char* EventKindName(EventKind k);
EventKind KindOf(const NetworkEvent& e);

template <typename E>
EventKind KindFor() {
  return static_cast<EventKind>(NetworkEvent(std::in_place_type<E>).index());
}

// Typed publish/subscribe. Emit dispatches to a snapshot of the subscribers of
// that kind, so a listener may subscribe or unsubscribe (itself or others)
// while being called: new listeners start with the next event, removed ones
// are skipped for the rest of the current dispatch.
class NetworkEventBus {
 public:
  using Listener = std::function<void(const NetworkEvent&)>;
  using SubscriptionId = uint64_t;

  SubscriptionId Subscribe(EventKind kind, Listener listener);

  template <typename E>
  SubscriptionId On(std::function<void(const E&)> fn) {
    return Subscribe(KindFor<E>(), [fn](const NetworkEvent& e) {
      if (const E* typed = std::get_if<E>(&e)) fn(*typed);
    });
  }

  // False when the id is unknown or already removed.
  bool Unsubscribe(SubscriptionId id);
  void Emit(const NetworkEvent& event);
  size_t ListenerCount(EventKind kind) const;
  void Clear();

 private:
  struct Entry {
    SubscriptionId id = 0;
    Listener fn;
    std::shared_ptr<std::atomic<bool>> active;
  };

  mutable std::mutex mu_;
  std::map<EventKind, std::vector<Entry>> subscribers_;
  SubscriptionId next_id_ = 1;
};

}  // namespace match
