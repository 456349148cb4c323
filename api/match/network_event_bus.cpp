#include "network_event_bus.h"

#include <algorithm>
#include <iostream>

namespace match {

const char* ErrorKindName(ErrorKind k) {
  switch (k) {
    case ErrorKind::None: return "none";
    case ErrorKind::BackendUnavailable: return "backend_unavailable";
    case ErrorKind::MatchNotFound: return "match_not_found";
    case ErrorKind::MatchNotJoinable: return "match_not_joinable";
    case ErrorKind::MatchFull: return "match_full";
    case ErrorKind::InvalidParameters: return "invalid_parameters";
    case ErrorKind::StaleCommand: return "stale_command";
    case ErrorKind::ValidationFailed: return "validation_failed";
    case ErrorKind::TransportDegraded: return "transport_degraded";
    case ErrorKind::NoActiveMatch: return "no_active_match";
  }
  return "unknown";
}

const char* EventKindName(EventKind k) {
  switch (k) {
    case EventKind::MatchCreated: return "match_created";
    case EventKind::ParticipantJoined: return "participant_joined";
    case EventKind::ParticipantLeft: return "participant_left";
    case EventKind::Connecting: return "connecting";
    case EventKind::Connected: return "connected";
    case EventKind::MatchStarted: return "match_started";
    case EventKind::CommandReceived: return "command_received";
    case EventKind::MatchEnded: return "match_ended";
    case EventKind::Error: return "error";
  }
  return "unknown";
}

EventKind KindOf(const NetworkEvent& e) {
  return static_cast<EventKind>(e.index());
}

NetworkEventBus::SubscriptionId NetworkEventBus::Subscribe(EventKind kind, Listener listener) {
  std::lock_guard<std::mutex> lock(mu_);
  Entry entry;
  entry.id = next_id_++;
  entry.fn = std::move(listener);
  entry.active = std::make_shared<std::atomic<bool>>(true);
  subscribers_[kind].push_back(entry);
  return entry.id;
}

bool NetworkEventBus::Unsubscribe(SubscriptionId id) {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& kv : subscribers_) {
    auto& list = kv.second;
    auto it = std::find_if(list.begin(), list.end(), [id](const Entry& e) { return e.id == id; });
    if (it == list.end()) continue;
    it->active->store(false);
    list.erase(it);
    return true;
  }
  return false;
}

void NetworkEventBus::Emit(const NetworkEvent& event) {
  const EventKind kind = KindOf(event);
  std::vector<Entry> snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = subscribers_.find(kind);
    if (it == subscribers_.end()) return;
    snapshot = it->second;
  }

  for (const auto& entry : snapshot) {
    if (!entry.active->load()) continue;
    try {
      entry.fn(event);
    } catch (const std::exception& e) {
      std::cerr << "[NetworkEventBus] listener " << entry.id << " threw on " << EventKindName(kind) << ": "
                << e.what() << "\n";
    }
  }
}

size_t NetworkEventBus::ListenerCount(EventKind kind) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = subscribers_.find(kind);
  return it == subscribers_.end() ? 0 : it->second.size();
}

void NetworkEventBus::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& kv : subscribers_) {
    for (auto& e : kv.second) e.active->store(false);
  }
  subscribers_.clear();
}

}  // namespace match
