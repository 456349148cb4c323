#include <stdexcept>
#include <string>
#include <vector>

#include "match/network_event_bus.h"
#include "test_support.h"

using match::EventKind;
using match::NetworkEvent;
using match::NetworkEventBus;

static int test_typed_dispatch() {
  NetworkEventBus bus;
  std::vector<std::string> seen;
  bus.On<match::MatchEndedEvent>([&](const match::MatchEndedEvent& e) { seen.push_back("ended:" + e.reason); });
  bus.On<match::ErrorEvent>([&](const match::ErrorEvent& e) { seen.push_back(match::ErrorKindName(e.kind)); });

  bus.Emit(match::MatchEndedEvent{"m1", "host_left"});
  bus.Emit(match::ErrorEvent{match::ErrorKind::MatchFull, "m1"});
  bus.Emit(match::ConnectedEvent{"m1"});

  EXPECT(seen.size() == 2, "only subscribed kinds delivered");
  EXPECT(seen[0] == "ended:host_left", "ended payload");
  EXPECT(seen[1] == "match_full", "error payload");
  EXPECT(bus.ListenerCount(EventKind::MatchEnded) == 1, "one listener");
  return 0;
}

static int test_kind_order_matches_variant() {
  EXPECT(match::KindOf(NetworkEvent(match::MatchCreatedEvent{})) == EventKind::MatchCreated, "first");
  EXPECT(match::KindOf(NetworkEvent(match::MatchStartedEvent{})) == EventKind::MatchStarted, "started");
  EXPECT(match::KindOf(NetworkEvent(match::ErrorEvent{})) == EventKind::Error, "last");
  EXPECT(match::KindFor<match::CommandReceivedEvent>() == EventKind::CommandReceived, "KindFor");
  return 0;
}

static int test_listener_removes_itself_mid_dispatch() {
  NetworkEventBus bus;
  int first_calls = 0;
  int second_calls = 0;
  NetworkEventBus::SubscriptionId first = 0;
  first = bus.Subscribe(EventKind::Connecting, [&](const NetworkEvent&) {
    ++first_calls;
    bus.Unsubscribe(first);
  });
  bus.Subscribe(EventKind::Connecting, [&](const NetworkEvent&) { ++second_calls; });

  bus.Emit(match::ConnectingEvent{"m"});
  bus.Emit(match::ConnectingEvent{"m"});
  EXPECT(first_calls == 1, "self-removing listener ran once");
  EXPECT(second_calls == 2, "other listener unaffected");
  EXPECT(!bus.Unsubscribe(first), "second removal reports false");
  return 0;
}

static int test_removed_listener_skipped_in_same_dispatch() {
  NetworkEventBus bus;
  int late_calls = 0;
  NetworkEventBus::SubscriptionId late = 0;
  bus.Subscribe(EventKind::Connected, [&](const NetworkEvent&) { bus.Unsubscribe(late); });
  late = bus.Subscribe(EventKind::Connected, [&](const NetworkEvent&) { ++late_calls; });

  bus.Emit(match::ConnectedEvent{"m"});
  EXPECT(late_calls == 0, "listener removed earlier in the dispatch is skipped");
  return 0;
}

static int test_added_listener_waits_for_next_event() {
  NetworkEventBus bus;
  int added_calls = 0;
  bool added = false;
  bus.Subscribe(EventKind::Connected, [&](const NetworkEvent&) {
    if (added) return;
    added = true;
    bus.Subscribe(EventKind::Connected, [&](const NetworkEvent&) { ++added_calls; });
  });

  bus.Emit(match::ConnectedEvent{"m"});
  EXPECT(added_calls == 0, "not called for the event that added it");
  bus.Emit(match::ConnectedEvent{"m"});
  EXPECT(added_calls == 1, "called from the next event on");
  return 0;
}

static int test_throwing_listener_isolated() {
  NetworkEventBus bus;
  int after = 0;
  bus.Subscribe(EventKind::MatchEnded, [](const NetworkEvent&) { throw std::runtime_error("boom"); });
  bus.Subscribe(EventKind::MatchEnded, [&](const NetworkEvent&) { ++after; });
  bus.Emit(match::MatchEndedEvent{"m", "x"});
  EXPECT(after == 1, "later listeners still run");

  bus.Clear();
  EXPECT(bus.ListenerCount(EventKind::MatchEnded) == 0, "cleared");
  bus.Emit(match::MatchEndedEvent{"m", "x"});
  EXPECT(after == 1, "nothing runs after Clear");
  return 0;
}

int main() {
  RUN_TEST(test_typed_dispatch);
  RUN_TEST(test_kind_order_matches_variant);
  RUN_TEST(test_listener_removes_itself_mid_dispatch);
  RUN_TEST(test_removed_listener_skipped_in_same_dispatch);
  RUN_TEST(test_added_listener_waits_for_next_event);
  RUN_TEST(test_throwing_listener_isolated);
  return 0;
}
