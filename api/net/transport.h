#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../lockstep/command.h"

namespace net {

struct PeerStats {
  std::string peer_id;
  bool connected = false;
  int64_t latency_ms = 0;
  // Highest tick seen in a command from this peer, -1 before the first one.
  int64_t last_seen_tick = -1;
  uint64_t packets_received = 0;
  uint64_t commands_received = 0;
};

// Diagnostic only. Nothing on the tick path reads it.
struct TransportStats {
  bool ready = false;
  bool degraded = false;
  int64_t latency_ms = 0;  // worst peer
  uint64_t packets_sent = 0;
  uint64_t packets_received = 0;
  uint64_t bytes_out = 0;
  uint64_t bytes_in = 0;
  // Repeated batches (same sender, same seq) discarded on receive.
  uint64_t duplicates_dropped = 0;
  std::vector<PeerStats> peers;
};

// Thrown from Initialize when the connection medium cannot be set up at all.
// Losing a subset of peers later is not an error; it shows up in GetStats().
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Moves local commands to every other participant and surfaces remote ones.
// Delivery is best-effort and may interleave senders; CommandQueue restores the
// order. Commands from one sender arrive in the order they were sent, and a
// batch is surfaced at most once even if the medium delivered it twice.
// Handlers must be registered before Initialize and may be invoked from an
// I/O thread.
class ITransport {
 public:
  using CommandHandler = std::function<void(const lockstep::Command&)>;
  using ReadyHandler = std::function<void()>;

  virtual ~ITransport() = default;

  // peer_ids excludes the local participant.
  virtual void Initialize(const std::string& match_id, const std::string& local_id, bool is_host,
                          const std::vector<std::string>& peer_ids) = 0;
  virtual void OnCommandReceived(CommandHandler handler) = 0;
  // Fires once, when sending is possible. Not necessarily every peer is connected.
  virtual void OnReady(ReadyHandler handler) = 0;
  virtual bool IsReady() const = 0;
  // Ack-less broadcast. No-op after Disconnect.
  virtual void SendCommand(const lockstep::Command& command) = 0;
  virtual void Disconnect() = 0;
  virtual TransportStats GetStats() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>()>;

}  // namespace net
