#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../../config/runtime_config.h"
#include "../protocol/protocol.h"
#include "transport.h"

namespace httplib {
class Client;
}

namespace net {

// Talks to a RelayService over HTTP. A worker thread polls the peer list until
// everyone is present (or the grace period runs out), flushes batched commands,
// drains the inbox and measures latency with ping/pong.
class RelayTransport : public ITransport {
 public:
  explicit RelayTransport(const RuntimeConfig& cfg);
  ~RelayTransport() override;

  void Initialize(const std::string& match_id, const std::string& local_id, bool is_host,
                  const std::vector<std::string>& peer_ids) override;
  void OnCommandReceived(CommandHandler handler) override;
  void OnReady(ReadyHandler handler) override;
  bool IsReady() const override;
  void SendCommand(const lockstep::Command& command) override;
  void Disconnect() override;
  TransportStats GetStats() const override;

 private:
  using Clock = std::chrono::steady_clock;

  void Run();
  bool PollPeers();
  bool Flush();
  bool PollInbox();
  void SendPing();
  // `delivered`, when given, receives how many mailboxes took a copy.
  bool Post(const std::string& to, const protocol::WireMessage& m, int* delivered = nullptr);
  void HandleMessage(const protocol::WireMessage& m, size_t bytes);
  void MarkReady(bool degraded);
  std::string Path(const char* leaf) const;

  const RuntimeConfig cfg_;
  std::unique_ptr<httplib::Client> client_;
  std::string match_id_;
  std::string local_id_;
  std::vector<std::string> peer_ids_;
  CommandHandler on_command_;
  ReadyHandler on_ready_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> ready_{false};
  std::atomic<bool> flush_now_{false};

  mutable std::mutex mu_;
  std::vector<lockstep::Command> outbox_;
  // Sent but not acknowledged by the relay; retried as is, same seq.
  std::optional<protocol::WireMessage> inflight_;
  uint64_t next_batch_seq_ = 1;
  std::map<std::string, uint64_t> last_seq_;
  TransportStats stats_;
  std::map<std::string, PeerStats> peers_;
  uint64_t next_ping_id_ = 1;
  uint64_t inbox_cursor_ = 0;
  bool disconnected_ = false;
};

}  // namespace net
