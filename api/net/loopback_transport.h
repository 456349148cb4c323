#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "transport.h"

namespace net {

class LoopbackTransport;

// In-process mesh shared by every LoopbackTransport of a local session. All
// traffic goes through the compact wire codec. Handlers run on the thread that
// sends (or calls DeliverAll).
class LoopbackHub {
 public:
  // While held, messages queue up instead of being delivered.
  void SetHoldMessages(bool hold);
  size_t PendingCount() const;
  // Delivers held messages in send order.
  void DeliverAll();
  // Delivers held messages with the per-link streams interleaved in an order
  // drawn from the given seed. Each sender-to-receiver stream stays FIFO.
  void DeliverAll(uint32_t shuffle_seed);

  // Every message is handed over twice, back to back, like a sender that
  // retried after a lost acknowledgement.
  void SetDuplicateDelivery(bool duplicate);

  // Drops traffic between a and b in both directions while down.
  void SetLinkDown(const std::string& a, const std::string& b, bool down);

 private:
  friend class LoopbackTransport;

  struct Pending {
    std::string match_id;
    std::string from;
    std::string to;
    std::string text;
  };

  void Register(const std::string& match_id, const std::string& id, LoopbackTransport* t);
  void Unregister(const std::string& match_id, const std::string& id);
  void Route(const std::string& match_id, const std::string& from, const std::string& text);
  bool LinkDownLocked(const std::string& a, const std::string& b) const;
  void DeliverLocked(std::vector<Pending> batch);

  mutable std::recursive_mutex mu_;
  std::map<std::string, std::map<std::string, LoopbackTransport*>> matches_;
  std::set<std::pair<std::string, std::string>> down_links_;
  std::vector<Pending> pending_;
  bool hold_ = false;
  bool duplicate_ = false;
};

class LoopbackTransport : public ITransport {
 public:
  explicit LoopbackTransport(std::shared_ptr<LoopbackHub> hub);
  ~LoopbackTransport() override;

  void Initialize(const std::string& match_id, const std::string& local_id, bool is_host,
                  const std::vector<std::string>& peer_ids) override;
  void OnCommandReceived(CommandHandler handler) override;
  void OnReady(ReadyHandler handler) override;
  bool IsReady() const override;
  void SendCommand(const lockstep::Command& command) override;
  void Disconnect() override;
  TransportStats GetStats() const override;

 private:
  friend class LoopbackHub;

  void Receive(const std::string& text);
  // Called by the hub whenever membership changes; fires the ready handler once.
  void CheckReady(const std::set<std::string>& present);

  std::shared_ptr<LoopbackHub> hub_;
  std::string match_id_;
  std::string local_id_;
  std::vector<std::string> peer_ids_;
  CommandHandler on_command_;
  ReadyHandler on_ready_;

  mutable std::mutex stats_mu_;
  TransportStats stats_;
  std::map<std::string, PeerStats> peers_;
  uint64_t next_seq_ = 1;
  // Highest batch seq applied per sender.
  std::map<std::string, uint64_t> last_seq_;
  bool initialized_ = false;
  bool ready_ = false;
  bool disconnected_ = false;
};

}  // namespace net
