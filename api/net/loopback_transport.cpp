#include "loopback_transport.h"

#include <algorithm>
#include <deque>
#include <iostream>
#include <iterator>

#include "../lockstep/deterministic_rng.h"
#include "../protocol/command_codec.h"

namespace net {
namespace {

std::pair<std::string, std::string> LinkKey(const std::string& a, const std::string& b) {
  return a < b ? std::make_pair(a, b) : std::make_pair(b, a);
}

}  // namespace

void LoopbackHub::SetHoldMessages(bool hold) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  hold_ = hold;
}

size_t LoopbackHub::PendingCount() const {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  return pending_.size();
}

void LoopbackHub::DeliverAll() {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  std::vector<Pending> batch;
  batch.swap(pending_);
  DeliverLocked(std::move(batch));
}

void LoopbackHub::DeliverAll(uint32_t shuffle_seed) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  std::map<std::pair<std::string, std::string>, std::deque<Pending>> links;
  for (auto& p : pending_) links[std::make_pair(p.from, p.to)].push_back(std::move(p));
  pending_.clear();

  lockstep::DeterministicRNG rng(shuffle_seed);
  std::vector<Pending> batch;
  while (!links.empty()) {
    auto it = links.begin();
    std::advance(it, rng.NextInt(0, static_cast<int>(links.size()) - 1));
    batch.push_back(std::move(it->second.front()));
    it->second.pop_front();
    if (it->second.empty()) links.erase(it);
  }
  DeliverLocked(std::move(batch));
}

void LoopbackHub::SetDuplicateDelivery(bool duplicate) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  duplicate_ = duplicate;
}

void LoopbackHub::SetLinkDown(const std::string& a, const std::string& b, bool down) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  if (down) {
    down_links_.insert(LinkKey(a, b));
  } else {
    down_links_.erase(LinkKey(a, b));
  }
}

bool LoopbackHub::LinkDownLocked(const std::string& a, const std::string& b) const {
  return down_links_.count(LinkKey(a, b)) > 0;
}

void LoopbackHub::Register(const std::string& match_id, const std::string& id, LoopbackTransport* t) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  auto& endpoints = matches_[match_id];
  endpoints[id] = t;

  std::set<std::string> present;
  for (const auto& kv : endpoints) present.insert(kv.first);
  // Snapshot: a ready handler may register or unregister endpoints.
  std::vector<LoopbackTransport*> members;
  for (const auto& kv : endpoints) members.push_back(kv.second);
  for (auto* m : members) m->CheckReady(present);
}

void LoopbackHub::Unregister(const std::string& match_id, const std::string& id) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return;
  it->second.erase(id);
  if (it->second.empty()) {
    matches_.erase(it);
    return;
  }
  std::set<std::string> present;
  std::vector<LoopbackTransport*> members;
  for (const auto& kv : it->second) {
    present.insert(kv.first);
    members.push_back(kv.second);
  }
  for (auto* m : members) m->CheckReady(present);
}

void LoopbackHub::Route(const std::string& match_id, const std::string& from, const std::string& text) {
  std::lock_guard<std::recursive_mutex> lock(mu_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return;

  std::vector<Pending> out;
  for (const auto& kv : it->second) {
    if (kv.first == from) continue;
    if (LinkDownLocked(from, kv.first)) continue;
    out.push_back(Pending{match_id, from, kv.first, text});
    if (duplicate_) out.push_back(Pending{match_id, from, kv.first, text});
  }
  if (hold_) {
    pending_.insert(pending_.end(), out.begin(), out.end());
    return;
  }
  DeliverLocked(std::move(out));
}

void LoopbackHub::DeliverLocked(std::vector<Pending> batch) {
  for (const auto& p : batch) {
    auto mit = matches_.find(p.match_id);
    if (mit == matches_.end()) continue;
    auto tit = mit->second.find(p.to);
    if (tit == mit->second.end()) continue;
    tit->second->Receive(p.text);
  }
}

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub) : hub_(std::move(hub)) {}

LoopbackTransport::~LoopbackTransport() {
  Disconnect();
}

void LoopbackTransport::Initialize(const std::string& match_id, const std::string& local_id, bool,
                                   const std::vector<std::string>& peer_ids) {
  if (!hub_) throw TransportError("loopback hub missing");
  if (initialized_) throw TransportError("loopback transport already initialized");
  match_id_ = match_id;
  local_id_ = local_id;
  peer_ids_ = peer_ids;
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    for (const auto& id : peer_ids_) {
      PeerStats ps;
      ps.peer_id = id;
      peers_[id] = ps;
    }
  }
  initialized_ = true;
  hub_->Register(match_id_, local_id_, this);
}

void LoopbackTransport::OnCommandReceived(CommandHandler handler) {
  on_command_ = std::move(handler);
}

void LoopbackTransport::OnReady(ReadyHandler handler) {
  on_ready_ = std::move(handler);
}

bool LoopbackTransport::IsReady() const {
  std::lock_guard<std::mutex> lock(stats_mu_);
  return ready_ && !disconnected_;
}

void LoopbackTransport::CheckReady(const std::set<std::string>& present) {
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    for (auto& kv : peers_) kv.second.connected = present.count(kv.first) > 0;
    if (ready_ || disconnected_) return;
    for (const auto& id : peer_ids_) {
      if (!present.count(id)) return;
    }
    ready_ = true;
  }
  if (on_ready_) on_ready_();
}

void LoopbackTransport::SendCommand(const lockstep::Command& command) {
  if (!initialized_ || disconnected_) return;
  protocol::WireMessage m;
  m.type = protocol::MsgType::CommandBatch;
  m.from = local_id_;
  m.commands.push_back(command);
  std::string text;
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    m.seq = next_seq_++;
    text = protocol::encode_wire_message(m);
    ++stats_.packets_sent;
    stats_.bytes_out += text.size();
  }
  hub_->Route(match_id_, local_id_, text);
}

void LoopbackTransport::Receive(const std::string& text) {
  if (disconnected_) return;
  auto m = protocol::decode_wire_message(text);
  if (!m) {
    std::cerr << "[LoopbackTransport] undecodable message dropped\n";
    return;
  }
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    if (m->seq > 0) {
      uint64_t& last = last_seq_[m->from];
      if (m->seq <= last) {
        ++stats_.duplicates_dropped;
        return;
      }
      last = m->seq;
    }
    ++stats_.packets_received;
    stats_.bytes_in += text.size();
    auto it = peers_.find(m->from);
    if (it != peers_.end()) {
      ++it->second.packets_received;
      it->second.commands_received += m->commands.size();
      for (const auto& c : m->commands) {
        it->second.last_seen_tick = std::max(it->second.last_seen_tick, c.tick);
      }
    }
  }
  if (m->type != protocol::MsgType::CommandBatch || !on_command_) return;
  for (const auto& c : m->commands) on_command_(c);
}

void LoopbackTransport::Disconnect() {
  if (!initialized_ || disconnected_) return;
  {
    std::lock_guard<std::mutex> lock(stats_mu_);
    disconnected_ = true;
    ready_ = false;
  }
  hub_->Unregister(match_id_, local_id_);
}

TransportStats LoopbackTransport::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mu_);
  TransportStats s = stats_;
  s.ready = ready_ && !disconnected_;
  for (const auto& kv : peers_) {
    PeerStats ps = kv.second;
    if (disconnected_) ps.connected = false;
    if (!ps.connected) s.degraded = s.ready;
    s.peers.push_back(ps);
  }
  return s;
}

}  // namespace net
