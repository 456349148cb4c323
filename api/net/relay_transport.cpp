#include "relay_transport.h"

#include <algorithm>
#include <iostream>
#include <optional>
#include <set>

#include "httplib.h"

#include "../protocol/command_codec.h"
#include "../protocol/json.h"

namespace net {
namespace {

using protocol::JsonValue;

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

std::string peer_body(const std::string& peer, const std::vector<std::string>& expect = {}) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("peer", JsonValue::MakeString(peer));
  if (!expect.empty()) {
    JsonValue arr = JsonValue::MakeArray();
    for (const auto& id : expect) arr.Push(JsonValue::MakeString(id));
    o.Set("expect", std::move(arr));
  }
  return protocol::json_stringify(o);
}

std::optional<std::vector<std::string>> parse_peers(const std::string& text) {
  JsonValue v;
  if (!protocol::json_parse(text, v)) return std::nullopt;
  const JsonValue* arr = v.Find("peers");
  if (!arr || !arr->IsArray()) return std::nullopt;
  std::vector<std::string> out;
  for (const auto& p : arr->array_values) {
    if (p.kind == JsonValue::String) out.push_back(p.string_value);
  }
  return out;
}

}  // namespace

RelayTransport::RelayTransport(const RuntimeConfig& cfg) : cfg_(cfg) {}

RelayTransport::~RelayTransport() {
  Disconnect();
}

std::string RelayTransport::Path(const char* leaf) const {
  return "/relay/" + match_id_ + "/" + leaf;
}

void RelayTransport::Initialize(const std::string& match_id, const std::string& local_id, bool,
                                const std::vector<std::string>& peer_ids) {
  if (client_) throw TransportError("relay transport already initialized");
  match_id_ = match_id;
  local_id_ = local_id;
  peer_ids_ = peer_ids;

  client_ = std::make_unique<httplib::Client>(cfg_.relay_host, cfg_.relay_port);
  client_->set_connection_timeout(2, 0);
  client_->set_read_timeout(2, 0);

  auto res = client_->Post(Path("hello"), peer_body(local_id_, peer_ids_), "application/json");
  if (!res || res->status != 200) {
    client_.reset();
    throw TransportError("relay unreachable at " + cfg_.relay_host + ":" + std::to_string(cfg_.relay_port));
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& id : peer_ids_) {
      PeerStats ps;
      ps.peer_id = id;
      peers_[id] = ps;
    }
  }

  std::cout << "[RelayTransport] " << local_id_ << " joined relay for match " << match_id_ << " ("
            << peer_ids_.size() << " peers expected)\n";

  running_.store(true);
  worker_ = std::thread([this] { Run(); });
}

void RelayTransport::OnCommandReceived(CommandHandler handler) {
  on_command_ = std::move(handler);
}

void RelayTransport::OnReady(ReadyHandler handler) {
  on_ready_ = std::move(handler);
}

bool RelayTransport::IsReady() const {
  return ready_.load();
}

void RelayTransport::SendCommand(const lockstep::Command& command) {
  std::lock_guard<std::mutex> lock(mu_);
  if (disconnected_ || !client_) return;
  outbox_.push_back(command);
  if (static_cast<int>(outbox_.size()) >= cfg_.max_batch_size) flush_now_.store(true);
}

void RelayTransport::Run() {
  using ms = std::chrono::milliseconds;
  const auto started = Clock::now();
  const ms batch_dt(cfg_.batch_interval_ms);
  const ms ping_dt(cfg_.ping_interval_ms);
  const ms grace(cfg_.ready_grace_ms);
  const ms poll_dt(cfg_.relay_poll_ms);
  auto next_flush = started + batch_dt;
  auto next_ping = started + ping_dt;

  while (running_.load()) {
    auto now = Clock::now();

    if (!ready_.load()) {
      if (PollPeers()) {
        MarkReady(false);
      } else if (now - started >= grace) {
        MarkReady(true);
      }
    }

    if (flush_now_.load() || now >= next_flush) {
      flush_now_.store(false);
      Flush();
      next_flush = now + batch_dt;
    }

    PollInbox();

    if (ready_.load() && now >= next_ping) {
      PollPeers();
      SendPing();
      next_ping = now + ping_dt;
    }

    std::this_thread::sleep_for(poll_dt);
  }
}

bool RelayTransport::PollPeers() {
  auto res = client_->Get(Path("peers"));
  if (!res || res->status != 200) return false;
  auto present = parse_peers(res->body);
  if (!present) return false;

  std::set<std::string> seen(present->begin(), present->end());
  bool all = true;
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& kv : peers_) {
    kv.second.connected = seen.count(kv.first) > 0;
    all = all && kv.second.connected;
  }
  return all;
}

void RelayTransport::MarkReady(bool degraded) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stats_.degraded = degraded;
  }
  ready_.store(true);
  if (degraded) {
    std::cerr << "[RelayTransport] not every peer arrived within " << cfg_.ready_grace_ms
              << "ms, continuing degraded\n";
  } else {
    std::cout << "[RelayTransport] all peers present\n";
  }
  if (on_ready_) on_ready_();
}

bool RelayTransport::Post(const std::string& to, const protocol::WireMessage& m, int* delivered) {
  const std::string text = protocol::encode_wire_message(m);
  JsonValue o = JsonValue::MakeObject();
  o.Set("from", JsonValue::MakeString(local_id_));
  if (!to.empty()) o.Set("to", JsonValue::MakeString(to));
  o.Set("body", JsonValue::MakeString(text));

  auto res = client_->Post(Path("send"), protocol::json_stringify(o), "application/json");
  if (!res || res->status != 200) return false;
  if (delivered) {
    JsonValue reply;
    if (!protocol::json_parse(res->body, reply)) return false;
    *delivered = static_cast<int>(reply.GetInt("delivered").value_or(0));
  }
  std::lock_guard<std::mutex> lock(mu_);
  ++stats_.packets_sent;
  stats_.bytes_out += text.size();
  return true;
}

bool RelayTransport::Flush() {
  protocol::WireMessage m;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!inflight_) {
      // Only whole tick contributions leave; a tick still being closed waits
      // for its noop marker.
      auto last = std::find_if(outbox_.rbegin(), outbox_.rend(),
                               [](const lockstep::Command& c) { return lockstep::IsNoOp(c); });
      if (last == outbox_.rend()) return true;
      auto end = last.base();
      protocol::WireMessage batch;
      batch.type = protocol::MsgType::CommandBatch;
      batch.from = local_id_;
      batch.seq = next_batch_seq_++;
      batch.commands.assign(outbox_.begin(), end);
      outbox_.erase(outbox_.begin(), end);
      inflight_ = std::move(batch);
    }
    m = *inflight_;
  }

  int delivered = 0;
  if (!Post("", m, &delivered)) {
    // Same seq next time; a peer that already got it drops the copy.
    std::cerr << "[RelayTransport] send failed, retrying batch " << m.seq << " (" << m.commands.size()
              << " commands)\n";
    return false;
  }

  std::lock_guard<std::mutex> lock(mu_);
  inflight_.reset();
  if (delivered < static_cast<int>(peer_ids_.size())) {
    stats_.degraded = true;
    std::cerr << "[RelayTransport] batch " << m.seq << " reached " << delivered << " of " << peer_ids_.size()
              << " peers\n";
  }
  return true;
}

bool RelayTransport::PollInbox() {
  uint64_t after = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    after = inbox_cursor_;
  }
  httplib::Params params{{"peer", local_id_}, {"after", std::to_string(after)}};
  auto res = client_->Get(Path("inbox"), params, httplib::Headers{});
  if (!res || res->status != 200) return false;

  JsonValue v;
  if (!protocol::json_parse(res->body, v)) return false;
  const JsonValue* msgs = v.Find("messages");
  if (!msgs || !msgs->IsArray()) return false;

  for (const auto& entry : msgs->array_values) {
    const uint64_t seq = static_cast<uint64_t>(entry.GetInt("seq").value_or(0));
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (seq <= inbox_cursor_) continue;
      inbox_cursor_ = seq;
    }
    const std::string body = entry.GetString("body").value_or("");
    auto m = protocol::decode_wire_message(body);
    if (!m) {
      std::cerr << "[RelayTransport] undecodable message " << seq << " dropped\n";
      continue;
    }
    HandleMessage(*m, body.size());
  }
  return true;
}

void RelayTransport::SendPing() {
  protocol::WireMessage m;
  m.type = protocol::MsgType::Ping;
  m.from = local_id_;
  {
    std::lock_guard<std::mutex> lock(mu_);
    m.ping_id = next_ping_id_++;
  }
  m.sent_at_ms = now_ms();
  Post("", m);
}

void RelayTransport::HandleMessage(const protocol::WireMessage& m, size_t bytes) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (m.type == protocol::MsgType::CommandBatch && m.seq > 0) {
      uint64_t& last = last_seq_[m.from];
      if (m.seq <= last) {
        ++stats_.duplicates_dropped;
        return;
      }
      last = m.seq;
    }
    ++stats_.packets_received;
    stats_.bytes_in += bytes;
    auto it = peers_.find(m.from);
    if (it != peers_.end()) {
      auto& ps = it->second;
      ps.connected = true;
      ++ps.packets_received;
      ps.commands_received += m.commands.size();
      for (const auto& c : m.commands) ps.last_seen_tick = std::max(ps.last_seen_tick, c.tick);
      if (m.type == protocol::MsgType::Pong) ps.latency_ms = std::max<int64_t>(0, now_ms() - m.sent_at_ms);
    }
  }

  switch (m.type) {
    case protocol::MsgType::CommandBatch:
      if (on_command_) {
        for (const auto& c : m.commands) on_command_(c);
      }
      break;
    case protocol::MsgType::Ping: {
      protocol::WireMessage pong;
      pong.type = protocol::MsgType::Pong;
      pong.from = local_id_;
      pong.ping_id = m.ping_id;
      pong.sent_at_ms = m.sent_at_ms;
      Post(m.from, pong);
      break;
    }
    case protocol::MsgType::Pong:
      break;
  }
}

void RelayTransport::Disconnect() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (disconnected_ || !client_) return;
  }
  running_.store(false);
  if (worker_.joinable()) worker_.join();

  Flush();
  auto res = client_->Post(Path("leave"), peer_body(local_id_), "application/json");
  if (!res || res->status != 200) {
    std::cerr << "[RelayTransport] leave failed for " << local_id_ << "\n";
  }

  std::lock_guard<std::mutex> lock(mu_);
  disconnected_ = true;
  ready_.store(false);
  outbox_.clear();
  inflight_.reset();
  for (auto& kv : peers_) kv.second.connected = false;
}

TransportStats RelayTransport::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  TransportStats s = stats_;
  s.ready = ready_.load();
  s.latency_ms = 0;
  for (const auto& kv : peers_) {
    s.latency_ms = std::max(s.latency_ms, kv.second.latency_ms);
    if (s.ready && !kv.second.connected) s.degraded = true;
    s.peers.push_back(kv.second);
  }
  return s;
}

}  // namespace net
