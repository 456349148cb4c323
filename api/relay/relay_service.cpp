#include "relay_service.h"

#include <iostream>

#include "httplib.h"

#include "../protocol/json.h"

namespace relay {
namespace {

using protocol::JsonValue;

void reply_json(httplib::Response& res, const JsonValue& v) {
  res.set_content(protocol::json_stringify(v), "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& error) {
  res.status = status;
  res.set_content("{\"error\":\"" + protocol::json_escape(error) + "\"}", "application/json");
}

JsonValue peers_json(const std::vector<std::string>& peers) {
  JsonValue o = JsonValue::MakeObject();
  JsonValue arr = JsonValue::MakeArray();
  for (const auto& p : peers) arr.Push(JsonValue::MakeString(p));
  o.Set("peers", std::move(arr));
  return o;
}

bool parse_body(const httplib::Request& req, JsonValue& out) {
  return protocol::json_parse(req.body, out) && out.IsObject();
}

}  // namespace

std::vector<std::string> RelayService::Hello(const std::string& match_id, const std::string& peer_id,
                                             const std::vector<std::string>& expected) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& m = matches_[match_id];
  m.present.insert(peer_id);
  m.departed.erase(peer_id);
  m.mailboxes[peer_id];
  for (const auto& id : expected) {
    if (id.empty() || m.departed.count(id)) continue;
    m.mailboxes[id];
  }
  return std::vector<std::string>(m.present.begin(), m.present.end());
}

std::vector<std::string> RelayService::Peers(const std::string& match_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return {};
  return std::vector<std::string>(it->second.present.begin(), it->second.present.end());
}

int RelayService::Send(const std::string& match_id, const std::string& from, const std::string& to,
                       const std::string& body) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return -1;
  auto& m = it->second;
  if (!m.present.count(from)) return -1;

  int delivered = 0;
  for (auto& kv : m.mailboxes) {
    if (kv.first == from) continue;
    if (!to.empty() && kv.first != to) continue;
    kv.second.push_back(Envelope{m.next_seq++, from, body});
    ++delivered;
  }
  return delivered;
}

std::vector<Envelope> RelayService::Inbox(const std::string& match_id, const std::string& peer_id,
                                          uint64_t after_seq) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Envelope> out;
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return out;
  auto mb = it->second.mailboxes.find(peer_id);
  if (mb == it->second.mailboxes.end()) return out;

  auto& q = mb->second;
  while (!q.empty() && q.front().seq <= after_seq) q.pop_front();
  out.assign(q.begin(), q.end());
  return out;
}

bool RelayService::Leave(const std::string& match_id, const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = matches_.find(match_id);
  if (it == matches_.end()) return false;
  auto& m = it->second;
  if (m.present.erase(peer_id) == 0) return false;
  m.mailboxes.erase(peer_id);
  m.departed.insert(peer_id);
  if (m.present.empty()) matches_.erase(it);
  return true;
}

size_t RelayService::MatchCount() const {
  std::lock_guard<std::mutex> lock(mu_);
  return matches_.size();
}

void RelayService::Mount(httplib::Server& srv) {
  srv.Post(R"(/relay/([A-Za-z0-9_-]+)/hello)", [this](const httplib::Request& req, httplib::Response& res) {
    JsonValue body;
    if (!parse_body(req, body)) return reply_error(res, 400, "bad_json");
    auto peer = body.GetString("peer");
    if (!peer || peer->empty()) return reply_error(res, 400, "missing_peer");
    std::vector<std::string> expected;
    if (const JsonValue* arr = body.Find("expect")) {
      if (!arr->IsArray()) return reply_error(res, 400, "bad_expect");
      for (const auto& e : arr->array_values) {
        if (e.kind == JsonValue::String) expected.push_back(e.string_value);
      }
    }
    reply_json(res, peers_json(Hello(req.matches[1], *peer, expected)));
  });

  srv.Get(R"(/relay/([A-Za-z0-9_-]+)/peers)", [this](const httplib::Request& req, httplib::Response& res) {
    reply_json(res, peers_json(Peers(req.matches[1])));
  });

  srv.Post(R"(/relay/([A-Za-z0-9_-]+)/send)", [this](const httplib::Request& req, httplib::Response& res) {
    JsonValue body;
    if (!parse_body(req, body)) return reply_error(res, 400, "bad_json");
    auto from = body.GetString("from");
    auto msg = body.GetString("body");
    if (!from || !msg) return reply_error(res, 400, "missing_fields");
    const int delivered = Send(req.matches[1], *from, body.GetString("to").value_or(""), *msg);
    if (delivered < 0) return reply_error(res, 404, "unknown_peer");
    JsonValue o = JsonValue::MakeObject();
    o.Set("delivered", JsonValue::MakeNumber(delivered));
    reply_json(res, o);
  });

  srv.Get(R"(/relay/([A-Za-z0-9_-]+)/inbox)", [this](const httplib::Request& req, httplib::Response& res) {
    const std::string peer = req.get_param_value("peer");
    if (peer.empty()) return reply_error(res, 400, "missing_peer");
    uint64_t after = 0;
    const std::string after_s = req.get_param_value("after");
    if (!after_s.empty()) {
      try {
        after = std::stoull(after_s);
      } catch (const std::exception&) {
        return reply_error(res, 400, "bad_after");
      }
    }
    JsonValue o = JsonValue::MakeObject();
    JsonValue arr = JsonValue::MakeArray();
    for (const auto& e : Inbox(req.matches[1], peer, after)) {
      JsonValue m = JsonValue::MakeObject();
      m.Set("seq", JsonValue::MakeNumber(static_cast<double>(e.seq)));
      m.Set("from", JsonValue::MakeString(e.from));
      m.Set("body", JsonValue::MakeString(e.body));
      arr.Push(std::move(m));
    }
    o.Set("messages", std::move(arr));
    reply_json(res, o);
  });

  srv.Post(R"(/relay/([A-Za-z0-9_-]+)/leave)", [this](const httplib::Request& req, httplib::Response& res) {
    JsonValue body;
    if (!parse_body(req, body)) return reply_error(res, 400, "bad_json");
    auto peer = body.GetString("peer");
    if (!peer) return reply_error(res, 400, "missing_peer");
    if (Leave(req.matches[1], *peer)) {
      std::cout << "[Relay] " << *peer << " left " << req.matches[1].str() << "\n";
    }
    res.set_content("{\"ok\":true}", "application/json");
  });

  srv.Get("/relay/health", [this](const httplib::Request&, httplib::Response& res) {
    JsonValue o = JsonValue::MakeObject();
    o.Set("matches", JsonValue::MakeNumber(static_cast<double>(MatchCount())));
    reply_json(res, o);
  });
}

}  // namespace relay
