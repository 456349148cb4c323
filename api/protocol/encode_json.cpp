#include "encode_json.h"

#include <sstream>

#include "json.h"

namespace protocol {
namespace {

void append_match(std::ostringstream& out, const storage::Match& m) {
  out << "{";
  out << "\"match_id\":\"" << json_escape(m.match_id) << "\",";
  out << "\"name\":\"" << json_escape(m.name) << "\",";
  out << "\"status\":\"" << json_escape(m.status) << "\",";
  out << "\"host\":\"" << json_escape(m.host_participant_id) << "\",";
  out << "\"seed\":" << m.seed << ",";
  out << "\"tick_rate\":" << m.tick_rate << ",";
  out << "\"max_participants\":" << m.max_participants << ",";
  out << "\"created_at\":" << m.created_at;
  out << "}";
}

}  // namespace

std::string encode_match_json(const storage::Match& m) {
  std::ostringstream out;
  append_match(out, m);
  return out.str();
}

std::string encode_match_list_json(const std::vector<storage::Match>& matches) {
  std::ostringstream out;
  out << "{\"matches\":[";
  for (size_t i = 0; i < matches.size(); ++i) {
    append_match(out, matches[i]);
    if (i + 1 < matches.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

std::string encode_queue_stats_json(const lockstep::QueueStats& s) {
  std::ostringstream out;
  out << "{";
  out << "\"tick\":" << s.current_tick << ",";
  out << "\"queued_ticks\":" << s.queued_ticks << ",";
  out << "\"released\":" << s.total_released << ",";
  out << "\"stale\":" << s.stale_rejected << ",";
  out << "\"backlog\":{";
  size_t i = 0;
  for (const auto& kv : s.per_participant_backlog) {
    out << "\"" << json_escape(kv.first) << "\":" << kv.second;
    if (++i < s.per_participant_backlog.size()) out << ",";
  }
  out << "}}";
  return out.str();
}

std::string encode_transport_stats_json(const net::TransportStats& s) {
  std::ostringstream out;
  out << "{";
  out << "\"ready\":" << (s.ready ? "true" : "false") << ",";
  out << "\"degraded\":" << (s.degraded ? "true" : "false") << ",";
  out << "\"latency_ms\":" << s.latency_ms << ",";
  out << "\"sent\":" << s.packets_sent << ",";
  out << "\"received\":" << s.packets_received << ",";
  out << "\"duplicates\":" << s.duplicates_dropped << ",";
  out << "\"peers\":[";
  for (size_t i = 0; i < s.peers.size(); ++i) {
    const auto& p = s.peers[i];
    out << "{";
    out << "\"id\":\"" << json_escape(p.peer_id) << "\",";
    out << "\"connected\":" << (p.connected ? "true" : "false") << ",";
    out << "\"latency_ms\":" << p.latency_ms << ",";
    out << "\"last_seen_tick\":" << p.last_seen_tick;
    out << "}";
    if (i + 1 < s.peers.size()) out << ",";
  }
  out << "]}";
  return out.str();
}

}  // namespace protocol
