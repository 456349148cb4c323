#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace httplib {
class Server;
}

namespace relay {

struct Envelope {
  uint64_t seq = 0;
  std::string from;
  std::string body;
};

// Store-and-forward mailboxes per match. The relay never looks inside a body;
// it only fans it out to the other peers of the same match.
class RelayService {
 public:
  // Registers peer in match and returns every peer currently present, sorted.
  // `expected` names the rest of the roster: their mailboxes are opened now so
  // traffic sent before they arrive waits for them.
  std::vector<std::string> Hello(const std::string& match_id, const std::string& peer_id,
                                 const std::vector<std::string>& expected = {});
  // Peers that said hello and have not left.
  std::vector<std::string> Peers(const std::string& match_id) const;
  // Empty `to` broadcasts to every other peer. Returns how many mailboxes got a
  // copy, or -1 when the sender never said hello.
  int Send(const std::string& match_id, const std::string& from, const std::string& to, const std::string& body);
  // Messages after `after_seq`; everything up to and including it is dropped
  // from the mailbox.
  std::vector<Envelope> Inbox(const std::string& match_id, const std::string& peer_id, uint64_t after_seq);
  bool Leave(const std::string& match_id, const std::string& peer_id);

  size_t MatchCount() const;

  // Routes under /relay/<match_id>/{hello,peers,send,inbox,leave}.
  void Mount(httplib::Server& srv);

 private:
  struct Match {
    uint64_t next_seq = 1;
    std::set<std::string> present;
    std::set<std::string> departed;
    std::map<std::string, std::deque<Envelope>> mailboxes;
  };

  mutable std::mutex mu_;
  std::map<std::string, Match> matches_;
};

}  // namespace relay
