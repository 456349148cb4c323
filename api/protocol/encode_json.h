#pragma once

#include <string>
#include <vector>

#include "../lockstep/command_queue.h"
#include "../net/transport.h"
#include "../storage/models.h"

namespace protocol {

// Status output for lockstep_node. Field names are stable for tooling that
// scrapes the node's stdout.
std::string encode_match_json(const storage::Match& m);
std::string encode_match_list_json(const std::vector<storage::Match>& matches);
std::string encode_queue_stats_json(const lockstep::QueueStats& s);
std::string encode_transport_stats_json(const net::TransportStats& s);

}  // namespace protocol
