#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../lockstep/command.h"
#include "protocol_version.h"

namespace protocol {

enum class MsgType : uint8_t {
  CommandBatch = 1,
  Ping = 2,
  Pong = 3,
};

const char* MsgTypeName(MsgType t);
std::optional<MsgType> ParseMsgType(const std::string& name);

// One peer-to-peer message. Commands and seq are set for CommandBatch; ping_id
// and sent_at_ms for Ping/Pong.
struct WireMessage {
  MsgType type = MsgType::CommandBatch;
  int version = kProtocolVersion;
  std::string from;
  // Per-sender batch counter starting at 1. A retried batch keeps its seq so
  // the receiver can drop the second copy. 0 means unsequenced.
  uint64_t seq = 0;
  std::vector<lockstep::Command> commands;
  uint64_t ping_id = 0;
  int64_t sent_at_ms = 0;
};

}  // namespace protocol
