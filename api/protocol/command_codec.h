#pragma once

#include <optional>
#include <string>

#include "../lockstep/command.h"
#include "json.h"
#include "protocol.h"

namespace protocol {

// DO NOT change field names/abbreviations without bumping kProtocolVersion;
// every peer must decode the same bytes into the same command.

// Full form: {"tick","participantId","commandType","payload"}.
JsonValue encode_command(const lockstep::Command& c);
std::optional<lockstep::Command> decode_command(const JsonValue& v);

std::string encode_command_json(const lockstep::Command& c);
std::optional<lockstep::Command> decode_command_json(const std::string& text);

// Compact form: {"t","p","c","d"}, abbreviated tag, coordinates at one decimal.
JsonValue encode_compact_command(const lockstep::Command& c);
std::optional<lockstep::Command> decode_compact_command(const JsonValue& v);

std::string abbreviate_command_type(const std::string& command_type);
std::string expand_command_type(const std::string& abbreviated);

// Payload object as it appears under "payload"/"d".
JsonValue encode_payload(const lockstep::Payload& p);
// Unknown{type, raw} when the tag is unknown or a required field is missing.
lockstep::Payload decode_payload(const std::string& command_type, const JsonValue& d);

double round_coordinate(double v);
void quantize_coordinates(lockstep::Payload& p);

// Peer message envelope. Commands always travel compact; decode accepts both forms.
std::string encode_wire_message(const WireMessage& m);
std::optional<WireMessage> decode_wire_message(const std::string& text);

}  // namespace protocol
