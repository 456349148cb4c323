#include "command_validator.h"

#include <cmath>

#include "../protocol/command_codec.h"

namespace lockstep {

namespace {

bool Fail(std::string* reason, const std::string& why) {
  if (reason) *reason = why;
  return false;
}

bool Finite(double v) {
  return std::isfinite(v);
}

bool Finite(const std::optional<Point>& p) {
  return !p || (std::isfinite(p->x) && std::isfinite(p->y));
}

bool NonEmptyIds(const std::vector<std::string>& ids) {
  if (ids.empty()) return false;
  for (const auto& id : ids) {
    if (id.empty()) return false;
  }
  return true;
}

// Per-type required fields. Returns an empty string when the payload is fine.
struct PayloadRules {
  std::string operator()(const NoOp&) const { return ""; }

  std::string operator()(const UnitMove& p) const {
    if (!NonEmptyIds(p.unit_ids)) return "unit_move requires unitIds";
    if (!Finite(p.target_x) || !Finite(p.target_y)) return "unit_move target is not finite";
    return "";
  }

  std::string operator()(const UnitTargetStructure& p) const {
    if (!NonEmptyIds(p.unit_ids)) return "unit_target_structure requires unitIds";
    if (p.target_player_index < 0) return "targetPlayerIndex is negative";
    if (p.structure_type != "forge" && p.structure_type != "building" && p.structure_type != "mirror") {
      return "unknown structureType '" + p.structure_type + "'";
    }
    if (p.structure_index < 0) return "structureIndex is negative";
    return "";
  }

  std::string operator()(const BuildBuilding& p) const {
    if (p.building_type.empty()) return "build_building requires buildingType";
    if (!Finite(p.x) || !Finite(p.y)) return "build_building position is not finite";
    return "";
  }

  std::string operator()(const ProduceHero& p) const {
    if (p.hero_type.empty()) return "produce_hero requires heroType";
    if (!Finite(p.spawn_position)) return "spawnPosition is not finite";
    return "";
  }

  std::string operator()(const UnitAbility& p) const {
    if (p.unit_id.empty()) return "unit_ability requires unitId";
    if (p.ability_index && *p.ability_index < 0) return "abilityIndex is negative";
    if (!Finite(p.direction) || !Finite(p.target_position)) return "unit_ability vector is not finite";
    return "";
  }

  std::string operator()(const MirrorControl& p) const {
    if (p.mirror_index < 0) return "mirrorIndex is negative";
    if (p.action == "select") return "";
    if (p.action == "link") {
      if (p.link_target && p.link_target->type != "forge" && p.link_target->type != "building") {
        return "unknown linkTarget type '" + p.link_target->type + "'";
      }
      return "";
    }
    if (p.action == "move") {
      if (!p.position) return "mirror move requires position";
      return Finite(p.position) ? "" : "mirror position is not finite";
    }
    if (p.action == "rotate") {
      if (!p.rotation) return "mirror rotate requires rotation";
      return Finite(*p.rotation) ? "" : "mirror rotation is not finite";
    }
    return "unknown mirror action '" + p.action + "'";
  }

  std::string operator()(const ForgeMove& p) const {
    if (!Finite(p.target_x) || !Finite(p.target_y)) return "forge_move target is not finite";
    return "";
  }

  std::string operator()(const ChatMessage& p) const {
    if (p.message.empty()) return "chat_message requires message";
    if (p.channel != "all" && p.channel != "team" && p.channel != "whisper") {
      return "unknown chat channel '" + p.channel + "'";
    }
    if (p.channel == "whisper" && (!p.target_player_id || p.target_player_id->empty())) {
      return "whisper requires targetPlayerId";
    }
    return "";
  }

  std::string operator()(const Surrender& p) const {
    return p.confirmed ? "" : "surrender is not confirmed";
  }

  std::string operator()(const Unknown&) const { return "payload does not decode"; }
};

}  // namespace

bool CommandValidator::Validate(const Command& command, std::string* reason) const {
  if (command.tick < 0) {
    return Fail(reason, "negative tick " + std::to_string(command.tick));
  }
  if (command.participant_id.empty()) {
    return Fail(reason, "empty participantId");
  }
  if (!IsKnownCommandType(command.command_type)) {
    return Fail(reason, "unknown commandType '" + command.command_type + "'");
  }
  if (std::holds_alternative<Unknown>(command.payload) || CommandTypeOf(command.payload) != command.command_type) {
    return Fail(reason, "payload does not match commandType '" + command.command_type + "'");
  }

  const std::string rule = std::visit(PayloadRules{}, command.payload);
  if (!rule.empty()) return Fail(reason, rule);

  const size_t payload_bytes = protocol::json_stringify(protocol::encode_payload(command.payload)).size();
  if (payload_bytes > kMaxPayloadBytes) {
    return Fail(reason, "payload too large: " + std::to_string(payload_bytes) + " bytes");
  }
  return true;
}

}  // namespace lockstep
