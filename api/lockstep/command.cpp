#include "command.h"

#include <algorithm>
#include <utility>

namespace lockstep {

namespace {

struct TypeName {
  std::string operator()(const NoOp&) const { return "noop"; }
  std::string operator()(const UnitMove&) const { return "unit_move"; }
  std::string operator()(const UnitTargetStructure&) const { return "unit_target_structure"; }
  std::string operator()(const BuildBuilding&) const { return "build_building"; }
  std::string operator()(const ProduceHero&) const { return "produce_hero"; }
  std::string operator()(const UnitAbility&) const { return "unit_ability"; }
  std::string operator()(const MirrorControl&) const { return "mirror_control"; }
  std::string operator()(const ForgeMove&) const { return "forge_move"; }
  std::string operator()(const ChatMessage&) const { return "chat_message"; }
  std::string operator()(const Surrender&) const { return "surrender"; }
  std::string operator()(const Unknown& u) const { return u.type; }
};

}  // namespace

std::string CommandTypeOf(const Payload& payload) {
  return std::visit(TypeName{}, payload);
}

const std::vector<std::string>& KnownCommandTypes() {
  static const std::vector<std::string> kTypes = {
      "noop",           "unit_move",  "unit_target_structure", "build_building", "produce_hero",
      "unit_ability",   "mirror_control", "forge_move",        "chat_message",   "surrender",
  };
  return kTypes;
}

bool IsKnownCommandType(const std::string& command_type) {
  const auto& types = KnownCommandTypes();
  return std::find(types.begin(), types.end(), command_type) != types.end();
}

Command MakeCommand(int64_t tick, const std::string& participant_id, Payload payload) {
  Command c;
  c.tick = tick;
  c.participant_id = participant_id;
  c.command_type = CommandTypeOf(payload);
  c.payload = std::move(payload);
  return c;
}

bool IsNoOp(const Command& c) {
  return std::holds_alternative<NoOp>(c.payload);
}

}  // namespace lockstep
