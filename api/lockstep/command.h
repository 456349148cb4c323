#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lockstep {

struct Point {
  double x = 0.0;
  double y = 0.0;

  bool operator==(const Point& o) const { return x == o.x && y == o.y; }
};

// "Submitted, did nothing this tick."
struct NoOp {
  bool operator==(const NoOp&) const { return true; }
};

struct UnitMove {
  std::vector<std::string> unit_ids;
  double target_x = 0.0;
  double target_y = 0.0;
  std::optional<int> move_order;
  bool attack_move = false;

  bool operator==(const UnitMove& o) const {
    return unit_ids == o.unit_ids && target_x == o.target_x && target_y == o.target_y &&
           move_order == o.move_order && attack_move == o.attack_move;
  }
};

struct UnitTargetStructure {
  std::vector<std::string> unit_ids;
  int target_player_index = 0;
  std::string structure_type;  // forge, building, mirror
  int structure_index = 0;
  std::optional<int> move_order;

  bool operator==(const UnitTargetStructure& o) const {
    return unit_ids == o.unit_ids && target_player_index == o.target_player_index &&
           structure_type == o.structure_type && structure_index == o.structure_index &&
           move_order == o.move_order;
  }
};

struct BuildBuilding {
  std::string building_type;
  double x = 0.0;
  double y = 0.0;

  bool operator==(const BuildBuilding& o) const {
    return building_type == o.building_type && x == o.x && y == o.y;
  }
};

struct ProduceHero {
  std::string hero_type;
  std::optional<Point> spawn_position;

  bool operator==(const ProduceHero& o) const {
    return hero_type == o.hero_type && spawn_position == o.spawn_position;
  }
};

struct UnitAbility {
  std::string unit_id;
  std::optional<int> ability_index;
  std::optional<Point> direction;
  std::optional<Point> target_position;
  std::optional<std::string> target_unit_id;

  bool operator==(const UnitAbility& o) const {
    return unit_id == o.unit_id && ability_index == o.ability_index && direction == o.direction &&
           target_position == o.target_position && target_unit_id == o.target_unit_id;
  }
};

struct LinkTarget {
  std::string type;  // forge, building
  std::optional<int> index;

  bool operator==(const LinkTarget& o) const { return type == o.type && index == o.index; }
};

struct MirrorControl {
  int mirror_index = 0;
  std::string action;  // select, link, move, rotate
  std::optional<LinkTarget> link_target;
  std::optional<Point> position;
  std::optional<double> rotation;

  bool operator==(const MirrorControl& o) const {
    return mirror_index == o.mirror_index && action == o.action && link_target == o.link_target &&
           position == o.position && rotation == o.rotation;
  }
};

struct ForgeMove {
  double target_x = 0.0;
  double target_y = 0.0;

  bool operator==(const ForgeMove& o) const { return target_x == o.target_x && target_y == o.target_y; }
};

struct ChatMessage {
  std::string message;
  std::string channel = "all";  // all, team, whisper
  std::optional<std::string> target_player_id;

  bool operator==(const ChatMessage& o) const {
    return message == o.message && channel == o.channel && target_player_id == o.target_player_id;
  }
};

struct Surrender {
  bool confirmed = false;

  bool operator==(const Surrender& o) const { return confirmed == o.confirmed; }
};

// Tag not known to this build, or a known tag whose payload did not decode.
struct Unknown {
  std::string type;
  std::string raw_json;

  bool operator==(const Unknown& o) const { return type == o.type && raw_json == o.raw_json; }
};

using Payload = std::variant<NoOp, UnitMove, UnitTargetStructure, BuildBuilding, ProduceHero, UnitAbility,
                             MirrorControl, ForgeMove, ChatMessage, Surrender, Unknown>;

struct Command {
  int64_t tick = 0;
  std::string participant_id;
  std::string command_type;
  Payload payload;

  bool operator==(const Command& o) const {
    return tick == o.tick && participant_id == o.participant_id && command_type == o.command_type &&
           payload == o.payload;
  }
  bool operator!=(const Command& o) const { return !(*this == o); }
};

// Wire tag for a payload alternative ("unit_move", ...). Unknown keeps its own tag.
std::string CommandTypeOf(const Payload& payload);

// True for the tags this build can decode into a typed payload.
bool IsKnownCommandType(const std::string& command_type);

const std::vector<std::string>& KnownCommandTypes();

Command MakeCommand(int64_t tick, const std::string& participant_id, Payload payload);

bool IsNoOp(const Command& c);

}  // namespace lockstep
