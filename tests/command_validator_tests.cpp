#include <cmath>
#include <limits>
#include <string>

#include "lockstep/command_validator.h"
#include "test_support.h"

using lockstep::Command;
using lockstep::CommandValidator;
using lockstep::MakeCommand;

static bool valid(const Command& c, std::string* why = nullptr) {
  return CommandValidator{}.Validate(c, why);
}

static int test_envelope_rules() {
  lockstep::UnitMove move;
  move.unit_ids = {"u1"};
  move.target_x = 10.5;
  move.target_y = 2.0;
  EXPECT(valid(MakeCommand(0, "p1", move)), "well-formed move");

  std::string why;
  EXPECT(!valid(MakeCommand(-1, "p1", move), &why), "negative tick");
  EXPECT(why.find("negative tick") != std::string::npos, "reason names the tick");
  EXPECT(!valid(MakeCommand(0, "", move)), "empty participant");

  Command renamed = MakeCommand(0, "p1", move);
  renamed.command_type = "teleport";
  EXPECT(!valid(renamed, &why), "unknown tag");
  EXPECT(why.find("teleport") != std::string::npos, "reason names the tag");

  Command mismatched = MakeCommand(0, "p1", move);
  mismatched.command_type = "forge_move";
  EXPECT(!valid(mismatched), "payload must match tag");

  Command unknown = MakeCommand(0, "p1", lockstep::Unknown{"unit_move", "{}"});
  unknown.command_type = "unit_move";
  EXPECT(!valid(unknown, &why), "undecodable payload");
  EXPECT(why.find("does not match") != std::string::npos, "mismatch reason");
  return 0;
}

static int test_required_fields() {
  lockstep::UnitMove no_units;
  EXPECT(!valid(MakeCommand(1, "p1", no_units)), "unit_move without units");

  lockstep::UnitMove nan_target;
  nan_target.unit_ids = {"u1"};
  nan_target.target_x = std::numeric_limits<double>::quiet_NaN();
  EXPECT(!valid(MakeCommand(1, "p1", nan_target)), "non-finite coordinate");

  lockstep::UnitTargetStructure uts;
  uts.unit_ids = {"u1"};
  uts.structure_type = "mirror";
  EXPECT(valid(MakeCommand(1, "p1", uts)), "target a mirror");
  uts.structure_type = "tower";
  EXPECT(!valid(MakeCommand(1, "p1", uts)), "unknown structure type");
  uts.structure_type = "forge";
  uts.target_player_index = -1;
  EXPECT(!valid(MakeCommand(1, "p1", uts)), "negative player index");

  EXPECT(!valid(MakeCommand(1, "p1", lockstep::BuildBuilding{})), "building type required");
  EXPECT(valid(MakeCommand(1, "p1", lockstep::BuildBuilding{"foundry", 3.0, 4.0})), "building ok");
  EXPECT(!valid(MakeCommand(1, "p1", lockstep::ProduceHero{})), "hero type required");
  EXPECT(!valid(MakeCommand(1, "p1", lockstep::UnitAbility{})), "unit id required");
  EXPECT(valid(MakeCommand(1, "p1", lockstep::ForgeMove{1.0, 2.0})), "forge move ok");
  EXPECT(valid(MakeCommand(1, "p1", lockstep::NoOp{})), "noop ok");
  return 0;
}

static int test_mirror_actions() {
  lockstep::MirrorControl m;
  m.mirror_index = 0;
  m.action = "select";
  EXPECT(valid(MakeCommand(2, "p1", m)), "select");

  m.action = "move";
  EXPECT(!valid(MakeCommand(2, "p1", m)), "move needs position");
  m.position = lockstep::Point{1.0, 1.0};
  EXPECT(valid(MakeCommand(2, "p1", m)), "move with position");

  m.action = "rotate";
  EXPECT(!valid(MakeCommand(2, "p1", m)), "rotate needs rotation");
  m.rotation = 1.5;
  EXPECT(valid(MakeCommand(2, "p1", m)), "rotate with rotation");

  m.action = "link";
  m.link_target = lockstep::LinkTarget{"mirror", 0};
  EXPECT(!valid(MakeCommand(2, "p1", m)), "link target must be forge or building");
  m.link_target = lockstep::LinkTarget{"building", 2};
  EXPECT(valid(MakeCommand(2, "p1", m)), "link to building");

  m.action = "spin";
  EXPECT(!valid(MakeCommand(2, "p1", m)), "unknown action");
  return 0;
}

static int test_chat_and_surrender() {
  lockstep::ChatMessage chat;
  EXPECT(!valid(MakeCommand(3, "p1", chat)), "empty message");
  chat.message = "gg";
  EXPECT(valid(MakeCommand(3, "p1", chat)), "chat to all");
  chat.channel = "whisper";
  EXPECT(!valid(MakeCommand(3, "p1", chat)), "whisper needs a target");
  chat.target_player_id = "p2";
  EXPECT(valid(MakeCommand(3, "p1", chat)), "whisper with target");
  chat.channel = "shout";
  EXPECT(!valid(MakeCommand(3, "p1", chat)), "unknown channel");

  EXPECT(!valid(MakeCommand(3, "p1", lockstep::Surrender{false})), "unconfirmed surrender");
  EXPECT(valid(MakeCommand(3, "p1", lockstep::Surrender{true})), "confirmed surrender");
  return 0;
}

static int test_payload_size_limit() {
  lockstep::ChatMessage chat;
  chat.message = std::string(CommandValidator::kMaxPayloadBytes, 'x');
  std::string why;
  EXPECT(!valid(MakeCommand(0, "p1", chat), &why), "oversized payload");
  EXPECT(why.find("too large") != std::string::npos, "size reason");
  return 0;
}

static int test_same_verdict_every_time() {
  lockstep::UnitMove move;
  move.unit_ids = {"u1", "u2"};
  const Command c = MakeCommand(7, "p1", move);
  const CommandValidator a;
  const CommandValidator b;
  for (int i = 0; i < 100; ++i) {
    EXPECT(a.Validate(c) == b.Validate(c), "pure: no state between calls");
  }
  return 0;
}

int main() {
  RUN_TEST(test_envelope_rules);
  RUN_TEST(test_required_fields);
  RUN_TEST(test_mirror_actions);
  RUN_TEST(test_chat_and_surrender);
  RUN_TEST(test_payload_size_limit);
  RUN_TEST(test_same_verdict_every_time);
  return 0;
}
