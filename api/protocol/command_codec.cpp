#include "command_codec.h"

#include <cmath>
#include <limits>
#include <map>
#include <utility>

namespace protocol {
namespace {

using lockstep::Payload;
using lockstep::Point;

const std::map<std::string, std::string>& Abbreviations() {
  static const std::map<std::string, std::string> kTable = {
      {"noop", "n"},
      {"unit_move", "um"},
      {"unit_target_structure", "ut"},
      {"build_building", "bb"},
      {"produce_hero", "ph"},
      {"unit_ability", "ua"},
      {"mirror_control", "mc"},
      {"forge_move", "fm"},
      {"chat_message", "cm"},
      {"surrender", "sr"},
  };
  return kTable;
}

const std::map<std::string, std::string>& Expansions() {
  static const std::map<std::string, std::string> kTable = [] {
    std::map<std::string, std::string> out;
    for (const auto& kv : Abbreviations()) out[kv.second] = kv.first;
    return out;
  }();
  return kTable;
}

JsonValue Num(double v) {
  return JsonValue::MakeNumber(v);
}

JsonValue Str(const std::string& v) {
  return JsonValue::MakeString(v);
}

JsonValue EncodePoint(const Point& p) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("x", Num(p.x));
  o.Set("y", Num(p.y));
  return o;
}

std::optional<Point> DecodePoint(const JsonValue* v) {
  if (!v || !v->IsObject()) return std::nullopt;
  auto x = v->GetNumber("x");
  auto y = v->GetNumber("y");
  if (!x || !y) return std::nullopt;
  return Point{*x, *y};
}

JsonValue EncodeIds(const std::vector<std::string>& ids) {
  JsonValue a = JsonValue::MakeArray();
  for (const auto& id : ids) a.Push(Str(id));
  return a;
}

// Unit ids arrive as strings or integers.
std::optional<std::vector<std::string>> DecodeIds(const JsonValue* v) {
  if (!v || !v->IsArray()) return std::nullopt;
  std::vector<std::string> out;
  out.reserve(v->array_values.size());
  for (const auto& e : v->array_values) {
    if (e.kind == JsonValue::String) {
      out.push_back(e.string_value);
    } else if (e.kind == JsonValue::Number) {
      out.push_back(json_stringify(e));
    } else {
      return std::nullopt;
    }
  }
  return out;
}

std::optional<std::string> DecodeIdField(const JsonValue& d, const std::string& key) {
  const JsonValue* v = d.Find(key);
  if (!v) return std::nullopt;
  if (v->kind == JsonValue::String) return v->string_value;
  if (v->kind == JsonValue::Number) return json_stringify(*v);
  return std::nullopt;
}

std::optional<int> DecodeInt(const JsonValue& d, const std::string& key) {
  auto v = d.GetInt(key);
  if (!v) return std::nullopt;
  if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) return std::nullopt;
  return static_cast<int>(*v);
}

// Absent is fine; present but not an int in range fails the payload.
bool DecodeOptionalInt(const JsonValue& d, const std::string& key, std::optional<int>& out) {
  out.reset();
  if (!d.Find(key)) return true;
  out = DecodeInt(d, key);
  return out.has_value();
}

struct PayloadEncoder {
  JsonValue operator()(const lockstep::NoOp&) const { return JsonValue::MakeObject(); }

  JsonValue operator()(const lockstep::UnitMove& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("unitIds", EncodeIds(p.unit_ids));
    o.Set("targetX", Num(p.target_x));
    o.Set("targetY", Num(p.target_y));
    if (p.move_order) o.Set("moveOrder", Num(*p.move_order));
    if (p.attack_move) o.Set("attackMove", JsonValue::MakeBool(true));
    return o;
  }

  JsonValue operator()(const lockstep::UnitTargetStructure& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("unitIds", EncodeIds(p.unit_ids));
    o.Set("targetPlayerIndex", Num(p.target_player_index));
    o.Set("structureType", Str(p.structure_type));
    o.Set("structureIndex", Num(p.structure_index));
    if (p.move_order) o.Set("moveOrder", Num(*p.move_order));
    return o;
  }

  JsonValue operator()(const lockstep::BuildBuilding& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("buildingType", Str(p.building_type));
    o.Set("x", Num(p.x));
    o.Set("y", Num(p.y));
    return o;
  }

  JsonValue operator()(const lockstep::ProduceHero& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("heroType", Str(p.hero_type));
    if (p.spawn_position) o.Set("spawnPosition", EncodePoint(*p.spawn_position));
    return o;
  }

  JsonValue operator()(const lockstep::UnitAbility& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("unitId", Str(p.unit_id));
    if (p.ability_index) o.Set("abilityIndex", Num(*p.ability_index));
    if (p.direction) o.Set("direction", EncodePoint(*p.direction));
    if (p.target_position) o.Set("targetPosition", EncodePoint(*p.target_position));
    if (p.target_unit_id) o.Set("targetUnitId", Str(*p.target_unit_id));
    return o;
  }

  JsonValue operator()(const lockstep::MirrorControl& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("mirrorIndex", Num(p.mirror_index));
    o.Set("action", Str(p.action));
    if (p.link_target) {
      JsonValue t = JsonValue::MakeObject();
      t.Set("type", Str(p.link_target->type));
      if (p.link_target->index) t.Set("index", Num(*p.link_target->index));
      o.Set("linkTarget", std::move(t));
    }
    if (p.position) o.Set("position", EncodePoint(*p.position));
    if (p.rotation) o.Set("rotation", Num(*p.rotation));
    return o;
  }

  JsonValue operator()(const lockstep::ForgeMove& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("targetX", Num(p.target_x));
    o.Set("targetY", Num(p.target_y));
    return o;
  }

  JsonValue operator()(const lockstep::ChatMessage& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("message", Str(p.message));
    o.Set("channel", Str(p.channel));
    if (p.target_player_id) o.Set("targetPlayerId", Str(*p.target_player_id));
    return o;
  }

  JsonValue operator()(const lockstep::Surrender& p) const {
    JsonValue o = JsonValue::MakeObject();
    o.Set("confirmed", JsonValue::MakeBool(p.confirmed));
    return o;
  }

  JsonValue operator()(const lockstep::Unknown& p) const {
    JsonValue raw;
    if (!json_parse(p.raw_json, raw)) return JsonValue::MakeNull();
    return raw;
  }
};

std::optional<Payload> DecodeKnown(const std::string& type, const JsonValue& d) {
  if (!d.IsObject()) return std::nullopt;

  if (type == "noop") return Payload{lockstep::NoOp{}};

  if (type == "unit_move") {
    lockstep::UnitMove p;
    auto ids = DecodeIds(d.Find("unitIds"));
    auto x = d.GetNumber("targetX");
    auto y = d.GetNumber("targetY");
    if (!ids || !x || !y) return std::nullopt;
    p.unit_ids = std::move(*ids);
    p.target_x = *x;
    p.target_y = *y;
    if (!DecodeOptionalInt(d, "moveOrder", p.move_order)) return std::nullopt;
    p.attack_move = d.GetBool("attackMove").value_or(false);
    return Payload{std::move(p)};
  }

  if (type == "unit_target_structure") {
    lockstep::UnitTargetStructure p;
    auto ids = DecodeIds(d.Find("unitIds"));
    auto player = DecodeInt(d, "targetPlayerIndex");
    auto kind = d.GetString("structureType");
    auto index = DecodeInt(d, "structureIndex");
    if (!ids || !player || !kind || !index) return std::nullopt;
    p.unit_ids = std::move(*ids);
    p.target_player_index = *player;
    p.structure_type = *kind;
    p.structure_index = *index;
    if (!DecodeOptionalInt(d, "moveOrder", p.move_order)) return std::nullopt;
    return Payload{std::move(p)};
  }

  if (type == "build_building") {
    lockstep::BuildBuilding p;
    auto kind = d.GetString("buildingType");
    auto x = d.GetNumber("x");
    auto y = d.GetNumber("y");
    if (!kind || !x || !y) return std::nullopt;
    p.building_type = *kind;
    p.x = *x;
    p.y = *y;
    return Payload{std::move(p)};
  }

  if (type == "produce_hero") {
    lockstep::ProduceHero p;
    auto kind = d.GetString("heroType");
    if (!kind) return std::nullopt;
    p.hero_type = *kind;
    if (d.Find("spawnPosition")) {
      p.spawn_position = DecodePoint(d.Find("spawnPosition"));
      if (!p.spawn_position) return std::nullopt;
    }
    return Payload{std::move(p)};
  }

  if (type == "unit_ability") {
    lockstep::UnitAbility p;
    auto unit = DecodeIdField(d, "unitId");
    if (!unit) return std::nullopt;
    p.unit_id = *unit;
    if (!DecodeOptionalInt(d, "abilityIndex", p.ability_index)) return std::nullopt;
    if (d.Find("direction")) {
      p.direction = DecodePoint(d.Find("direction"));
      if (!p.direction) return std::nullopt;
    }
    if (d.Find("targetPosition")) {
      p.target_position = DecodePoint(d.Find("targetPosition"));
      if (!p.target_position) return std::nullopt;
    }
    p.target_unit_id = DecodeIdField(d, "targetUnitId");
    return Payload{std::move(p)};
  }

  if (type == "mirror_control") {
    lockstep::MirrorControl p;
    auto index = DecodeInt(d, "mirrorIndex");
    auto action = d.GetString("action");
    if (!index || !action) return std::nullopt;
    p.mirror_index = *index;
    p.action = *action;
    if (const JsonValue* t = d.Find("linkTarget")) {
      auto link_type = t->GetString("type");
      if (!link_type) return std::nullopt;
      std::optional<int> link_index;
      if (!DecodeOptionalInt(*t, "index", link_index)) return std::nullopt;
      p.link_target = lockstep::LinkTarget{*link_type, link_index};
    }
    if (d.Find("position")) {
      p.position = DecodePoint(d.Find("position"));
      if (!p.position) return std::nullopt;
    }
    p.rotation = d.GetNumber("rotation");
    return Payload{std::move(p)};
  }

  if (type == "forge_move") {
    auto x = d.GetNumber("targetX");
    auto y = d.GetNumber("targetY");
    if (!x || !y) return std::nullopt;
    return Payload{lockstep::ForgeMove{*x, *y}};
  }

  if (type == "chat_message") {
    lockstep::ChatMessage p;
    auto message = d.GetString("message");
    if (!message) return std::nullopt;
    p.message = *message;
    p.channel = d.GetString("channel").value_or("all");
    p.target_player_id = d.GetString("targetPlayerId");
    return Payload{std::move(p)};
  }

  if (type == "surrender") {
    auto confirmed = d.GetBool("confirmed");
    if (!confirmed) return std::nullopt;
    return Payload{lockstep::Surrender{*confirmed}};
  }

  return std::nullopt;
}

void QuantizePoint(std::optional<Point>& p) {
  if (!p) return;
  p->x = round_coordinate(p->x);
  p->y = round_coordinate(p->y);
}

struct Quantizer {
  void operator()(lockstep::UnitMove& p) const {
    p.target_x = round_coordinate(p.target_x);
    p.target_y = round_coordinate(p.target_y);
  }
  void operator()(lockstep::BuildBuilding& p) const {
    p.x = round_coordinate(p.x);
    p.y = round_coordinate(p.y);
  }
  void operator()(lockstep::ProduceHero& p) const { QuantizePoint(p.spawn_position); }
  void operator()(lockstep::UnitAbility& p) const {
    QuantizePoint(p.direction);
    QuantizePoint(p.target_position);
  }
  void operator()(lockstep::MirrorControl& p) const {
    QuantizePoint(p.position);
    if (p.rotation) p.rotation = round_coordinate(*p.rotation);
  }
  void operator()(lockstep::ForgeMove& p) const {
    p.target_x = round_coordinate(p.target_x);
    p.target_y = round_coordinate(p.target_y);
  }
  template <typename T>
  void operator()(T&) const {}
};

}  // namespace

std::string abbreviate_command_type(const std::string& command_type) {
  const auto& table = Abbreviations();
  auto it = table.find(command_type);
  if (it != table.end()) return it->second;
  // Escape unknown tags that would otherwise read back as something else.
  if (Expansions().count(command_type) || (!command_type.empty() && command_type[0] == '!')) {
    return "!" + command_type;
  }
  return command_type;
}

std::string expand_command_type(const std::string& abbreviated) {
  if (!abbreviated.empty() && abbreviated[0] == '!') return abbreviated.substr(1);
  const auto& table = Expansions();
  auto it = table.find(abbreviated);
  return it == table.end() ? abbreviated : it->second;
}

double round_coordinate(double v) {
  if (!std::isfinite(v)) return v;
  return std::round(v * 10.0) / 10.0;
}

void quantize_coordinates(Payload& p) {
  std::visit(Quantizer{}, p);
}

JsonValue encode_payload(const Payload& p) {
  return std::visit(PayloadEncoder{}, p);
}

Payload decode_payload(const std::string& command_type, const JsonValue& d) {
  if (lockstep::IsKnownCommandType(command_type)) {
    auto known = DecodeKnown(command_type, d);
    if (known) return std::move(*known);
  }
  return Payload{lockstep::Unknown{command_type, json_stringify(d)}};
}

JsonValue encode_command(const lockstep::Command& c) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("tick", Num(static_cast<double>(c.tick)));
  o.Set("participantId", Str(c.participant_id));
  o.Set("commandType", Str(c.command_type));
  o.Set("payload", encode_payload(c.payload));
  return o;
}

std::optional<lockstep::Command> decode_command(const JsonValue& v) {
  auto tick = v.GetInt("tick");
  auto participant = v.GetString("participantId");
  auto type = v.GetString("commandType");
  if (!tick || !participant || !type) return std::nullopt;

  lockstep::Command c;
  c.tick = *tick;
  c.participant_id = *participant;
  c.command_type = *type;
  const JsonValue* payload = v.Find("payload");
  c.payload = decode_payload(c.command_type, payload ? *payload : JsonValue::MakeObject());
  return c;
}

std::string encode_command_json(const lockstep::Command& c) {
  return json_stringify(encode_command(c));
}

std::optional<lockstep::Command> decode_command_json(const std::string& text) {
  JsonValue v;
  if (!json_parse(text, v)) return std::nullopt;
  return decode_command(v);
}

JsonValue encode_compact_command(const lockstep::Command& c) {
  Payload quantized = c.payload;
  quantize_coordinates(quantized);

  JsonValue o = JsonValue::MakeObject();
  o.Set("t", Num(static_cast<double>(c.tick)));
  o.Set("p", Str(c.participant_id));
  o.Set("c", Str(abbreviate_command_type(c.command_type)));
  o.Set("d", encode_payload(quantized));
  return o;
}

std::optional<lockstep::Command> decode_compact_command(const JsonValue& v) {
  auto tick = v.GetInt("t");
  auto participant = v.GetString("p");
  auto abbreviated = v.GetString("c");
  if (!tick || !participant || !abbreviated) return std::nullopt;

  lockstep::Command c;
  c.tick = *tick;
  c.participant_id = *participant;
  c.command_type = expand_command_type(*abbreviated);
  const JsonValue* d = v.Find("d");
  c.payload = decode_payload(c.command_type, d ? *d : JsonValue::MakeObject());
  return c;
}

const char* MsgTypeName(MsgType t) {
  switch (t) {
    case MsgType::CommandBatch: return "command_batch";
    case MsgType::Ping: return "ping";
    case MsgType::Pong: return "pong";
  }
  return "unknown";
}

std::optional<MsgType> ParseMsgType(const std::string& name) {
  if (name == "command_batch") return MsgType::CommandBatch;
  if (name == "ping") return MsgType::Ping;
  if (name == "pong") return MsgType::Pong;
  return std::nullopt;
}

std::string encode_wire_message(const WireMessage& m) {
  JsonValue o = JsonValue::MakeObject();
  o.Set("type", Str(MsgTypeName(m.type)));
  o.Set("v", Num(m.version));
  o.Set("from", Str(m.from));
  if (m.type == MsgType::CommandBatch) {
    if (m.seq > 0) o.Set("seq", Num(static_cast<double>(m.seq)));
    JsonValue commands = JsonValue::MakeArray();
    for (const auto& c : m.commands) commands.Push(encode_compact_command(c));
    o.Set("commands", std::move(commands));
  } else {
    o.Set("id", Num(static_cast<double>(m.ping_id)));
    o.Set("sentAt", Num(static_cast<double>(m.sent_at_ms)));
  }
  return json_stringify(o);
}

std::optional<WireMessage> decode_wire_message(const std::string& text) {
  JsonValue v;
  if (!json_parse(text, v) || !v.IsObject()) return std::nullopt;
  auto type_name = v.GetString("type");
  if (!type_name) return std::nullopt;
  auto type = ParseMsgType(*type_name);
  if (!type) return std::nullopt;

  WireMessage m;
  m.type = *type;
  m.version = static_cast<int>(v.GetInt("v").value_or(kProtocolVersion));
  if (m.version != kProtocolVersion) return std::nullopt;
  m.from = v.GetString("from").value_or("");

  if (m.type == MsgType::CommandBatch) {
    const auto seq = v.GetInt("seq").value_or(0);
    if (seq < 0) return std::nullopt;
    m.seq = static_cast<uint64_t>(seq);
    const JsonValue* commands = v.Find("commands");
    if (!commands || !commands->IsArray()) return std::nullopt;
    for (const auto& entry : commands->array_values) {
      // Entries that do not even carry tick/participant/type are dropped here;
      // everything else goes on to the validator.
      auto c = entry.Find("t") ? decode_compact_command(entry) : decode_command(entry);
      if (c) m.commands.push_back(std::move(*c));
    }
  } else {
    m.ping_id = static_cast<uint64_t>(v.GetInt("id").value_or(0));
    m.sent_at_ms = v.GetInt("sentAt").value_or(0);
  }
  return m;
}

}  // namespace protocol
