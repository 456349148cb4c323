#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

struct JsonValue {
  enum Kind { Null, Bool, Number, String, Object, Array };

  Kind kind = Null;
  bool bool_value = false;
  double number_value = 0.0;
  std::string string_value;
  // Ordered keys keep serialization byte-identical on every peer.
  std::map<std::string, JsonValue> object_values;
  std::vector<JsonValue> array_values;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool v);
  static JsonValue MakeNumber(double v);
  static JsonValue MakeString(const std::string& v);
  static JsonValue MakeObject();
  static JsonValue MakeArray();

  bool IsObject() const { return kind == Object; }
  bool IsArray() const { return kind == Array; }

  // Object helpers; Find returns nullptr when absent or when this is not an object.
  const JsonValue* Find(const std::string& key) const;
  JsonValue& Set(const std::string& key, JsonValue v);
  void Push(JsonValue v);

  std::optional<std::string> GetString(const std::string& key) const;
  std::optional<double> GetNumber(const std::string& key) const;
  std::optional<int64_t> GetInt(const std::string& key) const;
  std::optional<bool> GetBool(const std::string& key) const;

  bool operator==(const JsonValue& o) const;
};

// Strict enough for wire input: rejects trailing garbage and malformed tokens.
bool json_parse(const std::string& text, JsonValue& out);
std::string json_stringify(const JsonValue& v);
std::string json_escape(const std::string& in);

}  // namespace protocol
