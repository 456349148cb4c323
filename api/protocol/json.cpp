#include "json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>

namespace protocol {
namespace {

constexpr int kMaxDepth = 64;

void skip_ws(const std::string& s, size_t& i) {
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n')) ++i;
}

void append_utf8(std::string& out, uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

bool parse_value(const std::string& s, size_t& i, JsonValue& out, int depth);

bool parse_hex4(const std::string& s, size_t& i, uint32_t& cp) {
  if (i + 4 > s.size()) return false;
  cp = 0;
  for (int k = 0; k < 4; ++k) {
    char h = s[i++];
    cp <<= 4;
    if (h >= '0' && h <= '9') cp |= static_cast<uint32_t>(h - '0');
    else if (h >= 'a' && h <= 'f') cp |= static_cast<uint32_t>(h - 'a' + 10);
    else if (h >= 'A' && h <= 'F') cp |= static_cast<uint32_t>(h - 'A' + 10);
    else return false;
  }
  return true;
}

bool parse_string(const std::string& s, size_t& i, std::string& out) {
  if (i >= s.size() || s[i] != '"') return false;
  ++i;
  while (i < s.size()) {
    char c = s[i++];
    if (c == '"') return true;
    if (c != '\\') {
      out.push_back(c);
      continue;
    }
    if (i >= s.size()) return false;
    char esc = s[i++];
    switch (esc) {
      case '"': out.push_back('"'); break;
      case '\\': out.push_back('\\'); break;
      case '/': out.push_back('/'); break;
      case 'b': out.push_back('\b'); break;
      case 'f': out.push_back('\f'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'u': {
        uint32_t cp = 0;
        if (!parse_hex4(s, i, cp)) return false;
        if (cp >= 0xDC00 && cp <= 0xDFFF) return false;
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          // High surrogate; a \uDC00-\uDFFF escape must follow.
          uint32_t low = 0;
          if (i + 2 > s.size() || s[i] != '\\' || s[i + 1] != 'u') return false;
          i += 2;
          if (!parse_hex4(s, i, low) || low < 0xDC00 || low > 0xDFFF) return false;
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
        }
        append_utf8(out, cp);
        break;
      }
      default:
        return false;
    }
  }
  return false;
}

bool parse_number(const std::string& s, size_t& i, double& out) {
  size_t start = i;
  if (i < s.size() && s[i] == '-') ++i;
  size_t digits = i;
  while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
  if (i == digits) return false;
  if (i < s.size() && s[i] == '.') {
    ++i;
    size_t frac = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == frac) return false;
  }
  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
    size_t exp = i;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == exp) return false;
  }
  const std::string token = s.substr(start, i - start);
  char* end = nullptr;
  out = std::strtod(token.c_str(), &end);
  return end != nullptr && *end == '\0' && std::isfinite(out);
}

bool parse_literal(const std::string& s, size_t& i, const char* lit) {
  size_t n = std::char_traits<char>::length(lit);
  if (s.compare(i, n, lit) != 0) return false;
  i += n;
  return true;
}

bool parse_array(const std::string& s, size_t& i, JsonValue& out, int depth) {
  ++i;
  out = JsonValue::MakeArray();
  skip_ws(s, i);
  if (i < s.size() && s[i] == ']') {
    ++i;
    return true;
  }
  while (i < s.size()) {
    JsonValue elem;
    if (!parse_value(s, i, elem, depth + 1)) return false;
    out.array_values.push_back(std::move(elem));
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == ',') {
      ++i;
      continue;
    }
    if (s[i] == ']') {
      ++i;
      return true;
    }
    return false;
  }
  return false;
}

bool parse_object(const std::string& s, size_t& i, JsonValue& out, int depth) {
  ++i;
  out = JsonValue::MakeObject();
  skip_ws(s, i);
  if (i < s.size() && s[i] == '}') {
    ++i;
    return true;
  }
  while (i < s.size()) {
    skip_ws(s, i);
    std::string key;
    if (!parse_string(s, i, key)) return false;
    skip_ws(s, i);
    if (i >= s.size() || s[i] != ':') return false;
    ++i;
    JsonValue value;
    if (!parse_value(s, i, value, depth + 1)) return false;
    out.object_values[key] = std::move(value);
    skip_ws(s, i);
    if (i >= s.size()) return false;
    if (s[i] == ',') {
      ++i;
      continue;
    }
    if (s[i] == '}') {
      ++i;
      return true;
    }
    return false;
  }
  return false;
}

bool parse_value(const std::string& s, size_t& i, JsonValue& out, int depth) {
  if (depth > kMaxDepth) return false;
  skip_ws(s, i);
  if (i >= s.size()) return false;
  const char c = s[i];
  if (c == '{') return parse_object(s, i, out, depth);
  if (c == '[') return parse_array(s, i, out, depth);
  if (c == '"') {
    out = JsonValue::MakeString("");
    return parse_string(s, i, out.string_value);
  }
  if (c == 't') {
    out = JsonValue::MakeBool(true);
    return parse_literal(s, i, "true");
  }
  if (c == 'f') {
    out = JsonValue::MakeBool(false);
    return parse_literal(s, i, "false");
  }
  if (c == 'n') {
    out = JsonValue::MakeNull();
    return parse_literal(s, i, "null");
  }
  out = JsonValue::MakeNumber(0.0);
  return parse_number(s, i, out.number_value);
}

// Shortest text that strtod reads back to the same double.
std::string format_number(double v) {
  if (!std::isfinite(v)) return "0";
  if (v == std::floor(v) && std::fabs(v) < 9007199254740992.0) {
    std::ostringstream out;
    out << static_cast<int64_t>(v);
    return out.str();
  }
  char buf[40];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v) break;
  }
  return buf;
}

void stringify_into(const JsonValue& v, std::ostringstream& out) {
  switch (v.kind) {
    case JsonValue::Null: out << "null"; break;
    case JsonValue::Bool: out << (v.bool_value ? "true" : "false"); break;
    case JsonValue::Number: out << format_number(v.number_value); break;
    case JsonValue::String: out << "\"" << json_escape(v.string_value) << "\""; break;
    case JsonValue::Array: {
      out << "[";
      for (size_t i = 0; i < v.array_values.size(); ++i) {
        if (i > 0) out << ",";
        stringify_into(v.array_values[i], out);
      }
      out << "]";
      break;
    }
    case JsonValue::Object: {
      out << "{";
      bool first = true;
      for (const auto& kv : v.object_values) {
        if (!first) out << ",";
        first = false;
        out << "\"" << json_escape(kv.first) << "\":";
        stringify_into(kv.second, out);
      }
      out << "}";
      break;
    }
  }
}

}  // namespace

JsonValue JsonValue::MakeNull() {
  return JsonValue();
}

JsonValue JsonValue::MakeBool(bool v) {
  JsonValue j;
  j.kind = Bool;
  j.bool_value = v;
  return j;
}

JsonValue JsonValue::MakeNumber(double v) {
  JsonValue j;
  j.kind = Number;
  j.number_value = v;
  return j;
}

JsonValue JsonValue::MakeString(const std::string& v) {
  JsonValue j;
  j.kind = String;
  j.string_value = v;
  return j;
}

JsonValue JsonValue::MakeObject() {
  JsonValue j;
  j.kind = Object;
  return j;
}

JsonValue JsonValue::MakeArray() {
  JsonValue j;
  j.kind = Array;
  return j;
}

const JsonValue* JsonValue::Find(const std::string& key) const {
  if (kind != Object) return nullptr;
  auto it = object_values.find(key);
  return it == object_values.end() ? nullptr : &it->second;
}

JsonValue& JsonValue::Set(const std::string& key, JsonValue v) {
  kind = Object;
  return object_values[key] = std::move(v);
}

void JsonValue::Push(JsonValue v) {
  kind = Array;
  array_values.push_back(std::move(v));
}

std::optional<std::string> JsonValue::GetString(const std::string& key) const {
  const JsonValue* v = Find(key);
  if (!v || v->kind != String) return std::nullopt;
  return v->string_value;
}

std::optional<double> JsonValue::GetNumber(const std::string& key) const {
  const JsonValue* v = Find(key);
  if (!v || v->kind != Number) return std::nullopt;
  return v->number_value;
}

std::optional<int64_t> JsonValue::GetInt(const std::string& key) const {
  const JsonValue* v = Find(key);
  if (!v || v->kind != Number) return std::nullopt;
  if (v->number_value != std::floor(v->number_value)) return std::nullopt;
  if (std::fabs(v->number_value) >= 9007199254740992.0) return std::nullopt;
  return static_cast<int64_t>(v->number_value);
}

std::optional<bool> JsonValue::GetBool(const std::string& key) const {
  const JsonValue* v = Find(key);
  if (!v || v->kind != Bool) return std::nullopt;
  return v->bool_value;
}

bool JsonValue::operator==(const JsonValue& o) const {
  if (kind != o.kind) return false;
  switch (kind) {
    case Null: return true;
    case Bool: return bool_value == o.bool_value;
    case Number: return number_value == o.number_value;
    case String: return string_value == o.string_value;
    case Array: return array_values == o.array_values;
    case Object: return object_values == o.object_values;
  }
  return false;
}

bool json_parse(const std::string& text, JsonValue& out) {
  size_t i = 0;
  JsonValue parsed;
  if (!parse_value(text, i, parsed, 0)) return false;
  skip_ws(text, i);
  if (i != text.size()) return false;
  out = std::move(parsed);
  return true;
}

std::string json_stringify(const JsonValue& v) {
  std::ostringstream out;
  stringify_into(v, out);
  return out.str();
}

std::string json_escape(const std::string& in) {
  std::ostringstream out;
  for (unsigned char c : in) {
    switch (c) {
      case '\"': out << "\\\""; break;
      case '\\': out << "\\\\"; break;
      case '\b': out << "\\b"; break;
      case '\f': out << "\\f"; break;
      case '\n': out << "\\n"; break;
      case '\r': out << "\\r"; break;
      case '\t': out << "\\t"; break;
      default:
        if (c < 0x20) {
          out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
              << static_cast<int>(c) << std::dec;
        } else {
          out << static_cast<char>(c);
        }
    }
  }
  return out.str();
}

}  // namespace protocol
