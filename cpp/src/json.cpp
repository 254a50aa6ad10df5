#include "diagram_stream.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace diagram_stream {

// ---------------- Json helpers ----------------

bool Json::is_null() const { return std::holds_alternative<std::nullptr_t>(value); }
bool Json::is_bool() const { return std::holds_alternative<bool>(value); }
bool Json::is_number() const { return std::holds_alternative<double>(value); }
bool Json::is_string() const { return std::holds_alternative<std::string>(value); }
bool Json::is_array() const { return std::holds_alternative<JsonArray>(value); }
bool Json::is_object() const { return std::holds_alternative<JsonObject>(value); }

const bool& Json::as_bool() const { return std::get<bool>(value); }
const double& Json::as_number() const { return std::get<double>(value); }
const std::string& Json::as_string() const { return std::get<std::string>(value); }
const JsonArray& Json::as_array() const { return std::get<JsonArray>(value); }
const JsonObject& Json::as_object() const { return std::get<JsonObject>(value); }

JsonArray& Json::as_array() { return std::get<JsonArray>(value); }
JsonObject& Json::as_object() { return std::get<JsonObject>(value); }

static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          std::ostringstream oss;
          oss << "\\u";
          oss.setf(std::ios::hex, std::ios::basefield);
          oss.width(4);
          oss.fill('0');
          oss << (static_cast<int>(static_cast<unsigned char>(c)));
          out += oss.str();
        } else {
          out.push_back(c);
        }
    }
  }
  return out;
}

std::string dumps_json(const Json& value) {
  if (value.is_null()) return "null";
  if (value.is_bool()) return value.as_bool() ? "true" : "false";
  if (value.is_number()) {
    double n = value.as_number();
    if (!std::isfinite(n)) return "null";
    double intpart;
    if (std::modf(n, &intpart) == 0.0 && std::fabs(n) < 1e15) {
      std::ostringstream oss;
      oss.setf(std::ios::fixed);
      oss.precision(0);
      oss << n;
      return oss.str();
    }
    std::ostringstream oss;
    oss.precision(15);
    oss << n;
    return oss.str();
  }
  if (value.is_string()) return "\"" + json_escape(value.as_string()) + "\"";
  if (value.is_array()) {
    std::string out = "[";
    const auto& arr = value.as_array();
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i) out += ",";
      out += dumps_json(arr[i]);
    }
    out += "]";
    return out;
  }
  std::string out = "{";
  bool first = true;
  for (const auto& kv : value.as_object()) {
    if (!first) out += ",";
    first = false;
    out += "\"" + json_escape(kv.first) + "\":" + dumps_json(kv.second);
  }
  out += "}";
  return out;
}

// ---------------- JSON parser (strict) ----------------

namespace {

void append_utf8(std::string& out, unsigned long cp) {
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

struct Parser {
  static constexpr int kMaxDepth = 256;

  const std::string& s;
  size_t i{0};
  int depth{0};

  explicit Parser(const std::string& in) : s(in) {}

  void skip_ws() {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
  }

  [[noreturn]] void fail(const std::string& msg) const {
    throw std::runtime_error("JSON parse error: " + msg + " at offset " + std::to_string(i));
  }

  bool consume(char c) {
    skip_ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  Json parse_value() {
    skip_ws();
    if (i >= s.size()) fail("unexpected end");
    char c = s[i];
    if (c == '{') return parse_object();
    if (c == '[') return parse_array();
    if (c == '"') return Json(parse_string());
    if (c == 't') return parse_literal("true", Json(true));
    if (c == 'f') return parse_literal("false", Json(false));
    if (c == 'n') return parse_literal("null", Json(nullptr));
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return Json(parse_number());
    fail(std::string("unexpected char '") + c + "'");
  }

  void enter() {
    if (++depth > kMaxDepth) fail("nesting too deep");
  }

  Json parse_object() {
    if (!consume('{')) fail("expected {");
    enter();
    JsonObject obj;
    if (consume('}')) {
      --depth;
      return Json(obj);
    }
    while (true) {
      skip_ws();
      if (i >= s.size()) fail("unterminated object");
      if (s[i] != '"') fail("expected string key");
      std::string key = parse_string();
      if (!consume(':')) fail("expected :");
      Json val = parse_value();
      // Last duplicate wins.
      obj[key] = std::move(val);
      if (consume('}')) break;
      if (!consume(',')) fail("expected , or }");
    }
    --depth;
    return Json(obj);
  }

  Json parse_array() {
    if (!consume('[')) fail("expected [");
    enter();
    JsonArray arr;
    if (consume(']')) {
      --depth;
      return Json(arr);
    }
    while (true) {
      arr.push_back(parse_value());
      if (consume(']')) break;
      if (!consume(',')) fail("expected , or ]");
    }
    --depth;
    return Json(arr);
  }

  unsigned long parse_hex4() {
    if (i + 4 > s.size()) fail("bad \\u escape");
    unsigned long v = 0;
    for (int k = 0; k < 4; ++k) {
      char h = s[i++];
      v <<= 4;
      if (h >= '0' && h <= '9') v |= static_cast<unsigned long>(h - '0');
      else if (h >= 'a' && h <= 'f') v |= static_cast<unsigned long>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') v |= static_cast<unsigned long>(h - 'A' + 10);
      else fail("bad \\u escape");
    }
    return v;
  }

  std::string parse_string() {
    if (i >= s.size() || s[i] != '"') fail("expected quote");
    ++i;
    std::string out;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return out;
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (i >= s.size()) fail("bad escape");
      char e = s[i++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned long cp = parse_hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF && i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            unsigned long lo = parse_hex4();
            if (lo >= 0xDC00 && lo <= 0xDFFF) {
              cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
            } else {
              append_utf8(out, 0xFFFD);
              cp = lo;
            }
          }
          append_utf8(out, cp);
          break;
        }
        default:
          fail(std::string("unknown escape '\\") + e + "'");
      }
    }
    fail("unterminated string");
  }

  double parse_number() {
    size_t start = i;
    if (s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) fail("bad number");
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i < s.size() && s[i] == '.') {
      ++i;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    std::string num = s.substr(start, i - start);
    return std::strtod(num.c_str(), nullptr);
  }

  Json parse_literal(const char* word, Json result) {
    std::string w(word);
    if (s.compare(i, w.size(), w) == 0) {
      i += w.size();
      return result;
    }
    fail("expected " + w);
  }
};

}  // namespace

Json loads_json(const std::string& text) {
  Parser p(text);
  Json v = p.parse_value();
  p.skip_ws();
  if (p.i != text.size()) p.fail("trailing data");
  return v;
}

std::string json_string_or(const JsonObject& o, const std::string& key, const std::string& def) {
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_string()) return def;
  return it->second.as_string();
}

bool json_bool_or(const JsonObject& o, const std::string& key, bool def) {
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_bool()) return def;
  return it->second.as_bool();
}

std::optional<double> json_number_opt(const JsonObject& o, const std::string& key) {
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_number()) return std::nullopt;
  return it->second.as_number();
}

std::vector<std::string> json_string_list(const JsonObject& o, const std::string& key) {
  std::vector<std::string> out;
  auto it = o.find(key);
  if (it == o.end() || !it->second.is_array()) return out;
  for (const auto& v : it->second.as_array()) {
    if (v.is_string()) out.push_back(v.as_string());
  }
  return out;
}

std::string read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw DiagramStreamError("cannot open file: " + path, ErrorKind::Rejected);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

// ---------------- Errors ----------------

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::StreamTransport: return "stream_transport";
    case ErrorKind::Validation: return "validation";
    case ErrorKind::EmptyArtifact: return "empty_artifact";
    case ErrorKind::Persistence: return "persistence";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Rejected: return "rejected";
  }
  return "unknown";
}

}  // namespace diagram_stream
