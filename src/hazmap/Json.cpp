#include "hazmap/Json.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <sstream>
#include <system_error>

namespace hazmap {

JsonValue JsonValue::MakeNull()
{
  return JsonValue{};
}

JsonValue JsonValue::MakeBool(bool b)
{
  JsonValue v;
  v.type = Type::Bool;
  v.boolValue = b;
  return v;
}

JsonValue JsonValue::MakeNumber(double n)
{
  JsonValue v;
  v.type = Type::Number;
  v.numberValue = n;
  return v;
}

JsonValue JsonValue::MakeString(std::string s)
{
  JsonValue v;
  v.type = Type::String;
  v.stringValue = std::move(s);
  return v;
}

JsonValue JsonValue::MakeArray()
{
  JsonValue v;
  v.type = Type::Array;
  return v;
}

JsonValue JsonValue::MakeObject()
{
  JsonValue v;
  v.type = Type::Object;
  return v;
}

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (const auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

JsonValue* FindJsonMember(JsonValue& obj, const std::string& key)
{
  if (!obj.isObject()) return nullptr;
  for (auto& kv : obj.objectValue) {
    if (kv.first == key) return &kv.second;
  }
  return nullptr;
}

std::string JsonEscape(const std::string& s)
{
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(s.size() + 2);
  for (unsigned char ch : s) {
    switch (ch) {
    case '\\': out += "\\\\"; break;
    case '"': out += "\\\""; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (ch < 0x20) {
        out += "\\u00";
        out.push_back(kHex[(ch >> 4) & 0xF]);
        out.push_back(kHex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

std::string JsonNumberText(double v)
{
  if (v == 0.0) return "0"; // also folds -0
  char buf[64];
  const std::to_chars_result r = std::to_chars(buf, buf + sizeof(buf), v);
  if (r.ec != std::errc()) {
    std::ostringstream oss;
    oss.precision(17);
    oss << v;
    return oss.str();
  }
  return std::string(buf, r.ptr);
}

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7Fu) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FFu) {
    out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else if (cp <= 0xFFFFu) {
    out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
  }
}

class Parser {
public:
  explicit Parser(const std::string& text) : m_s(text) {}

  const std::string& error() const { return m_err; }
  std::size_t pos() const { return m_i; }

  void skipWs()
  {
    while (m_i < m_s.size()) {
      const char c = m_s[m_i];
      if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
      ++m_i;
    }
  }

  bool parseValue(JsonValue& out, int depth)
  {
    if (depth > kMaxDepth) return fail("nesting too deep");
    skipWs();
    const char c = peek();
    if (c == '\0' && m_i >= m_s.size()) return fail("unexpected end of input");

    if (c == 'n') return parseLiteral("null", JsonValue::MakeNull(), out);
    if (c == 't') return parseLiteral("true", JsonValue::MakeBool(true), out);
    if (c == 'f') return parseLiteral("false", JsonValue::MakeBool(false), out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[') return parseArray(out, depth);
    if (c == '{') return parseObject(out, depth);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

private:
  static constexpr int kMaxDepth = 256;

  char peek() const { return m_i < m_s.size() ? m_s[m_i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++m_i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    std::ostringstream oss;
    oss << "JSON parse error @" << m_i << ": " << msg;
    m_err = oss.str();
    return false;
  }

  bool parseLiteral(const char* word, JsonValue v, JsonValue& out)
  {
    const std::string w(word);
    if (m_s.compare(m_i, w.size(), w) != 0) return fail("expected '" + w + "'");
    m_i += w.size();
    out = std::move(v);
    return true;
  }

  bool digits()
  {
    if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return false;
    while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++m_i;
    return true;
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = m_i;
    consume('-');
    if (!consume('0')) {
      if (!digits()) return fail("expected digit");
    }
    if (consume('.')) {
      if (!digits()) return fail("expected digit after '.'");
    }
    if (peek() == 'e' || peek() == 'E') {
      ++m_i;
      if (peek() == '+' || peek() == '-') ++m_i;
      if (!digits()) return fail("expected exponent digits");
    }

    const std::string numStr = m_s.substr(start, m_i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    if (errno == ERANGE && std::isinf(v)) return fail("number out of range");
    if (end == numStr.c_str() || *end != '\0') return fail("invalid number");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (m_i + 4 > m_s.size()) return fail("invalid \\u escape");
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = m_s[m_i++];
      out <<= 4;
      if (h >= '0' && h <= '9') out |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') out |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') out |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    return true;
  }

  bool parseString(std::string& out)
  {
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (m_i < m_s.size()) {
      const char c = m_s[m_i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20) return fail("control character in string");
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (m_i >= m_s.size()) return fail("unterminated escape sequence");
      const char e = m_s[m_i++];
      switch (e) {
      case '"': result.push_back('"'); break;
      case '\\': result.push_back('\\'); break;
      case '/': result.push_back('/'); break;
      case 'b': result.push_back('\b'); break;
      case 'f': result.push_back('\f'); break;
      case 'n': result.push_back('\n'); break;
      case 'r': result.push_back('\r'); break;
      case 't': result.push_back('\t'); break;
      case 'u': {
        std::uint32_t cp = 0;
        if (!parseHex4(cp)) return false;
        if (cp >= 0xD800u && cp <= 0xDBFFu) {
          std::uint32_t lo = 0;
          if (m_s.compare(m_i, 2, "\\u") != 0) return fail("unpaired high surrogate");
          m_i += 2;
          if (!parseHex4(lo)) return false;
          if (lo < 0xDC00u || lo > 0xDFFFu) return fail("invalid low surrogate");
          cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
        } else if (cp >= 0xDC00u && cp <= 0xDFFFu) {
          return fail("unpaired low surrogate");
        }
        AppendUtf8(result, cp);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out, int depth)
  {
    consume('[');
    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v, depth + 1)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out, int depth)
  {
    consume('{');
    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      skipWs();
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val, depth + 1)) return false;
      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }

  const std::string& m_s;
  std::size_t m_i = 0;
  std::string m_err;
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError)
{
  Parser p(text);
  JsonValue v;
  if (!p.parseValue(v, 0)) {
    outError = p.error();
    return false;
  }
  p.skipWs();
  if (p.pos() != text.size()) {
    outError = "JSON parse error @" + std::to_string(p.pos()) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "failed to read file: " + path;
    return false;
  }

  std::string err;
  if (!ParseJson(oss.str(), outValue, err)) {
    outError = path + ": " + err;
    return false;
  }
  outError.clear();
  return true;
}

bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt)
{
  JsonWriter w(os, opt);
  if (!w.value(value)) {
    outError = w.error();
    return false;
  }
  if (opt.pretty) os << '\n';
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  return true;
}

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt)
{
  std::ofstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open file for writing: " + path;
    return false;
  }
  return WriteJson(f, value, outError, opt);
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

bool JsonWriter::writeRaw(const std::string& s)
{
  (*m_os) << s;
  if (!(*m_os)) return setError("stream write failed");
  return true;
}

void JsonWriter::newlineIndent(std::size_t depth)
{
  if (!m_opt.pretty) return;
  (*m_os) << '\n';
  const std::size_t n = depth * static_cast<std::size_t>(m_opt.indent > 0 ? m_opt.indent : 0);
  for (std::size_t i = 0; i < n; ++i) (*m_os) << ' ';
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_stack.empty()) {
    if (m_finished) return setError("JsonWriter: multiple top-level values");
    return true;
  }

  Frame& f = m_stack.back();
  if (f.kind == Kind::Object) {
    if (f.expectingKey) return setError("JsonWriter: expected key() before value");
    return true;
  }

  if (!f.first) (*m_os) << ',';
  newlineIndent(m_stack.size());
  f.first = false;
  return true;
}

void JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return;
  }
  Frame& f = m_stack.back();
  if (f.kind == Kind::Object) f.expectingKey = true;
}

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Kind::Object) return setError("JsonWriter: key() outside object");
  Frame& f = m_stack.back();
  if (!f.expectingKey) return setError("JsonWriter: key() called twice");

  if (!f.first) (*m_os) << ',';
  newlineIndent(m_stack.size());
  f.first = false;
  f.expectingKey = false;
  return writeRaw("\"" + JsonEscape(k) + (m_opt.pretty ? "\": " : "\":"));
}

bool JsonWriter::beginContainer(Kind kind, char open)
{
  if (!prepareValue()) return false;
  (*m_os) << open;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return true;
}

bool JsonWriter::endContainer(Kind kind, char close)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: unbalanced container");
  const Frame f = m_stack.back();
  if (kind == Kind::Object && !f.expectingKey) return setError("JsonWriter: key without value");
  m_stack.pop_back();
  if (!f.first) newlineIndent(m_stack.size());
  (*m_os) << close;
  finishValue();
  return true;
}

bool JsonWriter::beginObject() { return beginContainer(Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Kind::Array, ']'); }

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  if (!writeRaw("null")) return false;
  finishValue();
  return true;
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  if (!writeRaw(b ? "true" : "false")) return false;
  finishValue();
  return true;
}

bool JsonWriter::numberValue(double n)
{
  if (!std::isfinite(n)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  if (!writeRaw(JsonNumberText(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  if (!writeRaw(std::to_string(n))) return false;
  finishValue();
  return true;
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  if (!writeRaw("\"" + JsonEscape(s) + "\"")) return false;
  finishValue();
  return true;
}

bool JsonWriter::value(const JsonValue& v)
{
  switch (v.type) {
  case JsonValue::Type::Null: return nullValue();
  case JsonValue::Type::Bool: return boolValue(v.boolValue);
  case JsonValue::Type::Number: return numberValue(v.numberValue);
  case JsonValue::Type::String: return stringValue(v.stringValue);
  case JsonValue::Type::Array:
    if (!beginArray()) return false;
    for (const JsonValue& e : v.arrayValue) {
      if (!value(e)) return false;
    }
    return endArray();
  case JsonValue::Type::Object:
    if (!beginObject()) return false;
    for (const auto& kv : v.objectValue) {
      if (!key(kv.first) || !value(kv.second)) return false;
    }
    return endObject();
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace hazmap
