#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace hazmap {

// Minimal JSON value representation, parser and writers.
//
// Zone files, engine config overrides and GeoJSON output all go through here so
// the library stays free of third-party JSON code.
//
// Notes:
//  - Strict JSON: no comments, no trailing commas.
//  - Numbers are parsed as double.
//  - Objects are stored as an ordered list of key/value pairs (input order is preserved).
//  - \uXXXX escapes (including surrogate pairs) decode to UTF-8.
struct JsonValue {
  enum class Type : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object,
  };

  Type type = Type::Null;

  bool boolValue = false;
  double numberValue = 0.0;
  std::string stringValue;
  std::vector<JsonValue> arrayValue;
  std::vector<std::pair<std::string, JsonValue>> objectValue;

  static JsonValue MakeNull();
  static JsonValue MakeBool(bool b);
  static JsonValue MakeNumber(double n);
  static JsonValue MakeString(std::string s);
  static JsonValue MakeArray();
  static JsonValue MakeObject();

  bool isNull() const { return type == Type::Null; }
  bool isBool() const { return type == Type::Bool; }
  bool isNumber() const { return type == Type::Number; }
  bool isString() const { return type == Type::String; }
  bool isArray() const { return type == Type::Array; }
  bool isObject() const { return type == Type::Object; }
};

const JsonValue* FindJsonMember(const JsonValue& obj, const std::string& key);
JsonValue* FindJsonMember(JsonValue& obj, const std::string& key);

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError);

// Read and parse a whole file.
bool LoadJsonFile(const std::string& path, JsonValue& outValue, std::string& outError);

// Escape a string to be used inside a JSON string literal (without surrounding quotes).
std::string JsonEscape(const std::string& s);

// Shortest decimal text that round-trips to the same double ("1", "0.6", "-97.540496").
// Callers must reject non-finite values first.
std::string JsonNumberText(double v);

struct JsonWriteOptions {
  bool pretty = true;
  int indent = 2;
};

// Serialize a JsonValue. Returns false on non-finite numbers or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError, const JsonWriteOptions& opt = {});

bool WriteJsonFile(const std::string& path, const JsonValue& value, std::string& outError,
                   const JsonWriteOptions& opt = {});

// Streaming writer used by exporters that never build a JsonValue tree
// (GeoJSON, zone files, config dumps).
//
// Callers control key order. On misuse (a value where a key is expected,
// unbalanced containers, NaN) the writer stores an error and every later call
// returns false.
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  // True once a complete top-level value has been written.
  bool finished() const { return m_finished; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool stringValue(const std::string& s);

  // Write a whole JsonValue subtree in the current context.
  bool value(const JsonValue& v);

  // Convenience: key + value.
  bool member(const std::string& k, double n) { return key(k) && numberValue(n); }
  bool member(const std::string& k, const std::string& s) { return key(k) && stringValue(s); }

private:
  enum class Kind : std::uint8_t { Object, Array };

  struct Frame {
    Kind kind = Kind::Object;
    bool first = true;
    bool expectingKey = true;
  };

  bool setError(std::string msg);
  bool writeRaw(const std::string& s);
  void newlineIndent(std::size_t depth);

  bool prepareValue();
  void finishValue();

  bool beginContainer(Kind kind, char open);
  bool endContainer(Kind kind, char close);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace hazmap
