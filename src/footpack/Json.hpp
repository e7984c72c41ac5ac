#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace footpack {

// Minimal JSON value representation and parser.
//
// Used for GeoJSON input, config files, the pack index, tile files and the
// canonical tile encoding. No third-party JSON library is involved so that
// the byte layout of everything we write stays under our control.
//
// The parser is strict (no comments or trailing commas) apart from the
// opt-in non-finite tokens below. Numbers are doubles; object members keep
// their document order.
//
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

struct JsonParseOptions {
  // Accept the non-standard tokens NaN, Infinity and -Infinity (as written by
  // Python's json module and by GeoPandas exports).
  bool allowNonFinite = false;
};

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError,
               const JsonParseOptions& opt = {});

// Read a whole file and parse it.
bool ParseJsonFile(const std::string& path, JsonValue& outValue, std::string& outError,
                   const JsonParseOptions& opt = {});

// Body of a JSON string literal, quotes not included.
// Non-ASCII bytes are passed through unchanged.
std::string JsonEscape(const std::string& s);

// Shortest round-trip decimal form of a finite double, laid out the way
// Python's repr(float) does it:
//   12.0 -> "12.0", 0.1 -> "0.1", 1e-05 -> "1e-05", 1e16 -> "1e+16", -0.0 -> "-0.0"
// Returns false for NaN/Inf.
bool FormatJsonNumber(double v, std::string& out);

struct JsonWriteOptions {
  // Pretty-print with newlines + indentation.
  bool pretty = true;

  // Spaces per indentation level when pretty-printing.
  int indent = 2;

  // Sort object keys lexicographically (JsonValue serialization only).
  bool sortKeys = false;

  // Compact mode only: use ", " and ": " instead of "," and ":".
  bool spacedSeparators = false;
};

// Serialize a JsonValue to a stream.
//
// Returns false on non-finite numbers (NaN/Inf) or stream failures.
bool WriteJson(std::ostream& os, const JsonValue& value, std::string& outError,
               const JsonWriteOptions& opt = {});

// Serialize a JsonValue to a string. Returns an empty string if the value
// contains a non-finite number.
std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt = {});

// -----------------------------------------------------------------------------------------------
// JsonWriter
//
// Streaming JSON writer used for large outputs (tile payloads, tile files,
// the pack index) without building a JsonValue tree first.
//
// Keys are written in call order. The first misuse (value without key,
// unbalanced end, non-finite number) latches error() and every later call
// returns false.
// -----------------------------------------------------------------------------------------------
class JsonWriter {
public:
  explicit JsonWriter(std::ostream& os, JsonWriteOptions opt = {});

  // Forget open containers and errors; the stream is left as is.
  void reset();

  bool ok() const { return m_error.empty(); }
  const std::string& error() const { return m_error; }

  const JsonWriteOptions& options() const { return m_opt; }

  bool beginObject();
  bool endObject();
  bool beginArray();
  bool endArray();

  // Object member key (must be inside an object).
  bool key(const std::string& k);

  bool nullValue();
  bool boolValue(bool b);
  bool numberValue(double n);
  bool intValue(std::int64_t n);
  bool uintValue(std::uint64_t n);
  bool stringValue(const std::string& s);

  // Serialize a JsonValue subtree in the current context.
  bool value(const JsonValue& v);

  // True once a complete top-level value has been written.
  bool finished() const { return m_finished; }

private:
  struct Frame {
    enum class Kind : std::uint8_t {
      Object,
      Array,
    };

    Kind kind = Kind::Object;
    bool first = true;
    // Only meaningful for objects: true when the next operation must be key().
    bool expectingKey = true;
  };

  bool setError(std::string msg);

  bool writeChar(char c);
  bool writeRaw(const std::string& s);

  void newlineIndent(std::size_t depth);

  bool prepareValue();
  bool finishValue();

  bool beginContainer(Frame::Kind kind, char openChar);
  bool endContainer(Frame::Kind kind, char closeChar);

  std::ostream* m_os = nullptr;
  JsonWriteOptions m_opt{};
  std::vector<Frame> m_stack;
  bool m_finished = false;
  std::string m_error;
};

} // namespace footpack
