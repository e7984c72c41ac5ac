#include "footpack/Json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>
#include <system_error>

namespace footpack {

JsonValue JsonValue::MakeNull()
{
  JsonValue v;
  v.type = Type::Null;
  return v;
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
  static const char* hex = "0123456789abcdef";
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
        out.push_back(hex[(ch >> 4) & 0xF]);
        out.push_back(hex[ch & 0xF]);
      } else {
        out.push_back(static_cast<char>(ch));
      }
      break;
    }
  }
  return out;
}

bool FormatJsonNumber(double v, std::string& out)
{
  out.clear();
  if (!std::isfinite(v)) return false;

  // Shortest round-trip digits, then re-layout with Python's repr rules.
  char buf[64];
  const auto res = std::to_chars(buf, buf + sizeof(buf), std::fabs(v), std::chars_format::scientific);
  if (res.ec != std::errc()) return false;

  const std::string sci(buf, res.ptr);
  const std::size_t epos = sci.find('e');
  if (epos == std::string::npos) return false;

  std::string digits;
  digits.reserve(epos);
  for (std::size_t i = 0; i < epos; ++i) {
    if (sci[i] != '.') digits.push_back(sci[i]);
  }

  int exp = 0;
  {
    const char* p = sci.data() + epos + 1;
    const char* end = sci.data() + sci.size();
    bool neg = false;
    if (p < end && (*p == '+' || *p == '-')) {
      neg = (*p == '-');
      ++p;
    }
    const auto er = std::from_chars(p, end, exp, 10);
    if (er.ec != std::errc() || er.ptr != end) return false;
    if (neg) exp = -exp;
  }

  if (std::signbit(v)) out.push_back('-');

  const int ndigits = static_cast<int>(digits.size());
  const int decpt = exp + 1;

  if (decpt <= -4 || decpt > 16) {
    out.push_back(digits[0]);
    if (ndigits > 1) {
      out.push_back('.');
      out.append(digits, 1, std::string::npos);
    }
    out.push_back('e');
    out.push_back(exp < 0 ? '-' : '+');
    const int a = exp < 0 ? -exp : exp;
    if (a < 10) out.push_back('0');
    out += std::to_string(a);
    return true;
  }

  if (decpt <= 0) {
    out += "0.";
    out.append(static_cast<std::size_t>(-decpt), '0');
    out += digits;
  } else if (decpt >= ndigits) {
    out += digits;
    out.append(static_cast<std::size_t>(decpt - ndigits), '0');
    out += ".0";
  } else {
    out.append(digits, 0, static_cast<std::size_t>(decpt));
    out.push_back('.');
    out.append(digits, static_cast<std::size_t>(decpt), std::string::npos);
  }
  return true;
}

namespace {

void AppendUtf8(std::string& out, std::uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
  } else if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0xFFFF) {
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
  const std::string& s;
  JsonParseOptions opt;
  std::size_t i = 0;
  std::string err;

  Parser(const std::string& str, const JsonParseOptions& o) : s(str), opt(o) {}

  void skipWs()
  {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])) != 0) ++i;
  }

  char peek() const { return i < s.size() ? s[i] : '\0'; }

  bool consume(char c)
  {
    if (peek() != c) return false;
    ++i;
    return true;
  }

  bool fail(const std::string& msg)
  {
    std::ostringstream oss;
    oss << "JSON parse error @" << i << ": " << msg;
    err = oss.str();
    return false;
  }

  bool parseValue(JsonValue& out)
  {
    skipWs();
    const char c = peek();
    if (c == '\0') return fail("unexpected end of input");

    if (c == 'n') return parseNull(out);
    if (c == 't' || c == 'f') return parseBool(out);
    if (c == '"') {
      std::string tmp;
      if (!parseString(tmp)) return false;
      out = JsonValue::MakeString(std::move(tmp));
      return true;
    }
    if (c == '[') return parseArray(out);
    if (c == '{') return parseObject(out);
    if (c == 'N' || c == 'I') return parseNonFinite(out);
    if (c == '-' && s.compare(i, 9, "-Infinity") == 0) return parseNonFinite(out);
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) return parseNumber(out);

    return fail(std::string("unexpected character '") + c + "'");
  }

  bool parseNull(JsonValue& out)
  {
    if (s.compare(i, 4, "null") != 0) return fail("expected 'null'");
    i += 4;
    out = JsonValue::MakeNull();
    return true;
  }

  bool parseBool(JsonValue& out)
  {
    if (s.compare(i, 4, "true") == 0) {
      i += 4;
      out = JsonValue::MakeBool(true);
      return true;
    }
    if (s.compare(i, 5, "false") == 0) {
      i += 5;
      out = JsonValue::MakeBool(false);
      return true;
    }
    return fail("expected boolean");
  }

  bool parseNonFinite(JsonValue& out)
  {
    if (!opt.allowNonFinite) return fail("non-finite number literal");
    if (s.compare(i, 3, "NaN") == 0) {
      i += 3;
      out = JsonValue::MakeNumber(std::numeric_limits<double>::quiet_NaN());
      return true;
    }
    if (s.compare(i, 8, "Infinity") == 0) {
      i += 8;
      out = JsonValue::MakeNumber(std::numeric_limits<double>::infinity());
      return true;
    }
    if (s.compare(i, 9, "-Infinity") == 0) {
      i += 9;
      out = JsonValue::MakeNumber(-std::numeric_limits<double>::infinity());
      return true;
    }
    return fail("invalid literal");
  }

  bool parseNumber(JsonValue& out)
  {
    const std::size_t start = i;

    if (peek() == '-') ++i;

    if (peek() == '0') {
      ++i;
    } else {
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == '.') {
      ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected digit after '.'");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    if (peek() == 'e' || peek() == 'E') {
      ++i;
      if (peek() == '+' || peek() == '-') ++i;
      if (std::isdigit(static_cast<unsigned char>(peek())) == 0) return fail("expected exponent digits");
      while (std::isdigit(static_cast<unsigned char>(peek())) != 0) ++i;
    }

    const std::string numStr = s.substr(start, i - start);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(numStr.c_str(), &end);
    // ERANGE on underflow still yields a usable (denormal/zero) value.
    if (end == numStr.c_str() || (end && *end != '\0')) return fail("invalid number");
    if (errno == ERANGE && std::isinf(v)) return fail("number out of range");

    out = JsonValue::MakeNumber(v);
    return true;
  }

  bool parseHex4(std::uint32_t& out)
  {
    if (i + 4 > s.size()) return fail("invalid \\u escape");
    std::uint32_t code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = s[i++];
      code <<= 4;
      if (h >= '0' && h <= '9') code |= static_cast<std::uint32_t>(h - '0');
      else if (h >= 'a' && h <= 'f') code |= static_cast<std::uint32_t>(h - 'a' + 10);
      else if (h >= 'A' && h <= 'F') code |= static_cast<std::uint32_t>(h - 'A' + 10);
      else return fail("invalid hex digit in \\u escape");
    }
    out = code;
    return true;
  }

  bool parseString(std::string& out)
  {
    skipWs();
    if (!consume('"')) return fail("expected string");

    std::string result;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') {
        out = std::move(result);
        return true;
      }
      if (c != '\\') {
        result.push_back(c);
        continue;
      }

      if (i >= s.size()) return fail("unterminated escape sequence");
      const char e = s[i++];
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
        std::uint32_t code = 0;
        if (!parseHex4(code)) return false;
        if (code >= 0xD800 && code <= 0xDBFF) {
          // High surrogate: combine with a following low surrogate if present.
          std::uint32_t low = 0;
          if (s.compare(i, 2, "\\u") == 0) {
            i += 2;
            if (!parseHex4(low)) return false;
            if (low >= 0xDC00 && low <= 0xDFFF) {
              code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
            } else {
              AppendUtf8(result, 0xFFFD);
              code = low;
            }
          } else {
            code = 0xFFFD;
          }
        }
        AppendUtf8(result, code);
        break;
      }
      default: return fail("unknown escape sequence");
      }
    }

    return fail("unterminated string");
  }

  bool parseArray(JsonValue& out)
  {
    if (!consume('[')) return fail("expected '['");

    JsonValue arr = JsonValue::MakeArray();
    skipWs();
    if (consume(']')) {
      out = std::move(arr);
      return true;
    }

    while (true) {
      JsonValue v;
      if (!parseValue(v)) return false;
      arr.arrayValue.push_back(std::move(v));

      skipWs();
      if (consume(']')) break;
      if (!consume(',')) return fail("expected ',' or ']'");
    }

    out = std::move(arr);
    return true;
  }

  bool parseObject(JsonValue& out)
  {
    if (!consume('{')) return fail("expected '{'");

    JsonValue obj = JsonValue::MakeObject();
    skipWs();
    if (consume('}')) {
      out = std::move(obj);
      return true;
    }

    while (true) {
      std::string key;
      if (!parseString(key)) return false;

      skipWs();
      if (!consume(':')) return fail("expected ':'");

      JsonValue val;
      if (!parseValue(val)) return false;

      obj.objectValue.emplace_back(std::move(key), std::move(val));

      skipWs();
      if (consume('}')) break;
      if (!consume(',')) return fail("expected ',' or '}'");
    }

    out = std::move(obj);
    return true;
  }
};

} // namespace

bool ParseJson(const std::string& text, JsonValue& outValue, std::string& outError, const JsonParseOptions& opt)
{
  Parser p(text, opt);
  JsonValue v;
  if (!p.parseValue(v)) {
    outError = p.err;
    return false;
  }
  p.skipWs();
  if (p.i != text.size()) {
    outError = "JSON parse error @" + std::to_string(p.i) + ": trailing characters";
    return false;
  }

  outValue = std::move(v);
  outError.clear();
  return true;
}

bool ParseJsonFile(const std::string& path, JsonValue& outValue, std::string& outError,
                   const JsonParseOptions& opt)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    outError = "failed to open: " + path;
    return false;
  }
  std::ostringstream oss;
  oss << f.rdbuf();
  if (f.bad()) {
    outError = "failed while reading: " + path;
    return false;
  }

  std::string err;
  if (!ParseJson(oss.str(), outValue, err, opt)) {
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
  if (!os) {
    outError = "stream write failed";
    return false;
  }
  outError.clear();
  return true;
}

std::string JsonStringify(const JsonValue& value, const JsonWriteOptions& opt)
{
  std::ostringstream oss;
  std::string err;
  if (!WriteJson(oss, value, err, opt)) return std::string();
  return oss.str();
}

// -----------------------------------------------------------------------------------------------
// JsonWriter
// -----------------------------------------------------------------------------------------------

JsonWriter::JsonWriter(std::ostream& os, JsonWriteOptions opt) : m_os(&os), m_opt(opt) {}

void JsonWriter::reset()
{
  m_stack.clear();
  m_finished = false;
  m_error.clear();
}

bool JsonWriter::setError(std::string msg)
{
  if (m_error.empty()) m_error = std::move(msg);
  return false;
}

bool JsonWriter::writeChar(char c)
{
  m_os->put(c);
  if (!*m_os) return setError("stream write failed");
  return true;
}

bool JsonWriter::writeRaw(const std::string& s)
{
  m_os->write(s.data(), static_cast<std::streamsize>(s.size()));
  if (!*m_os) return setError("stream write failed");
  return true;
}

void JsonWriter::newlineIndent(std::size_t depth)
{
  m_os->put('\n');
  const std::size_t n = depth * static_cast<std::size_t>(std::max(0, m_opt.indent));
  for (std::size_t k = 0; k < n; ++k) m_os->put(' ');
}

bool JsonWriter::prepareValue()
{
  if (!ok()) return false;
  if (m_finished) return setError("JsonWriter: multiple top-level values");
  if (m_stack.empty()) return true;

  Frame& top = m_stack.back();
  if (top.kind == Frame::Kind::Object) {
    if (top.expectingKey) return setError("JsonWriter: object value written without key");
    return true;
  }

  if (!top.first) {
    if (!writeChar(',')) return false;
    if (!m_opt.pretty && m_opt.spacedSeparators && !writeChar(' ')) return false;
  }
  if (m_opt.pretty) newlineIndent(m_stack.size());
  top.first = false;
  return ok();
}

bool JsonWriter::finishValue()
{
  if (m_stack.empty()) {
    m_finished = true;
    return true;
  }
  Frame& top = m_stack.back();
  if (top.kind == Frame::Kind::Object) top.expectingKey = true;
  return true;
}

bool JsonWriter::beginContainer(Frame::Kind kind, char openChar)
{
  if (!prepareValue()) return false;
  if (!writeChar(openChar)) return false;
  Frame f;
  f.kind = kind;
  m_stack.push_back(f);
  return true;
}

bool JsonWriter::endContainer(Frame::Kind kind, char closeChar)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != kind) return setError("JsonWriter: mismatched container end");
  const Frame f = m_stack.back();
  if (f.kind == Frame::Kind::Object && !f.expectingKey) return setError("JsonWriter: key without value");
  m_stack.pop_back();
  if (m_opt.pretty && !f.first) newlineIndent(m_stack.size());
  if (!writeChar(closeChar)) return false;
  return finishValue();
}

bool JsonWriter::beginObject() { return beginContainer(Frame::Kind::Object, '{'); }
bool JsonWriter::endObject() { return endContainer(Frame::Kind::Object, '}'); }
bool JsonWriter::beginArray() { return beginContainer(Frame::Kind::Array, '['); }
bool JsonWriter::endArray() { return endContainer(Frame::Kind::Array, ']'); }

bool JsonWriter::key(const std::string& k)
{
  if (!ok()) return false;
  if (m_stack.empty() || m_stack.back().kind != Frame::Kind::Object) {
    return setError("JsonWriter: key outside of object");
  }
  Frame& top = m_stack.back();
  if (!top.expectingKey) return setError("JsonWriter: key written twice");

  if (!top.first) {
    if (!writeChar(',')) return false;
    if (!m_opt.pretty && m_opt.spacedSeparators && !writeChar(' ')) return false;
  }
  if (m_opt.pretty) newlineIndent(m_stack.size());
  top.first = false;

  if (!writeChar('"')) return false;
  if (!writeRaw(JsonEscape(k))) return false;
  if (!writeChar('"')) return false;
  if (!writeChar(':')) return false;
  if ((m_opt.pretty || m_opt.spacedSeparators) && !writeChar(' ')) return false;

  top.expectingKey = false;
  return true;
}

bool JsonWriter::nullValue()
{
  if (!prepareValue()) return false;
  if (!writeRaw("null")) return false;
  return finishValue();
}

bool JsonWriter::boolValue(bool b)
{
  if (!prepareValue()) return false;
  if (!writeRaw(b ? "true" : "false")) return false;
  return finishValue();
}

bool JsonWriter::numberValue(double n)
{
  std::string text;
  if (!FormatJsonNumber(n, text)) return setError("JsonWriter: non-finite number");
  if (!prepareValue()) return false;
  if (!writeRaw(text)) return false;
  return finishValue();
}

bool JsonWriter::intValue(std::int64_t n)
{
  if (!prepareValue()) return false;
  if (!writeRaw(std::to_string(n))) return false;
  return finishValue();
}

bool JsonWriter::uintValue(std::uint64_t n)
{
  if (!prepareValue()) return false;
  if (!writeRaw(std::to_string(n))) return false;
  return finishValue();
}

bool JsonWriter::stringValue(const std::string& s)
{
  if (!prepareValue()) return false;
  if (!writeChar('"')) return false;
  if (!writeRaw(JsonEscape(s))) return false;
  if (!writeChar('"')) return false;
  return finishValue();
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
  case JsonValue::Type::Object: {
    if (!beginObject()) return false;
    std::vector<const std::pair<std::string, JsonValue>*> members;
    members.reserve(v.objectValue.size());
    for (const auto& kv : v.objectValue) members.push_back(&kv);
    if (m_opt.sortKeys) {
      std::stable_sort(members.begin(), members.end(),
                       [](const auto* a, const auto* b) { return a->first < b->first; });
    }
    for (const auto* kv : members) {
      if (!key(kv->first)) return false;
      if (!value(kv->second)) return false;
    }
    return endObject();
  }
  }
  return setError("JsonWriter: unknown value type");
}

} // namespace footpack
