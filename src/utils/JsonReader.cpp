/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include "core/Logger.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>

namespace Wayfinder {

namespace {
const JsonValue &nullValue() {
  static const JsonValue s_null;
  return s_null;
}

bool isDigit(char c) { return c >= '0' && c <= '9'; }

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += static_cast<char>(codepoint);
  } else if (codepoint < 0x800) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += static_cast<char>(0xE0 | (codepoint >> 12));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (codepoint >> 18));
    out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  }
}
} // namespace

// ---------------------------------------------------------------------------
// JsonValue
// ---------------------------------------------------------------------------

JsonType JsonValue::getType() const {
  switch (m_value.index()) {
  case 0:
    return JsonType::Null;
  case 1:
    return JsonType::Boolean;
  case 2:
    return JsonType::Number;
  case 3:
    return JsonType::String;
  case 4:
    return JsonType::Array;
  default:
    return JsonType::Object;
  }
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *v = std::get_if<bool>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *v = std::get_if<double>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

std::optional<float> JsonValue::tryAsFloat() const {
  const double *v = std::get_if<double>(&m_value);
  if (!v) {
    return std::nullopt;
  }
  if (!std::isfinite(*v) ||
      std::abs(*v) > static_cast<double>(std::numeric_limits<float>::max())) {
    return std::nullopt;
  }
  return static_cast<float>(*v);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *v = std::get_if<std::string>(&m_value)) {
    return *v;
  }
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

bool JsonValue::hasKey(const std::string &key) const {
  const JsonObject *obj = tryAsObject();
  return obj && obj->find(key) != obj->end();
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (const JsonObject *obj = tryAsObject()) {
    auto it = obj->find(key);
    if (it != obj->end()) {
      return it->second;
    }
  }
  return nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (const JsonArray *arr = tryAsArray()) {
    if (index < arr->size()) {
      return (*arr)[index];
    }
  }
  return nullValue();
}

size_t JsonValue::size() const {
  if (const JsonArray *arr = tryAsArray()) {
    return arr->size();
  }
  if (const JsonObject *obj = tryAsObject()) {
    return obj->size();
  }
  return 0;
}

// ---------------------------------------------------------------------------
// JsonReader
// ---------------------------------------------------------------------------

bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    setError("Cannot open file: " + path);
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_lastError.clear();
  m_root = JsonValue();

  skipWhitespace();
  if (atEnd()) {
    setError("Empty JSON document");
    return false;
  }

  std::optional<JsonValue> root = parseValue(0);
  if (!root) {
    return false;
  }

  skipWhitespace();
  if (!atEnd()) {
    setError(std::format("Unexpected trailing character '{}'", peek()));
    return false;
  }

  m_root = std::move(*root);
  return true;
}

std::optional<JsonValue> JsonReader::parseValue(size_t depth) {
  if (depth > MAX_DEPTH) {
    setError("Maximum nesting depth exceeded");
    return std::nullopt;
  }

  skipWhitespace();
  if (atEnd()) {
    setError("Unexpected end of input");
    return std::nullopt;
  }

  const char c = peek();
  switch (c) {
  case '{':
    return parseObject(depth + 1);
  case '[':
    return parseArray(depth + 1);
  case '"': {
    std::optional<std::string> s = parseString();
    if (!s) {
      return std::nullopt;
    }
    return JsonValue(std::move(*s));
  }
  case 't':
    if (parseLiteral("true")) {
      return JsonValue(true);
    }
    return std::nullopt;
  case 'f':
    if (parseLiteral("false")) {
      return JsonValue(false);
    }
    return std::nullopt;
  case 'n':
    if (parseLiteral("null")) {
      return JsonValue();
    }
    return std::nullopt;
  default:
    if (c == '-' || isDigit(c)) {
      return parseNumber();
    }
    setError(std::format("Unexpected character '{}'", c));
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseObject(size_t depth) {
  advance(); // {
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(object));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      setError("Expected string key in object");
      return std::nullopt;
    }
    std::optional<std::string> key = parseString();
    if (!key) {
      return std::nullopt;
    }

    skipWhitespace();
    if (peek() != ':') {
      setError("Expected ':' after object key");
      return std::nullopt;
    }
    advance();

    std::optional<JsonValue> value = parseValue(depth);
    if (!value) {
      return std::nullopt;
    }
    // Last duplicate wins
    object[std::move(*key)] = std::move(*value);

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == '}') {
      advance();
      return JsonValue(std::move(object));
    }
    setError("Expected ',' or '}' in object");
    return std::nullopt;
  }
}

std::optional<JsonValue> JsonReader::parseArray(size_t depth) {
  advance(); // [
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(array));
  }

  while (true) {
    std::optional<JsonValue> value = parseValue(depth);
    if (!value) {
      return std::nullopt;
    }
    array.push_back(std::move(*value));

    skipWhitespace();
    const char next = peek();
    if (next == ',') {
      advance();
      continue;
    }
    if (next == ']') {
      advance();
      return JsonValue(std::move(array));
    }
    setError("Expected ',' or ']' in array");
    return std::nullopt;
  }
}

std::optional<std::string> JsonReader::parseString() {
  advance(); // opening quote
  std::string out;

  while (!atEnd()) {
    const char c = advance();
    if (c == '"') {
      return out;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      setError("Unescaped control character in string");
      return std::nullopt;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }
    const char esc = advance();
    switch (esc) {
    case '"':
      out += '"';
      break;
    case '\\':
      out += '\\';
      break;
    case '/':
      out += '/';
      break;
    case 'b':
      out += '\b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
      out += '\t';
      break;
    case 'u':
      if (!appendUnicodeEscape(out)) {
        return std::nullopt;
      }
      break;
    default:
      setError(std::format("Invalid escape sequence '\\{}'", esc));
      return std::nullopt;
    }
  }

  setError("Unterminated string");
  return std::nullopt;
}

std::optional<JsonValue> JsonReader::parseNumber() {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek())) {
      advance();
    }
  } else {
    setError("Invalid number: expected digit");
    return std::nullopt;
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      setError("Invalid number: expected digit after '.'");
      return std::nullopt;
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-') {
      advance();
    }
    if (!isDigit(peek())) {
      setError("Invalid number: expected exponent digits");
      return std::nullopt;
    }
    while (isDigit(peek())) {
      advance();
    }
  }

  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  double value = 0.0;
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    setError("Number out of range: " + std::string(first, last));
    return std::nullopt;
  }
  return JsonValue(value);
}

bool JsonReader::parseLiteral(const char *literal) {
  for (const char *p = literal; *p != '\0'; ++p) {
    if (atEnd() || peek() != *p) {
      setError(std::format("Invalid literal, expected '{}'", literal));
      return false;
    }
    advance();
  }
  return true;
}

bool JsonReader::appendUnicodeEscape(std::string &out) {
  std::optional<uint32_t> high = parseHex4();
  if (!high) {
    return false;
  }
  uint32_t codepoint = *high;

  if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
    // Surrogate pair: a low surrogate escape must follow
    if (peek() != '\\') {
      setError("Unpaired high surrogate in string");
      return false;
    }
    advance();
    if (peek() != 'u') {
      setError("Unpaired high surrogate in string");
      return false;
    }
    advance();
    std::optional<uint32_t> low = parseHex4();
    if (!low) {
      return false;
    }
    if (*low < 0xDC00 || *low > 0xDFFF) {
      setError("Invalid low surrogate in string");
      return false;
    }
    codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (*low - 0xDC00);
  } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
    setError("Unpaired low surrogate in string");
    return false;
  }

  appendUtf8(out, codepoint);
  return true;
}

std::optional<uint32_t> JsonReader::parseHex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; ++i) {
    if (atEnd()) {
      setError("Truncated unicode escape");
      return std::nullopt;
    }
    const char c = advance();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint32_t>(c - 'A' + 10);
    } else {
      setError("Invalid hex digit in unicode escape");
      return std::nullopt;
    }
  }
  return value;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd()) {
    return '\0';
  }
  const char c = m_input[m_position++];
  if (c == '\n') {
    ++m_line;
    m_column = 1;
  } else {
    ++m_column;
  }
  return c;
}

void JsonReader::skipWhitespace() {
  while (!atEnd()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

void JsonReader::setError(const std::string &message) {
  // Keep the innermost (first) error
  if (!m_lastError.empty()) {
    return;
  }
  m_lastError = std::format("{} at line {}, column {}", message, m_line, m_column);
  JSON_DEBUG(m_lastError);
}

} // namespace Wayfinder
