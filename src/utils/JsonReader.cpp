/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <limits>
#include <ostream>
#include <sstream>

namespace DexVault {

std::ostream &operator<<(std::ostream &os, JsonType type) {
  switch (type) {
  case JsonType::Null:
    return os << "Null";
  case JsonType::Boolean:
    return os << "Boolean";
  case JsonType::Number:
    return os << "Number";
  case JsonType::String:
    return os << "String";
  case JsonType::Array:
    return os << "Array";
  case JsonType::Object:
    return os << "Object";
  }
  return os << "Unknown";
}

namespace {

const JsonValue &nullValue() {
  static const JsonValue value;
  return value;
}

void appendUtf8(std::string &out, uint32_t codepoint) {
  if (codepoint <= 0x7F) {
    out += static_cast<char>(codepoint);
  } else if (codepoint <= 0x7FF) {
    out += static_cast<char>(0xC0 | (codepoint >> 6));
    out += static_cast<char>(0x80 | (codepoint & 0x3F));
  } else if (codepoint <= 0xFFFF) {
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

void appendEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        out += std::format("\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

} // namespace

std::optional<bool> JsonValue::tryAsBool() const {
  if (isBool())
    return asBool();
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (isNumber())
    return asNumber();
  return std::nullopt;
}

std::optional<int> JsonValue::tryAsInt() const {
  auto value = tryAsInt64();
  if (!value || *value < std::numeric_limits<int>::min() ||
      *value > std::numeric_limits<int>::max()) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<int64_t> JsonValue::tryAsInt64() const {
  if (!isNumber())
    return std::nullopt;
  double number = asNumber();
  // 2^63 is exactly representable; anything at or above it overflows
  if (std::trunc(number) != number || number < -9223372036854775808.0 ||
      number >= 9223372036854775808.0) {
    return std::nullopt;
  }
  return static_cast<int64_t>(number);
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return std::get_if<JsonArray>(&m_value);
}

const JsonObject *JsonValue::tryAsObject() const {
  return std::get_if<JsonObject>(&m_value);
}

const JsonValue *JsonValue::find(const std::string &key) const {
  const auto *object = tryAsObject();
  if (object == nullptr)
    return nullptr;
  auto it = object->find(key);
  return it != object->end() ? &it->second : nullptr;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  const JsonValue *member = find(key);
  return member != nullptr ? *member : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const auto *array = tryAsArray();
  if (array == nullptr || index >= array->size())
    return nullValue();
  return (*array)[index];
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

std::string JsonValue::toString() const {
  std::string out;
  write(out);
  return out;
}

void JsonValue::write(std::string &out) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number: {
    double num = asNumber();
    if (std::floor(num) == num && std::abs(num) < 1e15) {
      out += std::to_string(static_cast<long long>(num));
    } else {
      out += std::format("{}", num);
    }
    break;
  }
  case JsonType::String:
    appendEscaped(out, asString());
    break;
  case JsonType::Array: {
    out += '[';
    bool first = true;
    for (const auto &element : asArray()) {
      if (!first)
        out += ',';
      first = false;
      element.write(out);
    }
    out += ']';
    break;
  }
  case JsonType::Object: {
    out += '{';
    bool first = true;
    for (const auto &[key, value] : asObject()) {
      if (!first)
        out += ',';
      first = false;
      appendEscaped(out, key);
      out += ':';
      value.write(out);
    }
    out += '}';
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  std::string contents = buffer.str();
  return parse(contents);
}

bool JsonReader::parse(std::string_view json) {
  clearError();
  m_input = json;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    m_input = {};
    return fail("Empty JSON input");
  }
  bool ok = parseValue(root, 0);
  if (ok) {
    skipWhitespace();
    if (!atEnd()) {
      ok = fail("Unexpected trailing characters after JSON value");
    }
  }

  // The view is only valid for the duration of this call
  m_input = {};
  if (ok) {
    m_root = std::move(root);
  }
  return ok;
}

bool JsonReader::fail(const std::string &message) {
  if (m_lastError.empty()) {
    m_lastError = std::format("Line {}, Column {}: {}", m_line, m_column,
                              message);
  }
  return false;
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';

  char c = m_input[m_position++];
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
    char c = peek();
    if (c != ' ' && c != '\t' && c != '\r' && c != '\n')
      break;
    advance();
  }
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth);
  case '[':
    return parseArray(out, depth);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    if (!parseLiteral("true"))
      return false;
    out = JsonValue(true);
    return true;
  case 'f':
    if (!parseLiteral("false"))
      return false;
    out = JsonValue(false);
    return true;
  case 'n':
    if (!parseLiteral("null"))
      return false;
    out = JsonValue();
    return true;
  case '\0':
    if (atEnd())
      return fail("Unexpected end of input");
    return fail("Unexpected character: \\0");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9')) {
      return parseNumber(out);
    }
    return fail(std::string("Unexpected character: ") + peek());
  }
}

bool JsonReader::parseObject(JsonValue &out, size_t depth) {
  advance(); // '{'
  JsonObject object;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      return fail("Expected string key in object");
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (advance() != ':') {
      return fail("Expected ':' after object key");
    }

    JsonValue value;
    if (!parseValue(value, depth + 1))
      return false;
    object.insert_or_assign(std::move(key), std::move(value));

    skipWhitespace();
    char c = advance();
    if (c == '}')
      break;
    if (c != ',') {
      return fail("Expected '}' or ',' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, size_t depth) {
  advance(); // '['
  JsonArray array;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth + 1))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    char c = advance();
    if (c == ']')
      break;
    if (c != ',') {
      return fail("Expected ']' or ',' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote

  while (!atEnd()) {
    char c = advance();
    if (c == '"') {
      return true;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      return fail("Unescaped control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd()) {
      break;
    }
    char escaped = advance();
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
      out += escaped;
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
    case 'u': {
      uint32_t codepoint = 0;
      if (!parseHex4(codepoint))
        return false;

      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        uint32_t low = 0;
        if (advance() != '\\' || advance() != 'u' || !parseHex4(low) ||
            low < 0xDC00 || low > 0xDFFF) {
          return fail("Invalid UTF-16 surrogate pair");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        return fail("Unpaired low surrogate");
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      return fail(std::string("Invalid escape sequence: \\") + escaped);
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseHex4(uint32_t &out) {
  out = 0;
  for (int i = 0; i < 4; ++i) {
    char c = peek();
    uint32_t digit = 0;
    if (c >= '0' && c <= '9') {
      digit = static_cast<uint32_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      digit = static_cast<uint32_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      digit = static_cast<uint32_t>(c - 'A' + 10);
    } else {
      return fail("Invalid Unicode escape sequence");
    }
    advance();
    out = (out << 4) | digit;
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;

  if (peek() == '-')
    advance();

  if (peek() == '0') {
    advance();
  } else if (peek() >= '1' && peek() <= '9') {
    while (peek() >= '0' && peek() <= '9')
      advance();
  } else {
    return fail("Invalid number format");
  }

  if (peek() == '.') {
    advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Invalid number format: expected digit after decimal point");
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!(peek() >= '0' && peek() <= '9')) {
      return fail("Invalid number format: expected digit in exponent");
    }
    while (peek() >= '0' && peek() <= '9')
      advance();
  }

  std::string_view text = m_input.substr(start, m_position - start);
  double number = 0.0;
  auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), number);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return fail("Invalid number: " + std::string(text));
  }

  out = JsonValue(number);
  return true;
}

bool JsonReader::parseLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    return fail(std::format("Invalid token starting with '{}'", peek()));
  }
  for (size_t i = 0; i < literal.size(); ++i)
    advance();
  return true;
}

} // namespace DexVault
