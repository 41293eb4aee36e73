/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace DexVault {

class JsonValue;

using JsonObject = std::unordered_map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

// Stream operator for JsonType (for Boost.Test)
std::ostream &operator<<(std::ostream &os, JsonType type);

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const {
    return static_cast<JsonType>(m_value.index());
  }
  bool isNull() const { return std::holds_alternative<std::nullptr_t>(m_value); }
  bool isBool() const { return std::holds_alternative<bool>(m_value); }
  bool isNumber() const { return std::holds_alternative<double>(m_value); }
  bool isString() const { return std::holds_alternative<std::string>(m_value); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_value); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_value); }

  // Value accessors (throw std::bad_variant_access if wrong type)
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  // Safe accessors
  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  // Only integral numbers that fit in int64_t
  std::optional<int64_t> tryAsInt64() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  // Object member lookup, nullptr when missing or not an object
  const JsonValue *find(const std::string &key) const;
  bool hasKey(const std::string &key) const { return find(key) != nullptr; }

  // Missing members and out-of-range elements read as null
  const JsonValue &operator[](const std::string &key) const;
  const JsonValue &operator[](size_t index) const;
  JsonValue &operator[](const std::string &key);

  size_t size() const;

  // Compact serialization with escaped strings
  std::string toString() const;

private:
  ValueType m_value;

  void write(std::string &out) const;
};

/**
 * @brief Recursive-descent JSON parser
 *
 * Parses a complete document (RFC 8259) including \uXXXX surrogate pairs.
 * Errors carry the line and column of the offending character.
 */
class JsonReader {
public:
  static constexpr size_t MAX_DEPTH = 256;

  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(std::string_view json);

  const JsonValue &getRoot() const { return m_root; }
  JsonValue takeRoot() { return std::move(m_root); }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

private:
  std::string_view m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
  std::string m_lastError;
  JsonValue m_root;

  bool parseValue(JsonValue &out, size_t depth);
  bool parseObject(JsonValue &out, size_t depth);
  bool parseArray(JsonValue &out, size_t depth);
  bool parseString(std::string &out);
  bool parseNumber(JsonValue &out);
  bool parseLiteral(std::string_view literal);
  bool parseHex4(uint32_t &out);

  char peek() const {
    return m_position < m_input.size() ? m_input[m_position] : '\0';
  }
  bool atEnd() const { return m_position >= m_input.size(); }
  char advance();
  void skipWhitespace();
  bool fail(const std::string &message);
};

} // namespace DexVault

#endif // JSONREADER_HPP
