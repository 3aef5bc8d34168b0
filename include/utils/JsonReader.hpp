/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace GridRoute {

class JsonValue;

// Ordered keys keep written documents stable between runs
using JsonObject = std::map<std::string, JsonValue>;
using JsonArray = std::vector<JsonValue>;

enum class JsonType { Null, Boolean, Number, String, Array, Object };

const char *toString(JsonType type);

// Stream operator for JsonType (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, JsonType type) {
  return os << toString(type);
}

class JsonValue {
public:
  using ValueType = std::variant<std::nullptr_t, bool, double, std::string,
                                 JsonArray, JsonObject>;

  JsonValue() : m_value(nullptr) {}
  explicit JsonValue(std::nullptr_t) : m_value(nullptr) {}
  explicit JsonValue(bool value) : m_value(value) {}
  explicit JsonValue(int value) : m_value(static_cast<double>(value)) {}
  explicit JsonValue(double value) : m_value(value) {}
  explicit JsonValue(std::string value) : m_value(std::move(value)) {}
  explicit JsonValue(const char *value) : m_value(std::string(value)) {}
  explicit JsonValue(JsonArray value) : m_value(std::move(value)) {}
  explicit JsonValue(JsonObject value) : m_value(std::move(value)) {}

  JsonType getType() const { return static_cast<JsonType>(m_value.index()); }
  bool isNull() const { return getType() == JsonType::Null; }
  bool isBool() const { return getType() == JsonType::Boolean; }
  bool isNumber() const { return getType() == JsonType::Number; }
  bool isString() const { return getType() == JsonType::String; }
  bool isArray() const { return getType() == JsonType::Array; }
  bool isObject() const { return getType() == JsonType::Object; }

  // True for numbers with no fractional part that fit in an int
  bool isInteger() const;

  // Throw std::bad_variant_access on a type mismatch
  bool asBool() const { return std::get<bool>(m_value); }
  double asNumber() const { return std::get<double>(m_value); }
  int asInt() const { return static_cast<int>(std::get<double>(m_value)); }
  const std::string &asString() const { return std::get<std::string>(m_value); }
  const JsonArray &asArray() const { return std::get<JsonArray>(m_value); }
  const JsonObject &asObject() const { return std::get<JsonObject>(m_value); }
  JsonArray &asArray() { return std::get<JsonArray>(m_value); }
  JsonObject &asObject() { return std::get<JsonObject>(m_value); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<int> tryAsInt() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const;
  const JsonObject *tryAsObject() const;

  bool hasKey(const std::string &key) const;
  // Missing keys and non-objects yield a shared null value
  const JsonValue &operator[](const std::string &key) const;
  // Converts a non-object into an empty object first
  JsonValue &operator[](const std::string &key);
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

  void push_back(JsonValue value);

  // Compact serialization with string escaping
  std::string toString() const;
  // Two-space indented serialization
  std::string toPrettyString() const;

private:
  ValueType m_value;

  void write(std::string &out, int indent, int depth) const;
};

/**
 * Recursive-descent JSON reader. Errors are reported through the return
 * value of parse()/loadFromFile() with line and column in getLastError().
 */
class JsonReader {
public:
  // Nesting deeper than this is rejected instead of exhausting the stack
  static constexpr size_t MAX_DEPTH = 256;

  JsonReader() = default;

  bool loadFromFile(const std::string &path);
  bool parse(const std::string &jsonString);

  const JsonValue &getRoot() const { return m_root; }
  const std::string &getLastError() const { return m_lastError; }
  void clearError() { m_lastError.clear(); }

  static bool saveToFile(const JsonValue &value, const std::string &path);

private:
  std::string m_input;
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
  bool parseLiteral(const char *word, JsonValue value, JsonValue &out);
  bool parseUnicodeEscape(uint32_t &codePoint);

  char peek() const;
  char advance();
  bool atEnd() const { return m_position >= m_input.size(); }
  void skipWhitespace();
  bool expect(char c);
  bool fail(const std::string &message);
};

} // namespace GridRoute

#endif // JSONREADER_HPP
