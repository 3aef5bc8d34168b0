/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>

namespace GridRoute {

namespace {

const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}

void appendUtf8(std::string &out, uint32_t cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

void writeEscaped(std::string &out, const std::string &text) {
  out += '"';
  for (char c : text) {
    switch (c) {
    case '"': out += "\\\""; break;
    case '\\': out += "\\\\"; break;
    case '\b': out += "\\b"; break;
    case '\f': out += "\\f"; break;
    case '\n': out += "\\n"; break;
    case '\r': out += "\\r"; break;
    case '\t': out += "\\t"; break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += buffer;
      } else {
        out += c;
      }
    }
  }
  out += '"';
}

void writeNumber(std::string &out, double num) {
  if (!std::isfinite(num)) {
    out += "null"; // JSON has no NaN or infinity
    return;
  }
  if (std::floor(num) == num && std::abs(num) < 1e15) {
    out += std::to_string(static_cast<long long>(num));
    return;
  }
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.17g", num);
  out += buffer;
}

void newline(std::string &out, int indent, int depth) {
  if (indent <= 0) {
    return;
  }
  out += '\n';
  out.append(static_cast<size_t>(indent * depth), ' ');
}

} // namespace

const char *toString(JsonType type) {
  switch (type) {
  case JsonType::Null: return "Null";
  case JsonType::Boolean: return "Boolean";
  case JsonType::Number: return "Number";
  case JsonType::String: return "String";
  case JsonType::Array: return "Array";
  case JsonType::Object: return "Object";
  }
  return "Unknown";
}

bool JsonValue::isInteger() const {
  if (!isNumber())
    return false;
  const double num = asNumber();
  return std::floor(num) == num &&
         num >= static_cast<double>(std::numeric_limits<int>::min()) &&
         num <= static_cast<double>(std::numeric_limits<int>::max());
}

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
  if (isInteger())
    return asInt();
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

const JsonArray *JsonValue::tryAsArray() const {
  return isArray() ? &asArray() : nullptr;
}

const JsonObject *JsonValue::tryAsObject() const {
  return isObject() ? &asObject() : nullptr;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) > 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  if (!isObject())
    return nullValue();
  const auto &obj = asObject();
  auto it = obj.find(key);
  return (it != obj.end()) ? it->second : nullValue();
}

JsonValue &JsonValue::operator[](const std::string &key) {
  if (!isObject()) {
    m_value = JsonObject{};
  }
  return asObject()[key];
}

const JsonValue &JsonValue::operator[](size_t index) const {
  if (!isArray() || index >= asArray().size())
    return nullValue();
  return asArray()[index];
}

size_t JsonValue::size() const {
  if (isArray())
    return asArray().size();
  if (isObject())
    return asObject().size();
  return 0;
}

void JsonValue::push_back(JsonValue value) {
  if (!isArray()) {
    m_value = JsonArray{};
  }
  asArray().push_back(std::move(value));
}

std::string JsonValue::toString() const {
  std::string out;
  write(out, 0, 0);
  return out;
}

std::string JsonValue::toPrettyString() const {
  std::string out;
  write(out, 2, 0);
  return out;
}

void JsonValue::write(std::string &out, int indent, int depth) const {
  switch (getType()) {
  case JsonType::Null:
    out += "null";
    break;
  case JsonType::Boolean:
    out += asBool() ? "true" : "false";
    break;
  case JsonType::Number:
    writeNumber(out, asNumber());
    break;
  case JsonType::String:
    writeEscaped(out, asString());
    break;
  case JsonType::Array: {
    const auto &arr = asArray();
    out += '[';
    for (size_t i = 0; i < arr.size(); ++i) {
      if (i > 0)
        out += ',';
      newline(out, indent, depth + 1);
      arr[i].write(out, indent, depth + 1);
    }
    if (!arr.empty())
      newline(out, indent, depth);
    out += ']';
    break;
  }
  case JsonType::Object: {
    const auto &obj = asObject();
    out += '{';
    bool first = true;
    for (const auto &[key, value] : obj) {
      if (!first)
        out += ',';
      first = false;
      newline(out, indent, depth + 1);
      writeEscaped(out, key);
      out += indent > 0 ? ": " : ":";
      value.write(out, indent, depth + 1);
    }
    if (!obj.empty())
      newline(out, indent, depth);
    out += '}';
    break;
  }
  }
}

// JsonReader implementation
bool JsonReader::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    m_lastError = "Could not open file: " + path;
    return false;
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return parse(buffer.str());
}

bool JsonReader::saveToFile(const JsonValue &value, const std::string &path) {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    return false;
  }
  file << value.toPrettyString() << '\n';
  return static_cast<bool>(file);
}

bool JsonReader::parse(const std::string &jsonString) {
  clearError();
  m_input = jsonString;
  m_position = 0;
  m_line = 1;
  m_column = 1;
  m_root = JsonValue();

  JsonValue root;
  skipWhitespace();
  if (atEnd()) {
    return fail("Empty document");
  }
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail(std::string("Unexpected trailing character '") + peek() + "'");
  }
  m_root = std::move(root);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = "Line " + std::to_string(m_line) + ", Column " +
                std::to_string(m_column) + ": " + message;
  return false;
}

char JsonReader::peek() const {
  return atEnd() ? '\0' : m_input[m_position];
}

char JsonReader::advance() {
  if (atEnd())
    return '\0';
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
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
      break;
    advance();
  }
}

bool JsonReader::expect(char c) {
  skipWhitespace();
  if (peek() != c) {
    if (atEnd())
      return fail(std::string("Expected '") + c + "' before end of input");
    return fail(std::string("Expected '") + c + "' but found '" + peek() + "'");
  }
  advance();
  return true;
}

bool JsonReader::parseValue(JsonValue &out, size_t depth) {
  if (depth > MAX_DEPTH) {
    return fail("Maximum nesting depth exceeded");
  }
  skipWhitespace();
  switch (peek()) {
  case '{':
    return parseObject(out, depth + 1);
  case '[':
    return parseArray(out, depth + 1);
  case '"': {
    std::string text;
    if (!parseString(text))
      return false;
    out = JsonValue(std::move(text));
    return true;
  }
  case 't':
    return parseLiteral("true", JsonValue(true), out);
  case 'f':
    return parseLiteral("false", JsonValue(false), out);
  case 'n':
    return parseLiteral("null", JsonValue(), out);
  case '\0':
    if (atEnd())
      return fail("Unexpected end of input");
    return fail("Unexpected null character");
  default:
    if (peek() == '-' || (peek() >= '0' && peek() <= '9'))
      return parseNumber(out);
    return fail(std::string("Unexpected character '") + peek() + "'");
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
    if (!parseString(key) || !expect(':'))
      return false;

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    // Later duplicates replace earlier ones
    object[std::move(key)] = std::move(value);

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect('}'))
      return false;
    break;
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
    if (!parseValue(element, depth))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    if (peek() == ',') {
      advance();
      continue;
    }
    if (!expect(']'))
      return false;
    break;
  }
  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  advance(); // opening quote
  out.clear();
  while (true) {
    if (atEnd())
      return fail("Unterminated string");
    const char c = advance();
    if (c == '"')
      return true;
    if (static_cast<unsigned char>(c) < 0x20)
      return fail("Unescaped control character in string");
    if (c != '\\') {
      out += c;
      continue;
    }

    const char escape = advance();
    switch (escape) {
    case '"': out += '"'; break;
    case '\\': out += '\\'; break;
    case '/': out += '/'; break;
    case 'b': out += '\b'; break;
    case 'f': out += '\f'; break;
    case 'n': out += '\n'; break;
    case 'r': out += '\r'; break;
    case 't': out += '\t'; break;
    case 'u': {
      uint32_t cp = 0;
      if (!parseUnicodeEscape(cp))
        return false;
      // Surrogate pair
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u')
          return fail("Unpaired high surrogate in string");
        uint32_t low = 0;
        if (!parseUnicodeEscape(low))
          return false;
        if (low < 0xDC00 || low > 0xDFFF)
          return fail("Invalid low surrogate in string");
        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, cp);
      break;
    }
    default:
      return fail(std::string("Invalid escape sequence '\\") + escape + "'");
    }
  }
}

bool JsonReader::parseUnicodeEscape(uint32_t &codePoint) {
  codePoint = 0;
  for (int i = 0; i < 4; ++i) {
    const char c = advance();
    codePoint <<= 4;
    if (c >= '0' && c <= '9')
      codePoint |= static_cast<uint32_t>(c - '0');
    else if (c >= 'a' && c <= 'f')
      codePoint |= static_cast<uint32_t>(c - 'a' + 10);
    else if (c >= 'A' && c <= 'F')
      codePoint |= static_cast<uint32_t>(c - 'A' + 10);
    else
      return fail("Invalid unicode escape");
  }
  return true;
}

bool JsonReader::parseNumber(JsonValue &out) {
  const size_t begin = m_position;
  auto digits = [this]() {
    size_t count = 0;
    while (peek() >= '0' && peek() <= '9') {
      advance();
      ++count;
    }
    return count;
  };

  if (peek() == '-')
    advance();
  if (peek() == '0') {
    advance();
    if (peek() >= '0' && peek() <= '9')
      return fail("Leading zeros are not allowed");
  } else if (digits() == 0) {
    return fail("Expected digit");
  }
  if (peek() == '.') {
    advance();
    if (digits() == 0)
      return fail("Expected digit after decimal point");
  }
  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (digits() == 0)
      return fail("Expected digit in exponent");
  }

  const std::string text = m_input.substr(begin, m_position - begin);
  char *end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size())
    return fail("Invalid number '" + text + "'");
  out = JsonValue(value);
  return true;
}

bool JsonReader::parseLiteral(const char *word, JsonValue value, JsonValue &out) {
  const size_t length = std::strlen(word);
  if (m_input.compare(m_position, length, word) != 0)
    return fail(std::string("Invalid literal, expected '") + word + "'");
  for (size_t i = 0; i < length; ++i)
    advance();
  out = std::move(value);
  return true;
}

} // namespace GridRoute
