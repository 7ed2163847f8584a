/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef JSONREADER_HPP
#define JSONREADER_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Amortize {

class JsonValue;

// Ordered map keeps serialized records stable across runs
using JsonObject = std::map<std::string, JsonValue, std::less<>>;
using JsonArray = std::vector<JsonValue>;

/**
 * @brief Malformed JSON text, with the 1-based position of the failure
 *
 * line() is 0 when the text could not be read at all.
 */
class JsonParseError : public std::runtime_error {
public:
  JsonParseError(const std::string &message, size_t line, size_t column);

  size_t line() const { return m_line; }
  size_t column() const { return m_column; }

private:
  size_t m_line;
  size_t m_column;
};

/**
 * @brief One node of a parsed or hand-built JSON document
 *
 * Lookups on the wrong kind never throw: a missing member or index reads
 * as null, and the tryAs accessors return nothing. Only the as* accessors
 * throw (std::bad_variant_access) and are meant for already-checked values.
 */
class JsonValue {
public:
  JsonValue() = default;
  explicit JsonValue(bool flag) : m_storage(flag) {}
  explicit JsonValue(int number) : m_storage(static_cast<double>(number)) {}
  explicit JsonValue(size_t count) : m_storage(static_cast<double>(count)) {}
  explicit JsonValue(double number) : m_storage(number) {}
  explicit JsonValue(std::string text) : m_storage(std::move(text)) {}
  explicit JsonValue(const char *text) : m_storage(std::string(text)) {}
  explicit JsonValue(JsonArray items) : m_storage(std::move(items)) {}
  explicit JsonValue(JsonObject members) : m_storage(std::move(members)) {}

  // "null", "boolean", "number", "string", "array" or "object"
  const char *kindName() const;

  bool isNull() const { return std::holds_alternative<std::monostate>(m_storage); }
  bool isBool() const { return std::holds_alternative<bool>(m_storage); }
  bool isNumber() const { return std::holds_alternative<double>(m_storage); }
  bool isString() const { return std::holds_alternative<std::string>(m_storage); }
  bool isArray() const { return std::holds_alternative<JsonArray>(m_storage); }
  bool isObject() const { return std::holds_alternative<JsonObject>(m_storage); }

  bool asBool() const { return std::get<bool>(m_storage); }
  double asNumber() const { return std::get<double>(m_storage); }
  const std::string &asString() const { return std::get<std::string>(m_storage); }

  std::optional<bool> tryAsBool() const;
  std::optional<double> tryAsNumber() const;
  std::optional<std::string> tryAsString() const;
  const JsonArray *tryAsArray() const { return std::get_if<JsonArray>(&m_storage); }
  const JsonObject *tryAsObject() const { return std::get_if<JsonObject>(&m_storage); }

  // Integral, non-negative numbers that fit in 53 bits (counts, sizes)
  std::optional<uint64_t> tryAsCount() const;

  // nullptr when this is not an object or the key is absent
  const JsonValue *find(std::string_view key) const;

  const JsonValue &operator[](std::string_view key) const;
  const JsonValue &operator[](size_t index) const;
  size_t size() const;

  // Turns a non-object into an empty object first; returns *this for chaining
  JsonValue &set(std::string key, JsonValue value);
  // Turns a non-array into an empty array first
  void append(JsonValue value);

  // Compact JSON text; non-finite numbers are written as null
  std::string toString() const;

private:
  void appendTo(std::string &out) const;

  std::variant<std::monostate, bool, double, std::string, JsonArray, JsonObject>
      m_storage;
};

/**
 * Recursive-descent JSON reader. Both entry points either return the whole
 * document or throw JsonParseError; there is no partial result.
 */
class JsonReader {
public:
  // Nesting limit for untrusted input
  static constexpr int MAX_DEPTH = 128;

  static JsonValue parse(std::string_view text);
  static JsonValue parseFile(const std::string &path);

private:
  explicit JsonReader(std::string_view text) : m_input(text) {}

  JsonValue readDocument();
  JsonValue readValue(int depth);
  JsonValue readObject(int depth);
  JsonValue readArray(int depth);
  JsonValue readNumber();
  std::string readString();
  uint32_t readHex4();

  char peek() const;
  char advance();
  void skipWhitespace();
  void expect(char wanted, const char *context);
  void expectLiteral(std::string_view literal);
  [[noreturn]] void fail(const std::string &message) const;

  std::string_view m_input;
  size_t m_position{0};
  size_t m_line{1};
  size_t m_column{1};
};

} // namespace Amortize

#endif // JSONREADER_HPP
