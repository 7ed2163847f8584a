/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "utils/JsonReader.hpp"
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <iterator>
#include <type_traits>

namespace Amortize {

namespace {

// Largest double below which every integer is exact
constexpr double MAX_EXACT_COUNT = 9007199254740992.0;

const JsonValue &nullValue() {
  static const JsonValue null_value;
  return null_value;
}

void appendQuoted(std::string &out, std::string_view text) {
  out += '"';
  for (unsigned char c : text) {
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
    default:
      if (c < 0x20) {
        std::format_to(std::back_inserter(out), "\\u{:04x}", static_cast<unsigned>(c));
      } else {
        out += static_cast<char>(c);
      }
    }
  }
  out += '"';
}

void appendNumber(std::string &out, double number) {
  if (!std::isfinite(number)) {
    out += "null";
    return;
  }
  if (std::floor(number) == number && std::abs(number) < MAX_EXACT_COUNT) {
    std::format_to(std::back_inserter(out), "{}", static_cast<long long>(number));
    return;
  }
  // Shortest text that reads back to the same double
  char buffer[32];
  auto result = std::to_chars(buffer, buffer + sizeof(buffer), number);
  out.append(buffer, result.ptr);
}

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

bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

JsonParseError::JsonParseError(const std::string &message, size_t line,
                               size_t column)
    : std::runtime_error(line == 0 ? message
                                   : std::format("Line {}, Column {}: {}",
                                                 line, column, message)),
      m_line(line), m_column(column) {}

// JsonValue

const char *JsonValue::kindName() const {
  static constexpr const char *NAMES[] = {"null",   "boolean", "number",
                                          "string", "array",   "object"};
  return NAMES[m_storage.index()];
}

std::optional<bool> JsonValue::tryAsBool() const {
  if (const bool *flag = std::get_if<bool>(&m_storage))
    return *flag;
  return std::nullopt;
}

std::optional<double> JsonValue::tryAsNumber() const {
  if (const double *number = std::get_if<double>(&m_storage))
    return *number;
  return std::nullopt;
}

std::optional<std::string> JsonValue::tryAsString() const {
  if (const std::string *text = std::get_if<std::string>(&m_storage))
    return *text;
  return std::nullopt;
}

std::optional<uint64_t> JsonValue::tryAsCount() const {
  const double *number = std::get_if<double>(&m_storage);
  if (number == nullptr || !(*number >= 0.0) || *number >= MAX_EXACT_COUNT ||
      std::floor(*number) != *number) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(*number);
}

const JsonValue *JsonValue::find(std::string_view key) const {
  const JsonObject *members = tryAsObject();
  if (members == nullptr)
    return nullptr;
  auto it = members->find(key);
  return it != members->end() ? &it->second : nullptr;
}

const JsonValue &JsonValue::operator[](std::string_view key) const {
  const JsonValue *member = find(key);
  return member != nullptr ? *member : nullValue();
}

const JsonValue &JsonValue::operator[](size_t index) const {
  const JsonArray *items = tryAsArray();
  if (items == nullptr || index >= items->size())
    return nullValue();
  return (*items)[index];
}

size_t JsonValue::size() const {
  if (const JsonArray *items = tryAsArray())
    return items->size();
  if (const JsonObject *members = tryAsObject())
    return members->size();
  return 0;
}

JsonValue &JsonValue::set(std::string key, JsonValue value) {
  if (!isObject()) {
    m_storage = JsonObject{};
  }
  std::get<JsonObject>(m_storage).insert_or_assign(std::move(key),
                                                   std::move(value));
  return *this;
}

void JsonValue::append(JsonValue value) {
  if (!isArray()) {
    m_storage = JsonArray{};
  }
  std::get<JsonArray>(m_storage).push_back(std::move(value));
}

std::string JsonValue::toString() const {
  std::string out;
  appendTo(out);
  return out;
}

void JsonValue::appendTo(std::string &out) const {
  std::visit(
      [&out](const auto &held) {
        using T = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          out += "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          out += held ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
          appendNumber(out, held);
        } else if constexpr (std::is_same_v<T, std::string>) {
          appendQuoted(out, held);
        } else if constexpr (std::is_same_v<T, JsonArray>) {
          out += '[';
          for (size_t i = 0; i < held.size(); ++i) {
            if (i > 0)
              out += ',';
            held[i].appendTo(out);
          }
          out += ']';
        } else {
          out += '{';
          bool first = true;
          for (const auto &[key, member] : held) {
            if (!first)
              out += ',';
            first = false;
            appendQuoted(out, key);
            out += ':';
            member.appendTo(out);
          }
          out += '}';
        }
      },
      m_storage);
}

// JsonReader

JsonValue JsonReader::parse(std::string_view text) {
  JsonReader reader(text);
  return reader.readDocument();
}

JsonValue JsonReader::parseFile(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw JsonParseError("Could not open file: " + path, 0, 0);
  }
  std::string text{std::istreambuf_iterator<char>(file),
                   std::istreambuf_iterator<char>()};
  if (file.bad()) {
    throw JsonParseError("Could not read file: " + path, 0, 0);
  }
  return parse(text);
}

JsonValue JsonReader::readDocument() {
  JsonValue root = readValue(0);
  skipWhitespace();
  if (m_position < m_input.size()) {
    fail("Unexpected trailing content");
  }
  return root;
}

void JsonReader::fail(const std::string &message) const {
  throw JsonParseError(message, m_line, m_column);
}

char JsonReader::peek() const {
  return m_position < m_input.size() ? m_input[m_position] : '\0';
}

char JsonReader::advance() {
  if (m_position >= m_input.size()) {
    return '\0';
  }
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
  for (char c = peek(); c == ' ' || c == '\t' || c == '\n' || c == '\r';
       c = peek()) {
    advance();
  }
}

void JsonReader::expect(char wanted, const char *context) {
  skipWhitespace();
  if (peek() != wanted) {
    fail(std::format("Expected '{}' {}", wanted, context));
  }
  advance();
}

void JsonReader::expectLiteral(std::string_view literal) {
  if (m_input.substr(m_position, literal.size()) != literal) {
    fail(std::format("Invalid literal, expected '{}'", literal));
  }
  for (size_t i = 0; i < literal.size(); ++i) {
    advance();
  }
}

JsonValue JsonReader::readValue(int depth) {
  if (depth > MAX_DEPTH) {
    fail("Maximum nesting depth exceeded");
  }

  skipWhitespace();
  const char c = peek();
  switch (c) {
  case '{':
    return readObject(depth + 1);
  case '[':
    return readArray(depth + 1);
  case '"':
    return JsonValue(readString());
  case 't':
    expectLiteral("true");
    return JsonValue(true);
  case 'f':
    expectLiteral("false");
    return JsonValue(false);
  case 'n':
    expectLiteral("null");
    return JsonValue();
  case '\0':
    fail("Unexpected end of input");
  default:
    if (c == '-' || isDigit(c)) {
      return readNumber();
    }
    fail(std::format("Unexpected character '{}'", c));
  }
}

JsonValue JsonReader::readObject(int depth) {
  advance(); // '{'
  JsonObject members;

  skipWhitespace();
  if (peek() == '}') {
    advance();
    return JsonValue(std::move(members));
  }

  while (true) {
    skipWhitespace();
    if (peek() != '"') {
      fail("Expected string key in object");
    }
    std::string key = readString();
    expect(':', "after object key");
    members.insert_or_assign(std::move(key), readValue(depth));

    skipWhitespace();
    const char next = advance();
    if (next == '}') {
      return JsonValue(std::move(members));
    }
    if (next != ',') {
      fail("Expected ',' or '}' in object");
    }
  }
}

JsonValue JsonReader::readArray(int depth) {
  advance(); // '['
  JsonArray items;

  skipWhitespace();
  if (peek() == ']') {
    advance();
    return JsonValue(std::move(items));
  }

  while (true) {
    items.push_back(readValue(depth));

    skipWhitespace();
    const char next = advance();
    if (next == ']') {
      return JsonValue(std::move(items));
    }
    if (next != ',') {
      fail("Expected ',' or ']' in array");
    }
  }
}

std::string JsonReader::readString() {
  advance(); // opening quote
  std::string out;

  while (true) {
    if (m_position >= m_input.size()) {
      fail("Unterminated string");
    }

    const char c = advance();
    if (c == '"') {
      return out;
    }
    if (static_cast<unsigned char>(c) < 0x20) {
      fail("Control character in string");
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    const char escape = advance();
    switch (escape) {
    case '"':
    case '\\':
    case '/':
      out += escape;
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
      uint32_t codepoint = readHex4();
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (advance() != '\\' || advance() != 'u') {
          fail("Unpaired high surrogate");
        }
        const uint32_t low = readHex4();
        if (low < 0xDC00 || low > 0xDFFF) {
          fail("Invalid low surrogate");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      }
      appendUtf8(out, codepoint);
      break;
    }
    default:
      fail(std::format("Invalid escape sequence '\\{}'", escape));
    }
  }
}

uint32_t JsonReader::readHex4() {
  if (m_position + 4 > m_input.size()) {
    fail("Truncated unicode escape");
  }
  uint32_t codepoint = 0;
  const char *first = m_input.data() + m_position;
  auto result = std::from_chars(first, first + 4, codepoint, 16);
  if (result.ec != std::errc() || result.ptr != first + 4) {
    fail("Invalid unicode escape");
  }
  for (int i = 0; i < 4; ++i) {
    advance();
  }
  return codepoint;
}

JsonValue JsonReader::readNumber() {
  const size_t start = m_position;

  if (peek() == '-') {
    advance();
  }
  if (peek() == '0') {
    advance();
  } else if (isDigit(peek())) {
    while (isDigit(peek()))
      advance();
  } else {
    fail("Invalid number");
  }

  if (peek() == '.') {
    advance();
    if (!isDigit(peek())) {
      fail("Expected digit after decimal point");
    }
    while (isDigit(peek()))
      advance();
  }

  if (peek() == 'e' || peek() == 'E') {
    advance();
    if (peek() == '+' || peek() == '-')
      advance();
    if (!isDigit(peek())) {
      fail("Expected digit in exponent");
    }
    while (isDigit(peek()))
      advance();
  }

  double number = 0.0;
  const char *first = m_input.data() + start;
  const char *last = m_input.data() + m_position;
  auto result = std::from_chars(first, last, number);
  if (result.ec != std::errc() || result.ptr != last) {
    fail("Number out of range");
  }
  return JsonValue(number);
}

} // namespace Amortize
