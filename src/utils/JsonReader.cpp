/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "utils/JsonReader.hpp"
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Tessera {

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

std::optional<std::string> JsonValue::tryAsString() const {
  if (isString())
    return asString();
  return std::nullopt;
}

bool JsonValue::hasKey(const std::string &key) const {
  return isObject() && asObject().count(key) != 0;
}

const JsonValue &JsonValue::operator[](const std::string &key) const {
  static const JsonValue nullValue;
  if (!isObject())
    return nullValue;
  auto it = asObject().find(key);
  return it != asObject().end() ? it->second : nullValue;
}

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

bool JsonReader::parse(const std::string &jsonString) {
  m_input = jsonString;
  m_position = 0;
  m_lastError.clear();
  m_root = JsonValue();

  JsonValue root;
  if (!parseValue(root, 0)) {
    return false;
  }
  skipWhitespace();
  if (!atEnd()) {
    return fail("Unexpected trailing characters");
  }

  m_root = std::move(root);
  return true;
}

bool JsonReader::fail(const std::string &message) {
  m_lastError = message + " at offset " + std::to_string(m_position);
  return false;
}

void JsonReader::skipWhitespace() {
  while (!atEnd() &&
         std::isspace(static_cast<unsigned char>(m_input[m_position]))) {
    ++m_position;
  }
}

bool JsonReader::parseValue(JsonValue &out, int depth) {
  if (depth > MAX_DEPTH) {
    return fail("Nesting too deep");
  }

  skipWhitespace();
  if (atEnd()) {
    return fail("Unexpected end of input");
  }

  switch (m_input[m_position]) {
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
  default:
    return parseNumber(out);
  }
}

bool JsonReader::parseObject(JsonValue &out, int depth) {
  ++m_position; // '{'
  JsonObject object;

  skipWhitespace();
  if (!atEnd() && m_input[m_position] == '}') {
    ++m_position;
    out = JsonValue(std::move(object));
    return true;
  }

  while (true) {
    skipWhitespace();
    if (atEnd() || m_input[m_position] != '"') {
      return fail("Expected object key");
    }
    std::string key;
    if (!parseString(key))
      return false;

    skipWhitespace();
    if (atEnd() || m_input[m_position] != ':') {
      return fail("Expected ':' after key '" + key + "'");
    }
    ++m_position;

    JsonValue value;
    if (!parseValue(value, depth))
      return false;
    object[key] = std::move(value);

    skipWhitespace();
    if (atEnd()) {
      return fail("Unterminated object");
    }
    char c = m_input[m_position++];
    if (c == '}')
      break;
    if (c != ',') {
      return fail("Expected ',' or '}' in object");
    }
  }

  out = JsonValue(std::move(object));
  return true;
}

bool JsonReader::parseArray(JsonValue &out, int depth) {
  ++m_position; // '['
  JsonArray array;

  skipWhitespace();
  if (!atEnd() && m_input[m_position] == ']') {
    ++m_position;
    out = JsonValue(std::move(array));
    return true;
  }

  while (true) {
    JsonValue element;
    if (!parseValue(element, depth))
      return false;
    array.push_back(std::move(element));

    skipWhitespace();
    if (atEnd()) {
      return fail("Unterminated array");
    }
    char c = m_input[m_position++];
    if (c == ']')
      break;
    if (c != ',') {
      return fail("Expected ',' or ']' in array");
    }
  }

  out = JsonValue(std::move(array));
  return true;
}

bool JsonReader::parseString(std::string &out) {
  ++m_position; // opening quote
  out.clear();

  while (!atEnd()) {
    char c = m_input[m_position++];
    if (c == '"') {
      return true;
    }
    if (c != '\\') {
      out += c;
      continue;
    }

    if (atEnd())
      break;
    char escape = m_input[m_position++];
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
      if (m_position + 4 > m_input.size()) {
        return fail("Truncated \\u escape");
      }
      std::string hex = m_input.substr(m_position, 4);
      char *end = nullptr;
      unsigned long code = std::strtoul(hex.c_str(), &end, 16);
      if (end != hex.c_str() + 4) {
        return fail("Invalid \\u escape");
      }
      if (code >= 0xD800 && code <= 0xDFFF) {
        return fail("Surrogate \\u escapes are not supported");
      }
      m_position += 4;
      // UTF-8 encode
      if (code < 0x80) {
        out += static_cast<char>(code);
      } else if (code < 0x800) {
        out += static_cast<char>(0xC0 | (code >> 6));
        out += static_cast<char>(0x80 | (code & 0x3F));
      } else {
        out += static_cast<char>(0xE0 | (code >> 12));
        out += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code & 0x3F));
      }
      break;
    }
    default:
      return fail(std::string("Invalid escape '\\") + escape + "'");
    }
  }

  return fail("Unterminated string");
}

bool JsonReader::parseNumber(JsonValue &out) {
  size_t start = m_position;
  if (m_input[m_position] == '-')
    ++m_position;

  auto digits = [this]() {
    size_t first = m_position;
    while (!atEnd() &&
           std::isdigit(static_cast<unsigned char>(m_input[m_position]))) {
      ++m_position;
    }
    return m_position > first;
  };

  if (!digits()) {
    m_position = start;
    return fail("Unexpected character");
  }
  if (!atEnd() && m_input[m_position] == '.') {
    ++m_position;
    if (!digits())
      return fail("Expected digits after decimal point");
  }
  if (!atEnd() && (m_input[m_position] == 'e' || m_input[m_position] == 'E')) {
    ++m_position;
    if (!atEnd() && (m_input[m_position] == '+' || m_input[m_position] == '-'))
      ++m_position;
    if (!digits())
      return fail("Expected exponent digits");
  }

  out = JsonValue(std::strtod(m_input.substr(start, m_position - start).c_str(), nullptr));
  return true;
}

bool JsonReader::parseLiteral(const char *literal, JsonValue value,
                              JsonValue &out) {
  std::string expected(literal);
  if (m_input.compare(m_position, expected.size(), expected) != 0) {
    return fail("Invalid literal");
  }
  m_position += expected.size();
  out = std::move(value);
  return true;
}

} // namespace Tessera
