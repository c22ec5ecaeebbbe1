#ifndef SITEAUDIT_CORE_JSON_DOM_HPP_
#define SITEAUDIT_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace siteaudit::core::json {

// Small DOM shared by settings loading, site scenarios and model-response
// parsing. STL-only on purpose so every module can reuse one parser.
struct Value {
  enum class Type {
    kObject,
    kArray,
    kString,
    kNumber,
    kBool,
    kNull,
  };

  using Object = std::map<std::string, Value>;
  using Array = std::vector<Value>;

  Type type = Type::kNull;
  Object object_value;
  Array array_value;
  std::string string_value;
  double number_value = 0.0;
  bool bool_value = false;

  bool IsObject() const {
    return type == Type::kObject;
  }
  bool IsArray() const {
    return type == Type::kArray;
  }
  bool IsString() const {
    return type == Type::kString;
  }
  bool IsNumber() const {
    return type == Type::kNumber;
  }
  bool IsBool() const {
    return type == Type::kBool;
  }
  bool IsNull() const {
    return type == Type::kNull;
  }
};

// Recursive-descent parser. Errors carry line/column so malformed settings and
// scenario fixtures point straight at the offending token.
class Parser {
public:
  explicit Parser(std::string_view input) : input_(input) {}

  bool Parse(Value& root, std::string& error) {
    SkipWhitespace();
    if (!ParseValue(root, error)) {
      return false;
    }
    SkipWhitespace();
    if (!AtEnd()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64;

  bool ParseValue(Value& value, std::string& error) {
    if (AtEnd()) {
      return Fail("unexpected end of input while parsing value", error);
    }
    if (depth_ > kMaxDepth) {
      return Fail("maximum nesting depth exceeded", error);
    }

    const char c = Peek();
    if (c == '{') {
      return ParseObject(value, error);
    }
    if (c == '[') {
      return ParseArray(value, error);
    }
    if (c == '"') {
      value = Value{};
      value.type = Value::Type::kString;
      return ParseString(value.string_value, error);
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c)) != 0) {
      value = Value{};
      value.type = Value::Type::kNumber;
      return ParseNumber(value.number_value, error);
    }
    if (ConsumeKeyword("true")) {
      value = Value{};
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return true;
    }
    if (ConsumeKeyword("false")) {
      value = Value{};
      value.type = Value::Type::kBool;
      return true;
    }
    if (ConsumeKeyword("null")) {
      value = Value{};
      return true;
    }

    return Fail("expected JSON value", error);
  }

  bool ParseObject(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kObject;
    Advance();
    ++depth_;
    SkipWhitespace();

    if (Match('}')) {
      --depth_;
      return true;
    }

    while (true) {
      SkipWhitespace();
      std::string key;
      if (!ParseString(key, error)) {
        return false;
      }

      SkipWhitespace();
      if (!ConsumeChar(':', "expected ':' after object key", error)) {
        return false;
      }

      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.object_value[std::move(key)] = std::move(item);

      SkipWhitespace();
      if (Match('}')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between object entries", error)) {
        return false;
      }
    }

    --depth_;
    return true;
  }

  bool ParseArray(Value& value, std::string& error) {
    value = Value{};
    value.type = Value::Type::kArray;
    Advance();
    ++depth_;
    SkipWhitespace();

    if (Match(']')) {
      --depth_;
      return true;
    }

    while (true) {
      SkipWhitespace();
      Value item;
      if (!ParseValue(item, error)) {
        return false;
      }
      value.array_value.push_back(std::move(item));

      SkipWhitespace();
      if (Match(']')) {
        break;
      }
      if (!ConsumeChar(',', "expected ',' between array items", error)) {
        return false;
      }
    }

    --depth_;
    return true;
  }

  bool ParseString(std::string& output, std::string& error) {
    output.clear();
    if (!ConsumeChar('"', "expected '\"' to start string", error)) {
      return false;
    }

    while (!AtEnd()) {
      const char c = Advance();
      if (c == '"') {
        return true;
      }
      if (c == '\\') {
        if (AtEnd()) {
          return Fail("unterminated escape sequence in string", error);
        }
        const char esc = Advance();
        switch (esc) {
        case '"':
        case '\\':
        case '/':
          output.push_back(esc);
          break;
        case 'b':
          output.push_back('\b');
          break;
        case 'f':
          output.push_back('\f');
          break;
        case 'n':
          output.push_back('\n');
          break;
        case 'r':
          output.push_back('\r');
          break;
        case 't':
          output.push_back('\t');
          break;
        case 'u':
          if (!ParseUnicodeEscape(output, error)) {
            return false;
          }
          break;
        default:
          return Fail("invalid escape sequence in string", error);
        }
        continue;
      }

      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("control character in string is not allowed", error);
      }
      output.push_back(c);
    }

    return Fail("unterminated string literal", error);
  }

  // Basic multilingual plane only; surrogate pairs are rejected. Model output
  // occasionally escapes punctuation this way.
  bool ParseUnicodeEscape(std::string& output, std::string& error) {
    std::uint32_t code_point = 0;
    for (int i = 0; i < 4; ++i) {
      if (AtEnd()) {
        return Fail("truncated \\u escape", error);
      }
      const char h = Advance();
      code_point <<= 4U;
      if (h >= '0' && h <= '9') {
        code_point |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code_point |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code_point |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code_point >= 0xD800U && code_point <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code_point < 0x80U) {
      output.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
      output.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
      output.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
      output.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
      output.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
    return true;
  }

  bool ParseNumber(double& output, std::string& error) {
    const std::size_t start = pos_;

    (void)Match('-');
    if (!Match('0') && !ConsumeDigits()) {
      return Fail("expected digits in number", error);
    }
    if (Match('.') && !ConsumeDigits()) {
      return Fail("expected digits after decimal point", error);
    }
    if (Match('e') || Match('E')) {
      if (!Match('+')) {
        (void)Match('-');
      }
      if (!ConsumeDigits()) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string text(input_.substr(start, pos_ - start));
    char* end = nullptr;
    output = std::strtod(text.c_str(), &end);
    if (end == nullptr || *end != '\0' || !std::isfinite(output)) {
      return Fail("invalid numeric value", error);
    }
    return true;
  }

  void SkipWhitespace() {
    while (!AtEnd() && std::isspace(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
    }
  }

  bool ConsumeDigits() {
    std::size_t count = 0;
    while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek())) != 0) {
      Advance();
      ++count;
    }
    return count > 0U;
  }

  bool ConsumeChar(char expected, std::string_view message, std::string& error) {
    if (AtEnd() || Peek() != expected) {
      return Fail(message, error);
    }
    Advance();
    return true;
  }

  bool ConsumeKeyword(std::string_view keyword) {
    if (input_.substr(pos_, keyword.size()) != keyword) {
      return false;
    }
    for (std::size_t i = 0; i < keyword.size(); ++i) {
      Advance();
    }
    return true;
  }

  bool Match(char expected) {
    if (AtEnd() || Peek() != expected) {
      return false;
    }
    Advance();
    return true;
  }

  char Peek() const {
    return input_[pos_];
  }

  char Advance() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
  }

  bool AtEnd() const {
    return pos_ >= input_.size();
  }

  bool Fail(std::string_view message, std::string& error) const {
    error = "parse error at line " + std::to_string(line_) + ", col " + std::to_string(col_) +
            ": " + std::string(message);
    return false;
  }

  std::string_view input_;
  std::size_t pos_ = 0;
  std::size_t line_ = 1;
  std::size_t col_ = 1;
  std::size_t depth_ = 0;
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Parser parser(input);
  return parser.Parse(root, error);
}

// Member lookup helpers. All return nullptr/nullopt on missing keys or type
// mismatches so loaders can decide between defaults and validation issues.
inline const Value* FindMember(const Value& object, std::string_view key) {
  if (!object.IsObject()) {
    return nullptr;
  }
  const auto it = object.object_value.find(std::string(key));
  if (it == object.object_value.end()) {
    return nullptr;
  }
  return &it->second;
}

inline std::optional<double> FindNumber(const Value& object, std::string_view key) {
  const Value* member = FindMember(object, key);
  if (member == nullptr || !member->IsNumber()) {
    return std::nullopt;
  }
  return member->number_value;
}

inline std::optional<std::string> FindString(const Value& object, std::string_view key) {
  const Value* member = FindMember(object, key);
  if (member == nullptr || !member->IsString()) {
    return std::nullopt;
  }
  return member->string_value;
}

inline std::optional<bool> FindBool(const Value& object, std::string_view key) {
  const Value* member = FindMember(object, key);
  if (member == nullptr || !member->IsBool()) {
    return std::nullopt;
  }
  return member->bool_value;
}

inline double NumberOr(const Value& object, std::string_view key, double fallback) {
  return FindNumber(object, key).value_or(fallback);
}

inline bool BoolOr(const Value& object, std::string_view key, bool fallback) {
  return FindBool(object, key).value_or(fallback);
}

inline std::string StringOr(const Value& object, std::string_view key, std::string fallback) {
  auto found = FindString(object, key);
  return found.has_value() ? std::move(*found) : std::move(fallback);
}

inline std::vector<std::string> StringArrayOr(const Value& object, std::string_view key) {
  std::vector<std::string> out;
  const Value* member = FindMember(object, key);
  if (member == nullptr || !member->IsArray()) {
    return out;
  }
  for (const auto& item : member->array_value) {
    if (item.IsString()) {
      out.push_back(item.string_value);
    }
  }
  return out;
}

// Non-negative whole number check used by validators for counts and millis.
inline bool TryGetNonNegativeInteger(const Value& value, std::uint64_t& out) {
  if (!value.IsNumber() || !std::isfinite(value.number_value) || value.number_value < 0.0) {
    return false;
  }
  const double floored = std::floor(value.number_value);
  if (floored != value.number_value || floored > 9.0e15) {
    return false;
  }
  out = static_cast<std::uint64_t>(floored);
  return true;
}

} // namespace siteaudit::core::json

#endif // SITEAUDIT_CORE_JSON_DOM_HPP_
