#ifndef BUGREPORTD_CORE_JSON_DOM_HPP_
#define BUGREPORTD_CORE_JSON_DOM_HPP_

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace bugreportd::core::json {

// Small STL-only DOM for service config files.
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

  bool is_object() const {
    return type == Type::kObject;
  }
  bool is_array() const {
    return type == Type::kArray;
  }
  bool is_string() const {
    return type == Type::kString;
  }
  bool is_number() const {
    return type == Type::kNumber;
  }
  bool is_bool() const {
    return type == Type::kBool;
  }

  // Returns nullptr for non-objects and missing keys.
  const Value* Find(std::string_view key) const {
    if (type != Type::kObject) {
      return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
  }
};

inline const char* TypeName(Value::Type type) {
  switch (type) {
  case Value::Type::kObject:
    return "object";
  case Value::Type::kArray:
    return "array";
  case Value::Type::kString:
    return "string";
  case Value::Type::kNumber:
    return "number";
  case Value::Type::kBool:
    return "bool";
  case Value::Type::kNull:
    return "null";
  }
  return "unknown";
}

// Recursive-descent reader. Diagnostics carry line/column so a broken config
// file points straight at the offending token. Duplicate object keys are
// rejected since a config with two values for one knob is ambiguous.
class Reader {
public:
  explicit Reader(std::string_view input) : input_(input) {}

  bool Read(Value& root, std::string& error) {
    SkipSpace();
    if (!ReadValue(root, 0U, error)) {
      return false;
    }
    SkipSpace();
    if (pos_ < input_.size()) {
      return Fail("unexpected trailing content after JSON value", error);
    }
    return true;
  }

private:
  static constexpr std::size_t kMaxDepth = 64U;

  bool ReadValue(Value& value, std::size_t depth, std::string& error) {
    if (depth > kMaxDepth) {
      return Fail("nesting too deep", error);
    }
    if (pos_ >= input_.size()) {
      return Fail("unexpected end of input while reading value", error);
    }

    value = Value{};
    switch (input_[pos_]) {
    case '{':
      value.type = Value::Type::kObject;
      return ReadObject(value.object_value, depth, error);
    case '[':
      value.type = Value::Type::kArray;
      return ReadArray(value.array_value, depth, error);
    case '"':
      value.type = Value::Type::kString;
      return ReadString(value.string_value, error);
    case 't':
      value.type = Value::Type::kBool;
      value.bool_value = true;
      return Keyword("true", error);
    case 'f':
      value.type = Value::Type::kBool;
      return Keyword("false", error);
    case 'n':
      return Keyword("null", error);
    default:
      value.type = Value::Type::kNumber;
      return ReadNumber(value.number_value, error);
    }
  }

  bool ReadObject(Value::Object& object, std::size_t depth, std::string& error) {
    Step();
    SkipSpace();
    if (TryConsume('}')) {
      return true;
    }

    for (;;) {
      SkipSpace();
      if (pos_ >= input_.size() || input_[pos_] != '"') {
        return Fail("expected string key in object", error);
      }
      std::string key;
      if (!ReadString(key, error)) {
        return false;
      }
      if (object.count(key) != 0U) {
        return Fail("duplicate key '" + key + "'", error);
      }

      SkipSpace();
      if (!TryConsume(':')) {
        return Fail("expected ':' after object key", error);
      }
      SkipSpace();
      if (!ReadValue(object[key], depth + 1U, error)) {
        return false;
      }

      SkipSpace();
      if (TryConsume('}')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or '}' in object", error);
      }
    }
  }

  bool ReadArray(Value::Array& array, std::size_t depth, std::string& error) {
    Step();
    SkipSpace();
    if (TryConsume(']')) {
      return true;
    }

    for (;;) {
      SkipSpace();
      array.emplace_back();
      if (!ReadValue(array.back(), depth + 1U, error)) {
        return false;
      }
      SkipSpace();
      if (TryConsume(']')) {
        return true;
      }
      if (!TryConsume(',')) {
        return Fail("expected ',' or ']' in array", error);
      }
    }
  }

  bool ReadString(std::string& out, std::string& error) {
    out.clear();
    Step(); // opening quote

    while (pos_ < input_.size()) {
      const char c = Step();
      if (c == '"') {
        return true;
      }
      if (static_cast<unsigned char>(c) < 0x20U) {
        return Fail("raw control character in string", error);
      }
      if (c != '\\') {
        out.push_back(c);
        continue;
      }

      if (pos_ >= input_.size()) {
        break;
      }
      const char esc = Step();
      switch (esc) {
      case '"':
      case '\\':
      case '/':
        out.push_back(esc);
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'u':
        if (!ReadUnicodeEscape(out, error)) {
          return false;
        }
        break;
      default:
        return Fail(std::string("invalid escape '\\") + esc + "'", error);
      }
    }

    return Fail("unterminated string", error);
  }

  // Basic-plane escapes only; surrogate pairs are not needed for config text.
  bool ReadUnicodeEscape(std::string& out, std::string& error) {
    if (pos_ + 4U > input_.size()) {
      return Fail("truncated \\u escape", error);
    }
    std::uint32_t code = 0;
    for (int i = 0; i < 4; ++i) {
      const char h = Step();
      code <<= 4U;
      if (h >= '0' && h <= '9') {
        code |= static_cast<std::uint32_t>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<std::uint32_t>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<std::uint32_t>(h - 'A' + 10);
      } else {
        return Fail("invalid hex digit in \\u escape", error);
      }
    }
    if (code >= 0xD800U && code <= 0xDFFFU) {
      return Fail("surrogate \\u escapes are not supported", error);
    }

    if (code < 0x80U) {
      out.push_back(static_cast<char>(code));
    } else if (code < 0x800U) {
      out.push_back(static_cast<char>(0xC0U | (code >> 6U)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    } else {
      out.push_back(static_cast<char>(0xE0U | (code >> 12U)));
      out.push_back(static_cast<char>(0x80U | ((code >> 6U) & 0x3FU)));
      out.push_back(static_cast<char>(0x80U | (code & 0x3FU)));
    }
    return true;
  }

  bool ReadNumber(double& out, std::string& error) {
    const std::size_t start = pos_;
    (void)TryConsume('-');
    if (!TryConsume('0') && SkipDigits() == 0U) {
      return Fail("expected JSON value", error);
    }
    if (TryConsume('.') && SkipDigits() == 0U) {
      return Fail("expected digits after decimal point", error);
    }
    if (TryConsume('e') || TryConsume('E')) {
      if (!TryConsume('+')) {
        (void)TryConsume('-');
      }
      if (SkipDigits() == 0U) {
        return Fail("expected exponent digits", error);
      }
    }

    const std::string token(input_.substr(start, pos_ - start));
    char* end = nullptr;
    errno = 0;
    out = std::strtod(token.c_str(), &end);
    if (end == nullptr || *end != '\0' || errno == ERANGE) {
      return Fail("number out of range: " + token, error);
    }
    return true;
  }

  bool Keyword(std::string_view word, std::string& error) {
    if (input_.substr(pos_, word.size()) != word) {
      return Fail("expected JSON value", error);
    }
    for (std::size_t i = 0; i < word.size(); ++i) {
      Step();
    }
    return true;
  }

  std::size_t SkipDigits() {
    std::size_t count = 0;
    while (pos_ < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step();
      ++count;
    }
    return count;
  }

  void SkipSpace() {
    while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(input_[pos_])) != 0) {
      Step();
    }
  }

  bool TryConsume(char expected) {
    if (pos_ >= input_.size() || input_[pos_] != expected) {
      return false;
    }
    Step();
    return true;
  }

  char Step() {
    const char c = input_[pos_++];
    if (c == '\n') {
      ++line_;
      col_ = 1;
    } else {
      ++col_;
    }
    return c;
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
};

inline bool Parse(std::string_view input, Value& root, std::string& error) {
  Reader reader(input);
  return reader.Read(root, error);
}

} // namespace bugreportd::core::json

#endif // BUGREPORTD_CORE_JSON_DOM_HPP_
