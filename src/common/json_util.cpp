#include "pairgate/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace pairgate::common {

namespace {

void append_utf8(std::string &out, const unsigned int cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<unsigned int> read_hex4(const std::string &text, const std::size_t at) {
  if (at + 4 > text.size()) {
    return std::nullopt;
  }
  unsigned int value = 0;
  const auto [ptr, ec] = std::from_chars(text.data() + at, text.data() + at + 4, value, 16);
  if (ec != std::errc() || ptr != text.data() + at + 4) {
    return std::nullopt;
  }
  return value;
}

// Forward-only reader over one JSON text. Positions past the end are clamped.
class Scanner {
public:
  explicit Scanner(const std::string &text) : text_(text) {}

  [[nodiscard]] bool done() {
    skip_ws();
    return pos_ >= text_.size();
  }

  [[nodiscard]] char peek() {
    skip_ws();
    return pos_ < text_.size() ? text_[pos_] : '\0';
  }

  bool consume(const char ch) {
    if (peek() != ch) {
      return false;
    }
    ++pos_;
    return true;
  }

  /// Reads a quoted string at the cursor and returns it unescaped.
  std::optional<std::string> read_string() {
    if (peek() != '"') {
      return std::nullopt;
    }
    std::string out;
    for (std::size_t i = pos_ + 1; i < text_.size(); ++i) {
      const char ch = text_[i];
      if (ch == '"') {
        pos_ = i + 1;
        return out;
      }
      if (ch != '\\') {
        out.push_back(ch);
        continue;
      }
      if (++i >= text_.size()) {
        break;
      }
      switch (text_[i]) {
      case 'n':
        out.push_back('\n');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'u':
        if (const auto cp = read_hex4(text_, i + 1)) {
          append_utf8(out, *cp);
          i += 4;
        } else {
          out.push_back('u');
        }
        break;
      default:
        out.push_back(text_[i]);
        break;
      }
    }
    return std::nullopt;
  }

  /// Returns the raw text of the value at the cursor (objects and arrays balanced).
  std::optional<std::string> read_raw() {
    const char first = peek();
    const std::size_t start = pos_;
    if (first == '"') {
      if (!read_string()) {
        return std::nullopt;
      }
      return text_.substr(start, pos_ - start);
    }
    if (first == '{' || first == '[') {
      const auto end = find_close(start);
      if (!end) {
        return std::nullopt;
      }
      pos_ = *end + 1;
      return text_.substr(start, pos_ - start);
    }
    while (pos_ < text_.size() && text_[pos_] != ',' && text_[pos_] != '}' &&
           text_[pos_] != ']' && std::isspace(static_cast<unsigned char>(text_[pos_])) == 0) {
      ++pos_;
    }
    if (pos_ == start) {
      return std::nullopt;
    }
    return text_.substr(start, pos_ - start);
  }

private:
  void skip_ws() {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
  }

  std::optional<std::size_t> find_close(const std::size_t open) const {
    std::vector<char> stack;
    bool in_string = false;
    for (std::size_t i = open; i < text_.size(); ++i) {
      const char ch = text_[i];
      if (in_string) {
        if (ch == '\\') {
          ++i;
        } else if (ch == '"') {
          in_string = false;
        }
        continue;
      }
      if (ch == '"') {
        in_string = true;
      } else if (ch == '{' || ch == '[') {
        stack.push_back(ch == '{' ? '}' : ']');
      } else if (ch == '}' || ch == ']') {
        if (stack.empty() || stack.back() != ch) {
          return std::nullopt;
        }
        stack.pop_back();
        if (stack.empty()) {
          return i;
        }
      }
    }
    return std::nullopt;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

// Walks "key": value pairs of the object at the start of `json`. Stops at the first
// malformed member and returns false when the object could not be read to its end.
template <typename Fn> bool for_each_member(const std::string &json, Fn &&fn) {
  Scanner scan(json);
  if (!scan.consume('{')) {
    return false;
  }
  if (scan.consume('}')) {
    return true;
  }
  while (true) {
    auto key = scan.read_string();
    if (!key || !scan.consume(':')) {
      return false;
    }
    const bool is_string = scan.peek() == '"';
    std::optional<std::string> value = is_string ? scan.read_string() : scan.read_raw();
    if (!value) {
      return false;
    }
    fn(*key, std::move(*value), is_string);
    if (scan.consume(',')) {
      continue;
    }
    return scan.consume('}');
  }
}

// Same walk over the elements of a `[...]` array.
template <typename Fn> bool for_each_element(const std::string &json, Fn &&fn) {
  Scanner scan(json);
  if (!scan.consume('[')) {
    return false;
  }
  if (scan.consume(']')) {
    return true;
  }
  while (true) {
    const bool is_string = scan.peek() == '"';
    std::optional<std::string> value = is_string ? scan.read_string() : scan.read_raw();
    if (!value) {
      return false;
    }
    fn(std::move(*value), is_string);
    if (scan.consume(',')) {
      continue;
    }
    return scan.consume(']');
  }
}

} // namespace

std::string json_string(const std::string &value) {
  std::string out = "\"";
  out.reserve(value.size() + 2);
  for (const char ch : value) {
    switch (ch) {
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
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(ch));
        out += buf;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  out.push_back('"');
  return out;
}

bool json_is_object(const std::string &json) {
  Scanner scan(json);
  if (scan.peek() != '{') {
    return false;
  }
  return scan.read_raw().has_value() && scan.done();
}

std::string json_get_string(const std::string &json, const std::string &field) {
  std::optional<std::string> found;
  (void)for_each_member(json, [&](const std::string &key, std::string value, const bool is_string) {
    if (!found && key == field) {
      found = is_string ? std::move(value) : std::string();
    }
  });
  return found.value_or("");
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  (void)for_each_member(json, [&](const std::string &key, std::string value,
                                  const bool is_string) {
    if (is_string || value != "null") {
      result[key] = std::move(value);
    }
  });
  return result;
}

std::optional<std::vector<std::string>> json_parse_string_array(const std::string &raw_array) {
  std::vector<std::string> out;
  const bool complete = for_each_element(raw_array, [&](std::string value, const bool is_string) {
    if (is_string) {
      out.push_back(std::move(value));
    }
  });
  if (!complete) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::vector<std::string>> json_parse_array(const std::string &raw_array) {
  std::vector<std::string> out;
  const bool complete = for_each_element(raw_array, [&](std::string value, const bool is_string) {
    out.push_back(is_string ? json_string(value) : std::move(value));
  });
  if (!complete) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::int64_t> json_to_int64(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

} // namespace pairgate::common
