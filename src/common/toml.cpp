#include "pairgate/common/toml.hpp"

#include "pairgate/common/fs.hpp"

#include <charconv>
#include <optional>
#include <sstream>

namespace pairgate::common {

namespace {

// Length of the quoted string starting at text[at], or npos when unterminated.
// Basic strings honour backslash escapes, literal strings do not.
std::size_t quoted_length(const std::string &text, const std::size_t at) {
  const char quote = text[at];
  for (std::size_t i = at + 1; i < text.size(); ++i) {
    if (quote == '"' && text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == quote) {
      return i - at + 1;
    }
  }
  return std::string::npos;
}

// Raw value text with any trailing comment removed; nullopt when a string or array is
// left open.
std::optional<std::string> cut_value(const std::string &text) {
  int depth = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    const char ch = text[i];
    if (ch == '"' || ch == '\'') {
      const std::size_t len = quoted_length(text, i);
      if (len == std::string::npos) {
        return std::nullopt;
      }
      i += len;
      continue;
    }
    if (ch == '#' && depth == 0) {
      break;
    }
    if (ch == '[') {
      ++depth;
    } else if (ch == ']') {
      --depth;
    }
    ++i;
  }
  if (depth != 0) {
    return std::nullopt;
  }
  return trim(text.substr(0, i));
}

std::string decode_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != value.back() ||
      (value.front() != '"' && value.front() != '\'')) {
    return value;
  }
  const std::string body = value.substr(1, value.size() - 2);
  if (value.front() == '\'') {
    return body;
  }
  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 == body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char esc = body[++i];
    out.push_back(esc == 'n' ? '\n' : esc == 't' ? '\t' : esc);
  }
  return out;
}

std::vector<std::string> array_elements(const std::string &body) {
  std::vector<std::string> out;
  std::size_t start = 0;
  std::size_t i = 0;
  while (i <= body.size()) {
    if (i < body.size() && (body[i] == '"' || body[i] == '\'')) {
      const std::size_t len = quoted_length(body, i);
      i = len == std::string::npos ? body.size() : i + len;
      continue;
    }
    if (i == body.size() || body[i] == ',') {
      if (auto element = trim(body.substr(start, i - start)); !element.empty()) {
        out.push_back(std::move(element));
      }
      start = i + 1;
    }
    ++i;
  }
  return out;
}

std::string line_error(const std::string &what, const std::size_t line_number) {
  return what + " at line " + std::to_string(line_number);
}

} // namespace

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : decode_string(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  if (it->second == "true") {
    return true;
  }
  return it->second == "false" ? false : fallback;
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  std::string digits;
  digits.reserve(it->second.size());
  for (const char ch : it->second) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::int64_t parsed = 0;
  const auto *last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(digits.data(), last, parsed);
  return ec == std::errc() && ptr == last ? parsed : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string &raw = it->second;
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : array_elements(raw.substr(1, raw.size() - 2))) {
    out.push_back(decode_string(element));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(line);
    if (text.empty() || text.front() == '#') {
      continue;
    }

    if (text.front() == '[') {
      const auto close = text.find(']');
      const auto rest = close == std::string::npos ? std::string() : trim(text.substr(close + 1));
      if (close == std::string::npos || (!rest.empty() && rest.front() != '#')) {
        return Result<TomlDocument>::failure(line_error("Malformed section header", line_number));
      }
      section = trim(text.substr(1, close - 1));
      if (section.empty()) {
        return Result<TomlDocument>::failure(line_error("Invalid empty section", line_number));
      }
      continue;
    }

    const std::size_t equals = text.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(line_error("Invalid key/value", line_number));
    }
    const std::string key = trim(text.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(line_error("Missing key", line_number));
    }
    const auto value = cut_value(text.substr(equals + 1));
    if (!value) {
      return Result<TomlDocument>::failure(line_error("Unterminated value for '" + key + "'",
                                                      line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, *value).second) {
      return Result<TomlDocument>::failure(
          line_error("Duplicate key '" + full_key + "'", line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    if (ch == '\n') {
      out += "\\n";
      continue;
    }
    if (ch == '\t') {
      out += "\\t";
      continue;
    }
    if (ch == '"' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out + "\"";
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << (i == 0 ? "" : ", ") << quote_toml_string(values[i]);
  }
  out << ']';
  return out.str();
}

} // namespace pairgate::common
