#include "pairgate/common/fs.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace pairgate::common {

std::string trim(const std::string &input) {
  constexpr const char *WHITESPACE = " \t\r\n\f\v";
  const auto first = input.find_first_not_of(WHITESPACE);
  if (first == std::string::npos) {
    return "";
  }
  return input.substr(first, input.find_last_not_of(WHITESPACE) - first + 1);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

// Expands a leading "~" and $NAME / ${NAME} references. Unset variables expand to "".
std::string expand_path(std::string value) {
  if (value == "~" || starts_with(value, "~/")) {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  const auto is_name_char = [](const char ch, const bool first) {
    return std::isalpha(static_cast<unsigned char>(ch)) != 0 || ch == '_' ||
           (!first && std::isdigit(static_cast<unsigned char>(ch)) != 0);
  };

  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;
  while (i < value.size()) {
    if (value[i] != '$' || i + 1 >= value.size()) {
      out.push_back(value[i++]);
      continue;
    }
    const bool braced = value[i + 1] == '{';
    std::size_t end = i + (braced ? 2 : 1);
    while (end < value.size() && is_name_char(value[end], end == i + (braced ? 2 : 1))) {
      ++end;
    }
    const std::size_t name_start = i + (braced ? 2 : 1);
    const bool closed = !braced || (end < value.size() && value[end] == '}');
    if (end == name_start || !closed) {
      out.push_back(value[i++]);
      continue;
    }
    if (const char *var = std::getenv(value.substr(name_start, end - name_start).c_str())) {
      out += var;
    }
    i = braced ? end + 1 : end;
  }
  return out;
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure("unable to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure("failed reading " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  if (!path.parent_path().empty()) {
    auto dir = ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return Status::error(dir.error());
    }
  }

  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error("unable to open " + tmp.string());
    }
    out << content;
    out.close();
    if (!out) {
      return Status::error("failed writing " + tmp.string());
    }
  }
#ifndef _WIN32
  // The registry holds the signing secret.
  (void)chmod(tmp.c_str(), S_IRUSR | S_IWUSR);
#endif

  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    return Status::error("failed replacing " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace pairgate::common
