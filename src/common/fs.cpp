#include "webfetch/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace webfetch::common {

std::string trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }
  return std::string(value.substr(begin, end - begin));
}

std::string to_lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return out;
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() &&
         value.substr(value.size() - suffix.size()) == suffix;
}

std::vector<std::string> split_lines(std::string_view value) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto pos = value.find('\n', start);
    if (pos == std::string_view::npos) {
      lines.emplace_back(value.substr(start));
      break;
    }
    lines.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
  return lines;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  if (const passwd *pw = getpwuid(getuid()); pw != nullptr && pw->pw_dir != nullptr) {
    return Result<std::filesystem::path>::success(std::filesystem::path(pw->pw_dir));
  }
  return Result<std::filesystem::path>::failure("unable to resolve home directory");
}

std::string expand_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());

  std::size_t i = 0;
  if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
    const auto home = home_dir();
    if (home.ok()) {
      out = home.value().string();
      i = 1;
    }
  }

  while (i < path.size()) {
    if (path[i] == '$' && i + 1 < path.size() && path[i + 1] == '{') {
      const auto close = path.find('}', i + 2);
      if (close != std::string::npos) {
        const std::string name = path.substr(i + 2, close - i - 2);
        if (const char *value = std::getenv(name.c_str()); value != nullptr) {
          out += value;
        }
        i = close + 1;
        continue;
      }
    }
    out.push_back(path[i]);
    ++i;
  }
  return out;
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("failed to create directory " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

Result<std::string> read_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::failure("failed to open " + path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::failure("failed to read " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

std::optional<std::filesystem::path> find_executable(const std::string &name) {
  if (name.empty()) {
    return std::nullopt;
  }
  if (name.find('/') != std::string::npos) {
    if (access(name.c_str(), X_OK) == 0) {
      return std::filesystem::path(name);
    }
    return std::nullopt;
  }

  const char *path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return std::nullopt;
  }
  std::stringstream dirs(path_env);
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = std::filesystem::path(dir) / name;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) &&
        access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

} // namespace webfetch::common
