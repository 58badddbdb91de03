#include "tai/common/fs.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iomanip>
#include <regex>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace tai::common {

namespace {

constexpr int kTempNameAttempts = 8;

std::string errno_message(const int err) { return std::strerror(err); }

Status write_all(const int fd, const std::string &content) {
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return Status::error(ErrorKind::Io, "write failed: " + errno_message(errno));
    }
    written += static_cast<std::size_t>(n);
  }
  return Status::success();
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorKind::Config, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorKind::Io, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

bool is_subpath(const std::filesystem::path &candidate, const std::filesystem::path &parent) {
  auto c_it = candidate.begin();
  auto p_it = parent.begin();

  for (; p_it != parent.end(); ++p_it, ++c_it) {
    if (c_it == candidate.end() || *c_it != *p_it) {
      return false;
    }
  }

  return true;
}

std::optional<std::filesystem::path> find_git_root(const std::filesystem::path &start) {
  std::error_code ec;
  std::filesystem::path current = std::filesystem::absolute(start, ec);
  if (ec) {
    return std::nullopt;
  }
  while (true) {
    if (std::filesystem::exists(current / ".git", ec)) {
      return current;
    }
    const auto parent = current.parent_path();
    if (parent.empty() || parent == current) {
      return std::nullopt;
    }
    current = parent;
  }
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::size_t begin = 0;
  while (begin < text.size()) {
    std::size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string line = text.substr(begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    lines.push_back(std::move(line));
    begin = end + 1;
  }
  return lines;
}

bool looks_binary(const std::filesystem::path &path, const std::size_t sample) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }

  std::string buffer(sample, '\0');
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  const auto count = static_cast<std::size_t>(in.gcount());
  return std::find(buffer.begin(), buffer.begin() + static_cast<long>(count), '\0') !=
         buffer.begin() + static_cast<long>(count);
}

Result<std::string> read_text_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorKind::Io,
                                        "Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorKind::Io,
                                        "Failed to read file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Result<std::string> random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  if (RAND_bytes(data.data(), static_cast<int>(data.size())) != 1) {
    return Result<std::string>::failure("random source unavailable");
  }

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return Result<std::string>::success(stream.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::filesystem::path parent = path.parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  const std::string base = path.filename().string();

  std::error_code ec;
  std::optional<std::filesystem::perms> previous_perms;
  const auto existing = std::filesystem::status(path, ec);
  if (!ec && std::filesystem::is_regular_file(existing)) {
    previous_perms = existing.permissions();
  }

  int fd = -1;
  std::filesystem::path temp;
  for (int attempt = 0; attempt < kTempNameAttempts && fd < 0; ++attempt) {
    auto suffix = random_hex(6);
    if (!suffix.ok()) {
      return Status::error(ErrorKind::Io, suffix.error());
    }
    temp = parent / ("." + base + ".tmp." + suffix.value());
    fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0 && errno != EEXIST) {
      return Status::error(ErrorKind::Io,
                           "Failed to create temp file " + temp.string() + ": " +
                               errno_message(errno));
    }
  }
  if (fd < 0) {
    return Status::error(ErrorKind::Io,
                         "Failed to allocate a unique temp file in " + parent.string());
  }

  const auto discard = [&](const std::string &message) {
    (void)::close(fd);
    std::error_code remove_ec;
    std::filesystem::remove(temp, remove_ec);
    return Status::error(ErrorKind::Io, message);
  };

  if (auto status = write_all(fd, content); !status.ok()) {
    return discard(status.error() + " (" + temp.string() + ")");
  }
  if (previous_perms.has_value() &&
      ::fchmod(fd, static_cast<mode_t>(*previous_perms)) != 0) {
    return discard("Failed to copy permissions: " + errno_message(errno));
  }
  if (::fsync(fd) != 0) {
    return discard("fsync failed: " + errno_message(errno));
  }
  if (::close(fd) != 0) {
    std::error_code remove_ec;
    std::filesystem::remove(temp, remove_ec);
    return Status::error(ErrorKind::Io, "close failed: " + errno_message(errno));
  }

  std::filesystem::rename(temp, path, ec);
  if (ec) {
    std::error_code remove_ec;
    std::filesystem::remove(temp, remove_ec);
    return Status::error(ErrorKind::Io, "Failed to rename " + temp.string() + " to " +
                                            path.string() + ": " + ec.message());
  }
  return Status::success();
}

Status write_file_direct(const std::filesystem::path &path, const std::string &content) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return Status::error(ErrorKind::Io, "Failed to open file for writing: " + path.string());
  }
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.flush();
  if (!out) {
    return Status::error(ErrorKind::Io, "Failed to write file: " + path.string());
  }
  return Status::success();
}

} // namespace tai::common
