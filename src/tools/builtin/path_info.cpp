#include "tai/tools/builtin/path_info.hpp"

#include "tai/common/json_util.hpp"
#include "tai/common/time.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <optional>
#include <sstream>
#include <sys/stat.h>

namespace tai::tools {

namespace {

std::string entry_type(const mode_t mode) {
  if (S_ISDIR(mode)) {
    return "dir";
  }
  if (S_ISREG(mode)) {
    return "file";
  }
  if (S_ISLNK(mode)) {
    return "symlink";
  }
  return "other";
}

std::string json_time(const std::optional<std::time_t> &seconds) {
  if (!seconds.has_value()) {
    return "null";
  }
  return common::json_quote(common::format_rfc3339_utc(*seconds));
}

std::optional<std::time_t> birth_time(const std::filesystem::path &path) {
#ifdef STATX_BTIME
  struct statx info {};
  if (::statx(AT_FDCWD, path.c_str(), AT_SYMLINK_NOFOLLOW, STATX_BTIME, &info) == 0 &&
      (info.stx_mask & STATX_BTIME) != 0) {
    return static_cast<std::time_t>(info.stx_btime.tv_sec);
  }
#else
  (void)path;
#endif
  return std::nullopt;
}

} // namespace

common::Result<std::string> describe_path(const std::filesystem::path &path) {
  struct stat info {};
  if (::lstat(path.c_str(), &info) != 0) {
    return common::Result<std::string>::failure(common::ErrorKind::Io,
                                                "stat failed for " + path.string() + ": " +
                                                    std::strerror(errno));
  }

  std::ostringstream mode;
  mode << std::oct << static_cast<unsigned>(info.st_mode);

  std::ostringstream out;
  out << "{\"path\":" << common::json_quote(path.string())
      << ",\"type\":" << common::json_quote(entry_type(info.st_mode))
      << ",\"size\":" << static_cast<std::uint64_t>(info.st_size)
      << ",\"modified\":" << json_time(static_cast<std::time_t>(info.st_mtim.tv_sec))
      << ",\"created\":" << json_time(birth_time(path))
      << ",\"mode\":" << common::json_quote(mode.str()) << "}";
  return common::Result<std::string>::success(out.str());
}

common::Result<std::vector<std::filesystem::directory_entry>>
sorted_children(const std::filesystem::path &dir) {
  using ResultT = common::Result<std::vector<std::filesystem::directory_entry>>;
  std::error_code ec;
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return ResultT::failure(common::ErrorKind::Io,
                            "Failed to read " + dir.string() + ": " + ec.message());
  }

  std::vector<std::filesystem::directory_entry> entries;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return ResultT::failure(common::ErrorKind::Io,
                              "Failed to read " + dir.string() + ": " + ec.message());
    }
    entries.push_back(*it);
  }
  std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.path().filename().string() < rhs.path().filename().string();
  });
  return ResultT::success(std::move(entries));
}

std::string relative_slash_path(const std::filesystem::path &path,
                                const std::filesystem::path &base) {
  return path.lexically_relative(base).generic_string();
}

} // namespace tai::tools
