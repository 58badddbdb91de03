#include "tai/agent/history.hpp"

#include "tai/common/fs.hpp"
#include "tai/common/json_util.hpp"
#include "tai/common/time.hpp"
#include "tai/observability/global.hpp"

#include <sstream>

namespace tai::agent {

InteractionHistory::InteractionHistory(std::filesystem::path path, const std::size_t max_entries)
    : path_(std::move(path)), max_entries_(max_entries) {}

common::Result<InteractionHistory> InteractionHistory::load(const std::filesystem::path &path,
                                                            const std::size_t max_entries) {
  InteractionHistory history(path, max_entries);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<InteractionHistory>::success(std::move(history));
  }

  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<InteractionHistory>::failure(content.kind(), content.error());
  }
  if (common::trim(content.value()).empty()) {
    return common::Result<InteractionHistory>::success(std::move(history));
  }

  auto entries = parse(content.value());
  if (!entries.ok()) {
    return common::Result<InteractionHistory>::failure(
        common::ErrorKind::Parse, "Failed to parse history file " + path.string() + ": " +
                                      entries.error());
  }
  history.entries_ = std::move(entries.value());
  return common::Result<InteractionHistory>::success(std::move(history));
}

common::Status InteractionHistory::clear(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Io, "Failed to remove history file " +
                                                            path.string() + ": " + ec.message());
  }
  return common::Status::success();
}

common::Status InteractionHistory::add_entry(const std::string &user_input,
                                             const std::string &llm_response,
                                             const std::time_t now) {
  entries_.push_back(
      HistoryEntry{.timestamp = now, .user_input = user_input, .llm_response = llm_response});
  if (entries_.size() > max_entries_) {
    entries_.erase(entries_.begin(),
                   entries_.begin() + static_cast<long>(entries_.size() - max_entries_));
  }
  auto status = save();
  if (status.ok()) {
    observability::record_history_write(entries_.size());
  }
  return status;
}

common::Status InteractionHistory::save() const {
  if (path_.has_parent_path()) {
    if (auto dir = common::ensure_dir(path_.parent_path()); !dir.ok()) {
      return common::Status::error(dir.kind(), dir.error());
    }
  }
  return common::write_file_atomic(path_, to_json());
}

std::vector<RelevantEntry> InteractionHistory::relevant_entries(
    const std::time_t now, const std::chrono::minutes window) const {
  std::vector<RelevantEntry> out;
  const auto window_seconds = std::chrono::duration_cast<std::chrono::seconds>(window).count();
  for (const auto &entry : entries_) {
    const auto age = static_cast<std::int64_t>(now - entry.timestamp);
    if (age < window_seconds) {
      out.push_back(RelevantEntry{.entry = entry, .age_minutes = age / 60});
    }
  }
  return out;
}

std::string InteractionHistory::to_json() const {
  std::ostringstream out;
  out << "{\n  \"entries\": [";
  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto &entry = entries_[i];
    out << (i > 0 ? "," : "") << "\n    {\n"
        << "      \"timestamp\": " << common::json_quote(common::format_rfc3339_utc(entry.timestamp))
        << ",\n"
        << "      \"user_input\": " << common::json_quote(entry.user_input) << ",\n"
        << "      \"llm_response\": " << common::json_quote(entry.llm_response) << "\n    }";
  }
  if (!entries_.empty()) {
    out << "\n  ";
  }
  out << "]\n}\n";
  return out.str();
}

common::Result<std::vector<HistoryEntry>> InteractionHistory::parse(const std::string &json) {
  using ResultT = common::Result<std::vector<HistoryEntry>>;
  auto root = common::json_parse_object(json);
  if (!root.ok()) {
    return ResultT::failure(common::ErrorKind::Parse, root.error());
  }
  const auto it = root.value().find("entries");
  if (it == root.value().end()) {
    return ResultT::success({});
  }
  auto items = common::json_parse_array(it->second);
  if (!items.ok()) {
    return ResultT::failure(common::ErrorKind::Parse, "entries is not an array");
  }

  std::vector<HistoryEntry> entries;
  for (const auto &item : items.value()) {
    auto fields = common::json_parse_object(item);
    if (!fields.ok()) {
      return ResultT::failure(common::ErrorKind::Parse, "history entry is not an object");
    }
    const auto timestamp =
        common::parse_rfc3339_utc(common::json_field_string(fields.value(), "timestamp"));
    if (!timestamp.has_value()) {
      return ResultT::failure(common::ErrorKind::Parse, "history entry has a bad timestamp");
    }
    entries.push_back(HistoryEntry{
        .timestamp = *timestamp,
        .user_input = common::json_field_string(fields.value(), "user_input"),
        .llm_response = common::json_field_string(fields.value(), "llm_response")});
  }
  return ResultT::success(std::move(entries));
}

} // namespace tai::agent
