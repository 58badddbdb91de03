#pragma once

#include "tai/common/result.hpp"

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <vector>

namespace tai::agent {

struct HistoryEntry {
  std::time_t timestamp = 0;
  std::string user_input;
  std::string llm_response;
};

struct RelevantEntry {
  HistoryEntry entry;
  std::int64_t age_minutes = 0;
};

/// Bounded log of finished turns, persisted as
/// {"entries":[{"timestamp","user_input","llm_response"}]}.
class InteractionHistory {
public:
  InteractionHistory(std::filesystem::path path, std::size_t max_entries);

  /// A missing or empty file yields an empty history.
  [[nodiscard]] static common::Result<InteractionHistory> load(const std::filesystem::path &path,
                                                               std::size_t max_entries);
  /// Removes the file if present.
  [[nodiscard]] static common::Status clear(const std::filesystem::path &path);

  [[nodiscard]] const std::vector<HistoryEntry> &entries() const { return entries_; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  /// Appends, drops the oldest entries beyond the bound and saves.
  [[nodiscard]] common::Status add_entry(const std::string &user_input,
                                         const std::string &llm_response, std::time_t now);
  [[nodiscard]] common::Status save() const;

  /// Entries younger than `window`, oldest first.
  [[nodiscard]] std::vector<RelevantEntry> relevant_entries(std::time_t now,
                                                            std::chrono::minutes window) const;

  [[nodiscard]] std::string to_json() const;
  [[nodiscard]] static common::Result<std::vector<HistoryEntry>> parse(const std::string &json);

private:
  std::filesystem::path path_;
  std::size_t max_entries_;
  std::vector<HistoryEntry> entries_;
};

} // namespace tai::agent
