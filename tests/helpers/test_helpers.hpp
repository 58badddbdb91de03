#pragma once

#include "tai/common/clipboard.hpp"
#include "tai/common/http.hpp"
#include "tai/common/json_util.hpp"
#include "tai/observability/observer.hpp"
#include "tai/providers/traits.hpp"
#include "tai/security/approval.hpp"
#include "tai/security/sandbox.hpp"

#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace tai::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  void create_dir(const std::string &name) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;
  [[nodiscard]] std::shared_ptr<security::PathSandbox> sandbox() const;

private:
  std::filesystem::path path_;
};

/// Answers every confirmation with the configured decision and records the commands.
class ScriptedApproval final : public security::ApprovalPrompt {
public:
  explicit ScriptedApproval(security::ApprovalDecision decision = security::ApprovalDecision::Execute)
      : decision_(decision) {}

  [[nodiscard]] common::Result<security::ApprovalDecision>
  ask(const std::string &command) override;

  void set_decision(security::ApprovalDecision decision) { decision_ = decision; }
  [[nodiscard]] const std::vector<std::string> &asked() const { return asked_; }

private:
  security::ApprovalDecision decision_;
  std::vector<std::string> asked_;
};

class FakeClipboard final : public common::Clipboard {
public:
  [[nodiscard]] common::Status copy(const std::string &text) override;

  void set_available(bool available) { available_ = available; }
  [[nodiscard]] const std::vector<std::string> &copied() const { return copied_; }

private:
  bool available_ = true;
  std::vector<std::string> copied_;
};

/// Replays queued responses in order; an empty queue answers 200 with "{}".
class FakeHttpClient final : public common::HttpClient {
public:
  [[nodiscard]] common::HttpResponse send(const common::HttpRequest &request) override;

  void push_response(common::HttpResponse response);
  void push_json(std::uint16_t status, std::string body);
  [[nodiscard]] const std::vector<common::HttpRequest> &requests() const { return requests_; }

private:
  std::deque<common::HttpResponse> responses_;
  std::vector<common::HttpRequest> requests_;
};

/// Model double: returns queued responses and records every request.
class ScriptedProvider final : public providers::Provider {
public:
  void push_text(std::string text);
  void push_tool_calls(std::vector<tools::ToolCall> calls, std::string text = "");
  void push_error(std::string message);

  [[nodiscard]] common::Result<providers::ChatResponse>
  chat(const providers::ChatRequest &request) override;
  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] const std::vector<providers::ChatRequest> &requests() const { return requests_; }

private:
  std::deque<common::Result<providers::ChatResponse>> responses_;
  std::vector<providers::ChatRequest> requests_;
};

/// Keeps every event and metric in memory. Install with set_global_observer and
/// read through the shared state, which outlives the observer.
class RecordingObserver final : public observability::IObserver {
public:
  struct Log {
    std::vector<observability::ObserverEvent> events;
    std::vector<observability::ObserverMetric> metrics;
  };

  explicit RecordingObserver(std::shared_ptr<Log> log) : log_(std::move(log)) {}

  void record_event(const observability::ObserverEvent &event) override {
    log_->events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    log_->metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

private:
  std::shared_ptr<Log> log_;
};

/// Installs a RecordingObserver for the guard's lifetime.
class ScopedRecorder {
public:
  ScopedRecorder();
  ~ScopedRecorder();

  ScopedRecorder(const ScopedRecorder &) = delete;
  ScopedRecorder &operator=(const ScopedRecorder &) = delete;

  [[nodiscard]] const RecordingObserver::Log &log() const { return *log_; }

  template <typename Event> [[nodiscard]] std::vector<Event> events() const {
    std::vector<Event> out;
    for (const auto &event : log_->events) {
      if (const auto *typed = std::get_if<Event>(&event); typed != nullptr) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  std::shared_ptr<RecordingObserver::Log> log_;
};

/// Parses a JSON object payload, throwing when it is not one.
[[nodiscard]] common::JsonFields parse_payload(const std::string &json);

/// Sets an environment variable for the lifetime of the guard, restoring the old value.
class ScopedEnv {
public:
  ScopedEnv(std::string name, const std::string &value);
  ~ScopedEnv();

  ScopedEnv(const ScopedEnv &) = delete;
  ScopedEnv &operator=(const ScopedEnv &) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

/// True once `pid` has exited (gone or a zombie), polling for a few seconds.
[[nodiscard]] bool process_gone(long pid);

/// Reads a pid written by a child process, waiting briefly for the file.
[[nodiscard]] long read_pid_file(const std::filesystem::path &path);

} // namespace tai::testing
