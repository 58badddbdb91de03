#include "tests/helpers/test_helpers.hpp"

#include "tai/common/fs.hpp"
#include "tai/observability/global.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace tai::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("tai-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
  path_ = std::filesystem::canonical(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

void TempWorkspace::create_dir(const std::string &name) const {
  std::filesystem::create_directories(path_ / name);
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name, std::ios::binary);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

std::shared_ptr<security::PathSandbox> TempWorkspace::sandbox() const {
  auto created = security::PathSandbox::create(path_);
  if (!created.ok()) {
    throw std::runtime_error(created.error());
  }
  return std::make_shared<security::PathSandbox>(std::move(created.value()));
}

common::Result<security::ApprovalDecision> ScriptedApproval::ask(const std::string &command) {
  asked_.push_back(command);
  return common::Result<security::ApprovalDecision>::success(decision_);
}

common::Status FakeClipboard::copy(const std::string &text) {
  if (!available_) {
    return common::Status::error(common::ErrorKind::Process, "No clipboard helper available");
  }
  copied_.push_back(text);
  return common::Status::success();
}

common::HttpResponse FakeHttpClient::send(const common::HttpRequest &request) {
  requests_.push_back(request);
  if (responses_.empty()) {
    common::HttpResponse response;
    response.status = 200;
    response.body = "{}";
    response.final_url = request.url;
    return response;
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  if (response.final_url.empty()) {
    response.final_url = request.url;
  }
  return response;
}

void FakeHttpClient::push_response(common::HttpResponse response) {
  responses_.push_back(std::move(response));
}

void FakeHttpClient::push_json(const std::uint16_t status, std::string body) {
  common::HttpResponse response;
  response.status = status;
  response.body = std::move(body);
  response.headers["content-type"] = "application/json";
  responses_.push_back(std::move(response));
}

void ScriptedProvider::push_text(std::string text) {
  providers::ChatResponse response;
  response.content = std::move(text);
  responses_.push_back(common::Result<providers::ChatResponse>::success(std::move(response)));
}

void ScriptedProvider::push_tool_calls(std::vector<tools::ToolCall> calls, std::string text) {
  providers::ChatResponse response;
  response.content = std::move(text);
  response.tool_calls = std::move(calls);
  responses_.push_back(common::Result<providers::ChatResponse>::success(std::move(response)));
}

void ScriptedProvider::push_error(std::string message) {
  responses_.push_back(common::Result<providers::ChatResponse>::failure(
      common::ErrorKind::Provider, std::move(message)));
}

common::Result<providers::ChatResponse>
ScriptedProvider::chat(const providers::ChatRequest &request) {
  requests_.push_back(request);
  if (responses_.empty()) {
    return common::Result<providers::ChatResponse>::failure(common::ErrorKind::Provider,
                                                            "no scripted response left");
  }
  auto response = std::move(responses_.front());
  responses_.pop_front();
  return response;
}

ScopedRecorder::ScopedRecorder() : log_(std::make_shared<RecordingObserver::Log>()) {
  observability::set_global_observer(std::make_unique<RecordingObserver>(log_));
}

ScopedRecorder::~ScopedRecorder() { observability::set_global_observer(nullptr); }

common::JsonFields parse_payload(const std::string &json) {
  auto fields = common::json_parse_object(json);
  if (!fields.ok()) {
    throw std::runtime_error("payload is not a JSON object: " + json);
  }
  return fields.value();
}

ScopedEnv::ScopedEnv(std::string name, const std::string &value) : name_(std::move(name)) {
  if (const char *current = std::getenv(name_.c_str()); current != nullptr) {
    previous_ = current;
  }
  ::setenv(name_.c_str(), value.c_str(), 1);
}

ScopedEnv::~ScopedEnv() {
  if (previous_.has_value()) {
    ::setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    ::unsetenv(name_.c_str());
  }
}

bool process_gone(const long pid) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (true) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!stat || !std::getline(stat, line)) {
      return true;
    }
    // The state letter follows the parenthesised command name.
    const auto close = line.rfind(')');
    if (close != std::string::npos && close + 2 < line.size() &&
        (line[close + 2] == 'Z' || line[close + 2] == 'X')) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

long read_pid_file(const std::filesystem::path &path) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (true) {
    auto text = common::read_text_file(path);
    if (text.ok() && !common::trim(text.value()).empty()) {
      return std::stol(common::trim(text.value()));
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw std::runtime_error("pid file not written: " + path.string());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

} // namespace tai::testing
