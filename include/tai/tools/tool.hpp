#pragma once

#include "tai/common/json_util.hpp"
#include "tai/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tai::tools {

/// Top-level members of a call's argument object, values kept as raw JSON.
using ToolArgs = common::JsonFields;

struct ToolParameter {
  std::string name;
  /// JSON schema type: string, integer, boolean, array, object.
  std::string type;
  std::string description;
  bool required = false;
  /// Element type for arrays, or "object" for arrays of objects.
  std::string items_type;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::vector<ToolParameter> parameters;
  std::string group;

  /// JSON schema object describing the parameters.
  [[nodiscard]] std::string parameters_json() const;
};

/// A model-issued request. `arguments` is the raw JSON text the model produced.
struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments;
};

/// Outcome of one dispatched call, correlated to its ToolCall by `id`.
/// `payload` is a JSON object: the tool's value, or {"error": message}.
struct ToolResult {
  std::string id;
  std::string name;
  std::string payload;
  bool success = true;
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::vector<ToolParameter> parameters() const = 0;
  /// Returns the JSON payload on success.
  [[nodiscard]] virtual common::Result<std::string> execute(const ToolArgs &args) = 0;
  [[nodiscard]] virtual std::string_view group() const = 0;

  [[nodiscard]] ToolSpec spec() const;
};

[[nodiscard]] std::string error_payload(const std::string &message);

} // namespace tai::tools
