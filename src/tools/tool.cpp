#include "tai/tools/tool.hpp"

#include <sstream>

namespace tai::tools {

std::string ToolSpec::parameters_json() const {
  std::ostringstream out;
  out << R"({"type":"object","properties":{)";
  for (std::size_t i = 0; i < parameters.size(); ++i) {
    const auto &param = parameters[i];
    if (i > 0) {
      out << ",";
    }
    out << common::json_quote(param.name) << ":{\"type\":" << common::json_quote(param.type);
    if (param.type == "array") {
      out << ",\"items\":{\"type\":"
          << common::json_quote(param.items_type.empty() ? "string" : param.items_type) << "}";
    }
    out << ",\"description\":" << common::json_quote(param.description) << "}";
  }
  out << "},\"required\":[";
  bool first = true;
  for (const auto &param : parameters) {
    if (!param.required) {
      continue;
    }
    if (!first) {
      out << ",";
    }
    out << common::json_quote(param.name);
    first = false;
  }
  out << "]}";
  return out.str();
}

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters = parameters(),
                  .group = std::string(group())};
}

std::string error_payload(const std::string &message) {
  return "{\"error\":" + common::json_quote(message) + "}";
}

} // namespace tai::tools
