#pragma once

#include "tai/security/sandbox.hpp"
#include "tai/tools/tool.hpp"

#include <memory>

namespace tai::tools {

class FileWriteTool final : public ITool {
public:
  explicit FileWriteTool(std::shared_ptr<security::PathSandbox> sandbox);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParameter> parameters() const override;
  [[nodiscard]] common::Result<std::string> execute(const ToolArgs &args) override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<security::PathSandbox> sandbox_;
};

} // namespace tai::tools
