#pragma once

#include "tai/security/sandbox.hpp"
#include "tai/tools/tool.hpp"

#include <cstddef>
#include <memory>

namespace tai::tools {

class GrepTool final : public ITool {
public:
  GrepTool(std::shared_ptr<security::PathSandbox> sandbox, std::size_t default_max_results);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParameter> parameters() const override;
  [[nodiscard]] common::Result<std::string> execute(const ToolArgs &args) override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<security::PathSandbox> sandbox_;
  std::size_t default_max_results_;
};

} // namespace tai::tools
