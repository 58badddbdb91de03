#pragma once

#include "tai/security/sandbox.hpp"
#include "tai/tools/tool.hpp"

#include <cstddef>
#include <memory>

namespace tai::tools {

class GlobTool final : public ITool {
public:
  GlobTool(std::shared_ptr<security::PathSandbox> sandbox, std::size_t default_limit);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParameter> parameters() const override;
  [[nodiscard]] common::Result<std::string> execute(const ToolArgs &args) override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<security::PathSandbox> sandbox_;
  std::size_t default_limit_;
};

} // namespace tai::tools
