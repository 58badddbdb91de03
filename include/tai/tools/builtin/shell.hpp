#pragma once

#include "tai/common/clipboard.hpp"
#include "tai/security/approval.hpp"
#include "tai/security/sandbox.hpp"
#include "tai/tools/tool.hpp"

#include <cstdint>
#include <memory>

namespace tai::tools {

class ShellTool final : public ITool {
public:
  ShellTool(std::shared_ptr<security::PathSandbox> sandbox,
            std::shared_ptr<security::ApprovalPrompt> approval,
            std::shared_ptr<common::Clipboard> clipboard, std::uint64_t default_timeout_sec);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParameter> parameters() const override;
  [[nodiscard]] common::Result<std::string> execute(const ToolArgs &args) override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<security::PathSandbox> sandbox_;
  std::shared_ptr<security::ApprovalPrompt> approval_;
  std::shared_ptr<common::Clipboard> clipboard_;
  std::uint64_t default_timeout_sec_;
};

} // namespace tai::tools
