#pragma once

#include "tai/common/result.hpp"

#include <iosfwd>
#include <string>
#include <string_view>

namespace tai::security {

enum class ApprovalDecision {
  Execute,
  Skip,
  CopyToClipboard,
};

[[nodiscard]] std::string_view approval_decision_name(ApprovalDecision decision);

/// "c" copies, "n"/"no" skips, anything else (including an empty answer) executes.
[[nodiscard]] ApprovalDecision parse_approval_choice(const std::string &answer);

/// Operator confirmation gate in front of command execution.
class ApprovalPrompt {
public:
  virtual ~ApprovalPrompt() = default;
  [[nodiscard]] virtual common::Result<ApprovalDecision> ask(const std::string &command) = 0;
};

class TerminalApprovalPrompt final : public ApprovalPrompt {
public:
  TerminalApprovalPrompt(std::istream &in, std::ostream &out);

  /// End of input counts as Skip.
  [[nodiscard]] common::Result<ApprovalDecision> ask(const std::string &command) override;

private:
  std::istream &in_;
  std::ostream &out_;
};

} // namespace tai::security
