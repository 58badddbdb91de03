#include "tai/security/approval.hpp"

#include "tai/common/fs.hpp"

#include <istream>
#include <ostream>

namespace tai::security {

std::string_view approval_decision_name(const ApprovalDecision decision) {
  switch (decision) {
  case ApprovalDecision::Execute:
    return "execute";
  case ApprovalDecision::Skip:
    return "skip";
  case ApprovalDecision::CopyToClipboard:
    return "copy";
  }
  return "execute";
}

ApprovalDecision parse_approval_choice(const std::string &answer) {
  const std::string normalized = common::to_lower(common::trim(answer));
  if (normalized == "c") {
    return ApprovalDecision::CopyToClipboard;
  }
  if (normalized == "n" || normalized == "no") {
    return ApprovalDecision::Skip;
  }
  return ApprovalDecision::Execute;
}

TerminalApprovalPrompt::TerminalApprovalPrompt(std::istream &in, std::ostream &out)
    : in_(in), out_(out) {}

common::Result<ApprovalDecision> TerminalApprovalPrompt::ask(const std::string &command) {
  out_ << "\n> " << command << "\n";
  out_ << "Do you want to execute this command? [Y/n/c] " << std::flush;

  std::string answer;
  if (!std::getline(in_, answer)) {
    if (in_.bad()) {
      return common::Result<ApprovalDecision>::failure(common::ErrorKind::Io,
                                                       "Failed to read confirmation");
    }
    out_ << "\n";
    return common::Result<ApprovalDecision>::success(ApprovalDecision::Skip);
  }
  return common::Result<ApprovalDecision>::success(parse_approval_choice(answer));
}

} // namespace tai::security
