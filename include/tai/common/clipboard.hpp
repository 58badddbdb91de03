#pragma once

#include "tai/common/result.hpp"

#include <string>
#include <vector>

namespace tai::common {

class Clipboard {
public:
  virtual ~Clipboard() = default;
  [[nodiscard]] virtual Status copy(const std::string &text) = 0;
};

/// Pipes text into the first available helper: wl-copy, xclip, xsel, pbcopy.
class SystemClipboard final : public Clipboard {
public:
  SystemClipboard();
  explicit SystemClipboard(std::vector<std::vector<std::string>> helpers);

  [[nodiscard]] Status copy(const std::string &text) override;

private:
  std::vector<std::vector<std::string>> helpers_;
};

} // namespace tai::common
