#pragma once

#include "tai/common/http.hpp"
#include "tai/tools/tool.hpp"

#include <cstdint>
#include <memory>

namespace tai::tools {

class FetchUrlTool final : public ITool {
public:
  FetchUrlTool(std::shared_ptr<common::HttpClient> http, std::uint64_t default_timeout_sec,
               std::uint64_t default_max_bytes);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::vector<ToolParameter> parameters() const override;
  [[nodiscard]] common::Result<std::string> execute(const ToolArgs &args) override;
  [[nodiscard]] std::string_view group() const override;

private:
  std::shared_ptr<common::HttpClient> http_;
  std::uint64_t default_timeout_sec_;
  std::uint64_t default_max_bytes_;
};

} // namespace tai::tools
