#include "bench_common.hpp"

#include "tai/common/glob.hpp"
#include "tai/config/schema.hpp"
#include "tai/security/approval.hpp"
#include "tai/security/sandbox.hpp"
#include "tai/tools/tool_registry.hpp"

#include <fstream>
#include <memory>

namespace {

void build_tree(const std::filesystem::path &root) {
  std::ofstream(root / ".gitignore") << "build/\n*.log\n";
  for (int d = 0; d < 20; ++d) {
    const auto dir = root / "src" / ("module" + std::to_string(d));
    std::filesystem::create_directories(dir);
    std::filesystem::create_directories(root / "build" / ("module" + std::to_string(d)));
    for (int f = 0; f < 10; ++f) {
      std::ofstream out(dir / ("file" + std::to_string(f) + ".cpp"));
      for (int line = 0; line < 50; ++line) {
        out << "int value_" << line << " = " << line << "; // TODO tidy\n";
      }
      std::ofstream(root / "build" / ("module" + std::to_string(d)) /
                    ("file" + std::to_string(f) + ".o"))
          << "object";
    }
  }
}

} // namespace

void run_search_benchmark() {
  auto pattern = tai::common::GlobPattern::compile("src/**/*.{cpp,hpp}");
  if (pattern.ok()) {
    tai::bench::run_bench("glob_match", 20000, [&] {
      (void)pattern.value().matches("src/module7/nested/file3.cpp");
    });
  }

  const auto root = tai::bench::make_temp_dir("tai-search-bench-");
  build_tree(root);
  auto sandbox = tai::security::PathSandbox::create(root);
  if (!sandbox.ok()) {
    return;
  }
  // Only read-only tools run here, so nothing is ever confirmed or copied.
  auto registry = tai::tools::ToolRegistry::create_default(
      std::make_shared<tai::security::PathSandbox>(std::move(sandbox.value())), nullptr, nullptr,
      nullptr, tai::config::ToolsConfig{});

  tai::bench::run_bench("glob_tool_tree", 50, [&] {
    (void)registry.dispatch({.id = "g", .name = "glob", .arguments = R"({"pattern":"**/*.cpp"})"});
  });
  tai::bench::run_bench("grep_tool_tree", 20, [&] {
    (void)registry.dispatch(
        {.id = "r", .name = "grep", .arguments = R"({"pattern":"TODO","max_results":1000})"});
  });

  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}
