#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <random>
#include <string>

namespace tai::bench {

inline void run_bench(const std::string &name, int iterations,
                      const std::function<void()> &fn) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << "\n";
}

inline std::filesystem::path make_temp_dir(const std::string &prefix) {
  static std::mt19937_64 rng{std::random_device{}()};
  const auto base = std::filesystem::temp_directory_path() / (prefix + std::to_string(rng()));
  std::filesystem::create_directories(base);
  return std::filesystem::canonical(base);
}

} // namespace tai::bench
