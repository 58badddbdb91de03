#include <iostream>

void run_config_benchmark();
void run_prompt_benchmark();
void run_search_benchmark();

int main() {
  std::cout << "tai benchmarks\n";
  run_config_benchmark();
  run_prompt_benchmark();
  run_search_benchmark();
  return 0;
}
