#include <iostream>

void run_allocator_benchmarks();
void run_lifecycle_benchmarks();

int main() {
  std::cout << "skillgov benchmarks\n";
  run_allocator_benchmarks();
  run_lifecycle_benchmarks();
  return 0;
}
